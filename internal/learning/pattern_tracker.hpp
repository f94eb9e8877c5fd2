#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "aiknowsys/v1.hpp"

namespace aiknowsys::learning {

/*
  PatternTracker

  Ledger of recurring errors in .aiknowsys/pattern-history.json. Entries are
  keyed by their exact error text. Every call reads the ledger from disk and
  every mutation rewrites it atomically, so two trackers on the same
  directory see each other's writes.

  A ledger that exists but does not parse throws util::StorageUnavailable.
*/
class PatternTracker {
 public:
  explicit PatternTracker(std::filesystem::path target_dir);

  // Bumps frequency and last_seen, or records a new entry first seen today.
  aiknowsys::v1::PatternEntry TrackPattern(const std::string& error, const std::optional<std::string>& resolution = std::nullopt);

  // false when no entry has this error text
  bool MarkPatternDocumented(const std::string& error);

  aiknowsys::v1::PatternHistory              Patterns() const;
  std::optional<aiknowsys::v1::PatternEntry> Find(const std::string& error) const;
  bool                                       IsDocumented(const std::string& error) const;

  const std::filesystem::path& LedgerPath() const {
    return path_;
  }

 private:
  aiknowsys::v1::PatternHistory Load() const;
  void                          Save(const aiknowsys::v1::PatternHistory& history) const;

  std::filesystem::path path_;
};

} // namespace aiknowsys::learning
