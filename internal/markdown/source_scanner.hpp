#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "aiknowsys/v1.hpp"

namespace aiknowsys::markdown {

struct ScanOptions {
  // Stamped on every plan/session record.
  std::string project_id;

  // Keep markdown bodies in `content`; the JSON index clears them.
  bool include_content = true;
};

/*
  Result of one pass over the markdown tree.

  `errors` holds one "<file>: <reason>" entry per skipped file; a bad file
  never aborts the scan.
*/
struct ScanResult {
  std::vector<aiknowsys::v1::Plan>           plans;
  std::vector<aiknowsys::v1::Session>        sessions;
  std::vector<aiknowsys::v1::LearnedPattern> learned;
  std::vector<std::string>                   errors;
};

ScanResult ScanKnowledgeBase(const std::filesystem::path& target, const ScanOptions& options = {});

/*
  Markdown body of a file with its frontmatter removed. Falls back to the raw
  text when the frontmatter does not parse. Throws std::runtime_error when the
  file cannot be read.
*/
std::string LoadBody(const std::filesystem::path& file);

// Plan reference as written in a session ("PLAN_x.md", "[X](../PLAN_x.md)") reduced to a plan id.
std::string NormalizePlanReference(std::string_view reference);

} // namespace aiknowsys::markdown
