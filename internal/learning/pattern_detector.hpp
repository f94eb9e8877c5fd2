#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/time.hpp"

namespace aiknowsys::learning {

struct SessionDocument {
  std::string file; // relative to .aiknowsys/
  std::string date; // YYYY-MM-DD
  std::string content;
};

struct SessionLoadResult {
  std::vector<SessionDocument> sessions;
  std::vector<std::string>     errors;
};

/*
  Session files dated within [now - window_days, now], oldest first.

  The date comes from the YYYY-MM-DD filename prefix, else the frontmatter
  `date`, else the file mtime. A missing sessions/ directory is not an error.
*/
SessionLoadResult LoadRecentSessions(const std::filesystem::path& target_dir, int window_days = 30, util::TimePoint now = util::Now());

// One annotated line, e.g. "**Key Learning:** chalk needs a dynamic import".
struct Observation {
  std::string text;
  std::string date;
  std::string source;
  std::size_t position = 0; // line index within the source
};

inline const std::vector<std::string> kDefaultMarkers = {"Key Learning"};

// Lines labelled with one of `markers`, bold or plain, case-insensitive.
std::vector<Observation> ExtractErrorPatterns(const std::vector<SessionDocument>& sessions,
                                              const std::vector<std::string>& markers = kDefaultMarkers);

// |A ∩ B| / |A ∪ B| over lowercase alphanumeric words; 0 when both are empty.
double JaccardSimilarity(std::string_view a, std::string_view b);

struct DetectedPattern {
  std::string              error; // chronologically first member
  int                      frequency = 0;
  std::string              first_seen;
  std::string              last_seen;
  std::vector<std::string> keywords;
  std::vector<std::string> examples;
  std::string              common_resolution;
};

/*
  Single-link clustering: every pair at or above `similarity` ends up in the
  same cluster. Clusters come back in order of their first member.
*/
std::vector<DetectedPattern> ClusterObservations(std::vector<Observation> observations, double similarity = 0.4);

struct DetectOptions {
  int    threshold   = 3;
  int    window_days = 30;
  double similarity  = 0.4;

  std::optional<util::TimePoint> now;
  std::vector<std::string>       markers = kDefaultMarkers;
};

struct DetectionResult {
  std::vector<DetectedPattern> patterns;
  std::vector<std::string>     errors;
};

// Clusters with frequency >= threshold, most frequent first.
DetectionResult DetectPatterns(const std::filesystem::path& target_dir, const DetectOptions& options = {});

} // namespace aiknowsys::learning
