#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "internal/learning/pattern_detector.hpp"
#include "internal/learning/pattern_tracker.hpp"

namespace aiknowsys::learning {

struct SkillExample {
  std::string before;
  std::string after;
};

struct SkillPattern {
  std::string               error;
  int                       frequency = 1;
  std::vector<std::string>  keywords;
  std::string               resolution; // empty: the error text itself
  std::vector<SkillExample> examples;
  std::vector<std::string>  observations;
  std::vector<std::string>  related_skills;
};

struct SkillOptions {
  // false + username: personal/<username>/ instead of learned/
  bool        shared = true;
  std::string username;
};

struct SkillCreationResult {
  std::filesystem::path path;
  bool                  created = false;
  bool                  existed = false;
};

SkillPattern ToSkillPattern(const DetectedPattern& pattern);

// Markdown of a learned skill file, frontmatter included.
std::string RenderSkillTemplate(const SkillPattern& pattern, const std::string& created_date);

/*
  Writes <dir>/<slug(error)>.md. An existing file is never overwritten; the
  result then reports existed=true. Throws util::ValidationError when the
  error text yields an empty file name.
*/
SkillCreationResult CreateLearnedSkill(const SkillPattern& pattern, const std::filesystem::path& target_dir, const SkillOptions& options = {});

struct ExtractResult {
  bool                  success = false;
  std::string           message;
  std::filesystem::path path;
  bool                  created = false;
  bool                  existed = false;
};

/*
  Documents the first detected pattern (any frequency) whose error text or
  keywords contain `search_term`, ignoring case.
*/
ExtractResult ExtractPattern(const std::filesystem::path& target_dir, const std::string& search_term, PatternTracker& tracker,
                             const SkillOptions& options = {}, DetectOptions detect = {});

struct AutoCreateResult {
  std::vector<SkillCreationResult> created;
  std::vector<std::string>         skipped; // error texts already documented
  std::vector<std::string>         errors;  // patterns that could not become a skill
};

/*
  Turns every pattern seen at least `threshold` times into a skill. A pattern
  that cannot be named is reported in `errors` and left out of the ledger;
  the rest of the run continues.
*/
AutoCreateResult AutoCreateSkills(const std::filesystem::path& target_dir, int threshold, PatternTracker& tracker,
                                  const SkillOptions& options = {}, DetectOptions detect = {});

} // namespace aiknowsys::learning
