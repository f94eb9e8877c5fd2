#include "skill_generator.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <sstream>
#include <system_error>

#include "internal/markdown/layout.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace aiknowsys::learning {

namespace fs = std::filesystem;

using observability::IntField;
using observability::PathField;
using observability::StringField;

namespace {

constexpr const char* kSkillCategory = "error_resolution";

std::string RenderFrontmatter(const SkillPattern& pattern, const std::string& created_date) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "category" << YAML::Value << kSkillCategory;
  out << YAML::Key << "keywords" << YAML::Value;
  if (pattern.keywords.empty()) out << YAML::Flow;
  out << YAML::BeginSeq;
  for (const auto& keyword : pattern.keywords) out << keyword;
  out << YAML::EndSeq;
  out << YAML::Key << "created" << YAML::Value << created_date;
  out << YAML::EndMap;
  return out.c_str();
}

fs::path SkillDir(const fs::path& target_dir, const SkillOptions& options) {
  if (options.shared || options.username.empty()) return markdown::LearnedDir(target_dir);

  if (options.username.find_first_of("/\\") != std::string::npos || options.username == "." || options.username == "..") {
    throw util::ValidationError("Invalid username: " + options.username);
  }
  return markdown::PersonalDir(target_dir, options.username);
}

bool MatchesTerm(const DetectedPattern& pattern, const std::string& term) {
  if (util::ContainsIgnoreCase(pattern.error, term)) return true;
  return std::any_of(pattern.keywords.begin(), pattern.keywords.end(), [&](const std::string& k) { return util::ContainsIgnoreCase(k, term); });
}

} // namespace

SkillPattern ToSkillPattern(const DetectedPattern& pattern) {
  SkillPattern skill;
  skill.error        = pattern.error;
  skill.frequency    = pattern.frequency;
  skill.keywords     = pattern.keywords;
  skill.resolution   = pattern.common_resolution;
  skill.observations = pattern.examples;
  return skill;
}

std::string RenderSkillTemplate(const SkillPattern& pattern, const std::string& created_date) {
  std::ostringstream md;
  md << "---\n" << RenderFrontmatter(pattern, created_date) << "\n---\n\n";

  md << "# Learned Skill: " << pattern.error << "\n\n";
  md << "**Description:** Pattern discovered from " << std::max(pattern.frequency, 1) << " occurrences\n\n";

  md << "## Trigger Words\n\n";
  for (const auto& keyword : pattern.keywords) md << "- `" << keyword << "`\n";
  if (!pattern.keywords.empty()) md << "\n";

  md << "## Resolution\n\n" << (pattern.resolution.empty() ? pattern.error : pattern.resolution) << "\n";

  if (!pattern.examples.empty()) {
    md << "\n## Examples\n\n";
    for (const auto& example : pattern.examples) {
      md << "**Before:**\n```\n" << example.before << "\n```\n\n";
      md << "**After:**\n```\n" << example.after << "\n```\n\n";
    }
  }

  if (!pattern.observations.empty()) {
    md << "\n## Observed Occurrences\n\n";
    for (const auto& observation : pattern.observations) md << "- " << observation << "\n";
  }

  md << "\n## Related Skills\n\n";
  if (pattern.related_skills.empty()) {
    md << "- None yet\n";
  } else {
    for (const auto& skill : pattern.related_skills) md << "- " << skill << "\n";
  }

  md << "\n---\n\n*Auto-generated learned skill. Edit as needed.*\n";
  return md.str();
}

SkillCreationResult CreateLearnedSkill(const SkillPattern& pattern, const fs::path& target_dir, const SkillOptions& options) {
  const auto slug = util::Slugify(pattern.error);
  if (slug.empty()) {
    throw util::ValidationError("Cannot derive a skill file name from: " + pattern.error);
  }

  SkillCreationResult result;
  result.path = SkillDir(fs::absolute(target_dir).lexically_normal(), options) / (slug + ".md");

  std::error_code ec;
  if (fs::exists(result.path, ec)) {
    result.existed = true;
    return result;
  }

  util::WriteTextFileAtomic(result.path, RenderSkillTemplate(pattern, util::FormatDate(util::Now())));
  result.created = true;

  AIKNOWSYS_LOG_INFO("learned skill created", {PathField("path", result.path), IntField("frequency", pattern.frequency)});
  return result;
}

ExtractResult ExtractPattern(const fs::path& target_dir, const std::string& search_term, PatternTracker& tracker, const SkillOptions& options,
                             DetectOptions detect) {
  const auto term = util::Trim(search_term);
  if (term.empty()) {
    throw util::ValidationError("Search term cannot be empty");
  }

  observability::SpanScope span("learning.extract_pattern");
  detect.threshold = 1;
  const auto detected = DetectPatterns(target_dir, detect);

  const auto match = std::find_if(detected.patterns.begin(), detected.patterns.end(), [&](const DetectedPattern& p) { return MatchesTerm(p, term); });
  ExtractResult result;
  if (match == detected.patterns.end()) {
    result.message = "Pattern not found";
    return result;
  }

  const auto created = CreateLearnedSkill(ToSkillPattern(*match), target_dir, options);
  if (!tracker.Find(match->error)) tracker.TrackPattern(match->error, match->common_resolution);
  tracker.MarkPatternDocumented(match->error);

  result.success = true;
  result.path    = created.path;
  result.created = created.created;
  result.existed = created.existed;
  result.message = created.created ? "Skill created" : "Skill already exists";
  return result;
}

AutoCreateResult AutoCreateSkills(const fs::path& target_dir, int threshold, PatternTracker& tracker, const SkillOptions& options, DetectOptions detect) {
  observability::SpanScope span("learning.auto_create_skills");
  detect.threshold    = threshold;
  const auto detected = DetectPatterns(target_dir, detect);

  AutoCreateResult result;
  for (const auto& pattern : detected.patterns) {
    if (tracker.IsDocumented(pattern.error)) {
      result.skipped.push_back(pattern.error);
      continue;
    }

    SkillCreationResult created;
    try {
      created = CreateLearnedSkill(ToSkillPattern(pattern), target_dir, options);
    } catch (const util::ValidationError& e) {
      AIKNOWSYS_LOG_WARN("pattern skipped", {StringField("error", pattern.error), StringField("reason", e.what())});
      result.errors.push_back(e.what());
      continue;
    }

    // ledger entries only for patterns that have a skill file
    tracker.TrackPattern(pattern.error, pattern.common_resolution);
    tracker.MarkPatternDocumented(pattern.error);

    if (created.existed) {
      result.skipped.push_back(pattern.error);
    } else {
      result.created.push_back(std::move(created));
    }
  }

  span.SetAttribute("created", static_cast<std::int64_t>(result.created.size()));
  AIKNOWSYS_LOG_INFO("auto-create finished",
                     {IntField("created", static_cast<std::int64_t>(result.created.size())), IntField("skipped", static_cast<std::int64_t>(result.skipped.size())),
                      IntField("errors", static_cast<std::int64_t>(result.errors.size()))});
  return result;
}

} // namespace aiknowsys::learning
