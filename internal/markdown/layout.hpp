#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace aiknowsys::markdown {

/*
  On-disk layout of a knowledge base:

    <target>/.aiknowsys/PLAN_<id>.md          plans (also plans/PLAN_<id>.md)
    <target>/.aiknowsys/plans/active-<user>.md
    <target>/.aiknowsys/sessions/YYYY-MM-DD*.md
    <target>/.aiknowsys/learned/<slug>.md
    <target>/.aiknowsys/context-index.json    JSON backend cache
    <target>/.aiknowsys/pattern-history.json  pattern ledger
*/

inline constexpr const char* kKnowledgeDirName = ".aiknowsys";
inline constexpr const char* kIndexFileName    = "context-index.json";
inline constexpr const char* kHistoryFileName  = "pattern-history.json";
inline constexpr const char* kPlanPrefix       = "PLAN_";
inline constexpr const char* kActivePrefix     = "active-";

inline std::filesystem::path KnowledgeDir(const std::filesystem::path& target) {
  return target / kKnowledgeDirName;
}

inline std::filesystem::path PlansDir(const std::filesystem::path& target) {
  return KnowledgeDir(target) / "plans";
}

inline std::filesystem::path SessionsDir(const std::filesystem::path& target) {
  return KnowledgeDir(target) / "sessions";
}

inline std::filesystem::path LearnedDir(const std::filesystem::path& target) {
  return KnowledgeDir(target) / "learned";
}

inline std::filesystem::path PersonalDir(const std::filesystem::path& target, const std::string& username) {
  return KnowledgeDir(target) / "personal" / username;
}

inline std::filesystem::path IndexPath(const std::filesystem::path& target) {
  return KnowledgeDir(target) / kIndexFileName;
}

inline std::filesystem::path PatternHistoryPath(const std::filesystem::path& target) {
  return KnowledgeDir(target) / kHistoryFileName;
}

bool IsPlanFileName(const std::string& filename);
bool IsActivePointerFileName(const std::string& filename);

// Sorted *.md regular files directly under dir; empty when dir is absent.
std::vector<std::filesystem::path> ListMarkdownFiles(const std::filesystem::path& dir);

// PLAN_*.md under .aiknowsys/ and .aiknowsys/plans/, sorted.
std::vector<std::filesystem::path> ListPlanFiles(const std::filesystem::path& target);

// Path of `file` relative to .aiknowsys/, generic separators.
std::string RelativeToKnowledgeDir(const std::filesystem::path& target, const std::filesystem::path& file);

} // namespace aiknowsys::markdown
