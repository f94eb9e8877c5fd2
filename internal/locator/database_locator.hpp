#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace aiknowsys::locator {

inline constexpr const char* kDatabasePathEnv  = "AIKNOWSYS_DB_PATH";
inline constexpr const char* kProjectConfigFile = ".aiknowsys.config";

struct DatabaseConfig {
  std::filesystem::path db_path;
  std::string           project_id;
  std::string           project_name;
};

/*
  Where the SQLite database lives, first match wins:

    1. $AIKNOWSYS_DB_PATH
    2. "databasePath" in <target>/.aiknowsys.config (relative to target)
    3. $HOME/.aiknowsys/knowledge.db

  No side effects. Never throws on missing/malformed config.
*/
std::filesystem::path ResolveDatabasePath(const std::filesystem::path& target_dir);

// ResolveDatabasePath + project identity; creates the database's parent directory.
DatabaseConfig GetDatabaseConfig(const std::filesystem::path& target_dir);

// "projectId" override, else git origin "owner/repo", else directory basename; sanitized.
std::string GetProjectId(const std::filesystem::path& target_dir);

std::string GetProjectName(const std::filesystem::path& target_dir);

// "owner/repo" of [remote "origin"] in a .git/config text.
std::optional<std::string> ParseOriginRepository(std::string_view git_config);

// Lowercase; runs outside [a-z0-9] collapse to '-'; hyphens trimmed.
std::string SanitizeProjectId(std::string_view raw);

} // namespace aiknowsys::locator
