#include "internal/locator/database_locator.hpp"

#include <pwd.h>
#include <unistd.h>

#include <cstdlib>
#include <system_error>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/strings.hpp"

namespace aiknowsys::locator {

namespace fs = std::filesystem;

using observability::PathField;
using observability::StringField;

namespace {

fs::path HomeDirectory() {
  if (const char* home = std::getenv("HOME"); home && *home) {
    return home;
  }
  if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) {
    return pw->pw_dir;
  }
  return fs::temp_directory_path();
}

fs::path NormalizedTarget(const fs::path& target_dir) {
  std::error_code ec;
  auto            abs = fs::absolute(target_dir.empty() ? fs::path(".") : target_dir, ec);
  return (ec ? target_dir : abs).lexically_normal();
}

std::string Basename(const fs::path& target_dir) {
  auto normalized = NormalizedTarget(target_dir);
  auto name       = normalized.filename().string();
  if (name.empty()) name = normalized.parent_path().filename().string();
  return name;
}

// [remote "origin"] url of the repository at target_dir, if any.
std::optional<std::string> OriginRepository(const fs::path& target_dir) {
  const auto      config_path = target_dir / ".git" / "config";
  std::error_code ec;
  if (!fs::is_regular_file(config_path, ec)) {
    return std::nullopt;
  }
  try {
    return ParseOriginRepository(util::ReadTextFile(config_path));
  } catch (const std::exception& e) {
    AIKNOWSYS_LOG_WARN("git config unreadable", {PathField("path", config_path), StringField("error", e.what())});
    return std::nullopt;
  }
}

} // namespace

std::optional<std::string> ParseOriginRepository(std::string_view git_config) {
  bool in_origin = false;
  for (const auto& raw : util::SplitLines(git_config)) {
    const auto line = util::Trim(raw);
    if (line.empty() || line[0] == '#' || line[0] == ';') continue;

    if (line.front() == '[') {
      in_origin = line == "[remote \"origin\"]";
      continue;
    }
    if (!in_origin) continue;

    const auto eq = line.find('=');
    if (eq == std::string::npos || util::Trim(std::string_view(line).substr(0, eq)) != "url") continue;

    auto url = util::Trim(std::string_view(line).substr(eq + 1));
    while (!url.empty() && url.back() == '/') url.pop_back();
    if (util::EndsWith(url, ".git")) url.resize(url.size() - 4);

    // git@host:owner/repo, ssh://git@host/owner/repo, https://host/owner/repo
    const auto repo_sep = url.find_last_of('/');
    if (repo_sep == std::string::npos || repo_sep + 1 >= url.size()) return std::nullopt;
    const auto owner_sep = url.find_last_of("/:", repo_sep - 1);
    if (owner_sep == std::string::npos || repo_sep == 0) return std::nullopt;

    auto owner = url.substr(owner_sep + 1, repo_sep - owner_sep - 1);
    auto repo  = url.substr(repo_sep + 1);
    if (owner.empty() || repo.empty()) return std::nullopt;
    return owner + "/" + repo;
  }
  return std::nullopt;
}

std::string SanitizeProjectId(std::string_view raw) {
  return util::Slugify(raw, 128);
}

fs::path ResolveDatabasePath(const fs::path& target_dir) {
  if (const char* env = std::getenv(kDatabasePathEnv); env && *env) {
    return fs::path(env).lexically_normal();
  }

  const auto target = NormalizedTarget(target_dir);
  if (auto config = config::ConfigLoader::LoadProjectConfig(target / kProjectConfigFile); config && !config->database_path().empty()) {
    fs::path path = config->database_path();
    return (path.is_absolute() ? path : target / path).lexically_normal();
  }

  return HomeDirectory() / ".aiknowsys" / "knowledge.db";
}

std::string GetProjectId(const fs::path& target_dir) {
  const auto target = NormalizedTarget(target_dir);

  if (auto config = config::ConfigLoader::LoadProjectConfig(target / kProjectConfigFile); config && !config->project_id().empty()) {
    auto id = SanitizeProjectId(config->project_id());
    if (!id.empty()) return id;
  }

  if (auto repo = OriginRepository(target)) {
    auto id = SanitizeProjectId(*repo);
    if (!id.empty()) return id;
  }

  auto id = SanitizeProjectId(Basename(target));
  return id.empty() ? "default" : id;
}

std::string GetProjectName(const fs::path& target_dir) {
  const auto target = NormalizedTarget(target_dir);
  if (auto config = config::ConfigLoader::LoadProjectConfig(target / kProjectConfigFile); config && !config->project_name().empty()) {
    return config->project_name();
  }
  auto name = Basename(target);
  return name.empty() ? "default" : name;
}

DatabaseConfig GetDatabaseConfig(const fs::path& target_dir) {
  DatabaseConfig config;
  config.db_path      = ResolveDatabasePath(target_dir);
  config.project_id   = GetProjectId(target_dir);
  config.project_name = GetProjectName(target_dir);

  std::error_code ec;
  if (config.db_path.has_parent_path()) {
    fs::create_directories(config.db_path.parent_path(), ec);
    if (ec) {
      // opening the database reports the real failure
      AIKNOWSYS_LOG_WARN("cannot create database directory", {PathField("path", config.db_path.parent_path()), StringField("error", ec.message())});
    }
  }
  return config;
}

} // namespace aiknowsys::locator
