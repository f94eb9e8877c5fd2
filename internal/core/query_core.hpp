#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "aiknowsys/v1.hpp"
#include "internal/factory.hpp"

namespace aiknowsys::core {

/*
  Query/search facade.

  Every entry point validates its options and throws util::ValidationError
  before touching storage, then opens exactly one adapter for the call and
  closes it on every exit path. `dir` is the project root (the directory
  holding .aiknowsys/); empty means the current directory.
*/

struct QueryPlansOptions {
  std::optional<std::string> status; // ACTIVE | PAUSED | PLANNED | COMPLETE | CANCELLED
  std::optional<std::string> author;
  std::optional<std::string> topic;
  std::optional<std::string> updated_after;  // YYYY-MM-DD, inclusive
  std::optional<std::string> updated_before; // YYYY-MM-DD, exclusive
  bool                       include_content = false;

  std::filesystem::path   dir;
  factory::StorageOptions storage;
};

struct QuerySessionsOptions {
  std::optional<std::string> date;
  std::optional<std::string> date_after;
  std::optional<std::string> date_before;
  std::optional<std::string> topic;
  std::optional<std::string> plan;

  // Sessions of the last N days; an explicit date_after takes precedence.
  std::optional<int> days;
  bool               include_content = false;

  std::filesystem::path   dir;
  factory::StorageOptions storage;
};

struct SearchContextOptions {
  std::string query;
  std::string scope = "all";

  std::filesystem::path   dir;
  factory::StorageOptions storage;
};

aiknowsys::v1::PlanList       QueryPlansCore(const QueryPlansOptions& options);
aiknowsys::v1::SessionList    QuerySessionsCore(const QuerySessionsOptions& options);
aiknowsys::v1::SearchResponse SearchContextCore(const SearchContextOptions& options);

// Absolute, normalized form of `dir`; the current directory when empty.
std::filesystem::path ResolveTargetDir(const std::filesystem::path& dir);

} // namespace aiknowsys::core
