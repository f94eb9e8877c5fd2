#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "aiknowsys/v1.hpp"
#include "internal/db/api/filters.hpp"
#include "internal/model/search_scope.hpp"

namespace aiknowsys::db {

/*
  Storage adapter contract shared by the JSON index and the SQLite database.

  The markdown tree is the source of truth; an adapter is a derived view that
  RebuildIndex() can always reproduce from it.

  Lifecycle: Init() -> any number of queries -> Close(). Instances are meant
  to serve one logical operation (see factory::ScopedStorage).

  Every method of this base throws util::NotImplemented; a backend overrides
  all of them.
*/
class StorageAdapter {
 public:
  virtual ~StorageAdapter() = default;

  // Opens/creates the backing store for the knowledge base under target_dir.
  // Throws util::StorageUnavailable when that is impossible.
  virtual void Init(const std::filesystem::path& target_dir);

  virtual aiknowsys::v1::PlanList    QueryPlans(const PlanFilters& filters);
  virtual aiknowsys::v1::SessionList QuerySessions(const SessionFilters& filters);

  // Case-insensitive literal match; results sorted by relevance, descending.
  virtual aiknowsys::v1::SearchResponse Search(const std::string& query, model::SearchScope scope);

  // Full rescan of the markdown tree. Per-file failures land in errors[].
  virtual aiknowsys::v1::RebuildReport RebuildIndex();

  // When the derived data was last rebuilt; nullopt when unknown.
  virtual std::optional<std::filesystem::file_time_type> IndexTimestamp() const;

  virtual void Close();

  virtual std::string Name() const;
};

} // namespace aiknowsys::db
