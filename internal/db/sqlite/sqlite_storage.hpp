#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/storage_adapter.hpp"
#include "project_record.hpp"
#include "internal/locator/database_locator.hpp"
#include "sqlite_db.hpp"

namespace aiknowsys::db::sqlite {

/*
  SQLite-backed knowledge base.

  One database may hold several projects; every query is scoped to the
  project this adapter was initialized for. Queries return metadata only
  unless the filter asks for content.

  The Insert* helpers are upserts for bulk loading and migration; normal
  reads never call them.
*/
class SqliteStorage final : public StorageAdapter {
 public:
  // Database path and project identity come from the locator at Init().
  SqliteStorage() = default;

  explicit SqliteStorage(locator::DatabaseConfig config);
  ~SqliteStorage() override;

  void Init(const std::filesystem::path& target_dir) override;

  aiknowsys::v1::PlanList       QueryPlans(const PlanFilters& filters) override;
  aiknowsys::v1::SessionList    QuerySessions(const SessionFilters& filters) override;
  aiknowsys::v1::SearchResponse Search(const std::string& query, model::SearchScope scope) override;
  aiknowsys::v1::RebuildReport  RebuildIndex() override;

  std::optional<std::filesystem::file_time_type> IndexTimestamp() const override {
    return std::nullopt;
  }

  void Close() override;

  std::string Name() const override {
    return "sqlite";
  }

  // FTS5 MATCH over every term (AND), ordered by bm25.
  aiknowsys::v1::SearchResponse FullTextSearch(const std::string& query, model::SearchScope scope, int limit = 20);

  aiknowsys::v1::StorageStats GetStats();

  Result InsertProject(const ProjectRecord& project);
  Result InsertPlan(const aiknowsys::v1::Plan& plan);
  Result InsertSession(const aiknowsys::v1::Session& session);
  Result InsertPattern(const aiknowsys::v1::LearnedPattern& pattern);

  const std::string& ProjectId() const {
    return config_.project_id;
  }

  const std::filesystem::path& DatabasePath() const {
    return config_.db_path;
  }

 private:
  SqliteDB& Db(const char* method);
  Result    Translate(int rc) const;

  locator::DatabaseConfig   config_;
  std::filesystem::path     target_dir_;
  std::shared_ptr<SqliteDB> db_;
};

} // namespace aiknowsys::db::sqlite
