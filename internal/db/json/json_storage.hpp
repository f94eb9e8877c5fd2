#pragma once

#include <filesystem>

#include "internal/db/api/storage_adapter.hpp"

namespace aiknowsys::db::json {

/*
  Flat-file index: .aiknowsys/context-index.json

  Holds metadata only. Queries filter the in-memory copy; Search() and
  include_content re-read the markdown files themselves. No locking: two
  concurrent rebuilds race and the last writer wins, but the atomic rename
  keeps the file itself well-formed.
*/
class JsonStorage final : public StorageAdapter {
 public:
  JsonStorage() = default;

  void Init(const std::filesystem::path& target_dir) override;

  aiknowsys::v1::PlanList       QueryPlans(const PlanFilters& filters) override;
  aiknowsys::v1::SessionList    QuerySessions(const SessionFilters& filters) override;
  aiknowsys::v1::SearchResponse Search(const std::string& query, model::SearchScope scope) override;
  aiknowsys::v1::RebuildReport  RebuildIndex() override;

  std::optional<std::filesystem::file_time_type> IndexTimestamp() const override;

  void Close() override {
  }

  std::string Name() const override {
    return "json";
  }

  const aiknowsys::v1::ContextIndex& Index() const {
    return index_;
  }

 private:
  void        RequireInit(const char* method) const;
  void        Save();
  std::string ReadContent(const std::string& rel) const;

  std::filesystem::path      target_dir_;
  aiknowsys::v1::ContextIndex index_;
  bool                        initialized_ = false;
};

} // namespace aiknowsys::db::json
