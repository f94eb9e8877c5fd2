#include "internal/db/api/storage_adapter.hpp"

#include "internal/util/errors.hpp"

namespace aiknowsys::db {

namespace {

[[noreturn]] void Unimplemented(const char* method) {
  throw util::NotImplemented(std::string("StorageAdapter::") + method + "() must be implemented by a backend");
}

} // namespace

void StorageAdapter::Init(const std::filesystem::path&) {
  Unimplemented("Init");
}

aiknowsys::v1::PlanList StorageAdapter::QueryPlans(const PlanFilters&) {
  Unimplemented("QueryPlans");
}

aiknowsys::v1::SessionList StorageAdapter::QuerySessions(const SessionFilters&) {
  Unimplemented("QuerySessions");
}

aiknowsys::v1::SearchResponse StorageAdapter::Search(const std::string&, model::SearchScope) {
  Unimplemented("Search");
}

aiknowsys::v1::RebuildReport StorageAdapter::RebuildIndex() {
  Unimplemented("RebuildIndex");
}

std::optional<std::filesystem::file_time_type> StorageAdapter::IndexTimestamp() const {
  Unimplemented("IndexTimestamp");
}

void StorageAdapter::Close() {
  Unimplemented("Close");
}

std::string StorageAdapter::Name() const {
  Unimplemented("Name");
}

} // namespace aiknowsys::db
