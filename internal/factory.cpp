#include "factory.hpp"

#include <string>
#include <system_error>

#include "internal/db/json/json_storage.hpp"
#include "internal/db/sqlite/sqlite_storage.hpp"
#include "internal/locator/database_locator.hpp"
#include "internal/markdown/layout.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace aiknowsys::factory {

namespace fs = std::filesystem;

using observability::PathField;
using observability::StringField;

namespace {

constexpr std::string_view ToString(RebuildPolicy policy) {
  switch (policy) {
    case RebuildPolicy::kAlways:
      return "always";
    case RebuildPolicy::kNever:
      return "never";
    case RebuildPolicy::kIfStale:
    default:
      return "if_stale";
  }
}

std::optional<fs::file_time_type> NewestMarkdown(const fs::path& dir) {
  std::optional<fs::file_time_type> newest;

  std::error_code ec;
  fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
  if (ec) return newest;

  fs::recursive_directory_iterator end;
  for (; it != end; it.increment(ec)) {
    if (ec) break;
    if (!it->is_regular_file(ec) || it->path().extension() != ".md") continue;
    const auto t = it->last_write_time(ec);
    if (ec) continue;
    if (!newest || t > *newest) newest = t;
  }
  return newest;
}

template <typename Records>
bool MissingSource(const fs::path& knowledge_dir, const Records& records) {
  std::error_code ec;
  for (const auto& record : records) {
    if (record.file().empty()) continue;
    if (!fs::exists(knowledge_dir / record.file(), ec)) {
      AIKNOWSYS_LOG_DEBUG("indexed file is gone", {StringField("file", record.file())});
      return true;
    }
  }
  return false;
}

void ApplyRebuildPolicy(db::StorageAdapter& storage, const fs::path& target_dir, RebuildPolicy policy) {
  if (policy == RebuildPolicy::kNever) return;
  if (policy == RebuildPolicy::kIfStale && !IsStale(target_dir, storage)) return;

  observability::SpanScope span("storage.rebuild");
  span.SetAttribute("adapter", storage.Name());

  AIKNOWSYS_LOG_INFO("rebuilding index", {StringField("adapter", storage.Name()), StringField("policy", ToString(policy))});
  aiknowsys::v1::RebuildReport report;
  try {
    report = storage.RebuildIndex();
  } catch (const std::exception& e) {
    span.MarkFailed(e.what());
    throw;
  }
  for (const auto& error : report.errors()) {
    AIKNOWSYS_LOG_WARN("skipped file during rebuild", {StringField("error", error)});
  }
  span.SetAttribute("errors", static_cast<std::int64_t>(report.errors_size()));
}

} // namespace

std::optional<AdapterKind> ParseAdapterKind(std::string_view text) {
  if (text.empty() || text == "auto") return std::nullopt;
  if (text == "json") return AdapterKind::kJson;
  if (text == "sqlite") return AdapterKind::kSqlite;
  throw util::ValidationError("Invalid storage adapter: " + std::string(text) + " (expected json or sqlite)");
}

RebuildPolicy ParseRebuildPolicy(std::string_view text) {
  if (text.empty() || text == "if_stale") return RebuildPolicy::kIfStale;
  if (text == "always") return RebuildPolicy::kAlways;
  if (text == "never") return RebuildPolicy::kNever;
  throw util::ValidationError("Invalid rebuild policy: " + std::string(text) + " (expected always, if_stale or never)");
}

StorageOptions StorageOptionsFromConfig(const aiknowsys::runtime::config::RuntimeConfig& config) {
  StorageOptions options;
  options.adapter = ParseAdapterKind(config.storage().adapter());
  options.rebuild = ParseRebuildPolicy(config.storage().rebuild());
  return options;
}

AdapterKind SelectAdapter(const fs::path& target_dir, const StorageOptions& options) {
  if (options.adapter) return *options.adapter;

  std::error_code ec;
  return fs::exists(locator::ResolveDatabasePath(target_dir), ec) ? AdapterKind::kSqlite : AdapterKind::kJson;
}

bool IsStale(const fs::path& target_dir, db::StorageAdapter& adapter) {
  const auto indexed = adapter.IndexTimestamp();
  if (!indexed) return true;

  const auto knowledge = markdown::KnowledgeDir(target_dir);
  const auto newest    = NewestMarkdown(knowledge);
  if (newest && *newest > *indexed) return true;

  // a deleted source leaves no newer mtime behind
  return MissingSource(knowledge, adapter.QueryPlans({}).plans()) || MissingSource(knowledge, adapter.QuerySessions({}).sessions());
}

std::unique_ptr<db::StorageAdapter> CreateStorage(const fs::path& target_dir, const StorageOptions& options) {
  std::unique_ptr<db::StorageAdapter> storage;
  switch (SelectAdapter(target_dir, options)) {
    case AdapterKind::kSqlite:
      storage = std::make_unique<db::sqlite::SqliteStorage>();
      break;
    case AdapterKind::kJson:
    default:
      storage = std::make_unique<db::json::JsonStorage>();
      break;
  }

  storage->Init(target_dir);
  ApplyRebuildPolicy(*storage, target_dir, options.rebuild);

  AIKNOWSYS_LOG_DEBUG("storage ready", {StringField("adapter", storage->Name()), PathField("target", target_dir)});
  return storage;
}

ScopedStorage::ScopedStorage(std::unique_ptr<db::StorageAdapter> storage) : storage_(std::move(storage)) {
}

ScopedStorage::~ScopedStorage() {
  if (closed_ || !storage_) return;
  try {
    storage_->Close();
  } catch (const std::exception& e) {
    AIKNOWSYS_LOG_WARN("failed to close storage", {StringField("adapter", storage_->Name()), StringField("error", e.what())});
  }
}

void ScopedStorage::Close() {
  if (closed_ || !storage_) return;
  closed_ = true;
  storage_->Close();
}

} // namespace aiknowsys::factory
