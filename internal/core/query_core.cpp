#include "query_core.hpp"

#include <algorithm>

#include "internal/db/api/filters.hpp"
#include "internal/markdown/source_scanner.hpp"
#include "internal/model/plan_status.hpp"
#include "internal/model/search_scope.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace aiknowsys::core {

namespace fs = std::filesystem;

using namespace aiknowsys::v1;
using observability::IntField;
using observability::PathField;
using observability::StringField;

namespace {

void ValidateDate(const std::optional<std::string>& value, const char* name) {
  if (value && !util::IsValidDate(*value)) {
    throw util::ValidationError(std::string("Invalid ") + name + ": " + *value + " (expected YYYY-MM-DD)");
  }
}

model::PlanStatus ValidateStatus(const std::string& value) {
  const auto status = model::ParsePlanStatus(util::ToUpper(util::Trim(value)));
  if (!status) {
    throw util::ValidationError("Invalid status: " + value + " (expected ACTIVE, PAUSED, PLANNED, COMPLETE or CANCELLED)");
  }
  return *status;
}

model::SearchScope ValidateScope(const std::string& value) {
  const auto scope = model::ParseSearchScope(value.empty() ? std::string_view("all") : std::string_view(value));
  if (!scope) {
    throw util::ValidationError("Invalid scope: " + value + " (expected all, plans, sessions or learned)");
  }
  return *scope;
}

// Opens one adapter for the call, runs `query` against it and closes it again.
template <typename Query>
auto WithStorage(observability::SpanScope& span, const fs::path& target, const factory::StorageOptions& options, Query&& query) {
  try {
    factory::ScopedStorage storage(factory::CreateStorage(target, options));
    auto                   result = query(*storage);
    storage.Close();
    span.SetAttribute("count", static_cast<std::int64_t>(result.count()));
    return result;
  } catch (const std::exception& e) {
    span.MarkFailed(e.what());
    throw;
  }
}

} // namespace

fs::path ResolveTargetDir(const fs::path& dir) {
  return fs::absolute(dir.empty() ? fs::current_path() : dir).lexically_normal();
}

PlanList QueryPlansCore(const QueryPlansOptions& options) {
  db::PlanFilters filters;
  if (options.status) filters.status = ValidateStatus(*options.status);
  ValidateDate(options.updated_after, "updated_after");
  ValidateDate(options.updated_before, "updated_before");

  filters.author          = options.author;
  filters.topic           = options.topic;
  filters.updated_after   = options.updated_after;
  filters.updated_before  = options.updated_before;
  filters.include_content = options.include_content;

  observability::SpanScope span("core.query_plans");
  const auto               target = ResolveTargetDir(options.dir);

  auto result = WithStorage(span, target, options.storage, [&](db::StorageAdapter& storage) { return storage.QueryPlans(filters); });
  AIKNOWSYS_LOG_DEBUG("queried plans", {PathField("target", target), IntField("count", result.count())});
  return result;
}

SessionList QuerySessionsCore(const QuerySessionsOptions& options) {
  ValidateDate(options.date, "date");
  ValidateDate(options.date_after, "date_after");
  ValidateDate(options.date_before, "date_before");
  if (options.days && *options.days < 0) {
    throw util::ValidationError("Invalid days: " + std::to_string(*options.days) + " (must be non-negative)");
  }

  db::SessionFilters filters;
  filters.date        = options.date;
  filters.date_before = options.date_before;
  filters.topic       = options.topic;
  if (options.plan) filters.plan = markdown::NormalizePlanReference(*options.plan);
  filters.include_content = options.include_content;

  // applied first so an explicit date_after overrides it
  if (options.days) filters.date_after = util::DateDaysBefore(util::Now(), *options.days);
  if (options.date_after) filters.date_after = options.date_after;

  observability::SpanScope span("core.query_sessions");
  const auto               target = ResolveTargetDir(options.dir);

  auto result = WithStorage(span, target, options.storage, [&](db::StorageAdapter& storage) { return storage.QuerySessions(filters); });

  auto* sessions = result.mutable_sessions();
  std::stable_sort(sessions->begin(), sessions->end(), [](const Session& a, const Session& b) { return a.date() > b.date(); });

  AIKNOWSYS_LOG_DEBUG("queried sessions", {PathField("target", target), IntField("count", result.count())});
  return result;
}

SearchResponse SearchContextCore(const SearchContextOptions& options) {
  const auto query = util::Trim(options.query);
  if (query.empty()) {
    throw util::ValidationError("Search query cannot be empty");
  }
  const auto scope = ValidateScope(options.scope);

  observability::SpanScope span("core.search_context");
  span.SetAttribute("scope", model::ToString(scope));
  const auto target = ResolveTargetDir(options.dir);

  auto result = WithStorage(span, target, options.storage, [&](db::StorageAdapter& storage) { return storage.Search(query, scope); });
  AIKNOWSYS_LOG_DEBUG("searched context",
                      {PathField("target", target), StringField("query", query), IntField("count", result.count())});
  return result;
}

} // namespace aiknowsys::core
