#include "internal/db/json/json_storage.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <system_error>

#include "internal/db/api/matching.hpp"
#include "internal/markdown/layout.hpp"
#include "internal/markdown/source_scanner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/time.hpp"

namespace aiknowsys::db::json {

namespace fs = std::filesystem;

using aiknowsys::v1::ContextIndex;
using aiknowsys::v1::Plan;
using aiknowsys::v1::PlanList;
using aiknowsys::v1::RebuildReport;
using aiknowsys::v1::SearchResponse;
using aiknowsys::v1::Session;
using aiknowsys::v1::SessionList;
using observability::PathField;
using observability::StringField;

namespace {

constexpr int kIndexVersion = 1;

ContextIndex EmptyIndex() {
  ContextIndex index;
  index.set_version(kIndexVersion);
  return index;
}

void SearchFiles(const fs::path& target, const std::vector<fs::path>& files, const std::string& query, model::SearchScope kind, SearchResponse& response) {
  for (const auto& file : files) {
    std::string text;
    try {
      // frontmatter is not searched
      text = markdown::LoadBody(file);
    } catch (const std::exception& e) {
      AIKNOWSYS_LOG_WARN("search skipped unreadable file", {PathField("file", file), StringField("error", e.what())});
      continue;
    }
    auto result = ScoreMatch(markdown::RelativeToKnowledgeDir(target, file), text, query, model::ResultType(kind));
    if (result) {
      *response.add_results() = std::move(*result);
    }
  }
}

} // namespace

void JsonStorage::Init(const fs::path& target_dir) {
  target_dir_ = fs::absolute(target_dir).lexically_normal();

  std::error_code ec;
  fs::create_directories(markdown::KnowledgeDir(target_dir_), ec);
  if (ec) {
    throw util::StorageUnavailable("cannot create " + markdown::KnowledgeDir(target_dir_).string() + ": " + ec.message());
  }

  index_             = EmptyIndex();
  const auto path    = markdown::IndexPath(target_dir_);
  if (fs::exists(path, ec)) {
    std::string json;
    try {
      json = util::ReadTextFile(path);
    } catch (const std::exception& e) {
      throw util::StorageUnavailable(e.what());
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    ContextIndex loaded;
    auto         status = google::protobuf::util::JsonStringToMessage(json, &loaded, options);
    if (status.ok()) {
      index_ = std::move(loaded);
    } else {
      // derived data; the next rebuild restores it
      AIKNOWSYS_LOG_WARN("context index unreadable, starting empty", {PathField("path", path), StringField("error", std::string(status.message()))});
    }
  }

  initialized_ = true;
}

void JsonStorage::RequireInit(const char* method) const {
  if (!initialized_) {
    throw util::StorageUnavailable(std::string("JsonStorage::") + method + "() called before Init()");
  }
}

std::optional<fs::file_time_type> JsonStorage::IndexTimestamp() const {
  RequireInit("IndexTimestamp");
  std::error_code ec;
  auto            ts = fs::last_write_time(markdown::IndexPath(target_dir_), ec);
  if (ec) {
    return std::nullopt;
  }
  return ts;
}

void JsonStorage::Save() {
  std::string json;

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = false;
  options.always_print_primitive_fields = true;

  auto status = google::protobuf::util::MessageToJsonString(index_, &json, options);
  if (!status.ok()) {
    throw util::StorageUnavailable("cannot serialize context index: " + std::string(status.message()));
  }

  try {
    util::WriteTextFileAtomic(markdown::IndexPath(target_dir_), json);
  } catch (const std::exception& e) {
    throw util::StorageUnavailable(e.what());
  }
}

RebuildReport JsonStorage::RebuildIndex() {
  RequireInit("RebuildIndex");

  markdown::ScanOptions options;
  options.include_content = false;
  auto scan               = markdown::ScanKnowledgeBase(target_dir_, options);

  ContextIndex index = EmptyIndex();
  index.set_updated(util::FormatTimestamp(util::Now()));
  for (auto& plan : scan.plans) *index.add_plans() = std::move(plan);
  for (auto& session : scan.sessions) *index.add_sessions() = std::move(session);
  for (auto& learned : scan.learned) *index.add_learned() = std::move(learned);

  index_ = std::move(index);
  Save();

  RebuildReport report;
  report.set_plans_indexed(index_.plans_size());
  report.set_sessions_indexed(index_.sessions_size());
  report.set_learned_indexed(index_.learned_size());
  for (auto& error : scan.errors) *report.add_errors() = std::move(error);

  AIKNOWSYS_LOG_INFO("context index rebuilt",
                     {PathField("path", markdown::IndexPath(target_dir_)), observability::IntField("plans", report.plans_indexed()),
                      observability::IntField("sessions", report.sessions_indexed()), observability::IntField("learned", report.learned_indexed()),
                      observability::IntField("errors", report.errors_size())});
  return report;
}

std::string JsonStorage::ReadContent(const std::string& rel) const {
  try {
    return markdown::LoadBody(markdown::KnowledgeDir(target_dir_) / rel);
  } catch (const std::exception& e) {
    AIKNOWSYS_LOG_WARN("content unavailable", {StringField("file", rel), StringField("error", e.what())});
    return {};
  }
}

PlanList JsonStorage::QueryPlans(const PlanFilters& filters) {
  RequireInit("QueryPlans");

  PlanList list;
  for (const auto& plan : index_.plans()) {
    if (!Matches(plan, filters)) continue;
    auto* out = list.add_plans();
    *out      = plan;
    if (filters.include_content) out->set_content(ReadContent(plan.file()));
  }
  // same order as the SQLite backend
  std::stable_sort(list.mutable_plans()->begin(), list.mutable_plans()->end(), [](const Plan& a, const Plan& b) {
    if (a.updated() != b.updated()) return a.updated() > b.updated();
    return a.id() < b.id();
  });
  list.set_count(list.plans_size());
  return list;
}

SessionList JsonStorage::QuerySessions(const SessionFilters& filters) {
  RequireInit("QuerySessions");

  SessionList list;
  for (const auto& session : index_.sessions()) {
    if (!Matches(session, filters)) continue;
    auto* out = list.add_sessions();
    *out      = session;
    if (filters.include_content) out->set_content(ReadContent(session.file()));
  }
  std::stable_sort(list.mutable_sessions()->begin(), list.mutable_sessions()->end(), [](const Session& a, const Session& b) {
    if (a.date() != b.date()) return a.date() > b.date();
    return a.id() < b.id();
  });
  list.set_count(list.sessions_size());
  return list;
}

SearchResponse JsonStorage::Search(const std::string& query, model::SearchScope scope) {
  RequireInit("Search");

  SearchResponse response;
  response.set_query(query);
  response.set_scope(std::string(model::ToString(scope)));

  using model::SearchScope;
  if (model::Includes(scope, SearchScope::kPlans)) {
    SearchFiles(target_dir_, markdown::ListPlanFiles(target_dir_), query, SearchScope::kPlans, response);
  }
  if (model::Includes(scope, SearchScope::kSessions)) {
    SearchFiles(target_dir_, markdown::ListMarkdownFiles(markdown::SessionsDir(target_dir_)), query, SearchScope::kSessions, response);
  }
  if (model::Includes(scope, SearchScope::kLearned)) {
    SearchFiles(target_dir_, markdown::ListMarkdownFiles(markdown::LearnedDir(target_dir_)), query, SearchScope::kLearned, response);
  }

  SortByRelevance(response.mutable_results());
  response.set_count(response.results_size());
  return response;
}

} // namespace aiknowsys::db::json
