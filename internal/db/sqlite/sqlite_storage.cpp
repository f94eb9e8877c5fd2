#include "sqlite_storage.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "internal/db/api/matching.hpp"
#include "internal/markdown/source_scanner.hpp"
#include "internal/model/plan_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"
#include "schema.hpp"

namespace aiknowsys::db::sqlite {

namespace fs = std::filesystem;

using aiknowsys::v1::LearnedPattern;
using aiknowsys::v1::Plan;
using aiknowsys::v1::PlanList;
using aiknowsys::v1::RebuildReport;
using aiknowsys::v1::SearchResponse;
using aiknowsys::v1::SearchResult;
using aiknowsys::v1::Session;
using aiknowsys::v1::SessionList;
using aiknowsys::v1::StorageStats;
using google::protobuf::RepeatedPtrField;
using observability::IntField;
using observability::PathField;
using observability::StringField;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindTextOrNull(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

static void BindAll(sqlite3_stmt* st, const std::vector<std::string>& params) {
  for (std::size_t i = 0; i < params.size(); ++i) {
    BindText(st, static_cast<int>(i + 1), params[i]);
  }
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static void CheckDone(sqlite3* db, int rc, const char* what) {
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

static std::string ToJsonArray(const RepeatedPtrField<std::string>& values) {
  google::protobuf::ListValue list;
  for (const auto& v : values) {
    list.add_values()->set_string_value(v);
  }
  std::string json;
  if (!google::protobuf::util::MessageToJsonString(list, &json).ok()) {
    return "[]";
  }
  return json;
}

static void FromJsonArray(const std::string& json, RepeatedPtrField<std::string>* out) {
  if (json.empty()) return;
  google::protobuf::ListValue list;
  if (!google::protobuf::util::JsonStringToMessage(json, &list).ok()) {
    AIKNOWSYS_LOG_WARN("ignoring malformed JSON list column", {StringField("value", json)});
    return;
  }
  for (const auto& v : list.values()) {
    if (v.kind_case() == google::protobuf::Value::kStringValue) *out->Add() = v.string_value();
  }
}

// '%needle%' with LIKE wildcards escaped by '\'
static std::string LikePattern(const std::string& needle) {
  std::string pattern = "%";
  for (char c : needle) {
    if (c == '%' || c == '_' || c == '\\') pattern.push_back('\\');
    pattern.push_back(c);
  }
  pattern.push_back('%');
  return pattern;
}

// Each term quoted so user input cannot form FTS5 syntax; terms are ANDed.
static std::string FtsQuery(const std::string& query) {
  std::istringstream in(query);
  std::string        word;
  std::string        out;
  while (in >> word) {
    word.erase(std::remove(word.begin(), word.end(), '"'), word.end());
    if (word.empty()) continue;
    if (!out.empty()) out += ' ';
    out += '"' + word + '"';
  }
  return out;
}

SqliteStorage::SqliteStorage(locator::DatabaseConfig config) : config_(std::move(config)) {
}

SqliteStorage::~SqliteStorage() = default;

SqliteDB& SqliteStorage::Db(const char* method) {
  if (!db_) {
    throw util::StorageUnavailable(std::string("SqliteStorage::") + method + "() called without an open database");
  }
  return *db_;
}

Result SqliteStorage::Translate(int rc) const {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  sqlite3* db = db_->Handle();
  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------------

void SqliteStorage::Init(const fs::path& target_dir) {
  auto target = fs::absolute(target_dir).lexically_normal();

  if (config_.db_path.empty()) {
    const auto ext = target.extension();
    if (ext == ".db" || ext == ".sqlite") {
      // a database file was named directly; its directory is the project
      target_dir_     = target.parent_path();
      config_.db_path = target;
    } else {
      target_dir_ = target;
      config_     = locator::GetDatabaseConfig(target_dir_);
    }
  } else {
    target_dir_ = target;
  }
  if (config_.project_id.empty()) config_.project_id = locator::GetProjectId(target_dir_);
  if (config_.project_name.empty()) config_.project_name = locator::GetProjectName(target_dir_);

  std::error_code ec;
  if (config_.db_path.has_parent_path()) fs::create_directories(config_.db_path.parent_path(), ec);

  try {
    db_ = std::make_shared<SqliteDB>(config_.db_path.string());
    ApplySchema(*db_);
  } catch (const std::exception& e) {
    db_.reset();
    throw util::StorageUnavailable("cannot open database " + config_.db_path.string() + ": " + e.what());
  }

  ProjectRecord project;
  project.id         = config_.project_id;
  project.name       = config_.project_name;
  project.path       = target_dir_.string();
  project.created_at = util::FormatTimestamp(util::Now());
  project.updated_at = project.created_at;
  if (auto r = InsertProject(project); !r) {
    db_.reset();
    throw util::StorageUnavailable("cannot register project " + project.id + ": " + r.Describe());
  }

  AIKNOWSYS_LOG_DEBUG("sqlite storage opened", {PathField("db", config_.db_path), StringField("project", config_.project_id)});
}

void SqliteStorage::Close() {
  db_.reset();
}

// ------------------------------------------------------------------
// Upserts
// ------------------------------------------------------------------

Result SqliteStorage::InsertProject(const ProjectRecord& project) {
  auto& db = Db("InsertProject");
  if (project.id.empty()) return Result::Err(ErrorCode::InvalidArgument, "project id must not be empty");

  const auto now = util::FormatTimestamp(util::Now());
  auto       st  = db.Prepare(
      "INSERT INTO projects(id,name,path,tech_stack,created_at,updated_at) VALUES(?,?,?,?,?,?) "
      "ON CONFLICT(id) DO UPDATE SET name=excluded.name, path=excluded.path, tech_stack=excluded.tech_stack, updated_at=excluded.updated_at;");
  BindText(st.get(), 1, project.id);
  BindText(st.get(), 2, project.name.empty() ? project.id : project.name);
  BindTextOrNull(st.get(), 3, project.path);
  BindText(st.get(), 4, project.tech_stack.empty() ? "{}" : project.tech_stack);
  BindText(st.get(), 5, project.created_at.empty() ? now : project.created_at);
  BindText(st.get(), 6, project.updated_at.empty() ? now : project.updated_at);
  return Translate(sqlite3_step(st.get()));
}

Result SqliteStorage::InsertPlan(const Plan& plan) {
  auto& db = Db("InsertPlan");
  if (plan.id().empty()) return Result::Err(ErrorCode::InvalidArgument, "plan id must not be empty");
  if (!model::ParsePlanStatus(plan.status())) return Result::Err(ErrorCode::InvalidArgument, "invalid plan status '" + plan.status() + "'");

  const auto now     = util::FormatTimestamp(util::Now());
  const auto created = plan.created().empty() ? now : plan.created();
  const auto project = plan.project_id().empty() ? config_.project_id : plan.project_id();

  auto st = db.Prepare(
      "INSERT INTO plans(id,project_id,name,title,status,author,priority,type,description,topics,file,content,created_at,updated_at) "
      "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?) "
      "ON CONFLICT(id) DO UPDATE SET title=excluded.title, status=excluded.status, author=excluded.author, "
      "priority=excluded.priority, type=excluded.type, description=excluded.description, topics=excluded.topics, file=excluded.file, "
      "content=excluded.content, created_at=excluded.created_at, updated_at=excluded.updated_at;");
  BindText(st.get(), 1, project + ":" + plan.id());
  BindText(st.get(), 2, project);
  BindText(st.get(), 3, plan.id());
  BindText(st.get(), 4, plan.title().empty() ? plan.id() : plan.title());
  BindText(st.get(), 5, plan.status());
  BindText(st.get(), 6, plan.author().empty() ? "unknown" : plan.author());
  BindTextOrNull(st.get(), 7, plan.priority());
  BindTextOrNull(st.get(), 8, plan.type());
  BindTextOrNull(st.get(), 9, plan.description());
  BindText(st.get(), 10, ToJsonArray(plan.topics()));
  BindTextOrNull(st.get(), 11, plan.file());
  BindText(st.get(), 12, plan.content());
  BindText(st.get(), 13, created);
  BindText(st.get(), 14, plan.updated().empty() ? created : plan.updated());
  return Translate(sqlite3_step(st.get()));
}

Result SqliteStorage::InsertSession(const Session& session) {
  auto& db = Db("InsertSession");
  if (!util::IsValidDate(session.date())) return Result::Err(ErrorCode::InvalidArgument, "invalid session date '" + session.date() + "'");

  const auto project = session.project_id().empty() ? config_.project_id : session.project_id();
  const auto name    = session.id().empty() ? session.date() : session.id();
  const auto now     = util::FormatTimestamp(util::Now());

  auto st = db.Prepare(
      "INSERT INTO sessions(id,project_id,name,date,topic,plan_id,status,phases,topics,file,content,created_at,updated_at) "
      "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?) "
      "ON CONFLICT(id) DO UPDATE SET date=excluded.date, topic=excluded.topic, plan_id=excluded.plan_id, status=excluded.status, "
      "phases=excluded.phases, topics=excluded.topics, file=excluded.file, content=excluded.content, created_at=excluded.created_at, "
      "updated_at=excluded.updated_at;");
  BindText(st.get(), 1, project + ":" + name);
  BindText(st.get(), 2, project);
  BindText(st.get(), 3, name);
  BindText(st.get(), 4, session.date());
  BindText(st.get(), 5, session.topic().empty() ? "Session" : session.topic());
  BindTextOrNull(st.get(), 6, session.plan());
  BindTextOrNull(st.get(), 7, session.status());
  BindText(st.get(), 8, ToJsonArray(session.phases()));
  BindText(st.get(), 9, ToJsonArray(session.topics()));
  BindTextOrNull(st.get(), 10, session.file());
  BindText(st.get(), 11, session.content());
  BindText(st.get(), 12, session.created().empty() ? session.date() : session.created());
  BindText(st.get(), 13, session.updated().empty() ? now : session.updated());
  return Translate(sqlite3_step(st.get()));
}

Result SqliteStorage::InsertPattern(const LearnedPattern& pattern) {
  auto& db = Db("InsertPattern");
  if (pattern.id().empty()) return Result::Err(ErrorCode::InvalidArgument, "pattern id must not be empty");

  auto st = db.Prepare(
      "INSERT INTO patterns(project_id,slug,category,title,keywords,file,content,created_at) VALUES(?,?,?,?,?,?,?,?) "
      "ON CONFLICT(project_id, slug) DO UPDATE SET category=excluded.category, title=excluded.title, keywords=excluded.keywords, "
      "file=excluded.file, content=excluded.content, created_at=excluded.created_at;");
  BindText(st.get(), 1, config_.project_id);
  BindText(st.get(), 2, pattern.id());
  BindText(st.get(), 3, pattern.category().empty() ? "learned" : pattern.category());
  BindText(st.get(), 4, pattern.title().empty() ? pattern.id() : pattern.title());
  BindText(st.get(), 5, ToJsonArray(pattern.keywords()));
  BindTextOrNull(st.get(), 6, pattern.file());
  BindText(st.get(), 7, pattern.content());
  BindText(st.get(), 8, pattern.created().empty() ? util::FormatTimestamp(util::Now()) : pattern.created());
  return Translate(sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

PlanList SqliteStorage::QueryPlans(const PlanFilters& filters) {
  auto& db = Db("QueryPlans");

  std::string sql = "SELECT name,project_id,title,status,author,priority,type,description,topics,file,created_at,updated_at";
  if (filters.include_content) sql += ",content";
  sql += " FROM plans WHERE project_id = ?";

  std::vector<std::string> params = {config_.project_id};
  if (filters.status) {
    sql += " AND status = ?";
    params.emplace_back(model::ToString(*filters.status));
  }
  if (filters.author) {
    sql += " AND author = ?";
    params.push_back(*filters.author);
  }
  if (filters.topic) {
    sql += " AND (title LIKE ? ESCAPE '\\' OR topics LIKE ? ESCAPE '\\')";
    params.push_back(LikePattern(*filters.topic));
    params.push_back(LikePattern(*filters.topic));
  }
  if (filters.updated_after) {
    sql += " AND updated_at >= ?";
    params.push_back(*filters.updated_after);
  }
  if (filters.updated_before) {
    sql += " AND updated_at < ?";
    params.push_back(*filters.updated_before);
  }
  sql += " ORDER BY updated_at DESC, name ASC;";

  auto st = db.Prepare(sql);
  BindAll(st.get(), params);

  PlanList list;
  int      rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    auto* plan = list.add_plans();
    plan->set_id(ColText(st.get(), 0));
    plan->set_project_id(ColText(st.get(), 1));
    plan->set_title(ColText(st.get(), 2));
    plan->set_status(ColText(st.get(), 3));
    plan->set_author(ColText(st.get(), 4));
    plan->set_priority(ColText(st.get(), 5));
    plan->set_type(ColText(st.get(), 6));
    plan->set_description(ColText(st.get(), 7));
    FromJsonArray(ColText(st.get(), 8), plan->mutable_topics());
    plan->set_file(ColText(st.get(), 9));
    plan->set_created(ColText(st.get(), 10));
    plan->set_updated(ColText(st.get(), 11));
    if (filters.include_content) plan->set_content(ColText(st.get(), 12));
  }
  CheckDone(db.Handle(), rc, "query plans");

  list.set_count(list.plans_size());
  return list;
}

SessionList SqliteStorage::QuerySessions(const SessionFilters& filters) {
  auto& db = Db("QuerySessions");

  std::string sql = "SELECT name,project_id,date,topic,plan_id,status,phases,topics,file,created_at,updated_at";
  if (filters.include_content) sql += ",content";
  sql += " FROM sessions WHERE project_id = ?";

  std::vector<std::string> params = {config_.project_id};
  if (filters.date) {
    sql += " AND date = ?";
    params.push_back(*filters.date);
  }
  if (filters.date_after) {
    sql += " AND date >= ?";
    params.push_back(*filters.date_after);
  }
  if (filters.date_before) {
    sql += " AND date < ?";
    params.push_back(*filters.date_before);
  }
  if (filters.topic) {
    sql += " AND (topic LIKE ? ESCAPE '\\' OR topics LIKE ? ESCAPE '\\')";
    params.push_back(LikePattern(*filters.topic));
    params.push_back(LikePattern(*filters.topic));
  }
  if (filters.plan) {
    sql += " AND plan_id = ?";
    params.push_back(*filters.plan);
  }
  sql += " ORDER BY date DESC, name ASC;";

  auto st = db.Prepare(sql);
  BindAll(st.get(), params);

  SessionList list;
  int         rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    auto* session = list.add_sessions();
    session->set_id(ColText(st.get(), 0));
    session->set_project_id(ColText(st.get(), 1));
    session->set_date(ColText(st.get(), 2));
    session->set_topic(ColText(st.get(), 3));
    session->set_plan(ColText(st.get(), 4));
    session->set_status(ColText(st.get(), 5));
    FromJsonArray(ColText(st.get(), 6), session->mutable_phases());
    FromJsonArray(ColText(st.get(), 7), session->mutable_topics());
    session->set_file(ColText(st.get(), 8));
    session->set_created(ColText(st.get(), 9));
    session->set_updated(ColText(st.get(), 10));
    if (filters.include_content) session->set_content(ColText(st.get(), 11));
  }
  CheckDone(db.Handle(), rc, "query sessions");

  list.set_count(list.sessions_size());
  return list;
}

SearchResponse SqliteStorage::Search(const std::string& query, model::SearchScope scope) {
  auto& db = Db("Search");

  struct Source {
    model::SearchScope kind;
    const char*        sql;
  };
  static const Source kSources[] = {
      {model::SearchScope::kPlans, "SELECT file, content FROM plans WHERE project_id = ? AND instr(lower(content), lower(?)) > 0 ORDER BY name;"},
      {model::SearchScope::kSessions, "SELECT file, content FROM sessions WHERE project_id = ? AND instr(lower(content), lower(?)) > 0 ORDER BY name;"},
      {model::SearchScope::kLearned, "SELECT file, content FROM patterns WHERE project_id = ? AND instr(lower(content), lower(?)) > 0 ORDER BY slug;"},
  };

  SearchResponse response;
  response.set_query(query);
  response.set_scope(std::string(model::ToString(scope)));

  for (const auto& source : kSources) {
    if (!model::Includes(scope, source.kind)) continue;

    auto st = db.Prepare(source.sql);
    BindText(st.get(), 1, config_.project_id);
    BindText(st.get(), 2, query);

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
      auto result = ScoreMatch(ColText(st.get(), 0), ColText(st.get(), 1), query, model::ResultType(source.kind));
      if (result) *response.add_results() = std::move(*result);
    }
    CheckDone(db.Handle(), rc, "search");
  }

  SortByRelevance(response.mutable_results());
  response.set_count(response.results_size());
  return response;
}

SearchResponse SqliteStorage::FullTextSearch(const std::string& query, model::SearchScope scope, int limit) {
  auto& db = Db("FullTextSearch");

  struct Source {
    model::SearchScope kind;
    const char*        sql;
  };
  static const Source kSources[] = {
      {model::SearchScope::kPlans,
       "SELECT t.file, t.content, bm25(plans_fts) AS score, snippet(plans_fts, 1, '', '', '...', 16) FROM plans_fts "
       "JOIN plans t ON t.rowid = plans_fts.rowid WHERE plans_fts MATCH ? AND t.project_id = ? ORDER BY score LIMIT ?;"},
      {model::SearchScope::kSessions,
       "SELECT t.file, t.content, bm25(sessions_fts) AS score, snippet(sessions_fts, 1, '', '', '...', 16) FROM sessions_fts "
       "JOIN sessions t ON t.rowid = sessions_fts.rowid WHERE sessions_fts MATCH ? AND t.project_id = ? ORDER BY score LIMIT ?;"},
      {model::SearchScope::kLearned,
       "SELECT t.file, t.content, bm25(patterns_fts) AS score, snippet(patterns_fts, 1, '', '', '...', 16) FROM patterns_fts "
       "JOIN patterns t ON t.rowid = patterns_fts.rowid WHERE patterns_fts MATCH ? AND t.project_id = ? ORDER BY score LIMIT ?;"},
  };

  SearchResponse response;
  response.set_query(query);
  response.set_scope(std::string(model::ToString(scope)));

  const auto fts_query = FtsQuery(query);
  if (fts_query.empty() || limit <= 0) {
    return response;
  }
  const auto first_term = util::SplitWords(query);

  for (const auto& source : kSources) {
    if (!model::Includes(scope, source.kind)) continue;

    auto st = db.Prepare(source.sql);
    BindText(st.get(), 1, fts_query);
    BindText(st.get(), 2, config_.project_id);
    sqlite3_bind_int(st.get(), 3, limit);

    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
      const auto content = ColText(st.get(), 1);
      // bm25 is negative; more negative ranks higher
      const auto score = sqlite3_column_double(st.get(), 2);

      SearchResult result;
      result.set_file(ColText(st.get(), 0));
      const auto pos = first_term.empty() ? std::string::npos : util::FindIgnoreCase(content, first_term.front());
      result.set_line(pos == std::string::npos ? 1 : util::LineOf(content, pos));
      result.set_context(ColText(st.get(), 3));
      result.set_relevance(std::clamp(static_cast<int>(std::lround(-score * 10.0)), 1, 100));
      result.set_type(std::string(model::ResultType(source.kind)));
      *response.add_results() = std::move(result);
    }
    CheckDone(db.Handle(), rc, "full-text search");
  }

  SortByRelevance(response.mutable_results());
  while (response.results_size() > limit) response.mutable_results()->RemoveLast();
  response.set_count(response.results_size());
  return response;
}

StorageStats SqliteStorage::GetStats() {
  auto& db = Db("GetStats");

  auto st = db.Prepare(
      "SELECT (SELECT COUNT(*) FROM projects), (SELECT COUNT(*) FROM plans), (SELECT COUNT(*) FROM sessions), (SELECT COUNT(*) FROM patterns);");
  StorageStats stats;
  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw std::runtime_error(std::string("stats: ") + sqlite3_errmsg(db.Handle()));
  }
  stats.set_projects(sqlite3_column_int64(st.get(), 0));
  stats.set_plans(sqlite3_column_int64(st.get(), 1));
  stats.set_sessions(sqlite3_column_int64(st.get(), 2));
  stats.set_patterns(sqlite3_column_int64(st.get(), 3));

  std::error_code ec;
  const auto      size = fs::file_size(config_.db_path, ec);
  stats.set_db_size_bytes(ec ? 0 : static_cast<int64_t>(size));
  return stats;
}

// ------------------------------------------------------------------
// Rebuild
// ------------------------------------------------------------------

namespace {

// Keys of `table` rows owned by `project_id` that the scan did not produce.
std::vector<std::string> StaleKeys(SqliteDB& db, const char* select_sql, const std::string& project_id, const std::set<std::string>& keep) {
  auto st = db.Prepare(select_sql);
  BindText(st.get(), 1, project_id);

  std::vector<std::string> stale;
  int                      rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    auto key = ColText(st.get(), 0);
    if (!keep.count(key)) stale.push_back(std::move(key));
  }
  CheckDone(db.Handle(), rc, "stale rows");
  return stale;
}

void DeleteKeys(SqliteDB& db, const char* delete_sql, const std::string& project_id, const std::vector<std::string>& keys) {
  for (const auto& key : keys) {
    auto st = db.Prepare(delete_sql);
    BindText(st.get(), 1, project_id);
    BindText(st.get(), 2, key);
    CheckDone(db.Handle(), sqlite3_step(st.get()), "delete stale row");
  }
}

} // namespace

RebuildReport SqliteStorage::RebuildIndex() {
  auto& db = Db("RebuildIndex");

  markdown::ScanOptions options;
  options.project_id      = config_.project_id;
  options.include_content = true;
  auto scan               = markdown::ScanKnowledgeBase(target_dir_, options);

  RebuildReport report;
  for (auto& error : scan.errors) *report.add_errors() = std::move(error);

  std::set<std::string> plan_ids;
  std::set<std::string> session_names;
  std::set<std::string> pattern_slugs;

  SqliteDB::WriteTransaction tx(db);

  for (const auto& plan : scan.plans) {
    if (auto r = InsertPlan(plan); !r) {
      *report.add_errors() = plan.file() + ": " + r.Describe();
      continue;
    }
    plan_ids.insert(plan.id());
  }
  for (const auto& session : scan.sessions) {
    if (auto r = InsertSession(session); !r) {
      *report.add_errors() = session.file() + ": " + r.Describe();
      continue;
    }
    session_names.insert(session.id());
  }
  for (const auto& pattern : scan.learned) {
    if (auto r = InsertPattern(pattern); !r) {
      *report.add_errors() = pattern.file() + ": " + r.Describe();
      continue;
    }
    pattern_slugs.insert(pattern.id());
  }

  DeleteKeys(db, "DELETE FROM plans WHERE project_id = ? AND name = ?;", config_.project_id,
             StaleKeys(db, "SELECT name FROM plans WHERE project_id = ?;", config_.project_id, plan_ids));
  DeleteKeys(db, "DELETE FROM sessions WHERE project_id = ? AND name = ?;", config_.project_id,
             StaleKeys(db, "SELECT name FROM sessions WHERE project_id = ?;", config_.project_id, session_names));
  DeleteKeys(db, "DELETE FROM patterns WHERE project_id = ? AND slug = ?;", config_.project_id,
             StaleKeys(db, "SELECT slug FROM patterns WHERE project_id = ?;", config_.project_id, pattern_slugs));

  tx.Commit();

  report.set_plans_indexed(static_cast<int32_t>(plan_ids.size()));
  report.set_sessions_indexed(static_cast<int32_t>(session_names.size()));
  report.set_learned_indexed(static_cast<int32_t>(pattern_slugs.size()));

  AIKNOWSYS_LOG_INFO("sqlite index rebuilt", {PathField("db", config_.db_path), StringField("project", config_.project_id),
                                              IntField("plans", report.plans_indexed()), IntField("sessions", report.sessions_indexed()),
                                              IntField("learned", report.learned_indexed()), IntField("errors", report.errors_size())});
  return report;
}

} // namespace aiknowsys::db::sqlite
