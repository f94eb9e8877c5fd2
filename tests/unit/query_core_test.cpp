#include "internal/core/query_core.hpp"

#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <string>

#include "helpers/sample_knowledge_base.hpp"
#include "helpers/temp_workspace.hpp"
#include "internal/locator/database_locator.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using aiknowsys::core::QueryPlansOptions;
using aiknowsys::core::QuerySessionsOptions;
using aiknowsys::core::SearchContextOptions;
using aiknowsys::factory::AdapterKind;
using aiknowsys::testing::ScopedEnv;
using aiknowsys::testing::TempWorkspace;

void ExpectValidation(const std::string& fragment, const std::function<void()>& call) {
  bool threw = false;
  try {
    call();
  } catch (const aiknowsys::util::ValidationError& e) {
    threw = std::string(e.what()).find(fragment) != std::string::npos;
  }
  assert(threw);
}

void TestValidationHappensBeforeIo() {
  TempWorkspace ws("core_validation");
  const auto    untouched = ws.Root() / "untouched";

  QueryPlansOptions plans;
  plans.dir    = untouched;
  plans.status = "DONE";
  ExpectValidation("Invalid status: DONE", [&] { aiknowsys::core::QueryPlansCore(plans); });

  plans.status        = std::nullopt;
  plans.updated_after = "2026-1-5";
  ExpectValidation("Invalid updated_after: 2026-1-5 (expected YYYY-MM-DD)", [&] { aiknowsys::core::QueryPlansCore(plans); });

  QuerySessionsOptions sessions;
  sessions.dir         = untouched;
  sessions.date_before = "yesterday";
  ExpectValidation("Invalid date_before", [&] { aiknowsys::core::QuerySessionsCore(sessions); });

  sessions.date_before = std::nullopt;
  sessions.days        = -1;
  ExpectValidation("Invalid days", [&] { aiknowsys::core::QuerySessionsCore(sessions); });

  SearchContextOptions search;
  search.dir   = untouched;
  search.query = "   ";
  ExpectValidation("Search query cannot be empty", [&] { aiknowsys::core::SearchContextCore(search); });

  search.query = "token";
  search.scope = "everything";
  ExpectValidation("Invalid scope", [&] { aiknowsys::core::SearchContextCore(search); });

  assert(!fs::exists(untouched));
}

void TestQueryPlans() {
  TempWorkspace ws("core_plans");
  aiknowsys::testing::WriteSampleKnowledgeBase(ws);

  QueryPlansOptions options;
  options.dir             = ws.Root();
  options.storage.adapter = AdapterKind::kJson;

  assert(aiknowsys::core::QueryPlansCore(options).count() == 3);

  // status is case-insensitive
  options.status   = " complete ";
  const auto plans = aiknowsys::core::QueryPlansCore(options);
  assert(plans.count() == 1);
  assert(plans.plans(0).author() == "alice");

  options.status        = std::nullopt;
  options.updated_after = "2026-01-01";
  assert(aiknowsys::core::QueryPlansCore(options).count() == 2);
}

void TestQuerySessions() {
  TempWorkspace ws("core_sessions");
  aiknowsys::testing::WriteSampleKnowledgeBase(ws);

  QuerySessionsOptions options;
  options.dir             = ws.Root();
  options.storage.adapter = AdapterKind::kJson;

  const auto all = aiknowsys::core::QuerySessionsCore(options);
  assert(all.count() == 3);
  assert(all.sessions(0).date() == "2026-02-01");
  assert(all.sessions(2).date() == "2026-01-20");

  options.plan = "PLAN_auth_refactor.md";
  assert(aiknowsys::core::QuerySessionsCore(options).count() == 1);
  options.plan = std::nullopt;

  // every sample session is older than today
  options.days = 0;
  assert(aiknowsys::core::QuerySessionsCore(options).count() == 0);

  options.date_after = "2026-01-25";
  assert(aiknowsys::core::QuerySessionsCore(options).count() == 2);
}

void TestDateAfterKeepsNewestFirst() {
  for (const auto adapter : {AdapterKind::kJson, AdapterKind::kSqlite}) {
    TempWorkspace ws(adapter == AdapterKind::kJson ? "core_date_after_json" : "core_date_after_sqlite");
    ScopedEnv     env(aiknowsys::locator::kDatabasePathEnv, (ws.Root() / "kb.db").string());
    for (const auto* date : {"2026-01-15", "2026-02-05", "2026-02-06"}) {
      ws.Write(std::string(".aiknowsys/sessions/") + date + ".md", std::string("# Session: work on ") + date + "\n");
    }

    QuerySessionsOptions options;
    options.dir             = ws.Root();
    options.storage.adapter = adapter;
    options.date_after      = "2026-02-01";

    const auto result = aiknowsys::core::QuerySessionsCore(options);
    assert(result.count() == 2);
    assert(result.sessions(0).date() == "2026-02-06");
    assert(result.sessions(1).date() == "2026-02-05");
  }
}

void TestSearchContext() {
  TempWorkspace ws("core_search");
  aiknowsys::testing::WriteSampleKnowledgeBase(ws);

  SearchContextOptions options;
  options.dir             = ws.Root();
  options.query           = "  token ";
  options.storage.adapter = AdapterKind::kJson;

  const auto all = aiknowsys::core::SearchContextCore(options);
  assert(all.query() == "token");
  assert(all.count() == 3);

  options.scope        = "sessions";
  const auto sessions = aiknowsys::core::SearchContextCore(options);
  assert(sessions.count() == 2);
  assert(sessions.scope() == "sessions");
  for (const auto& r : sessions.results()) assert(r.type() == "session");
}

void TestExplicitSqliteAdapter() {
  TempWorkspace ws("core_sqlite");
  aiknowsys::testing::WriteSampleKnowledgeBase(ws);
  ScopedEnv env(aiknowsys::locator::kDatabasePathEnv, (ws.Root() / "kb.db").string());

  QueryPlansOptions options;
  options.dir             = ws.Root();
  options.storage.adapter = AdapterKind::kSqlite;
  options.topic           = "auth";

  const auto plans = aiknowsys::core::QueryPlansCore(options);
  assert(plans.count() == 1);
  assert(plans.plans(0).id() == "auth_refactor");
  assert(fs::exists(ws.Root() / "kb.db"));
  assert(!fs::exists(ws.Knowledge() / "context-index.json"));
}

} // namespace

int main() {
  TestValidationHappensBeforeIo();
  TestQueryPlans();
  TestQuerySessions();
  TestDateAfterKeepsNewestFirst();
  TestSearchContext();
  TestExplicitSqliteAdapter();

  std::cout << "aiknowsys_unit_query_core: pass\n";
  return 0;
}
