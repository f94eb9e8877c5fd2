#include <algorithm>
#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "helpers/sample_knowledge_base.hpp"
#include "helpers/temp_workspace.hpp"
#include "internal/db/api/storage_adapter.hpp"
#include "internal/db/json/json_storage.hpp"
#include "internal/db/sqlite/sqlite_storage.hpp"

namespace {

using aiknowsys::db::PlanFilters;
using aiknowsys::db::SessionFilters;
using aiknowsys::db::StorageAdapter;
using aiknowsys::model::PlanStatus;
using aiknowsys::model::SearchScope;
using aiknowsys::testing::TempWorkspace;

struct BackendFactory {
  std::string                                                             name;
  std::function<std::unique_ptr<StorageAdapter>(const TempWorkspace& ws)> make_storage;
};

BackendFactory MakeJsonFactory() {
  return BackendFactory{
      "json",
      [](const TempWorkspace&) { return std::make_unique<aiknowsys::db::json::JsonStorage>(); },
  };
}

BackendFactory MakeSqliteFactory() {
  return BackendFactory{
      "sqlite",
      [](const TempWorkspace& ws) {
        aiknowsys::locator::DatabaseConfig config;
        config.db_path    = ws.Root() / "parity.db";
        config.project_id = "parity";
        return std::make_unique<aiknowsys::db::sqlite::SqliteStorage>(config);
      },
  };
}

std::vector<std::string> PlanIds(const aiknowsys::v1::PlanList& list) {
  std::vector<std::string> ids;
  for (const auto& plan : list.plans()) ids.push_back(plan.id());
  return ids;
}

std::vector<std::string> SessionIds(const aiknowsys::v1::SessionList& list) {
  std::vector<std::string> ids;
  for (const auto& session : list.sessions()) ids.push_back(session.id());
  return ids;
}

// file -> relevance; line numbers may legitimately differ between backends
std::set<std::pair<std::string, int>> Hits(const aiknowsys::v1::SearchResponse& response) {
  std::set<std::pair<std::string, int>> hits;
  for (const auto& r : response.results()) hits.emplace(r.file(), r.relevance());
  return hits;
}

struct Snapshot {
  std::vector<std::vector<std::string>>              plans;
  std::vector<std::vector<std::string>>              sessions;
  std::vector<std::set<std::pair<std::string, int>>> searches;
};

Snapshot RunBackendSuite(const BackendFactory& backend) {
  TempWorkspace ws("parity_" + backend.name);
  aiknowsys::testing::WriteSampleKnowledgeBase(ws);

  auto storage = backend.make_storage(ws);
  storage->Init(ws.Root());
  assert(storage->Name() == backend.name);

  const auto report = storage->RebuildIndex();
  assert(report.plans_indexed() == 3);
  assert(report.sessions_indexed() == 3);
  assert(report.learned_indexed() == 1);
  assert(report.errors_size() == 0);

  Snapshot snapshot;

  snapshot.plans.push_back(PlanIds(storage->QueryPlans({})));

  PlanFilters active;
  active.status = PlanStatus::kActive;
  snapshot.plans.push_back(PlanIds(storage->QueryPlans(active)));

  PlanFilters by_author;
  by_author.author = "carol";
  snapshot.plans.push_back(PlanIds(storage->QueryPlans(by_author)));

  PlanFilters by_topic;
  by_topic.topic = "Auth";
  snapshot.plans.push_back(PlanIds(storage->QueryPlans(by_topic)));

  PlanFilters window;
  window.updated_after  = "2025-12-01";
  window.updated_before = "2026-01-20";
  snapshot.plans.push_back(PlanIds(storage->QueryPlans(window)));

  snapshot.sessions.push_back(SessionIds(storage->QuerySessions({})));

  SessionFilters by_date;
  by_date.date = "2026-01-20";
  snapshot.sessions.push_back(SessionIds(storage->QuerySessions(by_date)));

  SessionFilters by_plan;
  by_plan.plan = "auth_refactor";
  snapshot.sessions.push_back(SessionIds(storage->QuerySessions(by_plan)));

  SessionFilters after;
  after.date_after = "2026-01-25";
  snapshot.sessions.push_back(SessionIds(storage->QuerySessions(after)));

  for (const auto* query : {"token", "MIDDLEWARE", "dynamic import", "nothing matches this"}) {
    snapshot.searches.push_back(Hits(storage->Search(query, SearchScope::kAll)));
  }
  snapshot.searches.push_back(Hits(storage->Search("token", SearchScope::kSessions)));

  PlanFilters with_content;
  with_content.author          = "alice";
  with_content.include_content = true;
  const auto full              = storage->QueryPlans(with_content);
  assert(full.count() == 1);
  assert(full.plans(0).content().find("middleware") != std::string::npos);

  // a deleted source file disappears on the next rebuild
  std::filesystem::remove(ws.Knowledge() / "PLAN_legacy.md");
  storage->RebuildIndex();
  assert(storage->QueryPlans({}).count() == 2);
  assert(storage->QueryPlans(by_author).count() == 0);

  storage->Close();
  return snapshot;
}

void VerifyExpectedAnswers(const Snapshot& s) {
  using Ids = std::vector<std::string>;

  assert((s.plans[0] == Ids{"auth_refactor", "search_index", "legacy"}));
  assert((s.plans[1] == Ids{"search_index"}));
  assert((s.plans[2] == Ids{"legacy"}));
  assert((s.plans[3] == Ids{"auth_refactor"}));
  assert((s.plans[4] == Ids{"search_index", "legacy"}));

  assert((s.sessions[0] == Ids{"2026-02-01-session", "2026-01-25", "2026-01-20-session"}));
  assert((s.sessions[1] == Ids{"2026-01-20-session"}));
  assert((s.sessions[2] == Ids{"2026-01-20-session"}));
  assert((s.sessions[3] == Ids{"2026-02-01-session", "2026-01-25"}));

  assert(s.searches[0].size() == 3);
  assert(s.searches[0].count({"PLAN_auth_refactor.md", 20}));
  assert(s.searches[0].count({"sessions/2026-01-25.md", 10}));
  assert(s.searches[1].size() == 2);
  assert(s.searches[2].size() == 2);
  assert(s.searches[3].empty());
  assert(s.searches[4].size() == 2);
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeJsonFactory());
  backends.push_back(MakeSqliteFactory());

  std::vector<Snapshot> snapshots;
  for (const auto& backend : backends) {
    snapshots.push_back(RunBackendSuite(backend));
    VerifyExpectedAnswers(snapshots.back());
  }

  for (std::size_t i = 1; i < snapshots.size(); ++i) {
    assert(snapshots[i].plans == snapshots[0].plans);
    assert(snapshots[i].sessions == snapshots[0].sessions);
    assert(snapshots[i].searches == snapshots[0].searches);
  }

  std::cout << "aiknowsys_integration_storage_parity: pass\n";
  return 0;
}
