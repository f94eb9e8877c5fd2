#include "internal/learning/pattern_detector.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "helpers/recurring_errors.hpp"
#include "helpers/temp_workspace.hpp"

namespace {

using aiknowsys::learning::DetectOptions;
using aiknowsys::learning::Observation;
using aiknowsys::learning::SessionDocument;
using aiknowsys::testing::TempWorkspace;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestJaccard() {
  using aiknowsys::learning::JaccardSimilarity;

  assert(Near(JaccardSimilarity("", ""), 0.0));
  assert(Near(JaccardSimilarity("alpha", ""), 0.0));
  assert(Near(JaccardSimilarity("Alpha beta", "beta, ALPHA!"), 1.0));
  assert(Near(JaccardSimilarity("foo bar", "foo baz"), 1.0 / 3.0));

  // non-Latin text is made of words too
  assert(Near(JaccardSimilarity("使用动态导入", "使用动态导入"), 1.0));
  assert(Near(JaccardSimilarity("ошибка импорта", "ошибка импорта"), 1.0));
  assert(Near(JaccardSimilarity("ESM ошибка", " esm ошибка "), 1.0));
  assert(Near(JaccardSimilarity("ошибка импорта", "ошибка сборки"), 1.0 / 3.0));
  assert(Near(JaccardSimilarity("使用动态导入", "ошибка"), 0.0));
  assert(Near(JaccardSimilarity("???", "???"), 1.0));
}

void TestIdenticalNonLatinObservationsCluster() {
  std::vector<Observation> observations = {
      {"使用动态导入", "2026-01-20", "sessions/2026-01-20.md", 2},
      {"ошибка импорта", "2026-01-21", "sessions/2026-01-21.md", 2},
      {"使用动态导入", "2026-01-22", "sessions/2026-01-22.md", 2},
      {"ошибка импорта", "2026-01-23", "sessions/2026-01-23.md", 2},
  };

  const auto patterns = aiknowsys::learning::ClusterObservations(observations);
  assert(patterns.size() == 2);
  assert(patterns[0].error == "使用动态导入");
  assert(patterns[0].frequency == 2);
  assert(patterns[1].error == "ошибка импорта");
  assert(patterns[1].frequency == 2);
}

void TestLoadRecentSessions() {
  TempWorkspace ws("detector_load");
  aiknowsys::testing::WriteRecurringErrorSessions(ws);
  ws.Write(".aiknowsys/sessions/notes.md", "---\ndate: 2026-01-30\n---\nNo learnings.\n");

  const auto loaded = aiknowsys::learning::LoadRecentSessions(ws.Root(), 30, aiknowsys::testing::RecurringErrorsNow());
  assert(loaded.errors.empty());
  assert(loaded.sessions.size() == 5);
  assert(loaded.sessions.front().date == "2026-01-20");
  assert(loaded.sessions.front().file == "sessions/2026-01-20-session.md");
  assert(loaded.sessions.back().date == "2026-01-30");
  assert(loaded.sessions.back().file == "sessions/notes.md");

  // no date in name or frontmatter: dated by mtime, which is today
  ws.Write(".aiknowsys/sessions/undated.md", "Scratch.\n");
  const auto today = aiknowsys::learning::LoadRecentSessions(ws.Root(), 0);
  assert(today.sessions.size() == 1);
  assert(today.sessions[0].file == "sessions/undated.md");

  TempWorkspace empty("detector_empty");
  const auto    none = aiknowsys::learning::LoadRecentSessions(empty.Root());
  assert(none.sessions.empty());
  assert(none.errors.empty());
}

void TestExtractMarkers() {
  std::vector<SessionDocument> sessions = {
      {"sessions/a.md", "2026-01-10",
       "**Key Learning:** bold label\n"
       "**Key Learning**: colon outside\n"
       "  - key learning: bullet\n"
       "Key Learning:\n"
       "Gotcha: not a default marker\n"
       "Some key learning: inline is not a label\n"},
  };

  const auto observations = aiknowsys::learning::ExtractErrorPatterns(sessions);
  assert(observations.size() == 3);
  assert(observations[0].text == "bold label");
  assert(observations[0].position == 0);
  assert(observations[1].text == "colon outside");
  assert(observations[2].text == "bullet");
  assert(observations[2].source == "sessions/a.md");
  assert(observations[2].date == "2026-01-10");

  const auto custom = aiknowsys::learning::ExtractErrorPatterns(sessions, {"Gotcha"});
  assert(custom.size() == 1);
  assert(custom[0].text == "not a default marker");
}

void TestClustering() {
  std::vector<Observation> observations = {
      {"retry the upload with backoff", "2026-01-12", "sessions/b.md", 4},
      {"retry upload with exponential backoff", "2026-01-10", "sessions/a.md", 2},
      {"docker volume permissions", "2026-01-11", "sessions/a.md", 7},
  };

  const auto patterns = aiknowsys::learning::ClusterObservations(observations, 0.4);
  assert(patterns.size() == 2);
  assert(patterns[0].error == "retry upload with exponential backoff");
  assert(patterns[0].frequency == 2);
  assert(patterns[0].first_seen == "2026-01-10");
  assert(patterns[0].last_seen == "2026-01-12");
  assert(patterns[0].examples.size() == 2);
  assert(patterns[1].error == "docker volume permissions");
  assert(patterns[1].frequency == 1);

  // a threshold above every similarity keeps each observation alone
  assert(aiknowsys::learning::ClusterObservations(observations, 1.0).size() == 3);
  assert(aiknowsys::learning::ClusterObservations({}).empty());
}

void TestDetectPatterns() {
  TempWorkspace ws("detector_detect");
  aiknowsys::testing::WriteRecurringErrorSessions(ws);

  DetectOptions options;
  options.now = aiknowsys::testing::RecurringErrorsNow();

  const auto result = aiknowsys::learning::DetectPatterns(ws.Root(), options);
  assert(result.errors.empty());
  assert(result.patterns.size() == 1);

  const auto& pattern = result.patterns[0];
  assert(pattern.error == "ESM chalk import error needs dynamic import");
  assert(pattern.frequency == 3);
  assert(pattern.first_seen == "2026-01-20");
  assert(pattern.last_seen == "2026-01-28");
  assert((pattern.keywords == std::vector<std::string>{"import", "chalk", "dynamic", "error", "again"}));

  options.threshold = 1;
  const auto everything = aiknowsys::learning::DetectPatterns(ws.Root(), options);
  assert(everything.patterns.size() == 2);
  assert(everything.patterns[0].frequency == 3);
  assert(everything.patterns[1].error == "sqlite busy timeout under load");

  // widening the window pulls in the December occurrence
  options.threshold   = 4;
  options.window_days = 90;
  const auto wide     = aiknowsys::learning::DetectPatterns(ws.Root(), options);
  assert(wide.patterns.size() == 1);
  assert(wide.patterns[0].first_seen == "2025-12-01");
}

void TestThresholdSeparatesRecurringFromUnique() {
  TempWorkspace ws("detector_threshold");
  ws.Write(".aiknowsys/sessions/2026-01-20.md", "# Session\n\n**Key Learning:** chalk import error with ESM\n");
  ws.Write(".aiknowsys/sessions/2026-01-25.md", "# Session\n\n**Key Learning:** chalk import error in ESM build\n");
  ws.Write(".aiknowsys/sessions/2026-01-30.md", "# Session\n\n**Key Learning:** chalk import error again\n"
                                               "**Key Learning:** docker volume permissions denied\n");

  DetectOptions options;
  options.now       = aiknowsys::testing::RecurringErrorsNow();
  options.threshold = 2;

  const auto two = aiknowsys::learning::DetectPatterns(ws.Root(), options);
  assert(two.patterns.size() == 1);
  assert(two.patterns[0].error == "chalk import error with ESM");
  assert(two.patterns[0].frequency == 3);
  assert(two.patterns[0].last_seen == "2026-01-30");

  options.threshold = 3;
  const auto three  = aiknowsys::learning::DetectPatterns(ws.Root(), options);
  assert(three.patterns.size() == 1);
  for (const auto& pattern : three.patterns) assert(pattern.error.find("docker") == std::string::npos);

  options.threshold = 1;
  assert(aiknowsys::learning::DetectPatterns(ws.Root(), options).patterns.size() == 2);
}

} // namespace

int main() {
  TestJaccard();
  TestLoadRecentSessions();
  TestExtractMarkers();
  TestClustering();
  TestIdenticalNonLatinObservationsCluster();
  TestDetectPatterns();
  TestThresholdSeparatesRecurringFromUnique();

  std::cout << "aiknowsys_unit_pattern_detector: pass\n";
  return 0;
}
