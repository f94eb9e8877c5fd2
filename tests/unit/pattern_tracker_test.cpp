#include "internal/learning/pattern_tracker.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "helpers/temp_workspace.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using aiknowsys::learning::PatternTracker;
using aiknowsys::testing::TempWorkspace;

void TestTrackNewAndRepeated() {
  TempWorkspace  ws("tracker_track");
  PatternTracker tracker(ws.Root());
  assert(tracker.LedgerPath() == ws.Knowledge() / "pattern-history.json");
  assert(tracker.Patterns().patterns_size() == 0);
  assert(!std::filesystem::exists(tracker.LedgerPath()));

  const auto today = aiknowsys::util::FormatDate(aiknowsys::util::Now());

  auto first = tracker.TrackPattern("Cannot find module 'chalk'");
  assert(first.id() == "cannot-find-module-chalk");
  assert(first.frequency() == 1);
  assert(first.first_seen() == today);
  assert(first.last_seen() == today);
  assert(!first.documented());
  assert(first.resolutions_size() == 0);

  tracker.TrackPattern("Cannot find module 'chalk'", std::string("use dynamic import"));
  auto third = tracker.TrackPattern("Cannot find module 'chalk'", std::string("use dynamic import"));
  assert(third.frequency() == 3);
  assert(third.resolutions_size() == 1);

  tracker.TrackPattern("EADDRINUSE on port 3000", std::string(""));
  assert(tracker.Patterns().patterns_size() == 2);
  assert(tracker.Find("EADDRINUSE on port 3000")->resolutions_size() == 0);
  assert(!tracker.Find("unknown error"));
}

void TestDocumented() {
  TempWorkspace  ws("tracker_documented");
  PatternTracker tracker(ws.Root());

  assert(!tracker.MarkPatternDocumented("never tracked"));
  assert(!std::filesystem::exists(tracker.LedgerPath()));

  tracker.TrackPattern("flaky timeout");
  assert(!tracker.IsDocumented("flaky timeout"));
  assert(tracker.MarkPatternDocumented("flaky timeout"));
  assert(tracker.IsDocumented("flaky timeout"));

  // tracking again keeps the flag
  tracker.TrackPattern("flaky timeout");
  assert(tracker.IsDocumented("flaky timeout"));
}

void TestLedgerSharedAcrossInstances() {
  TempWorkspace ws("tracker_shared");

  PatternTracker writer(ws.Root());
  writer.TrackPattern("shared error", std::string("restart"));

  PatternTracker reader(ws.Root());
  const auto     entry = reader.Find("shared error");
  assert(entry);
  assert(entry->frequency() == 1);
  assert(entry->resolutions(0) == "restart");

  const auto json = ws.Read(".aiknowsys/pattern-history.json");
  assert(json.find("\"first_seen\"") != std::string::npos);
  assert(json.find("\"documented\": false") != std::string::npos);
}

void TestValidationAndCorruption() {
  TempWorkspace  ws("tracker_errors");
  PatternTracker tracker(ws.Root());

  bool rejected = false;
  try {
    tracker.TrackPattern("   ");
  } catch (const aiknowsys::util::ValidationError&) {
    rejected = true;
  }
  assert(rejected);

  ws.Write(".aiknowsys/pattern-history.json", "[1, 2");
  bool unavailable = false;
  try {
    (void)tracker.Patterns();
  } catch (const aiknowsys::util::StorageUnavailable&) {
    unavailable = true;
  }
  assert(unavailable);
}

} // namespace

int main() {
  TestTrackNewAndRepeated();
  TestDocumented();
  TestLedgerSharedAcrossInstances();
  TestValidationAndCorruption();

  std::cout << "aiknowsys_unit_pattern_tracker: pass\n";
  return 0;
}
