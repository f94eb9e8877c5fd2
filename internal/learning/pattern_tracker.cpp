#include "pattern_tracker.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <system_error>

#include "internal/markdown/layout.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace aiknowsys::learning {

namespace fs = std::filesystem;

using aiknowsys::v1::PatternEntry;
using aiknowsys::v1::PatternHistory;
using observability::IntField;
using observability::StringField;

namespace {

PatternEntry* FindEntry(PatternHistory& history, const std::string& error) {
  for (auto& entry : *history.mutable_patterns()) {
    if (entry.error() == error) return &entry;
  }
  return nullptr;
}

} // namespace

PatternTracker::PatternTracker(fs::path target_dir) : path_(markdown::PatternHistoryPath(fs::absolute(target_dir).lexically_normal())) {
}

PatternHistory PatternTracker::Load() const {
  PatternHistory  history;
  std::error_code ec;
  if (!fs::exists(path_, ec)) return history;

  std::string json;
  try {
    json = util::ReadTextFile(path_);
  } catch (const std::exception& e) {
    throw util::StorageUnavailable(e.what());
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status                   = google::protobuf::util::JsonStringToMessage(json, &history, options);
  if (!status.ok()) {
    throw util::StorageUnavailable("corrupt pattern ledger " + path_.string() + ": " + std::string(status.message()));
  }
  return history;
}

void PatternTracker::Save(const PatternHistory& history) const {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(history, &json, options);
  if (!status.ok()) {
    throw util::StorageUnavailable("cannot serialize pattern ledger: " + std::string(status.message()));
  }

  try {
    util::WriteTextFileAtomic(path_, json);
  } catch (const std::exception& e) {
    throw util::StorageUnavailable(e.what());
  }
}

PatternEntry PatternTracker::TrackPattern(const std::string& error, const std::optional<std::string>& resolution) {
  if (util::Trim(error).empty()) {
    throw util::ValidationError("Pattern error text cannot be empty");
  }

  auto       history = Load();
  const auto today   = util::FormatDate(util::Now());

  auto* entry = FindEntry(history, error);
  if (entry) {
    entry->set_frequency(entry->frequency() + 1);
    entry->set_last_seen(today);
  } else {
    entry = history.add_patterns();
    entry->set_id(util::Slugify(error));
    entry->set_error(error);
    entry->set_frequency(1);
    entry->set_first_seen(today);
    entry->set_last_seen(today);
    entry->set_documented(false);
  }

  if (resolution && !resolution->empty()) {
    const auto& known = entry->resolutions();
    if (std::find(known.begin(), known.end(), *resolution) == known.end()) entry->add_resolutions(*resolution);
  }

  PatternEntry tracked = *entry;
  Save(history);

  AIKNOWSYS_LOG_DEBUG("pattern tracked", {StringField("id", tracked.id()), IntField("frequency", tracked.frequency())});
  return tracked;
}

bool PatternTracker::MarkPatternDocumented(const std::string& error) {
  auto  history = Load();
  auto* entry   = FindEntry(history, error);
  if (!entry) return false;

  entry->set_documented(true);
  Save(history);
  return true;
}

PatternHistory PatternTracker::Patterns() const {
  return Load();
}

std::optional<PatternEntry> PatternTracker::Find(const std::string& error) const {
  auto history = Load();
  if (auto* entry = FindEntry(history, error)) return *entry;
  return std::nullopt;
}

bool PatternTracker::IsDocumented(const std::string& error) const {
  const auto entry = Find(error);
  return entry && entry->documented();
}

} // namespace aiknowsys::learning
