#include "internal/markdown/source_scanner.hpp"

#include <map>
#include <optional>
#include <regex>
#include <set>
#include <system_error>

#include "internal/markdown/frontmatter.hpp"
#include "internal/markdown/layout.hpp"
#include "internal/model/plan_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace aiknowsys::markdown {

namespace fs = std::filesystem;

using aiknowsys::v1::LearnedPattern;
using aiknowsys::v1::Plan;
using aiknowsys::v1::Session;

namespace {

struct Link {
  std::string text;
  std::string target;
};

struct SourceFile {
  fs::path       path;
  std::string    rel;
  ParsedDocument doc;
};

// Modification time as a timestamp; used when a file carries no dates of its own.
std::string ModifiedAt(const fs::path& path) {
  std::error_code ec;
  const auto      ft = fs::last_write_time(path, ec);
  if (ec) {
    return {};
  }
  return util::FormatTimestamp(util::FromFileTime(ft));
}

// Text after "<label>" on the first line that contains it.
std::optional<std::string> FieldValue(std::string_view body, std::string_view label) {
  const auto pos = body.find(label);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  const auto start = pos + label.size();
  const auto end   = body.find('\n', start);
  return util::Trim(body.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start));
}

std::optional<std::string> FirstHeading(std::string_view body, std::string_view prefix) {
  for (const auto& line : util::SplitLines(body)) {
    if (util::StartsWith(line, prefix)) {
      auto heading = util::Trim(std::string_view(line).substr(prefix.size()));
      if (!heading.empty()) return heading;
    }
  }
  return std::nullopt;
}

std::optional<std::string> FirstDate(std::string_view text) {
  static const std::regex kDate(R"(\d{4}-\d{2}-\d{2})");
  std::match_results<std::string_view::const_iterator> m;
  if (std::regex_search(text.begin(), text.end(), m, kDate) && util::IsValidDate(m.str())) {
    return m.str();
  }
  return std::nullopt;
}

// First run of ASCII letters, so "🎯 ACTIVE" and "ACTIVE (since May)" both yield ACTIVE.
std::string StatusWord(std::string_view value) {
  std::string word;
  for (char c : value) {
    const bool letter = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    if (letter) {
      word.push_back(c);
    } else if (!word.empty()) {
      break;
    }
  }
  return util::ToUpper(word);
}

std::optional<Link> ParseLink(std::string_view value) {
  const auto open  = value.find('[');
  const auto mid   = value.find("](", open == std::string_view::npos ? 0 : open);
  if (open == std::string_view::npos || mid == std::string_view::npos) {
    return std::nullopt;
  }
  const auto close = value.find(')', mid + 2);
  if (close == std::string_view::npos) {
    return std::nullopt;
  }
  return Link{util::Trim(value.substr(open + 1, mid - open - 1)), util::Trim(value.substr(mid + 2, close - mid - 2))};
}

std::string StripSuffix(std::string s, std::string_view suffix) {
  if (util::EndsWith(s, suffix)) s.resize(s.size() - suffix.size());
  return s;
}

void AddAll(google::protobuf::RepeatedPtrField<std::string>* out, const std::vector<std::string>& values) {
  for (const auto& v : values) {
    *out->Add() = v;
  }
}

std::optional<SourceFile> Load(const fs::path& target, const fs::path& path, std::vector<std::string>& errors) {
  SourceFile file{path, RelativeToKnowledgeDir(target, path), {}};
  try {
    file.doc = ParseDocument(util::ReadTextFile(path));
  } catch (const std::exception& e) {
    errors.push_back(file.rel + ": " + e.what());
    return std::nullopt;
  }
  for (const auto& warning : file.doc.warnings) {
    AIKNOWSYS_LOG_WARN("frontmatter field ignored", {observability::StringField("file", file.rel), observability::StringField("reason", warning)});
  }
  return file;
}

// ------------------------------------------------------------------
// Plans
// ------------------------------------------------------------------

std::optional<Plan> ToPlan(const SourceFile& file, const ScanOptions& options, std::vector<std::string>& errors) {
  const auto& fm   = file.doc.frontmatter;
  const auto& body = file.doc.body;

  Plan plan;
  plan.set_id(StripSuffix(file.path.filename().string().substr(std::string(kPlanPrefix).size()), ".md"));
  if (plan.id().empty()) {
    errors.push_back(file.rel + ": empty plan id");
    return std::nullopt;
  }

  auto title = fm.title ? fm.title : FirstHeading(body, "# ");
  if (!title || title->empty()) {
    errors.push_back(file.rel + ": plan has no title");
    return std::nullopt;
  }
  plan.set_title(*title);

  std::string status = "PLANNED";
  if (fm.status) {
    status = util::ToUpper(*fm.status);
  } else if (auto value = FieldValue(body, "**Status:**")) {
    status = StatusWord(*value);
  }
  if (!model::ParsePlanStatus(status)) {
    errors.push_back(file.rel + ": invalid plan status '" + status + "'");
    return std::nullopt;
  }
  plan.set_status(status);

  plan.set_author(fm.author.value_or("unknown"));

  const auto modified = ModifiedAt(file.path);
  auto       created  = fm.created;
  if (!created) {
    if (auto value = FieldValue(body, "**Created:**")) created = FirstDate(*value);
  }
  auto updated = fm.updated;
  if (!updated) {
    if (auto value = FieldValue(body, "**Updated:**")) updated = FirstDate(*value);
  }
  plan.set_created(created.value_or(modified));
  plan.set_updated(updated.value_or(created.value_or(modified)));

  AddAll(plan.mutable_topics(), fm.topics);
  plan.set_file(file.rel);
  plan.set_description(fm.description.value_or(""));
  plan.set_priority(fm.priority.value_or(""));
  plan.set_type(fm.type.value_or(""));
  plan.set_project_id(options.project_id);
  if (options.include_content) plan.set_content(body);
  return plan;
}

/*
  active-<user>.md names the plan a developer is working on. When it links a
  scanned PLAN_ file the pointer contributes author/status to that record;
  otherwise it stands in for the plan itself.
*/
void ApplyActivePointer(const fs::path& target, const SourceFile& file, std::map<std::string, std::size_t>& plan_by_path, std::vector<Plan>& plans,
                        const ScanOptions& options, std::vector<std::string>& errors) {
  const auto user = StripSuffix(file.path.filename().string().substr(std::string(kActivePrefix).size()), ".md");
  const auto& body = file.doc.body;

  std::optional<Link> link;
  for (auto label : {"**Currently Working On:**", "**Plan:**", "**Active Plan:**"}) {
    if (auto value = FieldValue(body, label)) {
      link = ParseLink(*value);
      if (link) break;
    }
  }
  if (!link) {
    errors.push_back(file.rel + ": active plan pointer has no plan link");
    return;
  }

  std::optional<std::string> status;
  if (auto value = FieldValue(body, "**Status:**")) {
    auto word = StatusWord(*value);
    if (model::ParsePlanStatus(word)) status = word;
  }

  // links are written relative to plans/ ("../PLAN_x.md") or to .aiknowsys/
  auto rel = RelativeToKnowledgeDir(target, (file.path.parent_path() / link->target).lexically_normal());
  if (!plan_by_path.count(rel)) {
    const auto alt = RelativeToKnowledgeDir(target, (KnowledgeDir(target) / link->target).lexically_normal());
    if (plan_by_path.count(alt)) rel = alt;
  }
  if (auto it = plan_by_path.find(rel); it != plan_by_path.end()) {
    auto& plan = plans[it->second];
    plan.set_author(user);
    if (status) plan.set_status(*status);
    return;
  }

  const auto id = user + "-plan";
  for (const auto& existing : plans) {
    if (existing.id() == id) {
      errors.push_back(file.rel + ": duplicate plan id '" + id + "'");
      return;
    }
  }

  Plan plan;
  plan.set_id(id);
  plan.set_title(link->text.empty() ? link->target : link->text);
  plan.set_status(status.value_or("ACTIVE"));
  plan.set_author(user);
  const auto modified = ModifiedAt(file.path);
  plan.set_created(modified);
  plan.set_updated(modified);
  plan.set_file(rel);
  plan.set_project_id(options.project_id);
  if (options.include_content) plan.set_content(body);

  plan_by_path.emplace(rel, plans.size());
  plans.push_back(std::move(plan));
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

std::string SessionTopic(const Frontmatter& fm, std::string_view body) {
  if (fm.topic && !fm.topic->empty()) {
    return *fm.topic;
  }
  if (auto heading = FirstHeading(body, "# Session:")) {
    const auto paren = heading->find(" (");
    return util::Trim(std::string_view(*heading).substr(0, paren));
  }
  if (auto heading = FirstHeading(body, "# ")) {
    return *heading;
  }
  return "Session";
}

std::optional<Session> ToSession(const SourceFile& file, const ScanOptions& options, std::vector<std::string>& errors) {
  const auto& fm   = file.doc.frontmatter;
  const auto& body = file.doc.body;
  const auto  stem = file.path.stem().string();

  std::string date;
  if (fm.date && util::IsValidDate(*fm.date)) {
    date = *fm.date;
  } else if (stem.size() >= 10 && util::IsValidDate(std::string_view(stem).substr(0, 10))) {
    date = stem.substr(0, 10);
  } else {
    errors.push_back(file.rel + ": session has no valid date");
    return std::nullopt;
  }

  Session session;
  session.set_id(stem);
  session.set_date(date);
  session.set_topic(SessionTopic(fm, body));

  if (fm.plan) {
    session.set_plan(NormalizePlanReference(*fm.plan));
  } else if (auto value = FieldValue(body, "**Plan:**")) {
    session.set_plan(NormalizePlanReference(*value));
  }

  AddAll(session.mutable_phases(), fm.phases);
  AddAll(session.mutable_topics(), fm.topics);
  session.set_status(fm.status.value_or(""));
  session.set_file(file.rel);
  session.set_created(fm.created.value_or(date));
  session.set_updated(fm.updated.value_or(ModifiedAt(file.path)));
  session.set_project_id(options.project_id);
  if (options.include_content) session.set_content(body);
  return session;
}

// ------------------------------------------------------------------
// Learned patterns
// ------------------------------------------------------------------

std::vector<std::string> TriggerWords(std::string_view body) {
  std::vector<std::string> words;
  bool                     in_section = false;
  for (const auto& line : util::SplitLines(body)) {
    if (util::StartsWith(line, "## ")) {
      in_section = util::ContainsIgnoreCase(line, "Trigger Words");
      continue;
    }
    if (!in_section || !util::StartsWith(util::Trim(line), "- ")) {
      continue;
    }
    auto item = util::Trim(util::Trim(line).substr(2));
    if (item.size() >= 2 && item.front() == '`' && item.back() == '`') {
      item = item.substr(1, item.size() - 2);
    }
    if (!item.empty()) words.push_back(std::move(item));
  }
  return words;
}

LearnedPattern ToLearned(const SourceFile& file, const ScanOptions& options) {
  const auto& fm   = file.doc.frontmatter;
  const auto& body = file.doc.body;
  const auto  stem = file.path.stem().string();

  LearnedPattern learned;
  learned.set_id(stem);
  learned.set_category(fm.category.value_or("learned"));

  auto title = fm.title;
  if (!title) title = FirstHeading(body, "# Learned Skill:");
  if (!title) title = FirstHeading(body, "# ");
  learned.set_title(title.value_or(stem));

  AddAll(learned.mutable_keywords(), fm.keywords.empty() ? TriggerWords(body) : fm.keywords);
  learned.set_created(fm.created.value_or(ModifiedAt(file.path)));
  learned.set_file(file.rel);
  if (options.include_content) learned.set_content(body);
  return learned;
}

} // namespace

std::string NormalizePlanReference(std::string_view reference) {
  std::string ref = util::Trim(reference);
  if (auto link = ParseLink(ref)) {
    ref = link->target;
  }
  ref = fs::path(ref).filename().string();
  if (util::StartsWith(ref, kPlanPrefix)) ref = ref.substr(std::string(kPlanPrefix).size());
  return StripSuffix(std::move(ref), ".md");
}

std::string LoadBody(const fs::path& file) {
  const auto text = util::ReadTextFile(file);
  try {
    return ParseDocument(text).body;
  } catch (const FrontmatterError&) {
    return text;
  }
}

ScanResult ScanKnowledgeBase(const fs::path& target, const ScanOptions& options) {
  ScanResult result;

  std::map<std::string, std::size_t> plan_by_path;
  std::set<std::string>              plan_ids;
  for (const auto& path : ListPlanFiles(target)) {
    auto file = Load(target, path, result.errors);
    if (!file) continue;
    auto plan = ToPlan(*file, options, result.errors);
    if (!plan) continue;
    if (!plan_ids.insert(plan->id()).second) {
      result.errors.push_back(file->rel + ": duplicate plan id '" + plan->id() + "'");
      continue;
    }
    plan_by_path.emplace(plan->file(), result.plans.size());
    result.plans.push_back(std::move(*plan));
  }

  for (const auto& path : ListMarkdownFiles(PlansDir(target))) {
    if (!IsActivePointerFileName(path.filename().string())) continue;
    auto file = Load(target, path, result.errors);
    if (!file) continue;
    ApplyActivePointer(target, *file, plan_by_path, result.plans, options, result.errors);
  }

  for (const auto& path : ListMarkdownFiles(SessionsDir(target))) {
    auto file = Load(target, path, result.errors);
    if (!file) continue;
    if (auto session = ToSession(*file, options, result.errors)) {
      result.sessions.push_back(std::move(*session));
    }
  }

  for (const auto& path : ListMarkdownFiles(LearnedDir(target))) {
    auto file = Load(target, path, result.errors);
    if (!file) continue;
    result.learned.push_back(ToLearned(*file, options));
  }

  for (const auto& error : result.errors) {
    AIKNOWSYS_LOG_WARN("skipped markdown file", {observability::StringField("error", error)});
  }
  return result;
}

} // namespace aiknowsys::markdown
