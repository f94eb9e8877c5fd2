#include "pattern_detector.hpp"

#include <algorithm>
#include <map>
#include <numeric>
#include <regex>
#include <set>
#include <system_error>
#include <tuple>

#include "internal/markdown/frontmatter.hpp"
#include "internal/markdown/layout.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/strings.hpp"

namespace aiknowsys::learning {

namespace fs = std::filesystem;

using observability::IntField;
using observability::PathField;
using observability::StringField;

namespace {

const std::set<std::string> kStopwords = {
    "this", "that", "with", "from", "were", "been", "have", "will", "when", "should", "would", "could",
    "into", "than", "then", "they", "them", "their", "there", "what", "which", "while", "also", "only",
    "just", "does", "after", "before", "because", "using", "need", "needs",
};

std::string EscapeRegex(std::string_view text) {
  static const std::string kSpecial = R"(\^$.|?*+()[]{})";
  std::string              out;
  for (char c : text) {
    if (kSpecial.find(c) != std::string::npos) out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

std::regex MarkerRegex(const std::string& marker) {
  return std::regex(R"(^\s*(?:[-*+]\s+)?(?:\*\*)?)" + EscapeRegex(marker) + R"((?:\*\*)?\s*:\s*(?:\*\*)?\s*(.*)$)",
                    std::regex::ECMAScript | std::regex::icase);
}

std::optional<std::string> SessionDate(const fs::path& file, const std::string& content) {
  const auto stem = file.stem().string();
  if (stem.size() >= 10 && util::IsValidDate(std::string_view(stem).substr(0, 10))) {
    return stem.substr(0, 10);
  }

  try {
    const auto doc = markdown::ParseDocument(content);
    if (doc.frontmatter.date && util::IsValidDate(*doc.frontmatter.date)) return *doc.frontmatter.date;
  } catch (const markdown::FrontmatterError& e) {
    AIKNOWSYS_LOG_DEBUG("session frontmatter unreadable, dating by mtime", {PathField("file", file), StringField("error", e.what())});
  }

  std::error_code ec;
  const auto      mtime = fs::last_write_time(file, ec);
  if (ec) return std::nullopt;
  return util::FormatDate(util::FromFileTime(mtime));
}

std::set<std::string> WordSet(std::string_view text) {
  auto words = util::SplitWords(text);
  return {words.begin(), words.end()};
}

std::vector<std::string> TopKeywords(const std::vector<std::string>& texts, std::size_t limit) {
  std::map<std::string, int> counts;
  for (const auto& text : texts) {
    for (auto& word : util::SplitWords(text)) {
      if (word.size() < 4 || kStopwords.count(word)) continue;
      ++counts[word];
    }
  }

  std::vector<std::pair<std::string, int>> ranked(counts.begin(), counts.end());
  // std::map iteration is alphabetical, so a stable sort keeps ties in order
  std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) { return a.second > b.second; });

  std::vector<std::string> keywords;
  for (const auto& entry : ranked) {
    if (keywords.size() == limit) break;
    keywords.push_back(entry.first);
  }
  return keywords;
}

class DisjointSet {
 public:
  explicit DisjointSet(std::size_t n) : parent_(n) {
    std::iota(parent_.begin(), parent_.end(), std::size_t{0});
  }

  std::size_t Find(std::size_t x) {
    while (parent_[x] != x) {
      parent_[x] = parent_[parent_[x]];
      x          = parent_[x];
    }
    return x;
  }

  // the smaller root wins so a cluster is named by its earliest member
  void Union(std::size_t a, std::size_t b) {
    a = Find(a);
    b = Find(b);
    if (a == b) return;
    if (b < a) std::swap(a, b);
    parent_[b] = a;
  }

 private:
  std::vector<std::size_t> parent_;
};

} // namespace

SessionLoadResult LoadRecentSessions(const fs::path& target_dir, int window_days, util::TimePoint now) {
  SessionLoadResult result;

  const auto from  = util::DateDaysBefore(now, window_days);
  const auto until = util::FormatDate(now);

  for (const auto& file : markdown::ListMarkdownFiles(markdown::SessionsDir(target_dir))) {
    const auto rel = markdown::RelativeToKnowledgeDir(target_dir, file);

    std::string content;
    try {
      content = util::ReadTextFile(file);
    } catch (const std::exception& e) {
      result.errors.push_back(rel + ": " + e.what());
      continue;
    }

    const auto date = SessionDate(file, content);
    if (!date) {
      result.errors.push_back(rel + ": cannot determine session date");
      continue;
    }
    if (*date < from || *date > until) continue;

    result.sessions.push_back({rel, *date, std::move(content)});
  }

  std::stable_sort(result.sessions.begin(), result.sessions.end(),
                   [](const SessionDocument& a, const SessionDocument& b) { return std::tie(a.date, a.file) < std::tie(b.date, b.file); });
  return result;
}

std::vector<Observation> ExtractErrorPatterns(const std::vector<SessionDocument>& sessions, const std::vector<std::string>& markers) {
  std::vector<std::regex> patterns;
  patterns.reserve(markers.size());
  for (const auto& marker : markers) patterns.push_back(MarkerRegex(marker));

  std::vector<Observation> observations;
  for (const auto& session : sessions) {
    const auto lines = util::SplitLines(session.content);
    for (std::size_t i = 0; i < lines.size(); ++i) {
      for (const auto& pattern : patterns) {
        std::smatch m;
        if (!std::regex_match(lines[i], m, pattern)) continue;

        auto text = util::Trim(m[1].str());
        if (!text.empty()) observations.push_back({std::move(text), session.date, session.file, i});
        break;
      }
    }
  }
  return observations;
}

double JaccardSimilarity(std::string_view a, std::string_view b) {
  const auto normalized = util::ToLower(util::Trim(a));
  if (!normalized.empty() && normalized == util::ToLower(util::Trim(b))) return 1.0;

  const auto left  = WordSet(a);
  const auto right = WordSet(b);
  if (left.empty() && right.empty()) return 0.0;

  std::size_t shared = 0;
  for (const auto& word : left) shared += right.count(word);

  const auto combined = left.size() + right.size() - shared;
  return static_cast<double>(shared) / static_cast<double>(combined);
}

std::vector<DetectedPattern> ClusterObservations(std::vector<Observation> observations, double similarity) {
  std::stable_sort(observations.begin(), observations.end(), [](const Observation& a, const Observation& b) {
    return std::tie(a.date, a.source, a.position) < std::tie(b.date, b.source, b.position);
  });

  const auto  n = observations.size();
  DisjointSet clusters(n);
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = i + 1; j < n; ++j) {
      if (JaccardSimilarity(observations[i].text, observations[j].text) >= similarity) clusters.Union(i, j);
    }
  }

  // root index -> member indices, both ascending
  std::map<std::size_t, std::vector<std::size_t>> members;
  for (std::size_t i = 0; i < n; ++i) members[clusters.Find(i)].push_back(i);

  std::vector<DetectedPattern> patterns;
  patterns.reserve(members.size());
  for (const auto& [root, indices] : members) {
    DetectedPattern pattern;
    pattern.error             = observations[root].text;
    pattern.frequency         = static_cast<int>(indices.size());
    pattern.first_seen        = observations[indices.front()].date;
    pattern.last_seen         = observations[indices.back()].date;
    pattern.common_resolution = observations[root].text;
    for (auto i : indices) pattern.examples.push_back(observations[i].text);
    pattern.keywords = TopKeywords(pattern.examples, 5);
    patterns.push_back(std::move(pattern));
  }
  return patterns;
}

DetectionResult DetectPatterns(const fs::path& target_dir, const DetectOptions& options) {
  observability::SpanScope span("learning.detect_patterns");

  auto loaded = LoadRecentSessions(target_dir, options.window_days, options.now.value_or(util::Now()));
  for (const auto& error : loaded.errors) {
    AIKNOWSYS_LOG_WARN("skipped session file", {StringField("error", error)});
  }

  DetectionResult result;
  result.errors = std::move(loaded.errors);

  for (auto& pattern : ClusterObservations(ExtractErrorPatterns(loaded.sessions, options.markers), options.similarity)) {
    if (pattern.frequency >= options.threshold) result.patterns.push_back(std::move(pattern));
  }
  std::stable_sort(result.patterns.begin(), result.patterns.end(), [](const DetectedPattern& a, const DetectedPattern& b) {
    if (a.frequency != b.frequency) return a.frequency > b.frequency;
    return a.first_seen < b.first_seen;
  });

  span.SetAttribute("patterns", static_cast<std::int64_t>(result.patterns.size()));
  AIKNOWSYS_LOG_INFO("pattern detection finished", {PathField("target", target_dir), IntField("sessions", static_cast<std::int64_t>(loaded.sessions.size())),
                                                    IntField("patterns", static_cast<std::int64_t>(result.patterns.size()))});
  return result;
}

} // namespace aiknowsys::learning
