#include "internal/db/api/matching.hpp"

#include <algorithm>

#include "internal/util/strings.hpp"

namespace aiknowsys::db {

using aiknowsys::v1::Plan;
using aiknowsys::v1::SearchResult;
using aiknowsys::v1::Session;

namespace {

bool TopicMatches(std::string_view primary, const google::protobuf::RepeatedPtrField<std::string>& topics, std::string_view needle) {
  if (util::ContainsIgnoreCase(primary, needle)) {
    return true;
  }
  return std::any_of(topics.begin(), topics.end(), [&](const std::string& t) { return util::ContainsIgnoreCase(t, needle); });
}

} // namespace

bool Matches(const Plan& plan, const PlanFilters& filters) {
  if (filters.status && plan.status() != model::ToString(*filters.status)) return false;
  if (filters.author && plan.author() != *filters.author) return false;
  if (filters.topic && !TopicMatches(plan.title(), plan.topics(), *filters.topic)) return false;
  if (filters.updated_after && plan.updated() < *filters.updated_after) return false;
  if (filters.updated_before && !(plan.updated() < *filters.updated_before)) return false;
  return true;
}

bool Matches(const Session& session, const SessionFilters& filters) {
  if (filters.date && session.date() != *filters.date) return false;
  if (filters.date_after && session.date() < *filters.date_after) return false;
  if (filters.date_before && !(session.date() < *filters.date_before)) return false;
  if (filters.topic && !TopicMatches(session.topic(), session.topics(), *filters.topic)) return false;
  if (filters.plan && session.plan() != *filters.plan) return false;
  return true;
}

std::optional<SearchResult> ScoreMatch(std::string_view file, std::string_view text, std::string_view query, std::string_view type) {
  const auto first = util::FindIgnoreCase(text, query);
  if (first == std::string_view::npos) {
    return std::nullopt;
  }

  const auto occurrences = util::CountIgnoreCase(text, query);

  SearchResult result;
  result.set_file(std::string(file));
  result.set_line(util::LineOf(text, first));
  result.set_context(util::Snippet(text, first, kSnippetBefore, kSnippetAfter));
  result.set_relevance(static_cast<int32_t>(std::min<std::size_t>(100, occurrences * 10)));
  result.set_type(std::string(type));
  return result;
}

void SortByRelevance(google::protobuf::RepeatedPtrField<SearchResult>* results) {
  std::stable_sort(results->begin(), results->end(), [](const SearchResult& a, const SearchResult& b) {
    if (a.relevance() != b.relevance()) return a.relevance() > b.relevance();
    return a.file() < b.file();
  });
}

} // namespace aiknowsys::db
