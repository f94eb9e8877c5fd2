#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace aiknowsys::model {

enum class SearchScope : std::uint8_t {
  kAll,
  kPlans,
  kSessions,
  kLearned,
};

constexpr std::string_view ToString(SearchScope scope) {
  switch (scope) {
    case SearchScope::kPlans:
      return "plans";
    case SearchScope::kSessions:
      return "sessions";
    case SearchScope::kLearned:
      return "learned";
    case SearchScope::kAll:
    default:
      return "all";
  }
}

constexpr std::optional<SearchScope> ParseSearchScope(std::string_view text) {
  if (text == "all") return SearchScope::kAll;
  if (text == "plans") return SearchScope::kPlans;
  if (text == "sessions") return SearchScope::kSessions;
  if (text == "learned") return SearchScope::kLearned;
  return std::nullopt;
}

constexpr bool Includes(SearchScope scope, SearchScope kind) {
  return scope == SearchScope::kAll || scope == kind;
}

// SearchResult.type for results of a given (non-"all") scope
constexpr std::string_view ResultType(SearchScope kind) {
  switch (kind) {
    case SearchScope::kPlans:
      return "plan";
    case SearchScope::kSessions:
      return "session";
    case SearchScope::kLearned:
    default:
      return "learned";
  }
}

} // namespace aiknowsys::model
