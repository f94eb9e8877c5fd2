#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "aiknowsys/v1.hpp"
#include "internal/db/api/filters.hpp"

namespace aiknowsys::db {

inline constexpr std::size_t kSnippetBefore = 50;
inline constexpr std::size_t kSnippetAfter  = 100;

// In-memory evaluation of the filter semantics described in filters.hpp.
bool Matches(const aiknowsys::v1::Plan& plan, const PlanFilters& filters);
bool Matches(const aiknowsys::v1::Session& session, const SessionFilters& filters);

/*
  Literal-match scoring shared by both backends:
    relevance = min(100, 10 * occurrences)
    line      = 1-based line of the first occurrence
  nullopt when `text` does not contain `query`.
*/
std::optional<aiknowsys::v1::SearchResult> ScoreMatch(std::string_view file, std::string_view text, std::string_view query, std::string_view type);

// relevance desc, then file asc
void SortByRelevance(google::protobuf::RepeatedPtrField<aiknowsys::v1::SearchResult>* results);

} // namespace aiknowsys::db
