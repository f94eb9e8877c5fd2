#pragma once

#include <optional>
#include <string>

#include "internal/model/plan_status.hpp"

namespace aiknowsys::db {

/*
  Query filters. Every set field must match (AND).

  - status / author / date / plan: exact
  - topic: case-insensitive substring of the title (plans) or topic
    (sessions), or of any topics entry
  - *_after: inclusive lower bound, *_before: exclusive upper bound, both
    compared as ISO strings so a bare date bounds whole days

  Values reaching a backend are already validated.
*/

struct PlanFilters {
  std::optional<model::PlanStatus> status;
  std::optional<std::string>       author;
  std::optional<std::string>       topic;
  std::optional<std::string>       updated_after;
  std::optional<std::string>       updated_before;

  // false: metadata only (no `content`)
  bool include_content = false;
};

struct SessionFilters {
  std::optional<std::string> date;
  std::optional<std::string> date_after;
  std::optional<std::string> date_before;
  std::optional<std::string> topic;
  std::optional<std::string> plan;

  bool include_content = false;
};

} // namespace aiknowsys::db
