#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace aiknowsys::model {

enum class PlanStatus : std::uint8_t {
  kActive,
  kPaused,
  kPlanned,
  kComplete,
  kCancelled,
};

inline constexpr std::array<PlanStatus, 5> kAllPlanStatuses = {
    PlanStatus::kActive, PlanStatus::kPaused, PlanStatus::kPlanned, PlanStatus::kComplete, PlanStatus::kCancelled,
};

constexpr std::string_view ToString(PlanStatus status) {
  switch (status) {
    case PlanStatus::kActive:
      return "ACTIVE";
    case PlanStatus::kPaused:
      return "PAUSED";
    case PlanStatus::kComplete:
      return "COMPLETE";
    case PlanStatus::kCancelled:
      return "CANCELLED";
    case PlanStatus::kPlanned:
    default:
      return "PLANNED";
  }
}

// Exact, upper-case names only. Callers normalize case first if they want leniency.
constexpr std::optional<PlanStatus> ParsePlanStatus(std::string_view text) {
  for (auto status : kAllPlanStatuses) {
    if (ToString(status) == text) {
      return status;
    }
  }
  return std::nullopt;
}

} // namespace aiknowsys::model
