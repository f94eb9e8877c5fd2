#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace aiknowsys::util {

/*
  Time utilities; the single place that controls the clock source.

  Dates are calendar days ("YYYY-MM-DD", UTC). Timestamps are RFC 3339 UTC
  strings as produced by protobuf's TimeUtil.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

// "2026-01-20"
std::string FormatDate(TimePoint tp);

// "2026-01-20T10:00:00Z"
std::string FormatTimestamp(TimePoint tp);

// Strict YYYY-MM-DD that also names a real calendar day.
bool IsValidDate(std::string_view date);

// Midnight UTC of the given day.
std::optional<TimePoint> ParseDate(std::string_view date);

// Calendar date `days` before tp, formatted.
std::string DateDaysBefore(TimePoint tp, int days);

TimePoint FromFileTime(std::filesystem::file_time_type ft);

} // namespace aiknowsys::util
