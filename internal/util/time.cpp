#include "time.hpp"

#include <google/protobuf/util/time_util.h>

#include <cctype>
#include <cstdio>

namespace aiknowsys::util {

using google::protobuf::util::TimeUtil;

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

std::string FormatDate(TimePoint tp) {
  const std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(tp)};

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
  return buf;
}

std::string FormatTimestamp(TimePoint tp) {
  // second precision keeps rebuild output stable across filesystems
  return TimeUtil::ToString(ToProto(std::chrono::time_point_cast<std::chrono::seconds>(tp)));
}

bool IsValidDate(std::string_view date) {
  return ParseDate(date).has_value();
}

std::optional<TimePoint> ParseDate(std::string_view date) {
  if (date.size() != 10 || date[4] != '-' || date[7] != '-') {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < date.size(); ++i) {
    if (i == 4 || i == 7) continue;
    if (!std::isdigit(static_cast<unsigned char>(date[i]))) return std::nullopt;
  }

  const int      y = std::stoi(std::string(date.substr(0, 4)));
  const unsigned m = static_cast<unsigned>(std::stoi(std::string(date.substr(5, 2))));
  const unsigned d = static_cast<unsigned>(std::stoi(std::string(date.substr(8, 2))));

  const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
  if (!ymd.ok()) {
    return std::nullopt;
  }
  return TimePoint{std::chrono::sys_days{ymd}.time_since_epoch()};
}

std::string DateDaysBefore(TimePoint tp, int days) {
  return FormatDate(tp - std::chrono::days{days});
}

TimePoint FromFileTime(std::filesystem::file_time_type ft) {
  return std::chrono::time_point_cast<Clock::duration>(std::chrono::file_clock::to_sys(ft));
}

} // namespace aiknowsys::util
