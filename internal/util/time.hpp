#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace quotecast::util {

/*
  Time utilities: the single place that reads the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Date      = std::chrono::year_month_day;

// Millisecond resolution, the same as every persisted timestamp.
TimePoint Now();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// "YYYY-MM-DD"
std::string           FormatDate(const Date& date);
std::optional<Date>   ParseDate(std::string_view text);
std::string           FormatTimestamp(TimePoint tp);

// ISO weekday, 1 = Monday .. 7 = Sunday
unsigned IsoWeekday(const Date& date);

/*
  Calendar anchor for a timestamp.

  kUtc and kFixed never observe DST. kSystem follows the host zone through
  localtime_r/mktime, so the offset may differ between two instants.
*/
class TimeZone {
 public:
  static TimeZone Utc();
  static TimeZone Fixed(std::chrono::minutes utc_offset);
  static TimeZone System();

  // Accepts "UTC", "Z", "local", "+05:30", "-08:00", "+0200".
  static std::optional<TimeZone> Parse(std::string_view spec);

  Date      LocalDate(TimePoint tp) const;
  TimePoint AtLocalTime(const Date& date, int hour, int minute) const;

  std::string Name() const;

 private:
  enum class Kind { kUtc, kFixed, kSystem };

  TimeZone(Kind kind, std::chrono::minutes offset) : kind_(kind), offset_(offset) {
  }

  Kind                 kind_;
  std::chrono::minutes offset_;
};

} // namespace quotecast::util
