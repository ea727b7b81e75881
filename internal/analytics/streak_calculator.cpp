#include "streak_calculator.hpp"

#include <algorithm>
#include <chrono>

namespace quotecast::analytics {

using std::chrono::days;
using std::chrono::sys_days;

util::Date ToLocalDate(util::TimePoint tp, const util::TimeZone& zone) {
  return zone.LocalDate(tp);
}

DateSet DistinctDates(const std::vector<util::TimePoint>& timestamps, const util::TimeZone& zone) {
  DateSet out;
  for (const auto& tp : timestamps) {
    out.insert(zone.LocalDate(tp));
  }
  return out;
}

DateSet DistinctDates(const std::vector<std::string>& dates) {
  DateSet out;
  for (const auto& text : dates) {
    if (auto date = util::ParseDate(text)) {
      out.insert(*date);
    }
  }
  return out;
}

int CurrentStreak(const DateSet& dates, util::Date today) {
  if (dates.empty()) {
    return 0;
  }

  const sys_days most_recent{*dates.rbegin()};
  if (sys_days{today} - most_recent > days{1}) {
    return 0;
  }

  int      streak   = 1;
  sys_days expected = most_recent - days{1};
  for (auto it = std::next(dates.rbegin()); it != dates.rend(); ++it) {
    if (sys_days{*it} != expected) {
      break;
    }
    ++streak;
    expected -= days{1};
  }
  return streak;
}

int LongestStreak(const DateSet& dates) {
  if (dates.empty()) {
    return 0;
  }

  int      longest = 1;
  int      running = 1;
  sys_days previous{*dates.begin()};
  for (auto it = std::next(dates.begin()); it != dates.end(); ++it) {
    const sys_days current{*it};
    running  = (current - previous == days{1}) ? running + 1 : 1;
    longest  = std::max(longest, running);
    previous = current;
  }
  return longest;
}

int CurrentStreak(const std::vector<util::TimePoint>& timestamps, const util::TimeZone& zone, util::TimePoint now) {
  return CurrentStreak(DistinctDates(timestamps, zone), zone.LocalDate(now));
}

int LongestStreak(const std::vector<util::TimePoint>& timestamps, const util::TimeZone& zone) {
  return LongestStreak(DistinctDates(timestamps, zone));
}

int UniqueDays(const std::vector<util::TimePoint>& timestamps, const util::TimeZone& zone) {
  return static_cast<int>(DistinctDates(timestamps, zone).size());
}

int CurrentStreakFromDateStrings(const std::vector<std::string>& dates, const util::TimeZone& zone, util::TimePoint now) {
  return CurrentStreak(DistinctDates(dates), zone.LocalDate(now));
}

int LongestStreakFromDateStrings(const std::vector<std::string>& dates) {
  return LongestStreak(DistinctDates(dates));
}

model::StreakSummary Summarize(const std::vector<util::TimePoint>& timestamps, const util::TimeZone& zone, util::TimePoint now) {
  const auto dates = DistinctDates(timestamps, zone);

  model::StreakSummary out;
  out.current     = CurrentStreak(dates, zone.LocalDate(now));
  out.longest     = LongestStreak(dates);
  out.unique_days = static_cast<int>(dates.size());
  return out;
}

} // namespace quotecast::analytics
