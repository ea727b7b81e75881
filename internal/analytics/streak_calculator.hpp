#pragma once

#include <set>
#include <string>
#include <vector>

#include "internal/model/activity.hpp"
#include "internal/util/time.hpp"

namespace quotecast::analytics {

/*
  Streak calculator

  Turns sparse activity timestamps into consecutive-day counts. Every
  timestamp is first anchored to a calendar day in `zone`; from there on all
  arithmetic is on std::chrono::sys_days, so month ends, leap years and DST
  shifts need no special casing.

  Results do not depend on input order or on same-day duplicates.
*/

using DateSet = std::set<util::Date>;

util::Date ToLocalDate(util::TimePoint tp, const util::TimeZone& zone);

DateSet DistinctDates(const std::vector<util::TimePoint>& timestamps, const util::TimeZone& zone);

// Unparseable strings and impossible dates (2023-02-29) are dropped.
DateSet DistinctDates(const std::vector<std::string>& dates);

// 0 when the most recent day is older than yesterday.
int CurrentStreak(const DateSet& dates, util::Date today);
int LongestStreak(const DateSet& dates);

int CurrentStreak(const std::vector<util::TimePoint>& timestamps, const util::TimeZone& zone, util::TimePoint now = util::Now());
int LongestStreak(const std::vector<util::TimePoint>& timestamps, const util::TimeZone& zone);
int UniqueDays(const std::vector<util::TimePoint>& timestamps, const util::TimeZone& zone);

int CurrentStreakFromDateStrings(const std::vector<std::string>& dates, const util::TimeZone& zone, util::TimePoint now = util::Now());
int LongestStreakFromDateStrings(const std::vector<std::string>& dates);

model::StreakSummary Summarize(const std::vector<util::TimePoint>& timestamps, const util::TimeZone& zone, util::TimePoint now);

} // namespace quotecast::analytics
