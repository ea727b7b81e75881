#include "readiness_evaluator.hpp"

#include <chrono>

namespace quotecast::scheduling {

bool DeliveredOn(const model::Schedule& schedule, const util::Date& date, const util::TimeZone& zone) {
  return schedule.last_delivery_date && zone.LocalDate(*schedule.last_delivery_date) == date;
}

bool IsReady(const model::Schedule& schedule, util::TimePoint now, const util::TimeZone& zone) {
  if (!schedule.is_enabled) {
    return false;
  }

  const auto today = zone.LocalDate(now);
  if (!schedule.IsActiveOn(util::IsoWeekday(today))) {
    return false;
  }

  if (now < zone.AtLocalTime(today, schedule.scheduled_hour, schedule.scheduled_minute)) {
    return false;
  }

  return !DeliveredOn(schedule, today, zone);
}

std::vector<std::string> ReadySchedules(const std::vector<model::Schedule>& schedules, util::TimePoint now, const util::TimeZone& zone) {
  std::vector<std::string> out;
  for (const auto& schedule : schedules) {
    if (IsReady(schedule, now, zone)) {
      out.push_back(schedule.id);
    }
  }
  return out;
}

std::optional<util::TimePoint> NextDeliveryTime(const model::Schedule& schedule, util::TimePoint now, const util::TimeZone& zone) {
  if (!schedule.is_enabled) {
    return std::nullopt;
  }

  const std::chrono::sys_days today{zone.LocalDate(now)};

  // a week ahead always reaches every weekday; the eighth day covers "today, already past"
  for (int offset = 0; offset <= 7; ++offset) {
    const util::Date day{today + std::chrono::days{offset}};
    if (!schedule.IsActiveOn(util::IsoWeekday(day))) {
      continue;
    }
    if (offset == 0 && DeliveredOn(schedule, day, zone)) {
      continue;
    }

    const auto at = zone.AtLocalTime(day, schedule.scheduled_hour, schedule.scheduled_minute);
    if (at > now) {
      return at;
    }
  }
  return std::nullopt;
}

} // namespace quotecast::scheduling
