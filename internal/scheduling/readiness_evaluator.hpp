#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/schedule.hpp"
#include "internal/util/time.hpp"

namespace quotecast::scheduling {

/*
  Readiness rules, evaluated in `zone`:

    disabled                           -> not ready
    today is not an active day         -> not ready
    now < today at hour:minute         -> not ready
    last delivery on today's date      -> not ready
    otherwise                          -> ready

  Pure functions; safe to call as often as the trigger likes.
*/

bool IsReady(const model::Schedule& schedule, util::TimePoint now, const util::TimeZone& zone);

// Ids of ready schedules, input order preserved.
std::vector<std::string> ReadySchedules(const std::vector<model::Schedule>& schedules, util::TimePoint now, const util::TimeZone& zone);

bool DeliveredOn(const model::Schedule& schedule, const util::Date& date, const util::TimeZone& zone);

// Next scheduled instant strictly after `now` on an active day; nullopt when disabled.
std::optional<util::TimePoint> NextDeliveryTime(const model::Schedule& schedule, util::TimePoint now, const util::TimeZone& zone);

} // namespace quotecast::scheduling
