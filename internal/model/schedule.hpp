#pragma once

#include <optional>
#include <set>
#include <string>

#include "internal/model/delivery_method.hpp"
#include "internal/util/time.hpp"

namespace quotecast::model {

inline constexpr int kMaxExcludeRecentDays = 3650;

/*
  One configured delivery policy.

  categories  empty = no category filter
  active_days ISO weekdays (1 = Monday .. 7 = Sunday), empty = every day
  exclude_recent_days 0 disables the recency exclusion window (including the
                      last-delivered quote), at most kMaxExcludeRecentDays
*/
struct Schedule {
  std::string id;

  bool is_enabled = true;
  int  scheduled_hour   = 9;
  int  scheduled_minute = 0;

  DeliveryMethod delivery_method = DeliveryMethod::kBoth;

  bool                  favorites_only = false;
  std::set<std::string> categories;
  int                   exclude_recent_days = 7;
  std::set<int>         active_days;

  std::optional<std::string>     last_delivered_quote_id;
  std::optional<util::TimePoint> last_delivery_date;

  bool is_default = false;

  util::TimePoint created_at{};
  util::TimePoint updated_at{};

  bool IsActiveOn(unsigned iso_weekday) const {
    return active_days.empty() || active_days.contains(static_cast<int>(iso_weekday));
  }
};

// enabled, 09:00, both surfaces, no filters, every day
Schedule MakeDefaultSchedule();

} // namespace quotecast::model
