#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace quotecast::db::model {

/*
  Persistent schedule row.

  IMPORTANT:
  - last_delivery_at_ms is the idempotence guard for daily delivery; it is
    only ever changed through Repository::UpdateLastDelivery (compare-and-swap).
  - At most one row has is_default set.
*/

struct ScheduleRecord {
  std::string id;

  bool    is_enabled       = true;
  int32_t scheduled_hour   = 9;
  int32_t scheduled_minute = 0;

  // model::DeliveryMethod underlying value
  int32_t delivery_method = 2;

  bool                     favorites_only = false;
  std::vector<std::string> categories;
  int32_t                  exclude_recent_days = 7;
  std::vector<int32_t>     active_days;

  std::optional<std::string> last_delivered_quote_id;
  std::optional<int64_t>     last_delivery_at_ms;

  bool is_default = false;

  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;
};

} // namespace quotecast::db::model
