#include "internal/model/schedule.hpp"

#include "internal/util/uuid.hpp"

namespace quotecast::model {

Schedule MakeDefaultSchedule() {
  Schedule schedule;
  schedule.id                  = util::NewId();
  schedule.is_enabled          = true;
  schedule.scheduled_hour      = 9;
  schedule.scheduled_minute    = 0;
  schedule.delivery_method     = DeliveryMethod::kBoth;
  schedule.favorites_only      = false;
  schedule.exclude_recent_days = 7;
  schedule.is_default          = true;
  schedule.created_at          = util::Now();
  schedule.updated_at          = schedule.created_at;
  return schedule;
}

} // namespace quotecast::model
