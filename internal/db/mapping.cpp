#include "internal/db/mapping.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace quotecast::db {

namespace domain = quotecast::model;

model::ScheduleRecord ToRecord(const domain::Schedule& schedule) {
  model::ScheduleRecord r;
  r.id                  = schedule.id;
  r.is_enabled          = schedule.is_enabled;
  r.scheduled_hour      = schedule.scheduled_hour;
  r.scheduled_minute    = schedule.scheduled_minute;
  r.delivery_method     = static_cast<int32_t>(schedule.delivery_method);
  r.favorites_only      = schedule.favorites_only;
  r.categories          = {schedule.categories.begin(), schedule.categories.end()};
  r.exclude_recent_days = schedule.exclude_recent_days;
  r.active_days         = {schedule.active_days.begin(), schedule.active_days.end()};
  r.last_delivered_quote_id = schedule.last_delivered_quote_id;
  if (schedule.last_delivery_date) {
    r.last_delivery_at_ms = util::ToUnixMillis(*schedule.last_delivery_date);
  }
  r.is_default    = schedule.is_default;
  r.created_at_ms = util::ToUnixMillis(schedule.created_at);
  r.updated_at_ms = util::ToUnixMillis(schedule.updated_at);
  return r;
}

domain::Schedule FromRecord(const model::ScheduleRecord& r) {
  if (r.delivery_method < 0 || r.delivery_method > static_cast<int32_t>(domain::DeliveryMethod::kBoth)) {
    throw util::PersistenceFailure("schedule " + r.id + " has unknown delivery method " + std::to_string(r.delivery_method));
  }

  domain::Schedule s;
  s.id                  = r.id;
  s.is_enabled          = r.is_enabled;
  s.scheduled_hour      = r.scheduled_hour;
  s.scheduled_minute    = r.scheduled_minute;
  s.delivery_method     = static_cast<domain::DeliveryMethod>(r.delivery_method);
  s.favorites_only      = r.favorites_only;
  s.categories          = {r.categories.begin(), r.categories.end()};
  s.exclude_recent_days = r.exclude_recent_days;
  s.active_days         = {r.active_days.begin(), r.active_days.end()};
  s.last_delivered_quote_id = r.last_delivered_quote_id;
  if (r.last_delivery_at_ms) {
    s.last_delivery_date = util::FromUnixMillis(*r.last_delivery_at_ms);
  }
  s.is_default = r.is_default;
  s.created_at = util::FromUnixMillis(r.created_at_ms);
  s.updated_at = util::FromUnixMillis(r.updated_at_ms);
  return s;
}

model::QuoteRecord ToRecord(const domain::Quote& quote) {
  return model::QuoteRecord{
      .id          = quote.id,
      .text        = quote.text,
      .author      = quote.author,
      .categories  = {quote.categories.begin(), quote.categories.end()},
      .is_favorite = quote.is_favorite,
  };
}

domain::Quote FromRecord(const model::QuoteRecord& r) {
  return domain::Quote{
      .id          = r.id,
      .text        = r.text,
      .author      = r.author,
      .categories  = {r.categories.begin(), r.categories.end()},
      .is_favorite = r.is_favorite,
  };
}

model::DeliveryRecord ToRecord(const domain::DeliveryRecord& delivery) {
  return model::DeliveryRecord{
      .id              = 0,
      .quote_id        = delivery.quote_id,
      .schedule_id     = delivery.schedule_id,
      .delivered_at_ms = util::ToUnixMillis(delivery.delivered_at),
  };
}

domain::DeliveryRecord FromRecord(const model::DeliveryRecord& r) {
  return domain::DeliveryRecord{
      .quote_id     = r.quote_id,
      .schedule_id  = r.schedule_id,
      .delivered_at = util::FromUnixMillis(r.delivered_at_ms),
  };
}

void ThrowIfError(const Result& result, const std::string& what) {
  if (result) {
    return;
  }

  const auto message = what + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw util::AlreadyExists(message);
    case ErrorCode::Conflict:
    case ErrorCode::Busy:
      throw util::Conflict(message);
    default:
      throw util::PersistenceFailure(message);
  }
}

} // namespace quotecast::db
