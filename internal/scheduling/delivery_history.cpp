#include "delivery_history.hpp"

#include "internal/db/mapping.hpp"
#include "internal/model/activity.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace quotecast::scheduling {

using observability::IntField;
using observability::StringField;

DeliveryHistoryTracker::DeliveryHistoryTracker(std::shared_ptr<db::Repository> repository, util::TimeZone zone)
    : repository_(std::move(repository)), zone_(zone) {
}

void DeliveryHistoryTracker::RecordDelivery(db::Transaction& tx, const db::model::ScheduleRecord& schedule, const std::string& quote_id,
                                            util::TimePoint now) const {
  if (schedule.last_delivery_at_ms && zone_.LocalDate(util::FromUnixMillis(*schedule.last_delivery_at_ms)) == zone_.LocalDate(now)) {
    throw util::Conflict("schedule " + schedule.id + " already delivered on " + util::FormatDate(zone_.LocalDate(now)));
  }

  const auto now_ms = util::ToUnixMillis(now);

  db::model::DeliveryRecord record{.id = 0, .quote_id = quote_id, .schedule_id = schedule.id, .delivered_at_ms = now_ms};
  db::ThrowIfError(repository_->InsertDelivery(tx, record), "insert delivery for schedule " + schedule.id);

  PruneOlderThanRetention(tx, now);

  db::ThrowIfError(repository_->UpdateLastDelivery(tx, schedule.id, quote_id, now_ms, schedule.last_delivery_at_ms),
               "update last delivery of schedule " + schedule.id);

  db::model::ActivityRecord activity{.id = 0, .kind = std::string(model::kActivityQuoteDelivery), .occurred_at_ms = now_ms};
  db::ThrowIfError(repository_->InsertActivity(tx, activity), "record delivery activity");

  QUOTECAST_LOG_DEBUG("delivery recorded", {StringField("schedule_id", schedule.id), StringField("quote_id", quote_id),
                                            IntField("delivery_id", static_cast<int64_t>(record.id))});
}

void DeliveryHistoryTracker::RecordDelivery(const std::string& schedule_id, const std::string& quote_id, util::TimePoint now) const {
  auto tx       = repository_->Begin();
  auto schedule = repository_->GetSchedule(*tx, schedule_id);
  if (!schedule) {
    throw util::NotFound("schedule " + schedule_id);
  }

  RecordDelivery(*tx, *schedule, quote_id, now);
  tx->Commit();
}

std::vector<model::DeliveryRecord> DeliveryHistoryTracker::RecentDeliveries(db::Transaction& tx, const std::string& schedule_id,
                                                                            util::TimePoint now, std::chrono::days window) const {
  std::vector<model::DeliveryRecord> out;
  for (const auto& row : repository_->ListDeliveriesSince(tx, schedule_id, util::ToUnixMillis(now - window))) {
    out.push_back(db::FromRecord(row));
  }
  return out;
}

void DeliveryHistoryTracker::PruneOlderThanRetention(db::Transaction& tx, util::TimePoint now) const {
  const auto cutoff_ms = util::ToUnixMillis(now - kRetention);
  try {
    auto result = repository_->DeleteDeliveriesOlderThan(tx, cutoff_ms);
    if (!result) {
      QUOTECAST_LOG_WARN("delivery history prune failed", {IntField("cutoff_ms", cutoff_ms), StringField("error", result.message)});
    }
  } catch (const std::exception& e) {
    QUOTECAST_LOG_WARN("delivery history prune failed", {IntField("cutoff_ms", cutoff_ms), StringField("error", e.what())});
  }
}

} // namespace quotecast::scheduling
