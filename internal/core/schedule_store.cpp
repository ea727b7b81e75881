#include "schedule_store.hpp"

#include <algorithm>
#include <chrono>

#include "internal/core/observe.hpp"
#include "internal/db/mapping.hpp"
#include "internal/observability/logging.hpp"
#include "internal/scheduling/readiness_evaluator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace quotecast::core {

using observability::IntField;
using observability::StringField;

namespace {

void ValidateSchedule(const model::Schedule& schedule) {
  if (schedule.scheduled_hour < 0 || schedule.scheduled_hour > 23) {
    throw util::InvalidArgument("scheduled hour must be within 0-23, got " + std::to_string(schedule.scheduled_hour));
  }
  if (schedule.scheduled_minute < 0 || schedule.scheduled_minute > 59) {
    throw util::InvalidArgument("scheduled minute must be within 0-59, got " + std::to_string(schedule.scheduled_minute));
  }
  if (schedule.exclude_recent_days < 0 || schedule.exclude_recent_days > model::kMaxExcludeRecentDays) {
    throw util::InvalidArgument("exclude_recent_days must be within 0-" + std::to_string(model::kMaxExcludeRecentDays) + ", got " +
                                std::to_string(schedule.exclude_recent_days));
  }
  for (int day : schedule.active_days) {
    if (day < 1 || day > 7) {
      throw util::InvalidArgument("active day must be an ISO weekday 1-7, got " + std::to_string(day));
    }
  }
  for (const auto& category : schedule.categories) {
    if (category.empty() || std::any_of(category.begin(), category.end(), [](unsigned char c) { return c < 0x20; })) {
      throw util::InvalidArgument("invalid category '" + category + "'");
    }
  }
}

DeliveryOutcome Outcome(const std::string& id, DeliveryOutcomeKind kind, std::optional<std::string> quote_id = std::nullopt) {
  return DeliveryOutcome{.schedule_id = id, .kind = kind, .quote_id = std::move(quote_id), .status = util::Status::Ok()};
}

} // namespace

std::string_view ToString(DeliveryOutcomeKind kind) {
  switch (kind) {
    case DeliveryOutcomeKind::kDelivered:
      return "delivered";
    case DeliveryOutcomeKind::kNoEligibleQuote:
      return "no_eligible_quote";
    case DeliveryOutcomeKind::kSkipped:
      return "skipped";
    case DeliveryOutcomeKind::kNotFound:
      return "not_found";
    case DeliveryOutcomeKind::kFailed:
      return "failed";
  }
  return "unknown";
}

std::size_t DeliveryReport::Count(DeliveryOutcomeKind kind) const {
  return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(), [&](const DeliveryOutcome& o) { return o.kind == kind; }));
}

ScheduleStore::ScheduleStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<cache::EntityCache> cache,
                             std::shared_ptr<delivery::DeliverySurface> surface, util::TimeZone zone)
    : repository_(std::move(repository)),
      cache_(std::move(cache)),
      surface_(std::move(surface)),
      zone_(zone),
      catalog_(repository_, cache_),
      engagement_(repository_, cache_, zone_),
      selector_(),
      history_(repository_, zone_) {
}

ScheduleStore::ScheduleStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<cache::EntityCache> cache,
                             std::shared_ptr<delivery::DeliverySurface> surface, util::TimeZone zone, uint64_t selector_seed)
    : repository_(std::move(repository)),
      cache_(std::move(cache)),
      surface_(std::move(surface)),
      zone_(zone),
      catalog_(repository_, cache_),
      engagement_(repository_, cache_, zone_),
      selector_(selector_seed),
      history_(repository_, zone_) {
}

std::shared_ptr<std::mutex> ScheduleStore::ScheduleMutex(const std::string& id) {
  std::lock_guard<std::mutex> lock(schedule_mutexes_guard_);
  auto&                       schedule_mutex = schedule_mutexes_[id];
  if (!schedule_mutex) {
    schedule_mutex = std::make_shared<std::mutex>();
  }
  return schedule_mutex;
}

// ------------------------------------------------------------
// Internal helpers (throwing)
// ------------------------------------------------------------

model::Schedule ScheduleStore::LoadSchedule(const std::string& id) {
  if (auto cached = cache_->Get<cache::CacheType::kSchedule>(id)) {
    return *cached;
  }

  auto tx  = repository_->Begin();
  auto row = repository_->GetSchedule(*tx, id);
  if (!row) {
    tx->Commit();
    throw util::NotFound("schedule " + id);
  }

  // Filled while the transaction is open: a writer can only commit, and then
  // invalidate, after this Put.
  auto schedule = db::FromRecord(*row);
  cache_->Put<cache::CacheType::kSchedule>(id, schedule);
  tx->Commit();
  return schedule;
}

std::vector<model::Schedule> ScheduleStore::LoadSchedules(bool enabled_only) {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListSchedules(*tx, enabled_only);
  tx->Commit();

  std::vector<model::Schedule> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    out.push_back(db::FromRecord(row));
  }
  return out;
}

model::Schedule ScheduleStore::ModifySchedule(const std::string& id, const std::function<void(model::Schedule&)>& change) {
  auto tx  = repository_->Begin();
  auto row = repository_->GetSchedule(*tx, id);
  if (!row) {
    throw util::NotFound("schedule " + id);
  }

  auto schedule = db::FromRecord(*row);
  change(schedule);
  ValidateSchedule(schedule);
  schedule.updated_at = util::Now();

  db::ThrowIfError(repository_->UpdateSchedule(*tx, db::ToRecord(schedule)), "update schedule " + id);
  tx->Commit();

  cache_->Remove<cache::CacheType::kSchedule>(id);
  return schedule;
}

model::Schedule ScheduleStore::EnsureDefault() {
  auto tx = repository_->Begin();
  if (auto existing = repository_->GetDefaultSchedule(*tx)) {
    tx->Commit();
    return db::FromRecord(*existing);
  }

  auto candidate = model::MakeDefaultSchedule();
  auto result    = repository_->InsertDefaultScheduleIfAbsent(*tx, db::ToRecord(candidate));
  if (result.code == db::ErrorCode::AlreadyExists) {
    auto existing = repository_->GetDefaultSchedule(*tx);
    tx->Commit();
    if (!existing) {
      throw util::PersistenceFailure("default schedule reported present but not readable");
    }
    return db::FromRecord(*existing);
  }
  db::ThrowIfError(result, "insert default schedule");
  tx->Commit();

  QUOTECAST_LOG_INFO("default schedule created", {StringField("schedule_id", candidate.id)});
  return candidate;
}

// ------------------------------------------------------------
// Schedules
// ------------------------------------------------------------

util::StatusOr<model::Schedule> ScheduleStore::CreateSchedule(model::Schedule schedule) {
  return ObserveCall("ScheduleStore.CreateSchedule", [&] {
    ValidateSchedule(schedule);
    if (schedule.id.empty()) {
      schedule.id = util::NewId();
    }
    schedule.last_delivered_quote_id.reset();
    schedule.last_delivery_date.reset();
    schedule.created_at = util::Now();
    schedule.updated_at = schedule.created_at;

    auto tx     = repository_->Begin();
    auto result = repository_->InsertSchedule(*tx, db::ToRecord(schedule));
    if (result.code == db::ErrorCode::ConstraintViolation) {
      throw util::AlreadyExists("a default schedule already exists");
    }
    db::ThrowIfError(result, "insert schedule " + schedule.id);
    tx->Commit();

    QUOTECAST_LOG_INFO("schedule created", {StringField("schedule_id", schedule.id), IntField("hour", schedule.scheduled_hour),
                                            IntField("minute", schedule.scheduled_minute)});
    return schedule;
  });
}

util::StatusOr<model::Schedule> ScheduleStore::UpdateSchedule(model::Schedule update) {
  return ObserveCall("ScheduleStore.UpdateSchedule", [&] {
    return ModifySchedule(update.id, [&](model::Schedule& s) {
      s.is_enabled          = update.is_enabled;
      s.scheduled_hour      = update.scheduled_hour;
      s.scheduled_minute    = update.scheduled_minute;
      s.delivery_method     = update.delivery_method;
      s.favorites_only      = update.favorites_only;
      s.categories          = update.categories;
      s.exclude_recent_days = update.exclude_recent_days;
      s.active_days         = update.active_days;
      s.is_default          = update.is_default;
    });
  });
}

util::Status ScheduleStore::DeleteSchedule(const std::string& id) {
  return ObserveCall("ScheduleStore.DeleteSchedule", [&] {
    auto tx = repository_->Begin();
    db::ThrowIfError(repository_->DeleteSchedule(*tx, id), "delete schedule " + id);
    tx->Commit();

    cache_->Remove<cache::CacheType::kSchedule>(id);
    {
      std::lock_guard<std::mutex> lock(schedule_mutexes_guard_);
      schedule_mutexes_.erase(id);
    }
    QUOTECAST_LOG_INFO("schedule deleted", {StringField("schedule_id", id)});
  });
}

util::StatusOr<model::Schedule> ScheduleStore::GetSchedule(const std::string& id) {
  return ObserveCall("ScheduleStore.GetSchedule", [&] { return LoadSchedule(id); });
}

util::StatusOr<std::vector<model::Schedule>> ScheduleStore::ListSchedules() {
  return ObserveCall("ScheduleStore.ListSchedules", [&] { return LoadSchedules(false); });
}

util::StatusOr<std::vector<model::Schedule>> ScheduleStore::ListEnabledSchedules() {
  return ObserveCall("ScheduleStore.ListEnabledSchedules", [&] { return LoadSchedules(true); });
}

util::StatusOr<model::Schedule> ScheduleStore::EnsureDefaultSchedule() {
  return ObserveCall("ScheduleStore.EnsureDefaultSchedule", [&] { return EnsureDefault(); });
}

util::StatusOr<model::Schedule> ScheduleStore::GetDefaultSchedule() {
  return ObserveCall("ScheduleStore.GetDefaultSchedule", [&] { return EnsureDefault(); });
}

util::StatusOr<model::Schedule> ScheduleStore::SetEnabled(const std::string& id, bool enabled) {
  return ObserveCall("ScheduleStore.SetEnabled", [&] { return ModifySchedule(id, [&](model::Schedule& s) { s.is_enabled = enabled; }); });
}

util::StatusOr<model::Schedule> ScheduleStore::SetScheduledTime(const std::string& id, int hour, int minute) {
  return ObserveCall("ScheduleStore.SetScheduledTime", [&] {
    return ModifySchedule(id, [&](model::Schedule& s) {
      s.scheduled_hour   = hour;
      s.scheduled_minute = minute;
    });
  });
}

util::StatusOr<model::Schedule> ScheduleStore::SetDeliveryMethod(const std::string& id, model::DeliveryMethod method) {
  return ObserveCall("ScheduleStore.SetDeliveryMethod",
                     [&] { return ModifySchedule(id, [&](model::Schedule& s) { s.delivery_method = method; }); });
}

// ------------------------------------------------------------
// Delivery
// ------------------------------------------------------------

util::StatusOr<DeliveryReport> ScheduleStore::DeliverDueQuotes(util::TimePoint now) {
  return ObserveCall("ScheduleStore.DeliverDueQuotes", [&] {
    DeliveryReport report;
    report.run_at = now;

    for (const auto& id : scheduling::ReadySchedules(LoadSchedules(true), now, zone_)) {
      report.outcomes.push_back(DeliverOne(id, now));
    }

    QUOTECAST_LOG_INFO("delivery run finished",
                       {IntField("ready", static_cast<int64_t>(report.outcomes.size())),
                        IntField("delivered", static_cast<int64_t>(report.Count(DeliveryOutcomeKind::kDelivered))),
                        IntField("no_eligible_quote", static_cast<int64_t>(report.Count(DeliveryOutcomeKind::kNoEligibleQuote))),
                        IntField("failed", static_cast<int64_t>(report.Count(DeliveryOutcomeKind::kFailed)))});
    return report;
  });
}

DeliveryOutcome ScheduleStore::DeliverOne(const std::string& id, util::TimePoint now) {
  auto                        schedule_mutex = ScheduleMutex(id);
  std::lock_guard<std::mutex> lock(*schedule_mutex);

  for (int attempt = 1;; ++attempt) {
    try {
      return AttemptDelivery(id, now);
    } catch (const util::Conflict& e) {
      if (attempt < kMaxDeliveryAttempts) {
        QUOTECAST_LOG_DEBUG("delivery conflict, retrying", {StringField("schedule_id", id), StringField("error", e.what())});
        continue;
      }
      QUOTECAST_LOG_WARN("delivery failed", {StringField("schedule_id", id), StringField("error", e.what())});
      return DeliveryOutcome{.schedule_id = id, .kind = DeliveryOutcomeKind::kFailed, .quote_id = std::nullopt, .status = util::ToStatus(e)};
    } catch (const std::exception& e) {
      QUOTECAST_LOG_ERROR("delivery failed", {StringField("schedule_id", id), StringField("error", e.what())});
      return DeliveryOutcome{.schedule_id = id, .kind = DeliveryOutcomeKind::kFailed, .quote_id = std::nullopt, .status = util::ToStatus(e)};
    }
  }
}

DeliveryOutcome ScheduleStore::AttemptDelivery(const std::string& id, util::TimePoint now) {
  auto tx  = repository_->Begin();
  auto row = repository_->GetSchedule(*tx, id);
  if (!row) {
    return Outcome(id, DeliveryOutcomeKind::kNotFound);
  }

  // the listing that made this schedule ready may be stale by now
  const auto schedule = db::FromRecord(*row);
  if (!scheduling::IsReady(schedule, now, zone_)) {
    tx->Commit();
    return Outcome(id, DeliveryOutcomeKind::kSkipped);
  }

  const auto quotes  = catalog_.List(*tx, schedule.favorites_only);
  const auto history = history_.RecentDeliveries(*tx, id, now, scheduling::RecencyWindow(schedule));

  auto quote = selector_.SelectNext(schedule, quotes, history, now);
  if (!quote) {
    tx->Commit();
    QUOTECAST_LOG_INFO("no eligible quote", {StringField("schedule_id", id), IntField("catalog_size", static_cast<int64_t>(quotes.size()))});
    return Outcome(id, DeliveryOutcomeKind::kNoEligibleQuote);
  }

  history_.RecordDelivery(*tx, *row, quote->id, now);
  tx->Commit();

  cache_->Remove<cache::CacheType::kSchedule>(id);
  engagement_.InvalidateSummaries();

  if (surface_) {
    delivery::DeliveryNotice notice{.schedule_id  = id,
                                    .quote_id     = quote->id,
                                    .method       = schedule.delivery_method,
                                    .text         = quote->text,
                                    .author       = quote->author,
                                    .delivered_at = now};
    try {
      surface_->Deliver(notice);
    } catch (const std::exception& e) {
      QUOTECAST_LOG_WARN("delivery surface failed", {StringField("schedule_id", id), StringField("quote_id", quote->id),
                                                     StringField("error", e.what())});
    }
  }

  QUOTECAST_LOG_INFO("quote delivered", {StringField("schedule_id", id), StringField("quote_id", quote->id),
                                         StringField("method", model::ToString(schedule.delivery_method))});
  return Outcome(id, DeliveryOutcomeKind::kDelivered, quote->id);
}

util::StatusOr<std::optional<model::Quote>> ScheduleStore::PreviewNextQuote(const std::string& id, util::TimePoint now) {
  return ObserveCall("ScheduleStore.PreviewNextQuote", [&] {
    auto tx  = repository_->Begin();
    auto row = repository_->GetSchedule(*tx, id);
    if (!row) {
      throw util::NotFound("schedule " + id);
    }

    const auto schedule = db::FromRecord(*row);
    const auto quotes   = catalog_.List(*tx, schedule.favorites_only);
    const auto history  = history_.RecentDeliveries(*tx, id, now, scheduling::RecencyWindow(schedule));
    tx->Commit();

    return selector_.SelectNext(schedule, quotes, history, now);
  });
}

util::StatusOr<std::optional<util::TimePoint>> ScheduleStore::NextDeliveryTime(const std::string& id, util::TimePoint now) {
  return ObserveCall("ScheduleStore.NextDeliveryTime", [&] { return scheduling::NextDeliveryTime(LoadSchedule(id), now, zone_); });
}

util::StatusOr<std::size_t> ScheduleStore::ScheduleCount() {
  return ObserveCall("ScheduleStore.ScheduleCount", [&] { return LoadSchedules(false).size(); });
}

util::StatusOr<std::size_t> ScheduleStore::EnabledScheduleCount() {
  return ObserveCall("ScheduleStore.EnabledScheduleCount", [&] { return LoadSchedules(true).size(); });
}

util::StatusOr<std::optional<util::TimePoint>> ScheduleStore::MostRecentDeliveryDate() {
  return ObserveCall("ScheduleStore.MostRecentDeliveryDate", [&] {
    std::optional<util::TimePoint> latest;
    for (const auto& schedule : LoadSchedules(false)) {
      if (schedule.last_delivery_date && (!latest || *schedule.last_delivery_date > *latest)) {
        latest = schedule.last_delivery_date;
      }
    }
    return latest;
  });
}

// ------------------------------------------------------------
// Quotes
// ------------------------------------------------------------

util::StatusOr<model::Quote> ScheduleStore::GetQuote(const std::string& id) {
  return ObserveCall("ScheduleStore.GetQuote", [&] {
    auto quote = catalog_.Get(id);
    if (!quote) {
      throw util::NotFound("quote " + id);
    }
    return *quote;
  });
}

util::StatusOr<std::vector<model::Quote>> ScheduleStore::ListQuotes(bool favorites_only) {
  return ObserveCall("ScheduleStore.ListQuotes", [&] { return catalog_.List(favorites_only); });
}

util::StatusOr<model::Quote> ScheduleStore::UpsertQuote(model::Quote quote) {
  return ObserveCall("ScheduleStore.UpsertQuote", [&] { return catalog_.Upsert(std::move(quote)); });
}

util::Status ScheduleStore::DeleteQuote(const std::string& id) {
  return ObserveCall("ScheduleStore.DeleteQuote", [&] { catalog_.Delete(id); });
}

// ------------------------------------------------------------
// Engagement
// ------------------------------------------------------------

util::Status ScheduleStore::RecordActivity(const std::string& kind, util::TimePoint at) {
  return ObserveCall("ScheduleStore.RecordActivity", [&] { engagement_.RecordActivity(kind, at); });
}

util::StatusOr<model::StreakSummary> ScheduleStore::StreakSummary(const std::optional<std::string>& kind, util::TimePoint now) {
  return ObserveCall("ScheduleStore.StreakSummary", [&] { return engagement_.Summary(kind, now); });
}

} // namespace quotecast::core
