#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/analytics/engagement_service.hpp"
#include "internal/cache/entity_cache.hpp"
#include "internal/core/quote_catalog.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/delivery/delivery_surface.hpp"
#include "internal/model/activity.hpp"
#include "internal/model/quote.hpp"
#include "internal/model/schedule.hpp"
#include "internal/scheduling/delivery_history.hpp"
#include "internal/scheduling/eligibility_selector.hpp"
#include "internal/util/status.hpp"
#include "internal/util/time.hpp"

namespace quotecast::core {

enum class DeliveryOutcomeKind {
  kDelivered,
  kNoEligibleQuote,
  kSkipped,   // no longer ready once locked (delivered by a concurrent run)
  kNotFound,  // deleted between listing and delivery
  kFailed,
};

std::string_view ToString(DeliveryOutcomeKind kind);

struct DeliveryOutcome {
  std::string                schedule_id;
  DeliveryOutcomeKind        kind = DeliveryOutcomeKind::kFailed;
  std::optional<std::string> quote_id;
  util::Status               status; // set when kind == kFailed
};

struct DeliveryReport {
  util::TimePoint              run_at{};
  std::vector<DeliveryOutcome> outcomes;

  std::size_t Count(DeliveryOutcomeKind kind) const;
};

/*
  ScheduleStore

  Public facade of the engine. Every operation returns Status/StatusOr;
  nothing throws past this class.

  Schedules are cached by id in the kSchedule partition and invalidated on
  every write. DeliverDueQuotes runs, per ready schedule and under that
  schedule's mutex, one transaction that re-checks readiness, picks a
  quote, records the delivery and moves the pointer. The delivery surface
  is called only after that transaction committed.
*/
class ScheduleStore {
 public:
  ScheduleStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<cache::EntityCache> cache,
                std::shared_ptr<delivery::DeliverySurface> surface, util::TimeZone zone);

  // Test hook: deterministic quote choice.
  ScheduleStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<cache::EntityCache> cache,
                std::shared_ptr<delivery::DeliverySurface> surface, util::TimeZone zone, uint64_t selector_seed);

  // ------------------------------------------------------------------
  // Schedules
  // ------------------------------------------------------------------

  // Assigns id and timestamps; is_default=true fails with kAlreadyExists
  // when a default schedule is already stored.
  util::StatusOr<model::Schedule> CreateSchedule(model::Schedule schedule);

  // Replaces the configuration of an existing schedule. The delivery
  // pointer and created_at are kept from the stored row.
  util::StatusOr<model::Schedule> UpdateSchedule(model::Schedule schedule);

  // Deletes the schedule and its delivery history. Missing ids are OK.
  util::Status DeleteSchedule(const std::string& id);

  util::StatusOr<model::Schedule>              GetSchedule(const std::string& id);
  util::StatusOr<std::vector<model::Schedule>> ListSchedules();
  util::StatusOr<std::vector<model::Schedule>> ListEnabledSchedules();

  // Idempotent; concurrent callers all observe the same default schedule.
  util::StatusOr<model::Schedule> EnsureDefaultSchedule();
  util::StatusOr<model::Schedule> GetDefaultSchedule();

  util::StatusOr<model::Schedule> SetEnabled(const std::string& id, bool enabled);
  util::StatusOr<model::Schedule> SetScheduledTime(const std::string& id, int hour, int minute);
  util::StatusOr<model::Schedule> SetDeliveryMethod(const std::string& id, model::DeliveryMethod method);

  // ------------------------------------------------------------------
  // Delivery
  // ------------------------------------------------------------------

  util::StatusOr<DeliveryReport> DeliverDueQuotes(util::TimePoint now = util::Now());

  // What a delivery right now would pick; nullopt when nothing is eligible.
  util::StatusOr<std::optional<model::Quote>> PreviewNextQuote(const std::string& id, util::TimePoint now = util::Now());

  util::StatusOr<std::optional<util::TimePoint>> NextDeliveryTime(const std::string& id, util::TimePoint now = util::Now());

  util::StatusOr<std::size_t>                    ScheduleCount();
  util::StatusOr<std::size_t>                    EnabledScheduleCount();
  util::StatusOr<std::optional<util::TimePoint>> MostRecentDeliveryDate();

  // ------------------------------------------------------------------
  // Quotes
  // ------------------------------------------------------------------

  util::StatusOr<model::Quote>              GetQuote(const std::string& id);
  util::StatusOr<std::vector<model::Quote>> ListQuotes(bool favorites_only = false);
  util::StatusOr<model::Quote>              UpsertQuote(model::Quote quote);
  util::Status                              DeleteQuote(const std::string& id);

  // ------------------------------------------------------------------
  // Engagement
  // ------------------------------------------------------------------

  util::Status                         RecordActivity(const std::string& kind, util::TimePoint at = util::Now());
  util::StatusOr<model::StreakSummary> StreakSummary(const std::optional<std::string>& kind, util::TimePoint now = util::Now());

  const util::TimeZone& zone() const {
    return zone_;
  }

 private:
  static constexpr int kMaxDeliveryAttempts = 2;

  std::shared_ptr<std::mutex> ScheduleMutex(const std::string& id);

  model::Schedule              LoadSchedule(const std::string& id);
  std::vector<model::Schedule> LoadSchedules(bool enabled_only);
  model::Schedule              ModifySchedule(const std::string& id, const std::function<void(model::Schedule&)>& change);
  model::Schedule              EnsureDefault();

  DeliveryOutcome DeliverOne(const std::string& id, util::TimePoint now);
  DeliveryOutcome AttemptDelivery(const std::string& id, util::TimePoint now);

  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<cache::EntityCache>        cache_;
  std::shared_ptr<delivery::DeliverySurface> surface_;
  util::TimeZone                             zone_;

  QuoteCatalog                       catalog_;
  analytics::EngagementService       engagement_;
  scheduling::QuoteSelector          selector_;
  scheduling::DeliveryHistoryTracker history_;

  mutable std::mutex                                           schedule_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> schedule_mutexes_;
};

} // namespace quotecast::core
