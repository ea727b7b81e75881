#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/delivery.hpp"
#include "internal/util/time.hpp"

namespace quotecast::scheduling {

/*
  DeliveryHistoryTracker

  Records one delivery as a single unit of work inside the caller's
  transaction:

    1. append the DeliveryRecord
    2. prune records older than kRetention (best effort, logged)
    3. move the schedule's last-delivery pointer (compare-and-swap)
    4. append a quote_delivery activity event

  Step 3 always follows step 1; a failure in 1, 3 or 4 throws and the
  caller's transaction rolls back as a whole.
*/
class DeliveryHistoryTracker {
 public:
  static constexpr std::chrono::days kRetention{30};

  DeliveryHistoryTracker(std::shared_ptr<db::Repository> repository, util::TimeZone zone);

  // Throws util::NotFound, util::Conflict (already delivered today or lost
  // the pointer race) and util::PersistenceFailure.
  void RecordDelivery(db::Transaction& tx, const db::model::ScheduleRecord& schedule, const std::string& quote_id,
                      util::TimePoint now) const;

  // Opens and commits its own transaction.
  void RecordDelivery(const std::string& schedule_id, const std::string& quote_id, util::TimePoint now) const;

  // Rows of one schedule with delivered_at >= now - window, oldest first.
  std::vector<model::DeliveryRecord> RecentDeliveries(db::Transaction& tx, const std::string& schedule_id, util::TimePoint now,
                                                      std::chrono::days window) const;

  // Best effort: failures are logged and swallowed.
  void PruneOlderThanRetention(db::Transaction& tx, util::TimePoint now) const;

 private:
  std::shared_ptr<db::Repository> repository_;
  util::TimeZone                  zone_;
};

} // namespace quotecast::scheduling
