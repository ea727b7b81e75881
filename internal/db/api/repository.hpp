#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/activity_record.hpp"
#include "internal/db/model/delivery_record.hpp"
#include "internal/db/model/quote_record.hpp"
#include "internal/db/model/schedule_record.hpp"

namespace quotecast::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - InsertDefaultScheduleIfAbsent is atomic: two callers racing on an
    empty store end up with exactly one default schedule
  - UpdateLastDelivery is a compare-and-swap on last_delivery_at_ms

  The DB is the source of truth for:
    schedules
    delivery history
    quotes
    activity events
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Schedules
  // ---------------------------------------------------------------------

  virtual Result InsertSchedule(Transaction&, const model::ScheduleRecord&) = 0;

  // AlreadyExists when some schedule is already flagged default.
  virtual Result InsertDefaultScheduleIfAbsent(Transaction&, const model::ScheduleRecord&) = 0;

  virtual std::optional<model::ScheduleRecord> GetSchedule(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::ScheduleRecord> GetDefaultSchedule(Transaction&) = 0;

  // Ordered by scheduled time of day, then creation time.
  virtual std::vector<model::ScheduleRecord> ListSchedules(Transaction&, bool enabled_only) = 0;

  // Replaces configuration fields; delivery pointer and created_at are left untouched.
  virtual Result UpdateSchedule(Transaction&, const model::ScheduleRecord&) = 0;

  // Conflict when the stored last_delivery_at_ms differs from expected_previous_ms.
  virtual Result UpdateLastDelivery(Transaction&, const std::string& schedule_id, const std::string& quote_id, int64_t delivered_at_ms,
                                    std::optional<int64_t> expected_previous_ms) = 0;

  // Also removes the schedule's delivery history.
  virtual Result DeleteSchedule(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Delivery history
  // ---------------------------------------------------------------------

  virtual Result InsertDelivery(Transaction&, model::DeliveryRecord&) = 0;

  // delivered_at_ms >= since_ms, oldest first
  virtual std::vector<model::DeliveryRecord> ListDeliveriesSince(Transaction&, const std::string& schedule_id, int64_t since_ms) = 0;

  // delivered_at_ms < cutoff_ms, all schedules
  virtual Result DeleteDeliveriesOlderThan(Transaction&, int64_t cutoff_ms) = 0;

  // ---------------------------------------------------------------------
  // Quotes
  // ---------------------------------------------------------------------

  virtual Result UpsertQuote(Transaction&, const model::QuoteRecord&) = 0;

  virtual std::optional<model::QuoteRecord> GetQuote(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::QuoteRecord> ListQuotes(Transaction&, bool favorites_only) = 0;

  virtual Result DeleteQuote(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Activity events
  // ---------------------------------------------------------------------

  virtual Result InsertActivity(Transaction&, model::ActivityRecord&) = 0;

  // All kinds when kind is nullopt.
  virtual std::vector<model::ActivityRecord> ListActivity(Transaction&, const std::optional<std::string>& kind) = 0;
};

} // namespace quotecast::db
