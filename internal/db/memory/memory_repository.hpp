#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace quotecast::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertSchedule(Transaction&, const model::ScheduleRecord&) override;
  Result InsertDefaultScheduleIfAbsent(Transaction&, const model::ScheduleRecord&) override;
  std::optional<model::ScheduleRecord> GetSchedule(Transaction&, const std::string&) override;
  std::optional<model::ScheduleRecord> GetDefaultSchedule(Transaction&) override;
  std::vector<model::ScheduleRecord> ListSchedules(Transaction&, bool enabled_only) override;
  Result UpdateSchedule(Transaction&, const model::ScheduleRecord&) override;
  Result UpdateLastDelivery(Transaction&, const std::string& schedule_id, const std::string& quote_id,
                            int64_t delivered_at_ms, std::optional<int64_t> expected_previous_ms) override;
  Result DeleteSchedule(Transaction&, const std::string&) override;

  Result InsertDelivery(Transaction&, model::DeliveryRecord&) override;
  std::vector<model::DeliveryRecord> ListDeliveriesSince(Transaction&, const std::string& schedule_id,
                                                         int64_t since_ms) override;
  Result DeleteDeliveriesOlderThan(Transaction&, int64_t cutoff_ms) override;

  Result UpsertQuote(Transaction&, const model::QuoteRecord&) override;
  std::optional<model::QuoteRecord> GetQuote(Transaction&, const std::string&) override;
  std::vector<model::QuoteRecord> ListQuotes(Transaction&, bool favorites_only) override;
  Result DeleteQuote(Transaction&, const std::string&) override;

  Result InsertActivity(Transaction&, model::ActivityRecord&) override;
  std::vector<model::ActivityRecord> ListActivity(Transaction&, const std::optional<std::string>& kind) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::ScheduleRecord> schedules;
    std::vector<model::DeliveryRecord>                     deliveries;
    std::map<std::string, model::QuoteRecord>              quotes;
    std::vector<model::ActivityRecord>                     activity;

    uint64_t next_delivery_id = 1;
    uint64_t next_activity_id = 1;
  };

  std::mutex tx_mutex_; // held by the live transaction
  State      committed_;
};

}
