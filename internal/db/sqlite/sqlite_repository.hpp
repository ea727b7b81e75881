#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace quotecast::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
