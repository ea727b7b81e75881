#include "internal/scheduling/delivery_history.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono;
using quotecast::db::memory::MemoryRepository;
using quotecast::db::model::ScheduleRecord;
using quotecast::scheduling::DeliveryHistoryTracker;
using quotecast::util::TimePoint;
using quotecast::util::TimeZone;

namespace util = quotecast::util;

const TimePoint kNow = sys_days{2024y / May / 20} + hours{9};

std::shared_ptr<MemoryRepository> MakeRepositoryWithSchedule(const std::string& id) {
  auto repo = std::make_shared<MemoryRepository>();

  ScheduleRecord record;
  record.id            = id;
  record.created_at_ms = util::ToUnixMillis(kNow - days{60});
  record.updated_at_ms = record.created_at_ms;

  auto tx = repo->Begin();
  assert(repo->InsertSchedule(*tx, record));
  tx->Commit();
  return repo;
}

void TestRecordDeliveryMovesPointerAndAddsRows() {
  auto                         repo = MakeRepositoryWithSchedule("s1");
  const DeliveryHistoryTracker tracker(repo, TimeZone::Utc());

  tracker.RecordDelivery("s1", "q1", kNow);

  auto tx     = repo->Begin();
  auto stored = repo->GetSchedule(*tx, "s1");
  assert(stored.has_value());
  assert(stored->last_delivered_quote_id == "q1");
  assert(stored->last_delivery_at_ms == util::ToUnixMillis(kNow));

  const auto rows = repo->ListDeliveriesSince(*tx, "s1", 0);
  assert(rows.size() == 1);
  assert(rows.front().quote_id == "q1");
  assert(rows.front().id != 0);

  const auto activity = repo->ListActivity(*tx, std::string("quote_delivery"));
  assert(activity.size() == 1);
  assert(activity.front().occurred_at_ms == util::ToUnixMillis(kNow));
  tx->Commit();
}

void TestSecondDeliveryOnSameDayConflicts() {
  auto                         repo = MakeRepositoryWithSchedule("s1");
  const DeliveryHistoryTracker tracker(repo, TimeZone::Utc());

  tracker.RecordDelivery("s1", "q1", kNow);

  bool threw = false;
  try {
    tracker.RecordDelivery("s1", "q2", kNow + hours{3});
  } catch (const util::Conflict&) {
    threw = true;
  }
  assert(threw && "a schedule must not be delivered twice on one local day");

  // the failed attempt left nothing behind
  auto tx = repo->Begin();
  assert(repo->ListDeliveriesSince(*tx, "s1", 0).size() == 1);
  assert(repo->GetSchedule(*tx, "s1")->last_delivered_quote_id == "q1");
  tx->Commit();

  tracker.RecordDelivery("s1", "q2", kNow + days{1});
}

void TestUnknownScheduleIsNotFound() {
  auto                         repo = std::make_shared<MemoryRepository>();
  const DeliveryHistoryTracker tracker(repo, TimeZone::Utc());

  bool threw = false;
  try {
    tracker.RecordDelivery("missing", "q1", kNow);
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestRecordsOlderThanRetentionArePruned() {
  auto                         repo = MakeRepositoryWithSchedule("s1");
  const DeliveryHistoryTracker tracker(repo, TimeZone::Utc());

  tracker.RecordDelivery("s1", "q-old", kNow - days{31});
  tracker.RecordDelivery("s1", "q-kept", kNow - days{29});
  tracker.RecordDelivery("s1", "q-new", kNow);

  auto       tx   = repo->Begin();
  const auto rows = repo->ListDeliveriesSince(*tx, "s1", 0);
  tx->Commit();

  assert(rows.size() == 2);
  assert(rows[0].quote_id == "q-kept");
  assert(rows[1].quote_id == "q-new");
}

void TestRecentDeliveriesHonorsWindow() {
  auto                         repo = MakeRepositoryWithSchedule("s1");
  const DeliveryHistoryTracker tracker(repo, TimeZone::Utc());

  tracker.RecordDelivery("s1", "q1", kNow - days{10});
  tracker.RecordDelivery("s1", "q2", kNow - days{3});
  tracker.RecordDelivery("s1", "q3", kNow - days{1});

  auto       tx     = repo->Begin();
  const auto recent = tracker.RecentDeliveries(*tx, "s1", kNow, days{7});
  const auto none   = tracker.RecentDeliveries(*tx, "s1", kNow, days{0});
  tx->Commit();

  assert(recent.size() == 2);
  assert(recent[0].quote_id == "q2");
  assert(recent[1].quote_id == "q3");
  assert(recent[1].delivered_at == kNow - days{1});
  assert(none.empty());
}

} // namespace

int main() {
  TestRecordDeliveryMovesPointerAndAddsRows();
  TestSecondDeliveryOnSameDayConflicts();
  TestUnknownScheduleIsNotFound();
  TestRecordsOlderThanRetentionArePruned();
  TestRecentDeliveriesHonorsWindow();

  std::cout << "quotecast_unit_delivery_history: pass\n";
  return 0;
}
