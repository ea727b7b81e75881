#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/cache/entity_cache.hpp"
#include "internal/core/schedule_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"

namespace {

using quotecast::db::ErrorCode;
using quotecast::db::Repository;
using quotecast::db::memory::MemoryRepository;
using quotecast::db::model::ActivityRecord;
using quotecast::db::model::DeliveryRecord;
using quotecast::db::model::QuoteRecord;
using quotecast::db::model::ScheduleRecord;

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

ScheduleRecord MakeSchedule(const std::string& id, int32_t hour, int32_t minute, int64_t created_at_ms) {
  ScheduleRecord record;
  record.id               = id;
  record.scheduled_hour   = hour;
  record.scheduled_minute = minute;
  record.created_at_ms    = created_at_ms;
  record.updated_at_ms    = created_at_ms;
  return record;
}

void VerifyScheduleRoundTrip(Repository& repo, const std::string& id) {
  auto record                = MakeSchedule(id, 7, 45, 1000);
  record.delivery_method     = 1;
  record.favorites_only      = true;
  record.categories          = {"focus", "stoic"};
  record.exclude_recent_days = 3;
  record.active_days         = {1, 3, 5};

  {
    auto tx = repo.Begin();
    assert(repo.InsertSchedule(*tx, record));
    assert(repo.InsertSchedule(*tx, record).code == ErrorCode::AlreadyExists);
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto stored = repo.GetSchedule(*tx, id);
  assert(stored.has_value());
  assert(stored->scheduled_hour == 7);
  assert(stored->scheduled_minute == 45);
  assert(stored->delivery_method == 1);
  assert(stored->favorites_only);
  assert((stored->categories == std::vector<std::string>{"focus", "stoic"}));
  assert(stored->exclude_recent_days == 3);
  assert((stored->active_days == std::vector<int32_t>{1, 3, 5}));
  assert(!stored->last_delivered_quote_id.has_value());
  assert(!stored->last_delivery_at_ms.has_value());
  assert(!stored->is_default);
  assert(stored->created_at_ms == 1000);

  // configuration updates never touch the delivery pointer
  assert(repo.UpdateLastDelivery(*tx, id, "q1", 5000, std::nullopt));
  stored->scheduled_hour          = 8;
  stored->last_delivered_quote_id = "bogus";
  stored->last_delivery_at_ms     = 1;
  stored->created_at_ms           = 99;
  assert(repo.UpdateSchedule(*tx, *stored));

  auto updated = repo.GetSchedule(*tx, id);
  assert(updated->scheduled_hour == 8);
  assert(updated->last_delivered_quote_id == "q1");
  assert(updated->last_delivery_at_ms == 5000);
  assert(updated->created_at_ms == 1000);

  assert(repo.UpdateSchedule(*tx, MakeSchedule(id + "-missing", 1, 1, 1)).code == ErrorCode::NotFound);
  assert(repo.DeleteSchedule(*tx, id));
  assert(repo.DeleteSchedule(*tx, id));
  assert(!repo.GetSchedule(*tx, id).has_value());
  tx->Commit();
}

void VerifyListOrdering(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  auto late           = MakeSchedule(prefix + "-late", 21, 0, 10);
  auto early_new      = MakeSchedule(prefix + "-early-new", 6, 30, 30);
  auto early_old      = MakeSchedule(prefix + "-early-old", 6, 30, 20);
  auto disabled       = MakeSchedule(prefix + "-disabled", 12, 0, 40);
  disabled.is_enabled = false;

  for (const auto& record : {late, early_new, early_old, disabled}) {
    assert(repo.InsertSchedule(*tx, record));
  }

  const auto all = repo.ListSchedules(*tx, false);
  assert(all.size() == 4);
  assert(all[0].id == early_old.id);
  assert(all[1].id == early_new.id);
  assert(all[2].id == disabled.id);
  assert(all[3].id == late.id);

  const auto enabled = repo.ListSchedules(*tx, true);
  assert(enabled.size() == 3);

  for (const auto& record : all) {
    assert(repo.DeleteSchedule(*tx, record.id));
  }
  tx->Commit();
}

void VerifySingleDefault(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();
  assert(!repo.GetDefaultSchedule(*tx).has_value());

  auto first = MakeSchedule(prefix + "-default-a", 9, 0, 1);
  assert(repo.InsertDefaultScheduleIfAbsent(*tx, first));

  auto second = MakeSchedule(prefix + "-default-b", 9, 0, 2);
  assert(repo.InsertDefaultScheduleIfAbsent(*tx, second).code == ErrorCode::AlreadyExists);

  second.is_default = true;
  assert(repo.InsertSchedule(*tx, second).code == ErrorCode::ConstraintViolation);

  second.is_default = false;
  assert(repo.InsertSchedule(*tx, second));
  second.is_default = true;
  assert(repo.UpdateSchedule(*tx, second).code == ErrorCode::ConstraintViolation);

  auto found = repo.GetDefaultSchedule(*tx);
  assert(found.has_value());
  assert(found->id == first.id);
  assert(found->is_default);

  assert(repo.DeleteSchedule(*tx, first.id));
  assert(repo.DeleteSchedule(*tx, second.id));
  tx->Commit();
}

void VerifyLastDeliveryCompareAndSwap(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  assert(repo.InsertSchedule(*tx, MakeSchedule(id, 9, 0, 1)));

  assert(repo.UpdateLastDelivery(*tx, id, "q1", 100, std::nullopt));
  assert(repo.UpdateLastDelivery(*tx, id, "q2", 200, std::nullopt).code == ErrorCode::Conflict);
  assert(repo.UpdateLastDelivery(*tx, id, "q2", 200, 150).code == ErrorCode::Conflict);
  assert(repo.UpdateLastDelivery(*tx, id, "q2", 200, 100));
  assert(repo.UpdateLastDelivery(*tx, "missing-" + id, "q2", 300, 200).code == ErrorCode::NotFound);

  auto stored = repo.GetSchedule(*tx, id);
  assert(stored->last_delivered_quote_id == "q2");
  assert(stored->last_delivery_at_ms == 200);

  assert(repo.DeleteSchedule(*tx, id));
  tx->Commit();
}

void VerifyDeliveryHistory(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  assert(repo.InsertSchedule(*tx, MakeSchedule(id, 9, 0, 1)));
  assert(repo.InsertSchedule(*tx, MakeSchedule(id + "-other", 9, 0, 1)));

  uint64_t last_id = 0;
  for (int64_t at : {300, 100, 200}) {
    DeliveryRecord record{.id = 0, .quote_id = "q" + std::to_string(at), .schedule_id = id, .delivered_at_ms = at};
    assert(repo.InsertDelivery(*tx, record));
    assert(record.id > last_id);
    last_id = record.id;
  }
  DeliveryRecord other{.id = 0, .quote_id = "q-other", .schedule_id = id + "-other", .delivered_at_ms = 150};
  assert(repo.InsertDelivery(*tx, other));

  DeliveryRecord orphan{.id = 0, .quote_id = "q", .schedule_id = "missing-" + id, .delivered_at_ms = 1};
  assert(repo.InsertDelivery(*tx, orphan).code == ErrorCode::NotFound);

  const auto since = repo.ListDeliveriesSince(*tx, id, 150);
  assert(since.size() == 2);
  assert(since[0].delivered_at_ms == 200);
  assert(since[1].delivered_at_ms == 300);
  assert(since[1].quote_id == "q300");

  assert(repo.DeleteDeliveriesOlderThan(*tx, 200));
  assert(repo.ListDeliveriesSince(*tx, id, 0).size() == 2);
  assert(repo.ListDeliveriesSince(*tx, id + "-other", 0).empty());

  // history goes with its schedule
  assert(repo.DeleteSchedule(*tx, id));
  assert(repo.ListDeliveriesSince(*tx, id, 0).empty());
  assert(repo.DeleteSchedule(*tx, id + "-other"));
  tx->Commit();
}

void VerifyQuotesAndActivity(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  QuoteRecord plain{.id = prefix + "-b", .text = "Act.", .author = "", .categories = {}, .is_favorite = false};
  QuoteRecord liked{.id = prefix + "-a", .text = "Begin.", .author = "Someone", .categories = {"start", "work"}, .is_favorite = true};
  assert(repo.UpsertQuote(*tx, plain));
  assert(repo.UpsertQuote(*tx, liked));

  auto all = repo.ListQuotes(*tx, false);
  assert(all.size() == 2);
  assert(all[0].id == liked.id);
  assert((all[0].categories == std::vector<std::string>{"start", "work"}));
  assert(all[1].categories.empty());

  auto favorites = repo.ListQuotes(*tx, true);
  assert(favorites.size() == 1);
  assert(favorites[0].id == liked.id);

  plain.text = "Act now.";
  assert(repo.UpsertQuote(*tx, plain));
  assert(repo.GetQuote(*tx, plain.id)->text == "Act now.");

  assert(repo.DeleteQuote(*tx, plain.id));
  assert(repo.DeleteQuote(*tx, plain.id));
  assert(!repo.GetQuote(*tx, plain.id).has_value());
  assert(repo.DeleteQuote(*tx, liked.id));

  ActivityRecord journal{.id = 0, .kind = prefix + "-journal", .occurred_at_ms = 10};
  ActivityRecord exercise{.id = 0, .kind = prefix + "-exercise", .occurred_at_ms = 20};
  assert(repo.InsertActivity(*tx, journal));
  assert(repo.InsertActivity(*tx, exercise));
  assert(exercise.id > journal.id);

  assert(repo.ListActivity(*tx, prefix + "-journal").size() == 1);
  assert(repo.ListActivity(*tx, std::nullopt).size() >= 2);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertSchedule(*tx, MakeSchedule(id, 9, 0, 1)));
    tx->Rollback();
  }
  {
    // destructor rolls back an abandoned transaction
    auto tx = repo.Begin();
    assert(repo.InsertSchedule(*tx, MakeSchedule(id, 9, 0, 1)));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetSchedule(*check_tx, id).has_value());
  check_tx->Commit();
  assert(check_tx->IsCommitted());
}

void VerifyConcurrentDefaultCreation(Repository& repo, const std::string& prefix) {
  std::vector<std::thread> threads;
  for (int i = 0; i < 6; ++i) {
    threads.emplace_back([&repo, &prefix, i] {
      auto tx     = repo.Begin();
      auto result = repo.InsertDefaultScheduleIfAbsent(*tx, MakeSchedule(prefix + "-" + std::to_string(i), 9, 0, i));
      assert(result || result.code == ErrorCode::AlreadyExists);
      tx->Commit();
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  auto tx       = repo.Begin();
  int  defaults = 0;
  for (const auto& record : repo.ListSchedules(*tx, false)) {
    if (record.is_default) {
      ++defaults;
      assert(repo.DeleteSchedule(*tx, record.id));
    }
  }
  tx->Commit();
  assert(defaults == 1);
}

void VerifyStoreDeliversOverBackend(const std::shared_ptr<Repository>& repo) {
  using namespace std::chrono;
  using quotecast::core::DeliveryOutcomeKind;

  quotecast::core::ScheduleStore store(repo, std::make_shared<quotecast::cache::EntityCache>(), nullptr,
                                       quotecast::util::TimeZone::Utc(), 3);

  quotecast::model::Quote quote;
  quote.id   = "store-quote";
  quote.text = "Keep going.";
  assert(store.UpsertQuote(quote).ok());

  auto schedule = store.EnsureDefaultSchedule();
  assert(schedule.ok());

  const auto now    = sys_days{2024y / May / 20} + hours{9} + minutes{5};
  auto       report = store.DeliverDueQuotes(now);
  assert(report.ok());
  assert(report->Count(DeliveryOutcomeKind::kDelivered) == 1);
  assert(store.DeliverDueQuotes(now)->outcomes.empty());

  auto summary = store.StreakSummary(std::string("quote_delivery"), now);
  assert(summary.ok());
  assert(summary->current == 1);

  assert(store.DeleteSchedule(schedule->id).ok());
  assert(store.DeleteQuote(quote.id).ok());
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();

    auto record       = MakeSchedule(id, 18, 30, NowMs());
    record.categories = {"evening"};
    assert(repo->InsertSchedule(*tx, record));

    DeliveryRecord delivery{.id = 0, .quote_id = id + "-quote", .schedule_id = id, .delivered_at_ms = NowMs()};
    assert(repo->InsertDelivery(*tx, delivery));
    assert(repo->UpdateLastDelivery(*tx, id, delivery.quote_id, delivery.delivered_at_ms, std::nullopt));

    QuoteRecord quote{.id = id + "-quote", .text = "Persist.", .author = "", .categories = {"evening"}, .is_favorite = true};
    assert(repo->UpsertQuote(*tx, quote));

    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto s  = repo->GetSchedule(*tx, id);
  assert(s.has_value());
  assert(s->scheduled_hour == 18);
  assert((s->categories == std::vector<std::string>{"evening"}));
  assert(s->last_delivered_quote_id == id + "-quote");
  assert(repo->ListDeliveriesSince(*tx, id, 0).size() == 1);
  assert(repo->GetQuote(*tx, id + "-quote").has_value());
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("quotecast_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<quotecast::db::sqlite::SqliteDB>(db_path);
    quotecast::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<quotecast::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyScheduleRoundTrip(*repo, backend.name + "-roundtrip");
    VerifyListOrdering(*repo, backend.name + "-order");
    VerifySingleDefault(*repo, backend.name + "-single");
    VerifyLastDeliveryCompareAndSwap(*repo, backend.name + "-cas");
    VerifyDeliveryHistory(*repo, backend.name + "-history");
    VerifyQuotesAndActivity(*repo, backend.name + "-quotes");
    VerifyRollbackBehavior(*repo, backend.name + "-rollback");
    VerifyConcurrentDefaultCreation(*repo, backend.name + "-race");
    VerifyStoreDeliversOverBackend(repo);
  }

  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "quotecast_integration_repository_parity: pass\n";
  return 0;
}
