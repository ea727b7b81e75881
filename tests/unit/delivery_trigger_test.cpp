#include "internal/trigger/delivery_trigger.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/factory.hpp"

namespace {

using quotecast::delivery::DeliveryNotice;
using quotecast::delivery::DeliverySurface;

class RecordingSurface final : public DeliverySurface {
 public:
  void Deliver(const DeliveryNotice& notice) override {
    std::lock_guard<std::mutex> lock(mutex_);
    notices_.push_back(notice);
  }

  std::size_t Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return notices_.size();
  }

 private:
  mutable std::mutex          mutex_;
  std::vector<DeliveryNotice> notices_;
};

quotecast::runtime::config::RuntimeConfig MemoryConfig(int64_t interval_ms) {
  quotecast::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  config.mutable_scheduler()->set_time_zone("UTC");
  config.mutable_scheduler()->mutable_trigger_interval()->set_seconds(interval_ms / 1000);
  config.mutable_scheduler()->mutable_trigger_interval()->set_nanos(static_cast<int32_t>((interval_ms % 1000) * 1000000));
  return config;
}

template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

void TestBuildWiresMemoryBackend() {
  auto surface = std::make_shared<RecordingSurface>();
  auto app     = quotecast::factory::Build(MemoryConfig(250), surface);

  assert(app.repository != nullptr);
  assert(app.cache != nullptr);
  assert(app.store != nullptr);
  assert(app.trigger != nullptr);
  assert(app.surface == surface);
  assert(app.store->zone().Name() == "UTC");
  assert(app.trigger->runs() == 0);
}

void TestTriggerDeliversAndStops() {
  auto surface = std::make_shared<RecordingSurface>();
  auto app     = quotecast::factory::Build(MemoryConfig(20), surface);

  quotecast::model::Quote quote;
  quote.id   = "q1";
  quote.text = "Begin anywhere.";
  assert(app.store->UpsertQuote(quote).ok());

  // due from midnight on, so the first run delivers
  quotecast::model::Schedule schedule;
  schedule.scheduled_hour   = 0;
  schedule.scheduled_minute = 0;
  assert(app.store->CreateSchedule(schedule).ok());

  app.trigger->Start();
  app.trigger->Start();
  assert(WaitFor([&] { return app.trigger->runs() >= 3; }, std::chrono::seconds(5)));
  app.trigger->Stop();

  // further runs the same day find nothing due
  assert(surface->Count() == 1);

  const auto runs_after_stop = app.trigger->runs();
  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  assert(app.trigger->runs() == runs_after_stop);

  app.trigger->Stop();
}

void TestStopWithoutStartIsHarmless() {
  auto app = quotecast::factory::Build(MemoryConfig(1000));
  app.trigger->Stop();
  assert(app.trigger->runs() == 0);
}

} // namespace

int main() {
  TestBuildWiresMemoryBackend();
  TestTriggerDeliversAndStops();
  TestStopWithoutStartIsHarmless();

  std::cout << "quotecast_unit_delivery_trigger: pass\n";
  return 0;
}
