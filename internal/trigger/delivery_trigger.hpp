#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace quotecast::core {
class ScheduleStore;
}

namespace quotecast::trigger {

/*
  Background worker that runs ScheduleStore::DeliverDueQuotes.

  Fires once right after Start() and then every `interval`. Runs are
  idempotent within a day, so firing too often only costs a few reads.
  Stop() interrupts the wait and joins.
*/
class DeliveryTrigger {
 public:
  DeliveryTrigger(std::shared_ptr<core::ScheduleStore> store, std::chrono::milliseconds interval);
  ~DeliveryTrigger();

  void Start();
  void Stop();

  uint64_t runs() const {
    return runs_.load();
  }

 private:
  void Run();
  void RunOnce();

  std::shared_ptr<core::ScheduleStore> store_;
  std::chrono::milliseconds            interval_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable wake_;
  bool                    running_ = false;
  std::atomic<uint64_t>   runs_{0};
};

} // namespace quotecast::trigger
