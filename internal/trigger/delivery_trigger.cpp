#include "delivery_trigger.hpp"

#include "internal/core/schedule_store.hpp"
#include "internal/observability/logging.hpp"

namespace quotecast::trigger {

using observability::IntField;
using observability::StringField;

DeliveryTrigger::DeliveryTrigger(std::shared_ptr<core::ScheduleStore> store, std::chrono::milliseconds interval)
    : store_(std::move(store)), interval_(interval) {
}

DeliveryTrigger::~DeliveryTrigger() {
  Stop();
}

void DeliveryTrigger::Start() {
  {
    std::lock_guard lock(mutex_);
    if (running_) return;
    running_ = true;
  }
  thread_ = std::thread(&DeliveryTrigger::Run, this);
  QUOTECAST_LOG_INFO("delivery trigger started", {IntField("interval_ms", interval_.count())});
}

void DeliveryTrigger::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
    QUOTECAST_LOG_INFO("delivery trigger stopped", {IntField("runs", static_cast<int64_t>(runs_.load()))});
  }
}

void DeliveryTrigger::Run() {
  while (true) {
    RunOnce();

    std::unique_lock lock(mutex_);
    if (wake_.wait_for(lock, interval_, [this] { return !running_; })) {
      return;
    }
  }
}

void DeliveryTrigger::RunOnce() {
  ++runs_;

  auto report = store_->DeliverDueQuotes();
  if (!report.ok()) {
    // next tick retries; the store already logged the cause
    QUOTECAST_LOG_WARN("delivery run failed", {StringField("status", report.status().ToString())});
  }
}

} // namespace quotecast::trigger
