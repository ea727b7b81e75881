#pragma once

#include <chrono>
#include <cstddef>
#include <memory>

#include "config/config.pb.h"

#include "internal/cache/entity_cache.hpp"
#include "internal/core/schedule_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/delivery/delivery_surface.hpp"
#include "internal/trigger/delivery_trigger.hpp"
#include "internal/util/time.hpp"

namespace quotecast::factory {

/*
  Application

  Owns all long-lived objects of a process. The trigger is built but not
  started; the daemon starts it, the ctl tool never does.
*/
struct Application {
  std::shared_ptr<db::Repository>            repository;
  std::shared_ptr<cache::EntityCache>        cache;
  std::shared_ptr<delivery::DeliverySurface> surface;
  std::shared_ptr<core::ScheduleStore>       store;
  std::shared_ptr<trigger::DeliveryTrigger>  trigger;
};

inline constexpr std::chrono::milliseconds kDefaultTriggerInterval = std::chrono::hours{1};

// Throw util::InvalidArgument on values the config schema cannot rule out.
util::TimeZone            ResolveTimeZone(const quotecast::runtime::config::RuntimeConfig& config);
std::chrono::milliseconds ResolveTriggerInterval(const quotecast::runtime::config::RuntimeConfig& config);
std::size_t               ResolveCacheCapacity(const quotecast::runtime::config::RuntimeConfig& config);

// sqlite (schema bootstrapped) when configured, memory otherwise.
std::shared_ptr<db::Repository> BuildRepository(const quotecast::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: the only place that knows concrete repository types.
  `surface` defaults to LoggingDeliverySurface.
*/
Application Build(const quotecast::runtime::config::RuntimeConfig& config, std::shared_ptr<delivery::DeliverySurface> surface = nullptr);

} // namespace quotecast::factory
