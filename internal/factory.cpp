#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace quotecast::factory {

using observability::IntField;
using observability::StringField;

util::TimeZone ResolveTimeZone(const quotecast::runtime::config::RuntimeConfig& config) {
  const auto& spec = config.scheduler().time_zone();
  auto        zone = util::TimeZone::Parse(spec);
  if (!zone) {
    throw util::InvalidArgument("scheduler.time_zone: expected local, UTC or +HH:MM, got '" + spec + "'");
  }
  return *zone;
}

std::chrono::milliseconds ResolveTriggerInterval(const quotecast::runtime::config::RuntimeConfig& config) {
  if (!config.scheduler().has_trigger_interval()) {
    return kDefaultTriggerInterval;
  }

  const auto& d        = config.scheduler().trigger_interval();
  const auto  interval = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds{d.seconds()} +
                                                                              std::chrono::nanoseconds{d.nanos()});
  if (interval.count() < 0) {
    throw util::InvalidArgument("scheduler.trigger_interval must not be negative");
  }
  if (interval.count() == 0) {
    return kDefaultTriggerInterval;
  }
  return interval;
}

std::size_t ResolveCacheCapacity(const quotecast::runtime::config::RuntimeConfig& config) {
  const auto capacity = config.cache().capacity_per_partition();
  return capacity == 0 ? cache::EntityCache::kDefaultCapacity : static_cast<std::size_t>(capacity);
}

std::shared_ptr<db::Repository> BuildRepository(const quotecast::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    if (database.sqlite().path().empty()) {
      throw util::InvalidArgument("database.sqlite.path must not be empty");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    QUOTECAST_LOG_INFO("sqlite repository ready", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  QUOTECAST_LOG_INFO("memory repository ready");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const quotecast::runtime::config::RuntimeConfig& config, std::shared_ptr<delivery::DeliverySurface> surface) {
  Application app;

  const auto zone = ResolveTimeZone(config);

  // ------------------------------------------------------------------
  // Persistence + cache
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.cache      = std::make_shared<cache::EntityCache>(ResolveCacheCapacity(config));

  // ------------------------------------------------------------------
  // Facade
  // ------------------------------------------------------------------
  app.surface = surface ? std::move(surface) : std::make_shared<delivery::LoggingDeliverySurface>();
  app.store   = std::make_shared<core::ScheduleStore>(app.repository, app.cache, app.surface, zone);

  // ------------------------------------------------------------------
  // Periodic trigger
  // ------------------------------------------------------------------
  const auto interval = ResolveTriggerInterval(config);
  app.trigger         = std::make_shared<trigger::DeliveryTrigger>(app.store, interval);

  QUOTECAST_LOG_INFO("application built", {StringField("time_zone", zone.Name()), IntField("trigger_interval_ms", interval.count()),
                                           IntField("cache_capacity", static_cast<int64_t>(ResolveCacheCapacity(config)))});
  return app;
}

} // namespace quotecast::factory
