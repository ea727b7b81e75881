#include "entity_cache.hpp"

namespace quotecast::cache {

std::string_view ToString(CacheType type) {
  switch (type) {
    case CacheType::kQuote:
      return "quote";
    case CacheType::kSchedule:
      return "schedule";
    case CacheType::kStreak:
      return "streak";
  }
  return "unknown";
}

EntityCache::EntityCache(std::size_t capacity_per_partition)
    : quotes_(capacity_per_partition), schedules_(capacity_per_partition), streaks_(capacity_per_partition) {
}

void EntityCache::Clear(CacheType type) {
  switch (type) {
    case CacheType::kQuote:
      quotes_.Clear();
      break;
    case CacheType::kSchedule:
      schedules_.Clear();
      break;
    case CacheType::kStreak:
      streaks_.Clear();
      break;
  }
}

CacheStats EntityCache::Stats(CacheType type) const {
  switch (type) {
    case CacheType::kQuote:
      return quotes_.Stats();
    case CacheType::kSchedule:
      return schedules_.Stats();
    case CacheType::kStreak:
      return streaks_.Stats();
  }
  return {};
}

void EntityCache::ClearAll() {
  quotes_.Clear();
  schedules_.Clear();
  streaks_.Clear();
}

std::map<CacheType, CacheStats> EntityCache::AllStats() const {
  return {
      {CacheType::kQuote, quotes_.Stats()},
      {CacheType::kSchedule, schedules_.Stats()},
      {CacheType::kStreak, streaks_.Stats()},
  };
}

} // namespace quotecast::cache
