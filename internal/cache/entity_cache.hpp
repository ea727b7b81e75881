#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "internal/cache/lru_cache.hpp"
#include "internal/model/activity.hpp"
#include "internal/model/quote.hpp"
#include "internal/model/schedule.hpp"

namespace quotecast::cache {

/*
  EntityCache

  Read-through / write-invalidate layer in front of the repository.
  One LRU partition per entity type, each with its own capacity and mutex.

  The cache is never authoritative: callers Remove() on every mutation of
  the underlying row and treat a miss as "go to the repository".
*/

enum class CacheType {
  kQuote,
  kSchedule,
  kStreak,
};

std::string_view ToString(CacheType type);

template <CacheType T>
struct CacheTraits;

template <>
struct CacheTraits<CacheType::kQuote> {
  using Value = model::Quote;
};

template <>
struct CacheTraits<CacheType::kSchedule> {
  using Value = model::Schedule;
};

// key: "<kind>@YYYY-MM-DD", kind "*" for all activity
template <>
struct CacheTraits<CacheType::kStreak> {
  using Value = model::StreakSummary;
};

class EntityCache {
 public:
  static constexpr std::size_t kDefaultCapacity = 50;

  explicit EntityCache(std::size_t capacity_per_partition = kDefaultCapacity);

  template <CacheType T>
  void Put(const std::string& key, typename CacheTraits<T>::Value value) {
    Partition<T>().Put(key, std::move(value));
  }

  template <CacheType T>
  std::optional<typename CacheTraits<T>::Value> Get(const std::string& key) {
    return Partition<T>().Get(key);
  }

  template <CacheType T>
  bool Remove(const std::string& key) {
    return Partition<T>().Remove(key);
  }

  void       Clear(CacheType type);
  CacheStats Stats(CacheType type) const;

  void                            ClearAll();
  std::map<CacheType, CacheStats> AllStats() const;

 private:
  template <CacheType T>
  using PartitionFor = LruCache<std::string, typename CacheTraits<T>::Value>;

  template <CacheType T>
  PartitionFor<T>& Partition() {
    if constexpr (T == CacheType::kQuote) {
      return quotes_;
    } else if constexpr (T == CacheType::kSchedule) {
      return schedules_;
    } else {
      return streaks_;
    }
  }

  PartitionFor<CacheType::kQuote>    quotes_;
  PartitionFor<CacheType::kSchedule> schedules_;
  PartitionFor<CacheType::kStreak>   streaks_;
};

} // namespace quotecast::cache
