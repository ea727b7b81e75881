#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace quotecast::cache {

struct CacheStats {
  std::size_t size     = 0;
  std::size_t capacity = 0;

  uint64_t hits      = 0;
  uint64_t misses    = 0;
  uint64_t puts      = 0;
  uint64_t evictions = 0;
};

/*
  Fixed-capacity LRU map.

  - Get promotes the entry to most-recently-used
  - Put beyond capacity evicts exactly one entry, the least-recently-used
  - No time-based expiry
  - Every operation takes the cache mutex, so a single LruCache is linearizable

  Capacity 0 turns the cache into a counter: nothing is retained.
*/
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LruCache {
 public:
  explicit LruCache(std::size_t capacity) : capacity_(capacity) {
  }

  LruCache(const LruCache&)            = delete;
  LruCache& operator=(const LruCache&) = delete;

  void Put(const Key& key, Value value) {
    std::lock_guard lock(mutex_);
    ++stats_.puts;

    if (auto it = index_.find(key); it != index_.end()) {
      it->second->second = std::move(value);
      order_.splice(order_.begin(), order_, it->second);
      return;
    }

    if (capacity_ == 0) {
      return;
    }

    if (index_.size() >= capacity_) {
      index_.erase(order_.back().first);
      order_.pop_back();
      ++stats_.evictions;
    }

    order_.emplace_front(key, std::move(value));
    index_.emplace(key, order_.begin());
  }

  std::optional<Value> Get(const Key& key) {
    std::lock_guard lock(mutex_);

    auto it = index_.find(key);
    if (it == index_.end()) {
      ++stats_.misses;
      return std::nullopt;
    }

    ++stats_.hits;
    order_.splice(order_.begin(), order_, it->second);
    return it->second->second;
  }

  // true when an entry was removed
  bool Remove(const Key& key) {
    std::lock_guard lock(mutex_);

    auto it = index_.find(key);
    if (it == index_.end()) {
      return false;
    }
    order_.erase(it->second);
    index_.erase(it);
    return true;
  }

  void Clear() {
    std::lock_guard lock(mutex_);
    order_.clear();
    index_.clear();
  }

  CacheStats Stats() const {
    std::lock_guard lock(mutex_);
    CacheStats      out = stats_;
    out.size            = index_.size();
    out.capacity        = capacity_;
    return out;
  }

 private:
  using Entry = std::pair<Key, Value>;

  const std::size_t capacity_;

  mutable std::mutex                                                mutex_;
  std::list<Entry>                                                  order_; // front = most recently used
  std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> index_;
  CacheStats                                                        stats_;
};

} // namespace quotecast::cache
