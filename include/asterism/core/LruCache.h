#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <unordered_map>
#include <utility>

namespace asterism::core {

struct LruStats {
  std::size_t capacity{0};
  std::size_t size{0};
  std::size_t hits{0};
  std::size_t misses{0};
  std::size_t puts{0};
  std::size_t evictions{0};
};

// Bounded map that evicts the least recently used entry.
// Entries live in a list ordered newest first; the index points into it.
// get() refreshes recency and counts a hit or miss, peek() and contains()
// do neither. Capacity 0 means 1. Callers lock if they share one.
template <class Key, class Value, class Hash = std::hash<Key>>
class LruCache {
public:
  using Stats = LruStats;

  explicit LruCache(std::size_t capacity = 128) { setCapacity(capacity); }

  std::size_t capacity() const { return stats_.capacity; }
  void setCapacity(std::size_t capacity) {
    stats_.capacity = capacity == 0 ? 1 : capacity;
    trim();
  }

  std::size_t size() const { return index_.size(); }
  bool empty() const { return index_.empty(); }
  bool contains(const Key& key) const { return index_.count(key) != 0; }

  Stats stats() const {
    Stats s = stats_;
    s.size = index_.size();
    return s;
  }
  void resetStats() { stats_ = Stats{stats_.capacity}; }

  Value* get(const Key& key) {
    const auto found = index_.find(key);
    if (found == index_.end()) {
      ++stats_.misses;
      return nullptr;
    }
    ++stats_.hits;
    entries_.splice(entries_.begin(), entries_, found->second);
    return &found->second->second;
  }

  const Value* peek(const Key& key) const {
    const auto found = index_.find(key);
    return found == index_.end() ? nullptr : &found->second->second;
  }

  // Inserts or overwrites, making the entry the most recent. If the index
  // cannot grow the list is rolled back and the exception propagates.
  Value& put(const Key& key, Value value) {
    ++stats_.puts;
    if (const auto found = index_.find(key); found != index_.end()) {
      found->second->second = std::move(value);
      entries_.splice(entries_.begin(), entries_, found->second);
      return found->second->second;
    }

    entries_.emplace_front(key, std::move(value));
    try {
      index_.emplace(key, entries_.begin());
    } catch (...) {
      entries_.pop_front();
      throw;
    }
    Value& slot = entries_.front().second;
    trim();
    return slot;
  }

  void clear() {
    index_.clear();
    entries_.clear();
  }

private:
  using Entries = std::list<std::pair<Key, Value>>;

  void trim() {
    while (index_.size() > stats_.capacity) {
      index_.erase(entries_.back().first);
      entries_.pop_back();
      ++stats_.evictions;
    }
  }

  Entries entries_;
  std::unordered_map<Key, typename Entries::iterator, Hash> index_;
  Stats stats_{};
};

} // namespace asterism::core
