/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HOPPER_CACHE_HPP
#define HOPPER_CACHE_HPP

#include "core/Logger.hpp"
#include "core/PositionKey.hpp"
#include "utils/PerformanceMonitor.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace TickGuard {

struct HopperCacheConfig {
  bool optimizedCaching{true};
  bool skipEmptyCheck{true};
  bool throttleWhenFull{true};
  size_t capacity{4096};
  int maxAgeTicks{6000};
};

/**
 * @brief Base for host inventories held by the core's hopper cache
 */
class HopperContainer {
public:
  virtual ~HopperContainer() = default;

  virtual bool isEmpty() const = 0;
  virtual bool isFull() const = 0;
};

/**
 * @brief Per-position container cache and transfer hints for hoppers
 *
 * Holds two hints per position: whether a source may have items and whether
 * a destination may have room. A hint of "empty" or "full" lets the hopper
 * skip its transfer attempt until onContainerChanged() clears it.
 *
 * Containers are held by std::weak_ptr, so the cache never keeps a removed
 * container alive. A lookup whose container has been destroyed is a plain
 * miss. Entries untouched for maxAgeTicks are dropped by expire(), and the
 * cache never grows beyond capacity.
 *
 * Each optimization is toggled on its own. With a toggle off the matching
 * calls do nothing and the query calls answer "don't skip" or miss.
 *
 * Thread-safe: lookups take a shared lock, updates an exclusive one.
 *
 * @tparam Container The host's container type
 */
template <typename Container> class HopperCache {
public:
  explicit HopperCache(const HopperCacheConfig &config,
                       PerformanceMonitor *monitor = nullptr)
      : m_config(config), m_monitor(monitor) {
    if (m_config.capacity == 0) {
      throw std::invalid_argument("hopper cache capacity must be positive");
    }
    if (m_config.maxAgeTicks <= 0) {
      throw std::invalid_argument("hopper cache max age must be positive");
    }
  }

  /**
   * @brief Current tick used to stamp entries, set by the owner every tick
   */
  void setCurrentTick(int64_t tick) {
    m_currentTick.store(tick, std::memory_order_relaxed);
  }

  // Contents changed: the position may have items and may have room again
  void onContainerChanged(PositionKey pos) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(pos);
    if (it == m_entries.end()) {
      return;
    }
    it->second.sourceHasItems = true;
    it->second.destHasRoom = true;
    touch(it->second);
  }

  bool shouldSkipPull(PositionKey sourcePos) const {
    if (!m_config.skipEmptyCheck) {
      return false;
    }
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(sourcePos);
    return it != m_entries.end() && it->second.sourceHasItems.has_value() &&
           !*it->second.sourceHasItems;
  }

  void markSourceEmpty(PositionKey sourcePos) {
    if (!m_config.skipEmptyCheck) {
      return;
    }
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    Entry *entry = entryFor(sourcePos);
    if (entry) {
      entry->sourceHasItems = false;
      touch(*entry);
    }
  }

  bool shouldSkipPush(PositionKey destPos) const {
    if (!m_config.throttleWhenFull) {
      return false;
    }
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(destPos);
    return it != m_entries.end() && it->second.destHasRoom.has_value() &&
           !*it->second.destHasRoom;
  }

  void markDestFull(PositionKey destPos) {
    if (!m_config.throttleWhenFull) {
      return;
    }
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    Entry *entry = entryFor(destPos);
    if (entry) {
      entry->destHasRoom = false;
      touch(*entry);
    }
  }

  void cacheContainer(PositionKey pos, const std::shared_ptr<Container> &container) {
    if (!m_config.optimizedCaching || !container) {
      return;
    }
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    Entry *entry = entryFor(pos);
    if (entry) {
      entry->container = container;
      touch(*entry);
    }
  }

  /**
   * @brief Cached container, or an empty pointer on a miss
   *
   * A container that has since been destroyed counts as a miss and its
   * reference is dropped.
   */
  std::shared_ptr<Container> getContainer(PositionKey pos) {
    if (!m_config.optimizedCaching) {
      return nullptr;
    }

    {
      std::shared_lock<std::shared_mutex> lock(m_mutex);
      auto it = m_entries.find(pos);
      if (it == m_entries.end()) {
        countMiss();
        return nullptr;
      }
      if (auto container = it->second.container.lock()) {
        touch(it->second);
        countHit();
        return container;
      }
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(pos);
    if (it != m_entries.end()) {
      if (auto container = it->second.container.lock()) {
        // Re-cached between the two locks
        countHit();
        return container;
      }
      it->second.container.reset();
      if (!it->second.sourceHasItems && !it->second.destHasRoom) {
        m_entries.erase(it);
      }
    }
    countMiss();
    return nullptr;
  }

  // Block removed: forget everything about the position
  void removeContainer(PositionKey pos) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_entries.erase(pos);
  }

  void clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_entries.clear();
  }

  /**
   * @brief Drops entries idle for longer than maxAgeTicks and entries whose
   * container is gone and carry no hints
   * @return Number of entries removed
   */
  size_t expire(int64_t tick) {
    size_t removed = 0;
    size_t remaining = 0;
    {
      std::unique_lock<std::shared_mutex> lock(m_mutex);
      for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (isStale(it->second, tick)) {
          it = m_entries.erase(it);
          ++removed;
        } else {
          ++it;
        }
      }
      remaining = m_entries.size();
    }
    if (removed > 0) {
      HOPPER_DEBUG("Expired " + std::to_string(removed) + " entries, " +
                   std::to_string(remaining) + " cached");
    }
    (void)remaining;
    return removed;
  }

  size_t size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_entries.size();
  }

  uint64_t getHitCount() const { return m_hits.load(std::memory_order_relaxed); }
  uint64_t getMissCount() const { return m_misses.load(std::memory_order_relaxed); }

  const HopperCacheConfig &getConfig() const { return m_config; }

private:
  struct Entry {
    std::optional<bool> sourceHasItems{};
    std::optional<bool> destHasRoom{};
    std::weak_ptr<Container> container{};
    std::atomic<int64_t> lastTouchTick{0};
  };

  void touch(Entry &entry) const {
    entry.lastTouchTick.store(m_currentTick.load(std::memory_order_relaxed),
                              std::memory_order_relaxed);
  }

  bool isStale(const Entry &entry, int64_t tick) const {
    if (tick - entry.lastTouchTick.load(std::memory_order_relaxed) >
        m_config.maxAgeTicks) {
      return true;
    }
    return entry.container.expired() && !entry.sourceHasItems &&
           !entry.destHasRoom;
  }

  // Caller holds the exclusive lock. Returns nullptr only if the cache is
  // full of live entries and none can be evicted.
  Entry *entryFor(PositionKey pos) {
    auto it = m_entries.find(pos);
    if (it != m_entries.end()) {
      return &it->second;
    }
    if (m_entries.size() >= m_config.capacity) {
      evictOne();
    }
    if (m_entries.size() >= m_config.capacity) {
      return nullptr;
    }
    auto inserted = m_entries.try_emplace(pos);
    touch(inserted.first->second);
    return &inserted.first->second;
  }

  // Evicts the least recently touched entry
  void evictOne() {
    auto oldest = m_entries.end();
    int64_t oldestTick = 0;
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
      const int64_t touched = it->second.lastTouchTick.load(std::memory_order_relaxed);
      if (oldest == m_entries.end() || touched < oldestTick) {
        oldest = it;
        oldestTick = touched;
      }
    }
    if (oldest != m_entries.end()) {
      m_entries.erase(oldest);
    }
  }

  void countHit() {
    m_hits.fetch_add(1, std::memory_order_relaxed);
    if (m_monitor) {
      m_monitor->increment(MonitorCategory::HOPPER_CACHE_HITS);
    }
  }

  void countMiss() {
    m_misses.fetch_add(1, std::memory_order_relaxed);
    if (m_monitor) {
      m_monitor->increment(MonitorCategory::HOPPER_CACHE_MISSES);
    }
  }

  HopperCacheConfig m_config;
  PerformanceMonitor *m_monitor;

  mutable std::shared_mutex m_mutex{};
  std::unordered_map<PositionKey, Entry> m_entries{};
  std::atomic<int64_t> m_currentTick{0};
  std::atomic<uint64_t> m_hits{0};
  std::atomic<uint64_t> m_misses{0};
};

using CoreHopperCache = HopperCache<HopperContainer>;

} // namespace TickGuard

#endif // HOPPER_CACHE_HPP
