/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef OBSERVER_DEBOUNCE_HPP
#define OBSERVER_DEBOUNCE_HPP

#include "core/PositionKey.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace TickGuard {

class PerformanceMonitor;

struct ObserverDebounceConfig {
  bool enabled{true};
  int minIntervalTicks{4};
  int staleWindowTicks{200};       // entries idle longer than this are evicted
  int cleanupIntervalTicks{1200};  // how often eviction runs
};

/**
 * @brief Per-position minimum interval between observer fires
 *
 * Remembers the last tick each position fired on. A fire closer than
 * minIntervalTicks to the previous one is suppressed. The first fire of a
 * position that is not tracked always goes through, whatever the interval.
 *
 * Entries are cross-tick and are evicted by cleanup() once they have been
 * idle for staleWindowTicks. The stale window must be at least the minimum
 * interval, otherwise an evicted position could fire again too early.
 *
 * Safe to call from worker threads as well as the main thread.
 */
class ObserverDebounce {
public:
  /**
   * @throws std::invalid_argument on negative intervals or when
   * staleWindowTicks < minIntervalTicks
   */
  explicit ObserverDebounce(const ObserverDebounceConfig &config,
                            PerformanceMonitor *monitor = nullptr);

  bool shouldFire(PositionKey blockKey, int64_t tick);

  /**
   * @brief Evicts idle entries, at most once per cleanup interval
   * @return Number of entries removed
   */
  size_t cleanup(int64_t tick);

  /**
   * @brief Fires suppressed since the last call, then resets
   */
  uint64_t getDebouncedCount() {
    return m_debouncedCount.exchange(0, std::memory_order_relaxed);
  }

  size_t getTrackedCount() const;
  void clear();

  bool isEnabled() const { return m_config.enabled; }
  const ObserverDebounceConfig &getConfig() const { return m_config; }

private:
  ObserverDebounceConfig m_config;
  PerformanceMonitor *m_monitor;

  mutable std::mutex m_mutex{};
  std::unordered_map<PositionKey, int64_t> m_lastFire{};
  int64_t m_lastCleanupTick{0};
  std::atomic<uint64_t> m_debouncedCount{0};
};

} // namespace TickGuard

#endif // OBSERVER_DEBOUNCE_HPP
