/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/ObserverDebounce.hpp"
#include "core/Logger.hpp"
#include "utils/PerformanceMonitor.hpp"

#include <stdexcept>
#include <string>

namespace TickGuard {

ObserverDebounce::ObserverDebounce(const ObserverDebounceConfig &config,
                                   PerformanceMonitor *monitor)
    : m_config(config), m_monitor(monitor) {
  if (m_config.minIntervalTicks < 0) {
    throw std::invalid_argument("observer debounce interval must be >= 0");
  }
  if (m_config.cleanupIntervalTicks <= 0) {
    throw std::invalid_argument("observer cleanup interval must be positive");
  }
  if (m_config.staleWindowTicks < m_config.minIntervalTicks) {
    throw std::invalid_argument(
        "observer stale window (" + std::to_string(m_config.staleWindowTicks) +
        ") must not be shorter than the debounce interval (" +
        std::to_string(m_config.minIntervalTicks) + ")");
  }
}

bool ObserverDebounce::shouldFire(PositionKey blockKey, int64_t tick) {
  if (!m_config.enabled) {
    return true;
  }

  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto [it, inserted] = m_lastFire.try_emplace(blockKey, tick);
    if (inserted) {
      return true;
    }
    if (tick - it->second >= m_config.minIntervalTicks) {
      it->second = tick;
      return true;
    }
  }

  m_debouncedCount.fetch_add(1, std::memory_order_relaxed);
  if (m_monitor) {
    m_monitor->increment(MonitorCategory::OBSERVER_DEBOUNCED);
  }
  return false;
}

size_t ObserverDebounce::cleanup(int64_t tick) {
  if (!m_config.enabled) {
    return 0;
  }

  size_t removed = 0;
  size_t remaining = 0;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (tick - m_lastCleanupTick < m_config.cleanupIntervalTicks) {
      return 0;
    }
    m_lastCleanupTick = tick;

    const int64_t staleBefore = tick - m_config.staleWindowTicks;
    for (auto it = m_lastFire.begin(); it != m_lastFire.end();) {
      if (it->second < staleBefore) {
        it = m_lastFire.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    remaining = m_lastFire.size();
  }

  if (removed > 0) {
    DEBOUNCE_DEBUG("Evicted " + std::to_string(removed) + " idle observers, " +
                   std::to_string(remaining) + " tracked");
  }
  (void)remaining;
  return removed;
}

size_t ObserverDebounce::getTrackedCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_lastFire.size();
}

void ObserverDebounce::clear() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_lastFire.clear();
}

} // namespace TickGuard
