/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TICK_COALESCER_HPP
#define TICK_COALESCER_HPP

#include "core/PositionKey.hpp"

#include <cstddef>
#include <cstdint>
#include <unordered_set>

namespace TickGuard {

class PerformanceMonitor;

/**
 * @brief Lets each position run its scheduled tick at most once per tick
 *
 * The set is cleared by reset() at the start of every tick and holds no
 * cross-tick state. Main thread only.
 */
class TickCoalescer {
public:
  explicit TickCoalescer(bool enabled = true, PerformanceMonitor *monitor = nullptr)
      : m_enabled(enabled), m_monitor(monitor) {}

  void reset() { m_seen.clear(); }

  bool shouldTick(PositionKey blockKey);

  /**
   * @brief Duplicates dropped since the last call, then resets
   */
  uint64_t getCoalescedCount() {
    const uint64_t count = m_coalescedCount;
    m_coalescedCount = 0;
    return count;
  }

  size_t getTickedThisTick() const { return m_seen.size(); }
  bool isEnabled() const { return m_enabled; }

private:
  bool m_enabled;
  PerformanceMonitor *m_monitor;
  std::unordered_set<PositionKey> m_seen{};
  uint64_t m_coalescedCount{0};
};

} // namespace TickGuard

#endif // TICK_COALESCER_HPP
