/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/TickCoalescer.hpp"
#include "utils/PerformanceMonitor.hpp"

namespace TickGuard {

bool TickCoalescer::shouldTick(PositionKey blockKey) {
  if (!m_enabled) {
    return true;
  }

  if (m_seen.insert(blockKey).second) {
    return true;
  }

  ++m_coalescedCount;
  if (m_monitor) {
    m_monitor->increment(MonitorCategory::TICKS_COALESCED);
  }
  return false;
}

} // namespace TickGuard
