/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/RedstoneThrottler.hpp"
#include "core/Logger.hpp"
#include "utils/PerformanceMonitor.hpp"

#include <stdexcept>
#include <string>

namespace TickGuard {

RedstoneThrottler::RedstoneThrottler(const RedstoneThrottlerConfig &config,
                                     PerformanceMonitor *monitor)
    : m_config(config), m_monitor(monitor) {
  if (m_config.softThreshold <= 0 ||
      m_config.softThreshold > m_config.hardThreshold ||
      m_config.hardThreshold > m_config.criticalThreshold) {
    throw std::invalid_argument(
        "redstone thresholds must satisfy 0 < soft <= hard <= critical (got " +
        std::to_string(m_config.softThreshold) + "/" +
        std::to_string(m_config.hardThreshold) + "/" +
        std::to_string(m_config.criticalThreshold) + ")");
  }
  if (m_config.alertIntervalTicks <= 0) {
    throw std::invalid_argument("redstone alert interval must be positive");
  }

  THROTTLER_DEBUG("Thresholds soft=" + std::to_string(m_config.softThreshold) +
                  " hard=" + std::to_string(m_config.hardThreshold) +
                  " critical=" + std::to_string(m_config.criticalThreshold) +
                  (m_config.enabled ? "" : " (disabled)"));
}

void RedstoneThrottler::resetCounts() {
  if (!m_config.enabled) {
    return;
  }
  m_chunkCounts.clear();
}

void RedstoneThrottler::trackUpdate(PositionKey chunk) {
  if (!m_config.enabled) {
    return;
  }
  ++m_chunkCounts[chunk];
  ++m_stats.tracked;
}

int RedstoneThrottler::countFor(PositionKey chunk) const {
  auto it = m_chunkCounts.find(chunk);
  return it != m_chunkCounts.end() ? it->second : 0;
}

int RedstoneThrottler::getTickDivisor(PositionKey chunk) const {
  if (!m_config.enabled) {
    return 1;
  }

  const int count = countFor(chunk);
  if (count >= m_config.criticalThreshold) {
    return 8;
  }
  if (count >= m_config.hardThreshold) {
    return 4;
  }
  if (count >= m_config.softThreshold) {
    return 2;
  }
  return 1;
}

bool RedstoneThrottler::shouldUpdate(PositionKey chunk, PositionKey blockKey,
                                     int64_t tick) {
  if (!m_config.enabled) {
    return true;
  }

  const int divisor = getTickDivisor(chunk);
  if (divisor == 1) {
    ++m_stats.proceeded;
    return true;
  }

  // Divisors are powers of two, so unsigned wrap-around keeps the phase stable
  const uint64_t hash = blockKey * HASH_MULTIPLIER + HASH_INCREMENT;
  const bool proceed =
      (static_cast<uint64_t>(tick) + hash) % static_cast<uint64_t>(divisor) == 0;

  if (proceed) {
    ++m_stats.proceeded;
  } else {
    ++m_stats.throttled;
    if (m_monitor) {
      m_monitor->increment(MonitorCategory::REDSTONE_THROTTLED);
    }
  }
  return proceed;
}

std::vector<ChunkHotspot> RedstoneThrottler::getHotspots() const {
  std::vector<ChunkHotspot> hotspots;
  if (!m_config.enabled) {
    return hotspots;
  }

  for (const auto &[chunk, count] : m_chunkCounts) {
    if (count >= m_config.softThreshold) {
      hotspots.push_back(ChunkHotspot{chunk, count});
    }
  }
  return hotspots;
}

ChunkStats RedstoneThrottler::getChunkStats(PositionKey chunk) const {
  ChunkStats stats;
  stats.updateCount = m_config.enabled ? countFor(chunk) : 0;
  stats.tickDivisor = getTickDivisor(chunk);
  return stats;
}

bool RedstoneThrottler::checkAlerts(int64_t tick) {
  if (!m_config.enabled || !m_config.alertAdmins) {
    return false;
  }
  if (m_lastAlertTick != NEVER_ALERTED &&
      tick - m_lastAlertTick < m_config.alertIntervalTicks) {
    return false;
  }

  const auto hotspots = getHotspots();
  if (hotspots.empty()) {
    return false;
  }

  int criticalCount = 0;
  int hardCount = 0;
  int softCount = 0;
  for (const auto &hotspot : hotspots) {
    if (hotspot.updateCount >= m_config.criticalThreshold) {
      ++criticalCount;
    } else if (hotspot.updateCount >= m_config.hardThreshold) {
      ++hardCount;
    } else {
      ++softCount;
    }
  }

  if (criticalCount == 0 && hardCount == 0) {
    return false;
  }

  THROTTLER_WARN("Redstone hotspots detected: " + std::to_string(criticalCount) +
                 " critical, " + std::to_string(hardCount) + " hard, " +
                 std::to_string(softCount) + " soft (total " +
                 std::to_string(hotspots.size()) + " chunks)");
  m_lastAlertTick = tick;
  return true;
}

} // namespace TickGuard
