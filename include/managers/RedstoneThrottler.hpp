/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REDSTONE_THROTTLER_HPP
#define REDSTONE_THROTTLER_HPP

#include "core/PositionKey.hpp"

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace TickGuard {

class PerformanceMonitor;

struct RedstoneThrottlerConfig {
  bool enabled{true};
  int softThreshold{64};
  int hardThreshold{150};
  int criticalThreshold{300};
  bool alertAdmins{true};
  int alertIntervalTicks{1200}; // 1 minute at 20 TPS
};

struct ChunkStats {
  int updateCount{0};
  int tickDivisor{1};
};

struct ChunkHotspot {
  PositionKey chunk{0};
  int updateCount{0};
};

struct RedstoneThrottlerStats {
  uint64_t tracked{0};
  uint64_t throttled{0};
  uint64_t proceeded{0};
};

/**
 * @brief Density-based redstone update throttle
 *
 * Counts updates per chunk within the current tick. Once a chunk crosses the
 * soft, hard or critical threshold its updates run only every 2nd, 4th or
 * 8th tick. Which tick a given block lands on is spread by a multiplicative
 * hash of its position so a dense chunk does not fire in lockstep.
 *
 * Main thread only.
 */
class RedstoneThrottler {
public:
  /**
   * @throws std::invalid_argument unless 0 < soft <= hard <= critical
   */
  explicit RedstoneThrottler(const RedstoneThrottlerConfig &config,
                             PerformanceMonitor *monitor = nullptr);

  /**
   * @brief Clears the per-chunk counters, called once at the start of a tick
   */
  void resetCounts();

  /**
   * @brief Counts one update in a chunk. Called for every update, including
   * ones that end up throttled.
   */
  void trackUpdate(PositionKey chunk);

  /**
   * @brief 1, 2, 4 or 8 depending on how busy the chunk is this tick
   */
  int getTickDivisor(PositionKey chunk) const;

  /**
   * @brief Decides whether the update at blockKey runs on this tick
   */
  bool shouldUpdate(PositionKey chunk, PositionKey blockKey, int64_t tick);

  /**
   * @brief Chunks at or above the soft threshold this tick
   */
  std::vector<ChunkHotspot> getHotspots() const;

  ChunkStats getChunkStats(PositionKey chunk) const;

  /**
   * @brief Logs a summary of hard and critical hotspots, at most once per
   * alert interval
   * @return true if an alert was emitted
   */
  bool checkAlerts(int64_t tick);

  RedstoneThrottlerStats getStats() const { return m_stats; }
  void resetStats() { m_stats = {}; }

  bool isEnabled() const { return m_config.enabled; }
  const RedstoneThrottlerConfig &getConfig() const { return m_config; }
  size_t getTrackedChunkCount() const { return m_chunkCounts.size(); }

private:
  static constexpr uint64_t HASH_MULTIPLIER = 6364136223846793005ULL;
  static constexpr uint64_t HASH_INCREMENT = 1442695040888963407ULL;
  static constexpr int64_t NEVER_ALERTED = -1;

  int countFor(PositionKey chunk) const;

  RedstoneThrottlerConfig m_config;
  PerformanceMonitor *m_monitor;
  std::unordered_map<PositionKey, int> m_chunkCounts{};
  RedstoneThrottlerStats m_stats{};
  int64_t m_lastAlertTick{NEVER_ALERTED};
};

} // namespace TickGuard

#endif // REDSTONE_THROTTLER_HPP
