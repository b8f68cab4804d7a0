/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EXPLOSION_BATCHER_HPP
#define EXPLOSION_BATCHER_HPP

#include <boost/container/small_vector.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace TickGuard {

class PerformanceMonitor;

struct ExplosionBatcherConfig {
  bool enabled{true};
  double groupRadius{1.0};
};

/**
 * @brief An explosion waiting for the end-of-tick flush
 */
struct PendingDetonation {
  double x{0.0};
  double y{0.0};
  double z{0.0};
  float power{0.0f};
};

struct ExplosionBatcherStats {
  size_t queued{0};
  double groupRadiusSq{0.0};
  uint64_t batched{0};
};

/**
 * @brief Merges explosions that go off close together within one tick
 *
 * Detonations are queued during the tick and flushed once at its end.
 * Clustering is greedy and single-pass: the first unassigned detonation
 * seeds a cluster and every unassigned detonation within groupRadius of the
 * seed joins it. A cluster of several detonations is applied once at their
 * mean position with power sqrt(sum(p^2)), which keeps the combined energy
 * without the exaggerated blast radius a plain sum gives.
 *
 * Main thread only.
 */
class ExplosionBatcher {
public:
  using ExplosionFn = std::function<void(double x, double y, double z, float power)>;

  /**
   * @throws std::invalid_argument on a negative group radius
   */
  explicit ExplosionBatcher(const ExplosionBatcherConfig &config,
                            PerformanceMonitor *monitor = nullptr);

  void enqueue(double x, double y, double z, float power);

  /**
   * @brief Clusters and applies everything queued this tick
   *
   * applyFn runs synchronously once per cluster. The queue is empty
   * afterwards in every case, including when the batcher is disabled.
   *
   * @return Number of applyFn invocations
   */
  size_t flush(const ExplosionFn &applyFn);

  /**
   * @brief Detonations merged away since the last call, then resets
   */
  uint64_t getBatchedCount();

  ExplosionBatcherStats getStats() const;

  size_t getQueueSize() const { return m_queue.size(); }
  bool isEnabled() const { return m_config.enabled; }

private:
  ExplosionBatcherConfig m_config;
  double m_groupRadiusSq;
  PerformanceMonitor *m_monitor;
  std::vector<PendingDetonation> m_queue{};
  std::vector<uint8_t> m_assigned{};
  boost::container::small_vector<size_t, 16> m_cluster{};
  uint64_t m_batchedCount{0};
};

} // namespace TickGuard

#endif // EXPLOSION_BATCHER_HPP
