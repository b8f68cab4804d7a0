/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/ExplosionBatcher.hpp"
#include "core/Logger.hpp"
#include "utils/PerformanceMonitor.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace TickGuard {

ExplosionBatcher::ExplosionBatcher(const ExplosionBatcherConfig &config,
                                   PerformanceMonitor *monitor)
    : m_config(config), m_groupRadiusSq(config.groupRadius * config.groupRadius),
      m_monitor(monitor) {
  if (!(m_config.groupRadius >= 0.0)) {
    throw std::invalid_argument("explosion group radius must be >= 0 (got " +
                                formatFixed(m_config.groupRadius) + ")");
  }
}

void ExplosionBatcher::enqueue(double x, double y, double z, float power) {
  if (!m_config.enabled) {
    return;
  }
  m_queue.push_back(PendingDetonation{x, y, z, power});
}

size_t ExplosionBatcher::flush(const ExplosionFn &applyFn) {
  if (!m_config.enabled || m_queue.empty()) {
    m_queue.clear();
    return 0;
  }

  // Taken out first so the queue is empty even if applyFn throws
  std::vector<PendingDetonation> pending;
  pending.swap(m_queue);

  const size_t count = pending.size();
  m_assigned.assign(count, 0);
  size_t applied = 0;

  for (size_t seed = 0; seed < count; ++seed) {
    if (m_assigned[seed]) {
      continue;
    }

    const PendingDetonation &center = pending[seed];
    m_cluster.clear();
    m_cluster.push_back(seed);
    m_assigned[seed] = 1;

    for (size_t j = seed + 1; j < count; ++j) {
      if (m_assigned[j]) {
        continue;
      }
      const PendingDetonation &other = pending[j];
      const double dx = center.x - other.x;
      const double dy = center.y - other.y;
      const double dz = center.z - other.z;
      if (dx * dx + dy * dy + dz * dz <= m_groupRadiusSq) {
        m_cluster.push_back(j);
        m_assigned[j] = 1;
      }
    }

    if (m_cluster.size() == 1) {
      applyFn(center.x, center.y, center.z, center.power);
      ++applied;
      continue;
    }

    double sumX = 0.0;
    double sumY = 0.0;
    double sumZ = 0.0;
    double sumPowerSq = 0.0;
    for (size_t index : m_cluster) {
      const PendingDetonation &member = pending[index];
      sumX += member.x;
      sumY += member.y;
      sumZ += member.z;
      sumPowerSq += static_cast<double>(member.power) * member.power;
    }

    const double size = static_cast<double>(m_cluster.size());
    applyFn(sumX / size, sumY / size, sumZ / size,
            static_cast<float>(std::sqrt(sumPowerSq)));
    ++applied;

    const uint64_t merged = m_cluster.size() - 1;
    m_batchedCount += merged;
    if (m_monitor) {
      m_monitor->increment(MonitorCategory::EXPLOSIONS_BATCHED, merged);
    }
  }

  BATCHER_DEBUG("Flushed " + std::to_string(count) + " detonations as " +
                std::to_string(applied) + " explosions");

  // Hand the buffer back to reuse its capacity next tick
  pending.clear();
  if (m_queue.empty()) {
    m_queue.swap(pending);
  }
  return applied;
}

uint64_t ExplosionBatcher::getBatchedCount() {
  const uint64_t count = m_batchedCount;
  m_batchedCount = 0;
  return count;
}

ExplosionBatcherStats ExplosionBatcher::getStats() const {
  ExplosionBatcherStats stats;
  stats.queued = m_queue.size();
  stats.groupRadiusSq = m_groupRadiusSq;
  stats.batched = m_batchedCount;
  return stats;
}

} // namespace TickGuard
