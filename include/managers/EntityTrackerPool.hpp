/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_TRACKER_POOL_HPP
#define ENTITY_TRACKER_POOL_HPP

#include "core/WorkerPool.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace TickGuard {

class PerformanceMonitor;

struct EntityTrackerConfig {
  bool enabled{true};
  int threads{0};      // 0 = derive from core count
  int coreDivisor{4};  // auto threads = max(1, cores / coreDivisor)
  size_t queueCapacity{4096};
  bool compatMode{false};
  int shutdownGraceMs{5000};
};

/**
 * @brief Offloads entity tracking updates to a small worker pool
 *
 * Tasks must not touch shared world state without their own
 * synchronization. In compat mode, entities whose type name looks like a
 * plugin NPC are tracked synchronously on the caller because those plugins
 * expect main-thread tracking.
 *
 * With the pool disabled every task runs on the caller.
 */
class EntityTrackerPool {
public:
  explicit EntityTrackerPool(const EntityTrackerConfig &config,
                             PerformanceMonitor *monitor = nullptr);
  ~EntityTrackerPool();

  EntityTrackerPool(const EntityTrackerPool &) = delete;
  EntityTrackerPool &operator=(const EntityTrackerPool &) = delete;

  static size_t resolveThreadCount(int threadOverride, int coreDivisor,
                                   unsigned hardwareThreads);

  void start();

  SubmitResult submit(std::function<void()> task);

  /**
   * @brief Submits a tracking task for an entity of the given type, running
   * it inline when compat mode requires synchronous tracking
   */
  SubmitResult submitForEntity(const std::string &entityTypeName,
                               std::function<void()> task);

  /**
   * @brief True in compat mode for NPC plugin entity types
   */
  bool requiresSyncTracking(const std::string &entityTypeName) const;

  bool shutdown();

  bool isEnabled() const { return m_config.enabled; }
  bool isCompatMode() const { return m_config.compatMode; }
  size_t getThreadCount() const { return m_pool ? m_pool->getThreadCount() : 0; }
  uint64_t getSyncTrackedCount() const {
    return m_syncTracked.load(std::memory_order_relaxed);
  }
  WorkerPoolStats getPoolStats() const {
    return m_pool ? m_pool->getStats() : WorkerPoolStats{};
  }

private:
  std::function<void()> timed(std::function<void()> task);
  SubmitResult runOnCaller(std::function<void()> &task);

  EntityTrackerConfig m_config;
  PerformanceMonitor *m_monitor;
  std::unique_ptr<WorkerPool> m_pool{};
  std::atomic<uint64_t> m_syncTracked{0};
};

} // namespace TickGuard

#endif // ENTITY_TRACKER_POOL_HPP
