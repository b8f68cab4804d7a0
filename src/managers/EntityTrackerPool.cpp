/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/EntityTrackerPool.hpp"
#include "core/Logger.hpp"
#include "utils/PerformanceMonitor.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <thread>

namespace TickGuard {

namespace {
// Entity class name fragments used by common NPC plugins
constexpr std::array<const char *, 4> NPC_TYPE_MARKERS = {"NPC", "Citizens",
                                                          "FancyNpc", "ZNpc"};
} // namespace

EntityTrackerPool::EntityTrackerPool(const EntityTrackerConfig &config,
                                     PerformanceMonitor *monitor)
    : m_config(config), m_monitor(monitor) {
  if (m_config.threads < 0) {
    throw std::invalid_argument("entity tracker thread count must be >= 0");
  }
  if (m_config.coreDivisor <= 0) {
    throw std::invalid_argument("entity tracker core divisor must be positive");
  }
  if (m_config.queueCapacity == 0) {
    throw std::invalid_argument("entity tracker queue capacity must be positive");
  }
  if (m_config.shutdownGraceMs < 0) {
    throw std::invalid_argument("entity tracker shutdown grace must be >= 0");
  }

  if (!m_config.enabled) {
    TRACKER_INFO("Async entity tracker is disabled");
    return;
  }

  const size_t threads = resolveThreadCount(m_config.threads, m_config.coreDivisor,
                                            std::thread::hardware_concurrency());
  m_pool = std::make_unique<WorkerPool>("Tracker", threads, m_config.queueCapacity);
}

EntityTrackerPool::~EntityTrackerPool() { shutdown(); }

size_t EntityTrackerPool::resolveThreadCount(int threadOverride, int coreDivisor,
                                             unsigned hardwareThreads) {
  if (threadOverride > 0) {
    return static_cast<size_t>(threadOverride);
  }
  const unsigned divisor = static_cast<unsigned>(std::max(coreDivisor, 1));
  return std::max<size_t>(1, hardwareThreads / divisor);
}

void EntityTrackerPool::start() {
  if (!m_pool) {
    return;
  }
  m_pool->start();
  TRACKER_INFO("Async entity tracker initialized with " +
               std::to_string(m_pool->getThreadCount()) + " threads" +
               (m_config.compatMode ? " (compat-mode enabled)" : ""));
}

std::function<void()> EntityTrackerPool::timed(std::function<void()> task) {
  return [monitor = m_monitor, task = std::move(task)]() {
    ScopedTiming timing(monitor, MonitorCategory::ENTITY_TRACKING);
    task();
  };
}

SubmitResult EntityTrackerPool::runOnCaller(std::function<void()> &task) {
  // Exceptions propagate to the caller, it owns this work
  task();
  return SubmitResult::RanInline;
}

SubmitResult EntityTrackerPool::submit(std::function<void()> task) {
  if (!m_pool) {
    return runOnCaller(task);
  }

  const SubmitResult result = m_pool->submit(timed(std::move(task)));
  if (result == SubmitResult::RanInline && m_monitor) {
    m_monitor->increment(MonitorCategory::ENTITY_TRACKER_INLINE);
  }
  return result;
}

SubmitResult EntityTrackerPool::submitForEntity(const std::string &entityTypeName,
                                                std::function<void()> task) {
  if (m_pool && requiresSyncTracking(entityTypeName)) {
    m_syncTracked.fetch_add(1, std::memory_order_relaxed);
    if (m_monitor) {
      m_monitor->increment(MonitorCategory::ENTITY_TRACKER_INLINE);
    }
    auto syncTask = timed(std::move(task));
    return runOnCaller(syncTask);
  }
  return submit(std::move(task));
}

bool EntityTrackerPool::requiresSyncTracking(const std::string &entityTypeName) const {
  if (!m_config.compatMode) {
    return false;
  }
  return std::any_of(NPC_TYPE_MARKERS.begin(), NPC_TYPE_MARKERS.end(),
                     [&entityTypeName](const char *marker) {
                       return entityTypeName.find(marker) != std::string::npos;
                     });
}

bool EntityTrackerPool::shutdown() {
  if (!m_pool) {
    return true;
  }
  return m_pool->shutdown(std::chrono::milliseconds(m_config.shutdownGraceMs));
}

} // namespace TickGuard
