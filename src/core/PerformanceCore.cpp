/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/PerformanceCore.hpp"
#include "core/Logger.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

namespace TickGuard {

namespace {
[[maybe_unused]] const char *onOff(bool enabled) { return enabled ? "on" : "off"; }
} // namespace

PerformanceCore::PerformanceCore()
    : m_monitor(std::make_unique<PerformanceMonitor>()) {}

PerformanceCore::~PerformanceCore() { shutdown(); }

bool PerformanceCore::init(const CoreSettings &settings) {
  if (m_initialized) {
    CORE_WARN("init() called twice, keeping the running configuration");
    return true;
  }
  if (m_shutdown) {
    CORE_ERROR("init() after shutdown() is not supported");
    return false;
  }

  CORE_INFO("Initializing TickGuard performance core");

  if (auto error = settings.validate()) {
    CORE_CRITICAL("Invalid configuration: " + *error);
    return false;
  }

  PerformanceMonitor *monitor = settings.monitoring.enabled ? m_monitor.get() : nullptr;

  // Built into locals first so a failure leaves the core untouched; the pool
  // destructors stop anything already started.
  std::unique_ptr<RedstoneThrottler> redstoneThrottler;
  std::unique_ptr<ObserverDebounce> observerDebounce;
  std::unique_ptr<TickCoalescer> tickCoalescer;
  std::unique_ptr<ExplosionBatcher> explosionBatcher;
  std::unique_ptr<EntityTrackerPool> entityTrackerPool;
  std::unique_ptr<MobSpawnPool> mobSpawnPool;
  std::unique_ptr<CoreHopperCache> hopperCache;
  std::unique_ptr<EntityActivationGate> activationGate;

  try {
    redstoneThrottler = std::make_unique<RedstoneThrottler>(settings.redstone, monitor);
    observerDebounce = std::make_unique<ObserverDebounce>(settings.observer, monitor);
    tickCoalescer = std::make_unique<TickCoalescer>(settings.coalescerEnabled, monitor);
    explosionBatcher = std::make_unique<ExplosionBatcher>(settings.explosions, monitor);
    hopperCache = std::make_unique<CoreHopperCache>(settings.hopper, monitor);
    activationGate = std::make_unique<EntityActivationGate>(settings.entityAI);

    entityTrackerPool = std::make_unique<EntityTrackerPool>(settings.entityTracker, monitor);
    mobSpawnPool = std::make_unique<MobSpawnPool>(settings.mobSpawning, monitor);
    entityTrackerPool->start();
    mobSpawnPool->start();
  } catch (const std::invalid_argument &e) {
    CORE_CRITICAL("Invalid configuration: " + std::string(e.what()));
    return false;
  } catch (const std::system_error &e) {
    CORE_CRITICAL("Failed to start worker threads: " + std::string(e.what()));
    return false;
  }

  m_redstoneThrottler = std::move(redstoneThrottler);
  m_observerDebounce = std::move(observerDebounce);
  m_tickCoalescer = std::move(tickCoalescer);
  m_explosionBatcher = std::move(explosionBatcher);
  m_entityTrackerPool = std::move(entityTrackerPool);
  m_mobSpawnPool = std::move(mobSpawnPool);
  m_hopperCache = std::move(hopperCache);
  m_activationGate = std::move(activationGate);

  m_settings = settings;
  m_componentMonitor = monitor;
  m_simdLevel = settings.simdEnabled ? compiledSimdLevel() : SimdLevel::Scalar;

  m_monitor->setReportInterval(settings.monitoring.enabled
                                   ? settings.monitoring.reportIntervalTicks
                                   : 0);
  if (settings.monitoring.enabled) {
    m_monitor->addReportSink(
        [this](const PerformanceReport &report) { logReport(report); });
  }

  m_initialized = true;
  logStartupSummary();
  return true;
}

void PerformanceCore::beginTick(int64_t tick) {
  requireInitialized("beginTick");
  if (m_inTick) {
    CORE_WARN("beginTick(" + std::to_string(tick) +
              ") without endTick() for tick " + std::to_string(m_currentTick));
  }

  m_inTick = true;
  m_currentTick = tick;
  m_tickStart = PerformanceMonitor::Clock::now();

  m_tickCoalescer->reset();
  m_redstoneThrottler->resetCounts();
  m_observerDebounce->cleanup(tick);

  m_hopperCache->setCurrentTick(tick);
  if (tick % HOPPER_EXPIRE_INTERVAL == 0) {
    m_hopperCache->expire(tick);
  }
}

size_t PerformanceCore::endTick(const ExplosionBatcher::ExplosionFn &applyFn) {
  requireInitialized("endTick");
  if (!m_inTick) {
    CORE_WARN("endTick() without a matching beginTick()");
    return 0;
  }
  m_inTick = false;

  const size_t explosions = m_explosionBatcher->flush(applyFn);
  m_mobSpawnPool->drainCompleted();
  m_redstoneThrottler->checkAlerts(m_currentTick);

  if (m_componentMonitor) {
    auto elapsed = PerformanceMonitor::Clock::now() - m_tickStart;
    m_componentMonitor->record(
        MonitorCategory::TICK_TOTAL,
        static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count()));
  }
  m_monitor->tick();
  return explosions;
}

void PerformanceCore::shutdown() {
  if (!m_initialized || m_shutdown) {
    return;
  }
  m_shutdown = true;
  m_initialized = false;

  CORE_INFO("Shutting down TickGuard performance core");

  if (!m_entityTrackerPool->shutdown()) {
    CORE_WARN("Entity tracker did not drain within its grace period");
  }
  if (!m_mobSpawnPool->shutdown()) {
    CORE_WARN("Mob spawner did not drain within its grace period");
  }
  if (m_mobSpawnPool->getPendingCount() > 0) {
    CORE_DEBUG(std::to_string(m_mobSpawnPool->getPendingCount()) +
               " finished spawn evaluations discarded");
  }

  if (m_settings.monitoring.enabled) {
    // Goes through the report sinks like any periodic report
    m_monitor->drainReport();
  }
  CORE_INFO("TickGuard shutdown complete");
}

void PerformanceCore::requireInitialized(const char *accessor) const {
  if (!m_initialized) {
    throw std::logic_error(std::string("PerformanceCore::") + accessor +
                           " used before init() or after shutdown()");
  }
}

RedstoneThrottler &PerformanceCore::getRedstoneThrottler() {
  requireInitialized("getRedstoneThrottler");
  return *m_redstoneThrottler;
}

ObserverDebounce &PerformanceCore::getObserverDebounce() {
  requireInitialized("getObserverDebounce");
  return *m_observerDebounce;
}

TickCoalescer &PerformanceCore::getTickCoalescer() {
  requireInitialized("getTickCoalescer");
  return *m_tickCoalescer;
}

ExplosionBatcher &PerformanceCore::getExplosionBatcher() {
  requireInitialized("getExplosionBatcher");
  return *m_explosionBatcher;
}

EntityTrackerPool &PerformanceCore::getEntityTrackerPool() {
  requireInitialized("getEntityTrackerPool");
  return *m_entityTrackerPool;
}

MobSpawnPool &PerformanceCore::getMobSpawnPool() {
  requireInitialized("getMobSpawnPool");
  return *m_mobSpawnPool;
}

CoreHopperCache &PerformanceCore::getHopperCache() {
  requireInitialized("getHopperCache");
  return *m_hopperCache;
}

EntityActivationGate &PerformanceCore::getEntityActivationGate() {
  requireInitialized("getEntityActivationGate");
  return *m_activationGate;
}

const CoreSettings &PerformanceCore::getSettings() const {
  requireInitialized("getSettings");
  return m_settings;
}

void PerformanceCore::logStartupSummary() const {
  CORE_INFO("SIMD: " + std::string(simdLevelName(m_simdLevel)) + " (compiled " +
            simdLevelName(compiledSimdLevel()) + "), " +
            std::to_string(std::thread::hardware_concurrency()) + " hardware threads");
  CORE_INFO("Redstone throttle " + std::string(onOff(m_settings.redstone.enabled)) +
            " (" + std::to_string(m_settings.redstone.softThreshold) + "/" +
            std::to_string(m_settings.redstone.hardThreshold) + "/" +
            std::to_string(m_settings.redstone.criticalThreshold) + "), observer debounce " +
            onOff(m_settings.observer.enabled) + " (" +
            std::to_string(m_settings.observer.minIntervalTicks) + " ticks), coalescer " +
            onOff(m_settings.coalescerEnabled) + ", explosion batching " +
            onOff(m_settings.explosions.enabled));
  CORE_INFO("Entity tracker " + std::string(onOff(m_settings.entityTracker.enabled)) +
            " (" + std::to_string(m_entityTrackerPool->getThreadCount()) +
            " threads), mob spawner " + onOff(m_settings.mobSpawning.enabled) + " (" +
            std::to_string(m_mobSpawnPool->getThreadCount()) + " threads)");
  CORE_INFO("Hopper caching " + std::string(onOff(m_settings.hopper.optimizedCaching)) +
            ", entity tiers " + onOff(m_settings.entityAI.distanceTiers) + ", DAB " +
            onOff(m_settings.entityAI.dabEnabled) + ", monitoring " +
            onOff(m_settings.monitoring.enabled));
}

void PerformanceCore::logReport(const PerformanceReport &report) const {
  auto total = report.timings.find(MonitorCategory::TICK_TOTAL);
  if (total == report.timings.end() || !total->second.hasData()) {
    CORE_INFO("Report " + std::to_string(report.reportIndex) + ": no ticks recorded");
    return;
  }
  CORE_INFO("Report " + std::to_string(report.reportIndex) + " at tick " +
            std::to_string(report.tickCount) + ": tick avg " +
            formatFixed(total->second.avgMs(), 3) + "ms, max " +
            formatFixed(total->second.maxMs(), 3) + "ms over " +
            std::to_string(total->second.count) + " ticks");
}

} // namespace TickGuard
