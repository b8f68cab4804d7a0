/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PERFORMANCE_CORE_HPP
#define PERFORMANCE_CORE_HPP

#include "core/CoreSettings.hpp"
#include "managers/EntityActivationGate.hpp"
#include "managers/EntityTrackerPool.hpp"
#include "managers/ExplosionBatcher.hpp"
#include "managers/HopperCache.hpp"
#include "managers/MobSpawnPool.hpp"
#include "managers/ObserverDebounce.hpp"
#include "managers/RedstoneThrottler.hpp"
#include "managers/TickCoalescer.hpp"
#include "utils/CpuFeatures.hpp"
#include "utils/PerformanceMonitor.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace TickGuard {

/**
 * @brief Owns every TickGuard component and drives their per-tick lifecycle
 *
 * The host calls init() once, then brackets each simulation tick with
 * beginTick()/endTick() and consults the gates in between. Components are
 * reached through the accessors, which throw std::logic_error before init()
 * succeeded or after shutdown().
 *
 * The monitor is the exception: it exists for the whole lifetime of the core
 * so reports stay readable after shutdown.
 *
 * Initialization and the tick methods belong to the host thread.
 */
class PerformanceCore {
public:
  PerformanceCore();
  ~PerformanceCore();

  PerformanceCore(const PerformanceCore &) = delete;
  PerformanceCore &operator=(const PerformanceCore &) = delete;

  /**
   * @brief Validates the settings, builds every component and starts the
   * async pools
   *
   * On failure the error is logged as CRITICAL and nothing is left running.
   *
   * @return true on success
   */
  bool init(const CoreSettings &settings);

  /**
   * @brief Start of a tick: clears tick-scoped state and runs the amortized
   * cleanups
   */
  void beginTick(int64_t tick);

  /**
   * @brief End of a tick: flushes explosions through applyFn, applies
   * finished spawn evaluations, checks redstone alerts and advances reporting
   * @return Number of explosions applied
   */
  size_t endTick(const ExplosionBatcher::ExplosionFn &applyFn);

  /**
   * @brief Shuts the pools down and drains a final report. Idempotent.
   */
  void shutdown();

  bool isInitialized() const { return m_initialized; }

  RedstoneThrottler &getRedstoneThrottler();
  ObserverDebounce &getObserverDebounce();
  TickCoalescer &getTickCoalescer();
  ExplosionBatcher &getExplosionBatcher();
  EntityTrackerPool &getEntityTrackerPool();
  MobSpawnPool &getMobSpawnPool();
  CoreHopperCache &getHopperCache();
  EntityActivationGate &getEntityActivationGate();
  const CoreSettings &getSettings() const;

  PerformanceMonitor &getMonitor() { return *m_monitor; }
  const PerformanceMonitor &getMonitor() const { return *m_monitor; }

  /**
   * @brief Vector path available to the host's math kernels. Scalar when
   * simd_enabled is off.
   */
  SimdLevel simdLevel() const { return m_simdLevel; }

  int64_t getCurrentTick() const { return m_currentTick; }

private:
  // Hopper cache aging runs on ticks divisible by this
  static constexpr int64_t HOPPER_EXPIRE_INTERVAL = 100;

  void requireInitialized(const char *accessor) const;
  void logStartupSummary() const;
  void logReport(const PerformanceReport &report) const;

  std::unique_ptr<PerformanceMonitor> m_monitor;
  PerformanceMonitor *m_componentMonitor{nullptr}; // null with monitoring off

  std::unique_ptr<RedstoneThrottler> m_redstoneThrottler{};
  std::unique_ptr<ObserverDebounce> m_observerDebounce{};
  std::unique_ptr<TickCoalescer> m_tickCoalescer{};
  std::unique_ptr<ExplosionBatcher> m_explosionBatcher{};
  std::unique_ptr<EntityTrackerPool> m_entityTrackerPool{};
  std::unique_ptr<MobSpawnPool> m_mobSpawnPool{};
  std::unique_ptr<CoreHopperCache> m_hopperCache{};
  std::unique_ptr<EntityActivationGate> m_activationGate{};

  CoreSettings m_settings{};
  SimdLevel m_simdLevel{SimdLevel::Scalar};
  bool m_initialized{false};
  bool m_shutdown{false};
  bool m_inTick{false};
  int64_t m_currentTick{0};
  PerformanceMonitor::Clock::time_point m_tickStart{};
};

} // namespace TickGuard

#endif // PERFORMANCE_CORE_HPP
