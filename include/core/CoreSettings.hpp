/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CORE_SETTINGS_HPP
#define CORE_SETTINGS_HPP

#include "managers/EntityActivationGate.hpp"
#include "managers/EntityTrackerPool.hpp"
#include "managers/ExplosionBatcher.hpp"
#include "managers/HopperCache.hpp"
#include "managers/MobSpawnPool.hpp"
#include "managers/ObserverDebounce.hpp"
#include "managers/RedstoneThrottler.hpp"

#include <optional>
#include <string>

namespace TickGuard {

class SettingsManager;

struct MonitoringConfig {
  bool enabled{true};
  int reportIntervalTicks{6000}; // <= 0 disables periodic reports
};

/**
 * @brief Typed configuration for every component, with shipped defaults
 *
 * Each component can be switched off on its own. A disabled gate always
 * answers "proceed" and a disabled pool runs work on the caller.
 */
struct CoreSettings {
  RedstoneThrottlerConfig redstone{};
  ObserverDebounceConfig observer{};
  ExplosionBatcherConfig explosions{};
  bool coalescerEnabled{true};
  EntityTrackerConfig entityTracker{};
  MobSpawnConfig mobSpawning{};
  HopperCacheConfig hopper{};
  EntityActivationConfig entityAI{};
  MonitoringConfig monitoring{};
  bool simdEnabled{true};

  // Set by fromSettings() when a key holds a value of the wrong type
  std::string loadError{};

  /**
   * @brief Reads every known key, keeping the default for missing ones
   *
   * A present key of the wrong type (a string threshold, a fractional tick
   * count) is recorded in loadError and reported by validate().
   *
   * Categories: redstone, observer, explosions, coalescer, entity_tracker,
   * mob_spawning, hopper, entity_ai, monitoring, performance.
   */
  static CoreSettings fromSettings(const SettingsManager &settings);

  /**
   * @brief First configuration error found, or nullopt if the settings are
   * usable
   */
  std::optional<std::string> validate() const;
};

} // namespace TickGuard

#endif // CORE_SETTINGS_HPP
