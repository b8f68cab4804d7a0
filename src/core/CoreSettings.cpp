/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/CoreSettings.hpp"
#include "managers/SettingsManager.hpp"

#include <type_traits>

namespace TickGuard {

namespace {

/**
 * @brief Copies present settings into the typed config
 *
 * Missing keys keep their default. A key that is present with a value of the
 * wrong type is a configuration error; the first one is kept for validate().
 */
class SettingsReader {
public:
  explicit SettingsReader(const SettingsManager &settings) : m_settings(settings) {}

  template <typename T>
  void read(const char *category, const char *key, T &target) {
    if (!m_settings.has(category, key)) {
      return;
    }
    if (auto value = m_settings.tryGet<T>(category, key)) {
      target = *value;
      return;
    }
    if (m_error.empty()) {
      m_error = std::string(category) + "." + key + " must be " + typeName<T>();
    }
  }

  // Negative sizes in the file would wrap, clamp them to 0 so validate() rejects
  void readSize(const char *category, const char *key, size_t &target) {
    int value = static_cast<int>(target);
    read(category, key, value);
    target = value < 0 ? 0 : static_cast<size_t>(value);
  }

  const std::string &error() const { return m_error; }

private:
  template <typename T> static const char *typeName() {
    if constexpr (std::is_same_v<T, bool>) {
      return "true or false";
    } else if constexpr (std::is_same_v<T, int>) {
      return "a whole number";
    } else {
      return "a number";
    }
  }

  const SettingsManager &m_settings;
  std::string m_error{};
};

} // namespace

CoreSettings CoreSettings::fromSettings(const SettingsManager &settings) {
  CoreSettings config;
  SettingsReader in(settings);

  RedstoneThrottlerConfig &redstone = config.redstone;
  in.read("redstone", "enabled", redstone.enabled);
  in.read("redstone", "soft_threshold", redstone.softThreshold);
  in.read("redstone", "hard_threshold", redstone.hardThreshold);
  in.read("redstone", "critical_threshold", redstone.criticalThreshold);
  in.read("redstone", "alert_admins", redstone.alertAdmins);
  in.read("redstone", "alert_interval_ticks", redstone.alertIntervalTicks);

  ObserverDebounceConfig &observer = config.observer;
  in.read("observer", "enabled", observer.enabled);
  in.read("observer", "min_interval_ticks", observer.minIntervalTicks);
  in.read("observer", "stale_window_ticks", observer.staleWindowTicks);
  in.read("observer", "cleanup_interval_ticks", observer.cleanupIntervalTicks);

  in.read("explosions", "enabled", config.explosions.enabled);
  in.read("explosions", "group_radius", config.explosions.groupRadius);

  in.read("coalescer", "enabled", config.coalescerEnabled);

  EntityTrackerConfig &tracker = config.entityTracker;
  in.read("entity_tracker", "enabled", tracker.enabled);
  in.read("entity_tracker", "threads", tracker.threads);
  in.read("entity_tracker", "core_divisor", tracker.coreDivisor);
  in.readSize("entity_tracker", "queue_capacity", tracker.queueCapacity);
  in.read("entity_tracker", "compat_mode", tracker.compatMode);
  in.read("entity_tracker", "shutdown_grace_ms", tracker.shutdownGraceMs);

  MobSpawnConfig &spawning = config.mobSpawning;
  in.read("mob_spawning", "enabled", spawning.enabled);
  in.read("mob_spawning", "threads", spawning.threads);
  in.readSize("mob_spawning", "queue_capacity", spawning.queueCapacity);
  in.read("mob_spawning", "max_per_chunk", spawning.maxPerChunk);
  in.read("mob_spawning", "shutdown_grace_ms", spawning.shutdownGraceMs);

  HopperCacheConfig &hopper = config.hopper;
  in.read("hopper", "optimized_caching", hopper.optimizedCaching);
  in.read("hopper", "skip_empty_check", hopper.skipEmptyCheck);
  in.read("hopper", "throttle_when_full", hopper.throttleWhenFull);
  in.readSize("hopper", "capacity", hopper.capacity);
  in.read("hopper", "max_age_ticks", hopper.maxAgeTicks);

  EntityActivationConfig &ai = config.entityAI;
  in.read("entity_ai", "distance_tiers", ai.distanceTiers);
  in.read("entity_ai", "goal_selector_throttle", ai.goalSelectorThrottle);
  in.read("entity_ai", "inactive_goal_interval", ai.inactiveGoalInterval);
  in.read("entity_ai", "dab_enabled", ai.dabEnabled);
  in.read("entity_ai", "dab_start_distance", ai.dabStartDistance);
  in.read("entity_ai", "dab_max_tick_interval", ai.dabMaxTickInterval);

  in.read("monitoring", "enabled", config.monitoring.enabled);
  in.read("monitoring", "report_interval_ticks", config.monitoring.reportIntervalTicks);

  in.read("performance", "simd_enabled", config.simdEnabled);

  config.loadError = in.error();
  return config;
}

std::optional<std::string> CoreSettings::validate() const {
  if (!loadError.empty()) {
    return loadError;
  }
  if (redstone.softThreshold <= 0 || redstone.softThreshold > redstone.hardThreshold ||
      redstone.hardThreshold > redstone.criticalThreshold) {
    return std::string("redstone thresholds must satisfy 0 < soft <= hard <= critical");
  }
  if (redstone.alertIntervalTicks <= 0) {
    return std::string("redstone.alert_interval_ticks must be positive");
  }

  if (observer.minIntervalTicks < 0) {
    return std::string("observer.min_interval_ticks must be >= 0");
  }
  if (observer.cleanupIntervalTicks <= 0) {
    return std::string("observer.cleanup_interval_ticks must be positive");
  }
  if (observer.staleWindowTicks < observer.minIntervalTicks) {
    return std::string("observer.stale_window_ticks must be >= observer.min_interval_ticks");
  }

  if (!(explosions.groupRadius >= 0.0)) {
    return std::string("explosions.group_radius must be >= 0");
  }

  if (entityTracker.threads < 0 || entityTracker.coreDivisor <= 0) {
    return std::string("entity_tracker threads must be >= 0 and core_divisor positive");
  }
  if (entityTracker.queueCapacity == 0 || entityTracker.shutdownGraceMs < 0) {
    return std::string("entity_tracker queue_capacity must be positive and shutdown_grace_ms >= 0");
  }

  if (mobSpawning.threads < 0 || mobSpawning.queueCapacity == 0) {
    return std::string("mob_spawning threads must be >= 0 and queue_capacity positive");
  }
  if (mobSpawning.maxPerChunk < 0 || mobSpawning.shutdownGraceMs < 0) {
    return std::string("mob_spawning max_per_chunk and shutdown_grace_ms must be >= 0");
  }

  if (hopper.capacity == 0 || hopper.maxAgeTicks <= 0) {
    return std::string("hopper capacity and max_age_ticks must be positive");
  }

  if (entityAI.inactiveGoalInterval <= 0 || entityAI.dabMaxTickInterval <= 0) {
    return std::string("entity_ai tick intervals must be positive");
  }
  if (entityAI.dabStartDistance < 0.0) {
    return std::string("entity_ai.dab_start_distance must be >= 0");
  }

  return std::nullopt;
}

} // namespace TickGuard
