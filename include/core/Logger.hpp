/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>

namespace TickGuard {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release)
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    // Worker threads log too, keep lines whole
    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("TickGuard - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define TICKGUARD_CRITICAL(system, msg)                                        \
  TickGuard::Logger::Log(TickGuard::LogLevel::CRITICAL, system, msg)
#define TICKGUARD_ERROR(system, msg)                                           \
  TickGuard::Logger::Log(TickGuard::LogLevel::ERROR_LEVEL, system, msg)
#define TICKGUARD_WARN(system, msg)                                            \
  TickGuard::Logger::Log(TickGuard::LogLevel::WARNING, system, msg)
#define TICKGUARD_INFO(system, msg)                                            \
  TickGuard::Logger::Log(TickGuard::LogLevel::INFO, system, msg)
#define TICKGUARD_DEBUG(system, msg)                                           \
  TickGuard::Logger::Log(TickGuard::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds: CRITICAL and ERROR go to a log file, the rest compiles away
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  // Defined in Logger.cpp, writes under SDL_GetPrefPath
  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define TICKGUARD_CRITICAL(system, msg)                                        \
  TickGuard::Logger::Log("CRITICAL", system, msg)

#define TICKGUARD_ERROR(system, msg)                                           \
  TickGuard::Logger::Log("ERROR", system, msg)

#define TICKGUARD_WARN(system, msg) ((void)0)
#define TICKGUARD_INFO(system, msg) ((void)0)
#define TICKGUARD_DEBUG(system, msg) ((void)0)
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
#ifdef DEBUG
inline std::mutex Logger::s_logMutex{};
#endif

// Convenience macros for each system

// Core
#define CORE_CRITICAL(msg) TICKGUARD_CRITICAL("PerformanceCore", msg)
#define CORE_ERROR(msg) TICKGUARD_ERROR("PerformanceCore", msg)
#define CORE_WARN(msg) TICKGUARD_WARN("PerformanceCore", msg)
#define CORE_INFO(msg) TICKGUARD_INFO("PerformanceCore", msg)
#define CORE_DEBUG(msg) TICKGUARD_DEBUG("PerformanceCore", msg)

#define WORKERPOOL_CRITICAL(msg) TICKGUARD_CRITICAL("WorkerPool", msg)
#define WORKERPOOL_ERROR(msg) TICKGUARD_ERROR("WorkerPool", msg)
#define WORKERPOOL_WARN(msg) TICKGUARD_WARN("WorkerPool", msg)
#define WORKERPOOL_INFO(msg) TICKGUARD_INFO("WorkerPool", msg)
#define WORKERPOOL_DEBUG(msg) TICKGUARD_DEBUG("WorkerPool", msg)

#define TICKCLOCK_CRITICAL(msg) TICKGUARD_CRITICAL("TickClock", msg)
#define TICKCLOCK_ERROR(msg) TICKGUARD_ERROR("TickClock", msg)
#define TICKCLOCK_WARN(msg) TICKGUARD_WARN("TickClock", msg)
#define TICKCLOCK_INFO(msg) TICKGUARD_INFO("TickClock", msg)
#define TICKCLOCK_DEBUG(msg) TICKGUARD_DEBUG("TickClock", msg)

// Gates
#define THROTTLER_CRITICAL(msg) TICKGUARD_CRITICAL("RedstoneThrottler", msg)
#define THROTTLER_ERROR(msg) TICKGUARD_ERROR("RedstoneThrottler", msg)
#define THROTTLER_WARN(msg) TICKGUARD_WARN("RedstoneThrottler", msg)
#define THROTTLER_INFO(msg) TICKGUARD_INFO("RedstoneThrottler", msg)
#define THROTTLER_DEBUG(msg) TICKGUARD_DEBUG("RedstoneThrottler", msg)

#define BATCHER_CRITICAL(msg) TICKGUARD_CRITICAL("ExplosionBatcher", msg)
#define BATCHER_ERROR(msg) TICKGUARD_ERROR("ExplosionBatcher", msg)
#define BATCHER_WARN(msg) TICKGUARD_WARN("ExplosionBatcher", msg)
#define BATCHER_INFO(msg) TICKGUARD_INFO("ExplosionBatcher", msg)
#define BATCHER_DEBUG(msg) TICKGUARD_DEBUG("ExplosionBatcher", msg)

#define DEBOUNCE_CRITICAL(msg) TICKGUARD_CRITICAL("ObserverDebounce", msg)
#define DEBOUNCE_ERROR(msg) TICKGUARD_ERROR("ObserverDebounce", msg)
#define DEBOUNCE_WARN(msg) TICKGUARD_WARN("ObserverDebounce", msg)
#define DEBOUNCE_INFO(msg) TICKGUARD_INFO("ObserverDebounce", msg)
#define DEBOUNCE_DEBUG(msg) TICKGUARD_DEBUG("ObserverDebounce", msg)

#define COALESCER_CRITICAL(msg) TICKGUARD_CRITICAL("TickCoalescer", msg)
#define COALESCER_ERROR(msg) TICKGUARD_ERROR("TickCoalescer", msg)
#define COALESCER_WARN(msg) TICKGUARD_WARN("TickCoalescer", msg)
#define COALESCER_INFO(msg) TICKGUARD_INFO("TickCoalescer", msg)
#define COALESCER_DEBUG(msg) TICKGUARD_DEBUG("TickCoalescer", msg)

#define ACTIVATION_CRITICAL(msg) TICKGUARD_CRITICAL("EntityActivationGate", msg)
#define ACTIVATION_ERROR(msg) TICKGUARD_ERROR("EntityActivationGate", msg)
#define ACTIVATION_WARN(msg) TICKGUARD_WARN("EntityActivationGate", msg)
#define ACTIVATION_INFO(msg) TICKGUARD_INFO("EntityActivationGate", msg)
#define ACTIVATION_DEBUG(msg) TICKGUARD_DEBUG("EntityActivationGate", msg)

#define HOPPER_CRITICAL(msg) TICKGUARD_CRITICAL("HopperCache", msg)
#define HOPPER_ERROR(msg) TICKGUARD_ERROR("HopperCache", msg)
#define HOPPER_WARN(msg) TICKGUARD_WARN("HopperCache", msg)
#define HOPPER_INFO(msg) TICKGUARD_INFO("HopperCache", msg)
#define HOPPER_DEBUG(msg) TICKGUARD_DEBUG("HopperCache", msg)

// Async pools
#define TRACKER_CRITICAL(msg) TICKGUARD_CRITICAL("EntityTrackerPool", msg)
#define TRACKER_ERROR(msg) TICKGUARD_ERROR("EntityTrackerPool", msg)
#define TRACKER_WARN(msg) TICKGUARD_WARN("EntityTrackerPool", msg)
#define TRACKER_INFO(msg) TICKGUARD_INFO("EntityTrackerPool", msg)
#define TRACKER_DEBUG(msg) TICKGUARD_DEBUG("EntityTrackerPool", msg)

#define SPAWNER_CRITICAL(msg) TICKGUARD_CRITICAL("MobSpawnPool", msg)
#define SPAWNER_ERROR(msg) TICKGUARD_ERROR("MobSpawnPool", msg)
#define SPAWNER_WARN(msg) TICKGUARD_WARN("MobSpawnPool", msg)
#define SPAWNER_INFO(msg) TICKGUARD_INFO("MobSpawnPool", msg)
#define SPAWNER_DEBUG(msg) TICKGUARD_DEBUG("MobSpawnPool", msg)

// Utilities
#define MONITOR_CRITICAL(msg) TICKGUARD_CRITICAL("PerformanceMonitor", msg)
#define MONITOR_ERROR(msg) TICKGUARD_ERROR("PerformanceMonitor", msg)
#define MONITOR_WARN(msg) TICKGUARD_WARN("PerformanceMonitor", msg)
#define MONITOR_INFO(msg) TICKGUARD_INFO("PerformanceMonitor", msg)
#define MONITOR_DEBUG(msg) TICKGUARD_DEBUG("PerformanceMonitor", msg)

#define SETTINGS_CRITICAL(msg) TICKGUARD_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) TICKGUARD_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) TICKGUARD_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) TICKGUARD_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) TICKGUARD_DEBUG("SettingsManager", msg)

// Demo host
#define DEMO_CRITICAL(msg) TICKGUARD_CRITICAL("Demo", msg)
#define DEMO_ERROR(msg) TICKGUARD_ERROR("Demo", msg)
#define DEMO_WARN(msg) TICKGUARD_WARN("Demo", msg)
#define DEMO_INFO(msg) TICKGUARD_INFO("Demo", msg)

/**
 * @brief Fixed-precision text for floating point values in log lines
 */
inline std::string formatFixed(double value, int precision = 2) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.*f", precision, value);
  return std::string(buffer);
}

// Benchmark mode convenience macros
#define TICKGUARD_ENABLE_BENCHMARK_MODE()                                      \
  TickGuard::Logger::SetBenchmarkMode(true)
#define TICKGUARD_DISABLE_BENCHMARK_MODE()                                     \
  TickGuard::Logger::SetBenchmarkMode(false)

} // namespace TickGuard

#endif // LOGGER_HPP
