/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PERFORMANCE_MONITOR_HPP
#define PERFORMANCE_MONITOR_HPP

#include <boost/container/flat_map.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace TickGuard {

/**
 * @brief Well-known category names shared by every component
 */
namespace MonitorCategory {
// Timing categories (pre-registered)
inline constexpr const char* ENTITIES = "entities";
inline constexpr const char* BLOCKS = "blocks";
inline constexpr const char* CHUNKS = "chunks";
inline constexpr const char* PATHFINDING = "pathfinding";
inline constexpr const char* ENTITY_TRACKING = "entity-tracking";
inline constexpr const char* MOB_SPAWNING = "mob-spawning";
inline constexpr const char* REDSTONE = "redstone";
inline constexpr const char* TICK_TOTAL = "tick-total";

// Counter categories
inline constexpr const char* REDSTONE_THROTTLED = "redstone-throttled";
inline constexpr const char* OBSERVER_DEBOUNCED = "observer-debounced";
inline constexpr const char* TICKS_COALESCED = "ticks-coalesced";
inline constexpr const char* EXPLOSIONS_BATCHED = "explosions-batched";
inline constexpr const char* ENTITY_TRACKER_INLINE = "entity-tracker-inline";
inline constexpr const char* MOB_SPAWN_INLINE = "mob-spawn-inline";
inline constexpr const char* HOPPER_CACHE_HITS = "hopper-cache-hits";
inline constexpr const char* HOPPER_CACHE_MISSES = "hopper-cache-misses";
} // namespace MonitorCategory

/**
 * @brief Immutable view of one timing category at a point in time
 */
struct TimingSnapshot {
    uint64_t totalNanos{0};
    uint64_t maxNanos{0};
    uint64_t count{0};

    bool hasData() const { return count > 0; }
    uint64_t avgNanos() const { return count == 0 ? 0 : totalNanos / count; }
    double avgMs() const { return static_cast<double>(avgNanos()) / 1'000'000.0; }
    double maxMs() const { return static_cast<double>(maxNanos) / 1'000'000.0; }
};

/**
 * @brief Aggregated values drained from the monitor once per report interval
 */
struct PerformanceReport {
    uint64_t reportIndex{0};
    uint64_t tickCount{0};
    boost::container::flat_map<std::string, TimingSnapshot> timings{};
    boost::container::flat_map<std::string, uint64_t> counters{};
};

/**
 * @brief Thread-safe timing and counter registry
 *
 * Any thread may record. Recording is lock-free once a category exists:
 * totals and counts are atomic adds and the maximum is kept with a
 * compare-exchange loop. Categories are created on first use under an
 * exclusive lock and never destroyed, so references stay valid.
 *
 * Snapshot and reset of a category serialize on that category's mutex, so a
 * reader never observes a half-reset category.
 *
 * tick() is called once per simulation tick by the owner. Every
 * reportInterval ticks all categories are drained into a PerformanceReport
 * which is stored and handed to the registered sinks. The monitor itself
 * never formats text for display.
 */
class PerformanceMonitor {
public:
    using Clock = std::chrono::steady_clock;
    using ReportSink = std::function<void(const PerformanceReport&)>;

    static constexpr int DEFAULT_REPORT_INTERVAL = 6000; // 5 minutes at 20 TPS

    /**
     * @param reportIntervalTicks Ticks between drained reports, 0 disables
     */
    explicit PerformanceMonitor(int reportIntervalTicks = DEFAULT_REPORT_INTERVAL);
    ~PerformanceMonitor() = default;

    PerformanceMonitor(const PerformanceMonitor&) = delete;
    PerformanceMonitor& operator=(const PerformanceMonitor&) = delete;

    /**
     * @brief Adds one sample to a timing category
     * @param category Category name, created if unknown
     * @param nanos Sample duration in nanoseconds
     */
    void record(const std::string& category, uint64_t nanos);

    /**
     * @brief Adds to a counter category
     */
    void increment(const std::string& category, uint64_t delta = 1);

    /**
     * @brief Reads a timing category without resetting it
     * @return All-zero snapshot for unknown or empty categories
     */
    TimingSnapshot snapshot(const std::string& category) const;

    /**
     * @brief Reads a timing category and resets it to zero atomically with
     * respect to other readers
     */
    TimingSnapshot snapshotAndReset(const std::string& category);

    uint64_t counterValue(const std::string& category) const;
    uint64_t counterValueAndReset(const std::string& category);

    /**
     * @brief Advances the report counter by one tick
     * @return true if a report was drained on this tick
     */
    bool tick();

    /**
     * @brief Drains every category into a report immediately
     *
     * Used by tick() and by the owner's shutdown for a final report.
     */
    std::shared_ptr<const PerformanceReport> drainReport();

    /**
     * @brief Most recent drained report, nullptr before the first one
     */
    std::shared_ptr<const PerformanceReport> getLatestReport() const;

    void addReportSink(ReportSink sink);

    void setReportInterval(int ticks) {
        m_reportInterval.store(ticks, std::memory_order_relaxed);
    }
    int getReportInterval() const {
        return m_reportInterval.load(std::memory_order_relaxed);
    }

    uint64_t getTickCount() const { return m_tickCount.load(std::memory_order_relaxed); }

    std::vector<std::string> getTimingCategories() const;
    std::vector<std::string> getCounterCategories() const;

private:
    struct TimingCategory {
        std::atomic<uint64_t> totalNanos{0};
        std::atomic<uint64_t> maxNanos{0};
        std::atomic<uint64_t> count{0};
        mutable std::mutex snapshotMutex{};
    };

    struct CounterCategory {
        std::atomic<uint64_t> value{0};
        mutable std::mutex snapshotMutex{};
    };

    TimingCategory& timingFor(const std::string& category);
    CounterCategory& counterFor(const std::string& category);
    TimingCategory* findTiming(const std::string& category) const;
    CounterCategory* findCounter(const std::string& category) const;

    static TimingSnapshot read(const TimingCategory& timing);
    static TimingSnapshot readAndReset(TimingCategory& timing);

    mutable std::shared_mutex m_categoriesMutex{};
    std::unordered_map<std::string, std::unique_ptr<TimingCategory>> m_timings{};
    std::unordered_map<std::string, std::unique_ptr<CounterCategory>> m_counters{};

    std::atomic<int> m_reportInterval;
    std::atomic<uint64_t> m_tickCount{0};
    int m_ticksSinceReport{0};
    uint64_t m_reportIndex{0};

    mutable std::mutex m_reportMutex{};
    std::shared_ptr<const PerformanceReport> m_latestReport{};
    std::vector<ReportSink> m_sinks{};
};

/**
 * @brief RAII timer that records its lifetime into a timing category
 *
 * A null monitor makes the timer a no-op.
 */
class ScopedTiming {
public:
    ScopedTiming(PerformanceMonitor* monitor, const char* category)
        : m_monitor(monitor), m_category(category),
          m_start(PerformanceMonitor::Clock::now()) {}

    ~ScopedTiming() {
        if (m_monitor) {
            auto elapsed = PerformanceMonitor::Clock::now() - m_start;
            m_monitor->record(m_category,
                              static_cast<uint64_t>(std::chrono::duration_cast<
                                  std::chrono::nanoseconds>(elapsed).count()));
        }
    }

    ScopedTiming(const ScopedTiming&) = delete;
    ScopedTiming& operator=(const ScopedTiming&) = delete;

private:
    PerformanceMonitor* m_monitor;
    const char* m_category;
    PerformanceMonitor::Clock::time_point m_start;
};

} // namespace TickGuard

#endif // PERFORMANCE_MONITOR_HPP
