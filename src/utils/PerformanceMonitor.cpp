/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/PerformanceMonitor.hpp"
#include "core/Logger.hpp"

#include <algorithm>

namespace TickGuard {

PerformanceMonitor::PerformanceMonitor(int reportIntervalTicks)
    : m_reportInterval(reportIntervalTicks) {
    for (const char* category : {MonitorCategory::ENTITIES, MonitorCategory::BLOCKS,
                                 MonitorCategory::CHUNKS, MonitorCategory::PATHFINDING,
                                 MonitorCategory::ENTITY_TRACKING,
                                 MonitorCategory::MOB_SPAWNING, MonitorCategory::REDSTONE,
                                 MonitorCategory::TICK_TOTAL}) {
        m_timings.emplace(category, std::make_unique<TimingCategory>());
    }
}

PerformanceMonitor::TimingCategory& PerformanceMonitor::timingFor(const std::string& category) {
    {
        std::shared_lock<std::shared_mutex> lock(m_categoriesMutex);
        auto it = m_timings.find(category);
        if (it != m_timings.end()) {
            return *it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(m_categoriesMutex);
    auto [it, inserted] = m_timings.try_emplace(category, nullptr);
    if (inserted) {
        it->second = std::make_unique<TimingCategory>();
    }
    return *it->second;
}

PerformanceMonitor::CounterCategory& PerformanceMonitor::counterFor(const std::string& category) {
    {
        std::shared_lock<std::shared_mutex> lock(m_categoriesMutex);
        auto it = m_counters.find(category);
        if (it != m_counters.end()) {
            return *it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(m_categoriesMutex);
    auto [it, inserted] = m_counters.try_emplace(category, nullptr);
    if (inserted) {
        it->second = std::make_unique<CounterCategory>();
    }
    return *it->second;
}

PerformanceMonitor::TimingCategory*
PerformanceMonitor::findTiming(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(m_categoriesMutex);
    auto it = m_timings.find(category);
    return it != m_timings.end() ? it->second.get() : nullptr;
}

PerformanceMonitor::CounterCategory*
PerformanceMonitor::findCounter(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(m_categoriesMutex);
    auto it = m_counters.find(category);
    return it != m_counters.end() ? it->second.get() : nullptr;
}

void PerformanceMonitor::record(const std::string& category, uint64_t nanos) {
    TimingCategory& timing = timingFor(category);

    timing.totalNanos.fetch_add(nanos, std::memory_order_relaxed);
    timing.count.fetch_add(1, std::memory_order_relaxed);

    uint64_t currentMax = timing.maxNanos.load(std::memory_order_relaxed);
    while (nanos > currentMax &&
           !timing.maxNanos.compare_exchange_weak(currentMax, nanos,
                                                  std::memory_order_relaxed)) {
        // currentMax reloaded by compare_exchange_weak
    }
}

void PerformanceMonitor::increment(const std::string& category, uint64_t delta) {
    counterFor(category).value.fetch_add(delta, std::memory_order_relaxed);
}

TimingSnapshot PerformanceMonitor::read(const TimingCategory& timing) {
    std::lock_guard<std::mutex> lock(timing.snapshotMutex);
    TimingSnapshot result;
    result.totalNanos = timing.totalNanos.load(std::memory_order_relaxed);
    result.maxNanos = timing.maxNanos.load(std::memory_order_relaxed);
    result.count = timing.count.load(std::memory_order_relaxed);
    return result;
}

TimingSnapshot PerformanceMonitor::readAndReset(TimingCategory& timing) {
    std::lock_guard<std::mutex> lock(timing.snapshotMutex);
    TimingSnapshot result;
    result.totalNanos = timing.totalNanos.exchange(0, std::memory_order_relaxed);
    result.maxNanos = timing.maxNanos.exchange(0, std::memory_order_relaxed);
    result.count = timing.count.exchange(0, std::memory_order_relaxed);
    return result;
}

TimingSnapshot PerformanceMonitor::snapshot(const std::string& category) const {
    const TimingCategory* timing = findTiming(category);
    return timing ? read(*timing) : TimingSnapshot{};
}

TimingSnapshot PerformanceMonitor::snapshotAndReset(const std::string& category) {
    TimingCategory* timing = findTiming(category);
    return timing ? readAndReset(*timing) : TimingSnapshot{};
}

uint64_t PerformanceMonitor::counterValue(const std::string& category) const {
    const CounterCategory* counter = findCounter(category);
    if (!counter) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(counter->snapshotMutex);
    return counter->value.load(std::memory_order_relaxed);
}

uint64_t PerformanceMonitor::counterValueAndReset(const std::string& category) {
    CounterCategory* counter = findCounter(category);
    if (!counter) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(counter->snapshotMutex);
    return counter->value.exchange(0, std::memory_order_relaxed);
}

bool PerformanceMonitor::tick() {
    m_tickCount.fetch_add(1, std::memory_order_relaxed);

    const int interval = m_reportInterval.load(std::memory_order_relaxed);
    if (interval <= 0) {
        return false;
    }

    if (++m_ticksSinceReport < interval) {
        return false;
    }
    m_ticksSinceReport = 0;

    auto report = drainReport();
    MONITOR_DEBUG("Report " + std::to_string(report->reportIndex) + " drained at tick " +
                  std::to_string(report->tickCount) + ": " +
                  std::to_string(report->timings.size()) + " timing categories, " +
                  std::to_string(report->counters.size()) + " counters");
    (void)report;
    return true;
}

std::shared_ptr<const PerformanceReport> PerformanceMonitor::drainReport() {
    auto report = std::make_shared<PerformanceReport>();
    report->tickCount = m_tickCount.load(std::memory_order_relaxed);

    {
        std::shared_lock<std::shared_mutex> lock(m_categoriesMutex);
        report->timings.reserve(m_timings.size());
        for (auto& [name, timing] : m_timings) {
            report->timings.emplace(name, readAndReset(*timing));
        }
        report->counters.reserve(m_counters.size());
        for (auto& [name, counter] : m_counters) {
            std::lock_guard<std::mutex> counterLock(counter->snapshotMutex);
            report->counters.emplace(name,
                                     counter->value.exchange(0, std::memory_order_relaxed));
        }
    }

    std::vector<ReportSink> sinks;
    {
        std::lock_guard<std::mutex> lock(m_reportMutex);
        report->reportIndex = ++m_reportIndex;
        m_latestReport = report;
        sinks = m_sinks;
    }

    // Sinks run outside the lock so they may query the monitor
    for (const auto& sink : sinks) {
        try {
            sink(*report);
        } catch (const std::exception& e) {
            MONITOR_ERROR("Report sink threw: " + std::string(e.what()));
        }
    }

    return report;
}

std::shared_ptr<const PerformanceReport> PerformanceMonitor::getLatestReport() const {
    std::lock_guard<std::mutex> lock(m_reportMutex);
    return m_latestReport;
}

void PerformanceMonitor::addReportSink(ReportSink sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_reportMutex);
    m_sinks.push_back(std::move(sink));
}

std::vector<std::string> PerformanceMonitor::getTimingCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_categoriesMutex);
    std::vector<std::string> names;
    names.reserve(m_timings.size());
    for (const auto& entry : m_timings) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> PerformanceMonitor::getCounterCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_categoriesMutex);
    std::vector<std::string> names;
    names.reserve(m_counters.size());
    for (const auto& entry : m_counters) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace TickGuard
