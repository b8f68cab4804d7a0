/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TICK_CLOCK_HPP
#define TICK_CLOCK_HPP

#include <chrono>
#include <cstdint>

namespace TickGuard {

/**
 * TickClock drives a fixed-step simulation at a target tick rate
 * (20 ticks per second by default, 50 ms per tick).
 *
 * It owns the monotonic tick counter every component reads. Each tick is
 * bracketed by startTick()/endTick(); endTick() measures how long the tick's
 * work took, flags ticks that ran over budget and, with pacing enabled,
 * sleeps out the rest of the tick using SDL_DelayPrecise.
 *
 * Not thread-safe, owned by the host loop.
 */
class TickClock {
public:
    using Clock = std::chrono::high_resolution_clock;

    static constexpr double DEFAULT_TPS = 20.0;

    /**
     * @param targetTPS Ticks per second, must be > 0
     * @param pacing Sleep out the remainder of each tick in endTick()
     * @throws std::invalid_argument on a non-positive tick rate
     */
    explicit TickClock(double targetTPS = DEFAULT_TPS, bool pacing = true);

    /**
     * Call at the start of each tick
     * @return The tick number of the tick being started
     */
    int64_t startTick();

    /**
     * Call at the end of each tick. Advances the tick counter.
     */
    void endTick();

    /**
     * Ticks completed so far, which is also the number of the next tick
     */
    int64_t getTick() const { return m_tick; }

    /**
     * Measured ticks per second, exponentially smoothed
     */
    float getCurrentTPS() const { return m_currentTPS; }
    double getTargetTPS() const { return m_targetTPS; }

    /**
     * Work time of the last completed tick, pacing excluded
     */
    double getLastTickMs() const { return m_lastTickMs; }

    double getTickBudgetMs() const {
        return static_cast<double>(m_tickBudget.count()) / 1'000'000.0;
    }

    /**
     * True if the last completed tick took longer than its budget
     */
    bool wasOverrun() const { return m_lastOverrun; }
    uint64_t getOverrunCount() const { return m_overrunCount; }

    void setPacing(bool pacing) { m_pacing = pacing; }
    bool isPacing() const { return m_pacing; }

    /**
     * Zeroes the tick counter and the TPS measurement
     */
    void reset();

private:
    void updateTPS(double deltaSeconds);
    void waitForNextTick() const;

    double m_targetTPS;
    std::chrono::nanoseconds m_tickBudget;
    bool m_pacing;

    int64_t m_tick{0};
    Clock::time_point m_tickStart{};
    Clock::time_point m_lastTickStart{};
    bool m_firstTick{true};
    bool m_inTick{false};

    float m_currentTPS{0.0f};
    float m_smoothingAlpha{0.05f};
    double m_lastTickMs{0.0};
    bool m_lastOverrun{false};
    uint64_t m_overrunCount{0};
};

} // namespace TickGuard

#endif // TICK_CLOCK_HPP
