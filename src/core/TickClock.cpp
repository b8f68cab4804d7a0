/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/TickClock.hpp"
#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace TickGuard {

namespace {
// Overruns are logged once per this many occurrences
constexpr uint64_t OVERRUN_LOG_EVERY = 100;
} // namespace

TickClock::TickClock(double targetTPS, bool pacing)
    : m_targetTPS(targetTPS), m_tickBudget(0), m_pacing(pacing) {
    if (!(targetTPS > 0.0)) {
        throw std::invalid_argument("tick rate must be positive (got " +
                                    formatFixed(targetTPS) + ")");
    }
    m_tickBudget = std::chrono::nanoseconds(static_cast<int64_t>(1e9 / targetTPS));
}

int64_t TickClock::startTick() {
    auto currentTime = Clock::now();

    if (m_firstTick) {
        m_firstTick = false;
    } else {
        auto deltaNs = std::chrono::duration_cast<std::chrono::nanoseconds>(
            currentTime - m_lastTickStart);
        updateTPS(static_cast<double>(deltaNs.count()) / 1e9);
    }

    m_lastTickStart = currentTime;
    m_tickStart = currentTime;
    m_inTick = true;
    return m_tick;
}

void TickClock::endTick() {
    if (!m_inTick) {
        TICKCLOCK_WARN("endTick() without a matching startTick()");
        return;
    }
    m_inTick = false;

    auto workNs = std::chrono::duration_cast<std::chrono::nanoseconds>(
        Clock::now() - m_tickStart);
    m_lastTickMs = static_cast<double>(workNs.count()) / 1'000'000.0;
    m_lastOverrun = workNs > m_tickBudget;

    if (m_lastOverrun) {
        ++m_overrunCount;
        if (m_overrunCount % OVERRUN_LOG_EVERY == 1) {
            TICKCLOCK_WARN("Tick " + std::to_string(m_tick) + " took " +
                           formatFixed(m_lastTickMs) + "ms (budget " +
                           formatFixed(getTickBudgetMs()) + "ms), " +
                           std::to_string(m_overrunCount) + " overruns so far");
        }
    }

    ++m_tick;

    if (m_pacing && !m_lastOverrun) {
        waitForNextTick();
    }
}

void TickClock::reset() {
    m_tick = 0;
    m_firstTick = true;
    m_inTick = false;
    m_currentTPS = 0.0f;
    m_lastTickMs = 0.0;
    m_lastOverrun = false;
    m_overrunCount = 0;
}

void TickClock::updateTPS(double deltaSeconds) {
    if (deltaSeconds <= 0.0) {
        return;
    }
    float instantTPS = static_cast<float>(1.0 / deltaSeconds);
    instantTPS = std::clamp(instantTPS, 0.1f, 10000.0f);

    if (m_currentTPS <= 0.0f) {
        m_currentTPS = instantTPS;
    } else {
        m_currentTPS = m_smoothingAlpha * instantTPS + (1.0f - m_smoothingAlpha) * m_currentTPS;
    }
}

void TickClock::waitForNextTick() const {
    auto targetEndTime = m_tickStart + m_tickBudget;
    auto remainingNs = std::chrono::duration_cast<std::chrono::nanoseconds>(
        targetEndTime - Clock::now());

    if (remainingNs.count() > 0) {
        // Hybrid sleep and spin, adaptive to the OS scheduler
        SDL_DelayPrecise(static_cast<Uint64>(remainingNs.count()));
    }
}

} // namespace TickGuard
