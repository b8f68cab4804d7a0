/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE TickClockTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "core/TickClock.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

using namespace TickGuard;
using namespace std::chrono_literals;

struct TickClockFixture {
    TickClockFixture() { TICKGUARD_ENABLE_BENCHMARK_MODE(); }
    ~TickClockFixture() { TICKGUARD_DISABLE_BENCHMARK_MODE(); }
};

BOOST_FIXTURE_TEST_SUITE(TickClockTestSuite, TickClockFixture)

BOOST_AUTO_TEST_CASE(TestDefaults) {
    TickClock clock;
    BOOST_CHECK_EQUAL(clock.getTick(), 0);
    BOOST_CHECK_CLOSE(clock.getTargetTPS(), 20.0, 0.001);
    BOOST_CHECK_CLOSE(clock.getTickBudgetMs(), 50.0, 0.001);
    BOOST_CHECK(clock.isPacing());
    BOOST_CHECK_EQUAL(clock.getCurrentTPS(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestInvalidRateThrows) {
    BOOST_CHECK_THROW(TickClock(0.0), std::invalid_argument);
    BOOST_CHECK_THROW(TickClock(-20.0), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestTickCounterIsMonotonic) {
    TickClock clock(20.0, false);

    for (int64_t expected = 0; expected < 100; ++expected) {
        BOOST_CHECK_EQUAL(clock.startTick(), expected);
        clock.endTick();
        BOOST_CHECK_EQUAL(clock.getTick(), expected + 1);
    }
}

BOOST_AUTO_TEST_CASE(TestUnmatchedEndTickIgnored) {
    TickClock clock(20.0, false);
    clock.endTick();
    BOOST_CHECK_EQUAL(clock.getTick(), 0);

    clock.startTick();
    clock.endTick();
    clock.endTick();
    BOOST_CHECK_EQUAL(clock.getTick(), 1);
}

BOOST_AUTO_TEST_CASE(TestPacingHoldsTickRate) {
    // 100 TPS keeps the test short: 10 ms per tick
    TickClock clock(100.0, true);

    const auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 10; ++i) {
        clock.startTick();
        clock.endTick();
    }
    const auto elapsed = std::chrono::steady_clock::now() - start;

    // Ten paced ticks take at least nine budgets
    BOOST_CHECK(elapsed >= 90ms);
    BOOST_CHECK_GT(clock.getCurrentTPS(), 50.0f);
    BOOST_CHECK_LT(clock.getCurrentTPS(), 150.0f);
    BOOST_CHECK_EQUAL(clock.getOverrunCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestOverrunDetected) {
    // 1000 TPS gives a 1 ms budget
    TickClock clock(1000.0, false);

    clock.startTick();
    std::this_thread::sleep_for(5ms);
    clock.endTick();

    BOOST_CHECK(clock.wasOverrun());
    BOOST_CHECK_EQUAL(clock.getOverrunCount(), 1u);
    BOOST_CHECK_GE(clock.getLastTickMs(), 5.0);

    clock.startTick();
    clock.endTick();
    BOOST_CHECK(!clock.wasOverrun());
    BOOST_CHECK_EQUAL(clock.getOverrunCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestReset) {
    TickClock clock(1000.0, false);
    for (int i = 0; i < 5; ++i) {
        clock.startTick();
        std::this_thread::sleep_for(2ms);
        clock.endTick();
    }
    BOOST_CHECK_GT(clock.getCurrentTPS(), 0.0f);

    clock.reset();
    BOOST_CHECK_EQUAL(clock.getTick(), 0);
    BOOST_CHECK_EQUAL(clock.getCurrentTPS(), 0.0f);
    BOOST_CHECK_EQUAL(clock.getOverrunCount(), 0u);
    BOOST_CHECK(!clock.wasOverrun());
}

BOOST_AUTO_TEST_SUITE_END()
