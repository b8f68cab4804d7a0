/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ExplosionBatcherTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "managers/ExplosionBatcher.hpp"
#include "utils/PerformanceMonitor.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace TickGuard;

struct AppliedExplosion {
    double x;
    double y;
    double z;
    float power;
};

struct ExplosionBatcherFixture {
    ExplosionBatcherFixture() { TICKGUARD_ENABLE_BENCHMARK_MODE(); }
    ~ExplosionBatcherFixture() { TICKGUARD_DISABLE_BENCHMARK_MODE(); }

    ExplosionBatcher::ExplosionFn recorder() {
        return [this](double x, double y, double z, float power) {
            applied.push_back(AppliedExplosion{x, y, z, power});
        };
    }

    ExplosionBatcherConfig config{};
    std::vector<AppliedExplosion> applied;
};

BOOST_FIXTURE_TEST_SUITE(ExplosionBatcherTestSuite, ExplosionBatcherFixture)

BOOST_AUTO_TEST_CASE(TestNegativeRadiusThrows) {
    config.groupRadius = -0.5;
    BOOST_CHECK_THROW(ExplosionBatcher{config}, std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestSingleDetonationUnchanged) {
    ExplosionBatcher batcher(config);
    batcher.enqueue(10.0, 64.0, -5.0, 4.0f);

    BOOST_CHECK_EQUAL(batcher.flush(recorder()), 1u);
    BOOST_REQUIRE_EQUAL(applied.size(), 1u);
    BOOST_CHECK_CLOSE(applied[0].x, 10.0, 0.001);
    BOOST_CHECK_CLOSE(applied[0].z, -5.0, 0.001);
    BOOST_CHECK_CLOSE(applied[0].power, 4.0f, 0.001);
    BOOST_CHECK_EQUAL(batcher.getBatchedCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestClusterMergedAtMeanWithRootSumSquarePower) {
    PerformanceMonitor monitor(0);
    ExplosionBatcher batcher(config, &monitor);

    // Four TNT within 1 block of the first
    batcher.enqueue(0.0, 64.0, 0.0, 4.0f);
    batcher.enqueue(0.5, 64.0, 0.0, 4.0f);
    batcher.enqueue(0.0, 64.5, 0.0, 4.0f);
    batcher.enqueue(0.0, 64.0, 0.5, 4.0f);

    BOOST_CHECK_EQUAL(batcher.flush(recorder()), 1u);
    BOOST_REQUIRE_EQUAL(applied.size(), 1u);
    BOOST_CHECK_CLOSE(applied[0].x, 0.125, 0.001);
    BOOST_CHECK_CLOSE(applied[0].y, 64.125, 0.001);
    BOOST_CHECK_CLOSE(applied[0].z, 0.125, 0.001);
    // sqrt(4 * 16) = 8, not 16
    BOOST_CHECK_CLOSE(applied[0].power, 8.0f, 0.001);

    BOOST_CHECK_EQUAL(monitor.counterValue(MonitorCategory::EXPLOSIONS_BATCHED), 3u);
    BOOST_CHECK_EQUAL(batcher.getBatchedCount(), 3u);
    BOOST_CHECK_EQUAL(batcher.getBatchedCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestDistantDetonationsStaySeparate) {
    ExplosionBatcher batcher(config);
    batcher.enqueue(0.0, 64.0, 0.0, 4.0f);
    batcher.enqueue(5.0, 64.0, 0.0, 4.0f);
    batcher.enqueue(0.0, 64.0, 5.0, 4.0f);

    BOOST_CHECK_EQUAL(batcher.flush(recorder()), 3u);
    BOOST_CHECK_EQUAL(applied.size(), 3u);
    for (const auto& explosion : applied) {
        BOOST_CHECK_CLOSE(explosion.power, 4.0f, 0.001);
    }
}

BOOST_AUTO_TEST_CASE(TestClusteringIsSeededNotTransitive) {
    ExplosionBatcher batcher(config);
    // b is within range of a, c is within range of b but not of a
    batcher.enqueue(0.0, 0.0, 0.0, 1.0f);
    batcher.enqueue(0.9, 0.0, 0.0, 1.0f);
    batcher.enqueue(1.8, 0.0, 0.0, 1.0f);

    BOOST_CHECK_EQUAL(batcher.flush(recorder()), 2u);
    BOOST_REQUIRE_EQUAL(applied.size(), 2u);
    BOOST_CHECK_CLOSE(applied[0].x, 0.45, 0.001);
    BOOST_CHECK_CLOSE(applied[1].x, 1.8, 0.001);
}

BOOST_AUTO_TEST_CASE(TestBoundaryDistanceIncluded) {
    ExplosionBatcher batcher(config);
    batcher.enqueue(0.0, 0.0, 0.0, 3.0f);
    batcher.enqueue(1.0, 0.0, 0.0, 4.0f);

    BOOST_CHECK_EQUAL(batcher.flush(recorder()), 1u);
    BOOST_CHECK_CLOSE(applied[0].power, 5.0f, 0.001);
}

BOOST_AUTO_TEST_CASE(TestZeroRadiusMergesOnlyCoincident) {
    config.groupRadius = 0.0;
    ExplosionBatcher batcher(config);
    batcher.enqueue(1.0, 1.0, 1.0, 2.0f);
    batcher.enqueue(1.0, 1.0, 1.0, 2.0f);
    batcher.enqueue(1.1, 1.0, 1.0, 2.0f);

    BOOST_CHECK_EQUAL(batcher.flush(recorder()), 2u);
}

BOOST_AUTO_TEST_CASE(TestFlushEmptiesQueue) {
    ExplosionBatcher batcher(config);
    batcher.enqueue(0.0, 0.0, 0.0, 1.0f);
    BOOST_CHECK_EQUAL(batcher.getQueueSize(), 1u);
    BOOST_CHECK_EQUAL(batcher.getStats().queued, 1u);

    batcher.flush(recorder());
    BOOST_CHECK_EQUAL(batcher.getQueueSize(), 0u);

    applied.clear();
    BOOST_CHECK_EQUAL(batcher.flush(recorder()), 0u);
    BOOST_CHECK(applied.empty());
}

BOOST_AUTO_TEST_CASE(TestThrowingApplyStillClearsQueue) {
    ExplosionBatcher batcher(config);
    batcher.enqueue(0.0, 0.0, 0.0, 1.0f);
    batcher.enqueue(50.0, 0.0, 0.0, 1.0f);

    BOOST_CHECK_THROW(batcher.flush([](double, double, double, float) {
                          throw std::runtime_error("world refused");
                      }),
                      std::runtime_error);
    BOOST_CHECK_EQUAL(batcher.getQueueSize(), 0u);

    // Usable afterwards
    batcher.enqueue(0.0, 0.0, 0.0, 1.0f);
    BOOST_CHECK_EQUAL(batcher.flush(recorder()), 1u);
}

BOOST_AUTO_TEST_CASE(TestDisabledDropsEverything) {
    config.enabled = false;
    ExplosionBatcher batcher(config);
    batcher.enqueue(0.0, 0.0, 0.0, 1.0f);
    BOOST_CHECK_EQUAL(batcher.getQueueSize(), 0u);
    BOOST_CHECK_EQUAL(batcher.flush(recorder()), 0u);
    BOOST_CHECK(applied.empty());
}

BOOST_AUTO_TEST_CASE(TestStatsReportRadiusSquared) {
    config.groupRadius = 2.0;
    ExplosionBatcher batcher(config);
    BOOST_CHECK_CLOSE(batcher.getStats().groupRadiusSq, 4.0, 0.001);
}

BOOST_AUTO_TEST_SUITE_END()
