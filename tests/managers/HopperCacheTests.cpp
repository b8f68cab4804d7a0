/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE HopperCacheTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "managers/HopperCache.hpp"
#include "utils/PerformanceMonitor.hpp"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace TickGuard;

namespace {

struct TestChest {
    int slotsUsed{0};
};

class TestBarrel : public HopperContainer {
public:
    bool isEmpty() const override { return true; }
    bool isFull() const override { return false; }
};

} // namespace

struct HopperCacheFixture {
    HopperCacheFixture() { TICKGUARD_ENABLE_BENCHMARK_MODE(); }
    ~HopperCacheFixture() { TICKGUARD_DISABLE_BENCHMARK_MODE(); }

    HopperCacheConfig config{};
    const PositionKey chestPos = blockKey(5, 64, 5);
    const PositionKey otherPos = blockKey(6, 64, 5);
};

BOOST_FIXTURE_TEST_SUITE(HopperCacheTestSuite, HopperCacheFixture)

BOOST_AUTO_TEST_CASE(TestConfigValidation) {
    config.capacity = 0;
    BOOST_CHECK_THROW(HopperCache<TestChest>{config}, std::invalid_argument);

    config = HopperCacheConfig{};
    config.maxAgeTicks = 0;
    BOOST_CHECK_THROW(HopperCache<TestChest>{config}, std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestContainerHitAndMiss) {
    PerformanceMonitor monitor(0);
    HopperCache<TestChest> cache(config, &monitor);
    auto chest = std::make_shared<TestChest>();

    BOOST_CHECK(cache.getContainer(chestPos) == nullptr);
    cache.cacheContainer(chestPos, chest);
    BOOST_CHECK(cache.getContainer(chestPos) == chest);
    BOOST_CHECK(cache.getContainer(chestPos) == chest);

    BOOST_CHECK_EQUAL(cache.getHitCount(), 2u);
    BOOST_CHECK_EQUAL(cache.getMissCount(), 1u);
    BOOST_CHECK_EQUAL(monitor.counterValue(MonitorCategory::HOPPER_CACHE_HITS), 2u);
    BOOST_CHECK_EQUAL(monitor.counterValue(MonitorCategory::HOPPER_CACHE_MISSES), 1u);
}

BOOST_AUTO_TEST_CASE(TestDestroyedContainerIsMiss) {
    HopperCache<TestChest> cache(config);
    auto chest = std::make_shared<TestChest>();
    cache.cacheContainer(chestPos, chest);

    std::weak_ptr<TestChest> observer = chest;
    chest.reset();

    // The cache must not have kept it alive
    BOOST_CHECK(observer.expired());
    BOOST_CHECK(cache.getContainer(chestPos) == nullptr);
    BOOST_CHECK_EQUAL(cache.getMissCount(), 1u);

    // No hints left either, so the entry is gone
    BOOST_CHECK_EQUAL(cache.size(), 0u);
}

BOOST_AUTO_TEST_CASE(TestDestroyedContainerKeepsHints) {
    HopperCache<TestChest> cache(config);
    auto chest = std::make_shared<TestChest>();
    cache.cacheContainer(chestPos, chest);
    cache.markSourceEmpty(chestPos);
    chest.reset();

    BOOST_CHECK(cache.getContainer(chestPos) == nullptr);
    BOOST_CHECK_EQUAL(cache.size(), 1u);
    BOOST_CHECK(cache.shouldSkipPull(chestPos));
}

BOOST_AUTO_TEST_CASE(TestSourceEmptyHint) {
    HopperCache<TestChest> cache(config);

    BOOST_CHECK(!cache.shouldSkipPull(chestPos));
    cache.markSourceEmpty(chestPos);
    BOOST_CHECK(cache.shouldSkipPull(chestPos));
    BOOST_CHECK(!cache.shouldSkipPull(otherPos));

    cache.onContainerChanged(chestPos);
    BOOST_CHECK(!cache.shouldSkipPull(chestPos));
}

BOOST_AUTO_TEST_CASE(TestDestFullHint) {
    HopperCache<TestChest> cache(config);

    BOOST_CHECK(!cache.shouldSkipPush(chestPos));
    cache.markDestFull(chestPos);
    BOOST_CHECK(cache.shouldSkipPush(chestPos));
    BOOST_CHECK(!cache.shouldSkipPull(chestPos));

    cache.onContainerChanged(chestPos);
    BOOST_CHECK(!cache.shouldSkipPush(chestPos));

    // Unknown positions are ignored
    cache.onContainerChanged(otherPos);
    BOOST_CHECK_EQUAL(cache.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestTogglesDisableEachOptimization) {
    config.optimizedCaching = false;
    config.skipEmptyCheck = false;
    config.throttleWhenFull = false;
    HopperCache<TestChest> cache(config);
    auto chest = std::make_shared<TestChest>();

    cache.cacheContainer(chestPos, chest);
    BOOST_CHECK(cache.getContainer(chestPos) == nullptr);
    BOOST_CHECK_EQUAL(cache.getMissCount(), 0u);

    cache.markSourceEmpty(chestPos);
    cache.markDestFull(chestPos);
    BOOST_CHECK(!cache.shouldSkipPull(chestPos));
    BOOST_CHECK(!cache.shouldSkipPush(chestPos));
    BOOST_CHECK_EQUAL(cache.size(), 0u);
}

BOOST_AUTO_TEST_CASE(TestHintsWorkWithoutContainerCaching) {
    config.optimizedCaching = false;
    HopperCache<TestChest> cache(config);

    cache.markSourceEmpty(chestPos);
    BOOST_CHECK(cache.shouldSkipPull(chestPos));
}

BOOST_AUTO_TEST_CASE(TestCapacityEvictsLeastRecentlyTouched) {
    config.capacity = 2;
    HopperCache<TestChest> cache(config);

    const PositionKey a = blockKey(0, 64, 0);
    const PositionKey b = blockKey(1, 64, 0);
    const PositionKey c = blockKey(2, 64, 0);

    cache.setCurrentTick(1);
    cache.markSourceEmpty(a);
    cache.setCurrentTick(2);
    cache.markSourceEmpty(b);
    cache.setCurrentTick(3);
    cache.markSourceEmpty(c);

    BOOST_CHECK_EQUAL(cache.size(), 2u);
    BOOST_CHECK(!cache.shouldSkipPull(a));
    BOOST_CHECK(cache.shouldSkipPull(b));
    BOOST_CHECK(cache.shouldSkipPull(c));
}

BOOST_AUTO_TEST_CASE(TestExpireDropsIdleEntries) {
    config.maxAgeTicks = 100;
    HopperCache<TestChest> cache(config);
    auto chest = std::make_shared<TestChest>();

    cache.setCurrentTick(0);
    cache.markSourceEmpty(chestPos);
    cache.setCurrentTick(50);
    cache.markDestFull(otherPos);

    BOOST_CHECK_EQUAL(cache.expire(100), 0u);
    BOOST_CHECK_EQUAL(cache.expire(120), 1u);
    BOOST_CHECK(!cache.shouldSkipPull(chestPos));
    BOOST_CHECK(cache.shouldSkipPush(otherPos));

    // A hit refreshes the entry
    cache.setCurrentTick(140);
    cache.cacheContainer(otherPos, chest);
    cache.setCurrentTick(230);
    BOOST_CHECK(cache.getContainer(otherPos) == chest);
    BOOST_CHECK_EQUAL(cache.expire(300), 0u);
    BOOST_CHECK_EQUAL(cache.expire(331), 1u);
}

BOOST_AUTO_TEST_CASE(TestExpireDropsDeadContainers) {
    HopperCache<TestChest> cache(config);
    auto chest = std::make_shared<TestChest>();
    cache.cacheContainer(chestPos, chest);
    chest.reset();

    BOOST_CHECK_EQUAL(cache.expire(1), 1u);
    BOOST_CHECK_EQUAL(cache.size(), 0u);
}

BOOST_AUTO_TEST_CASE(TestRemoveAndClear) {
    HopperCache<TestChest> cache(config);
    cache.markSourceEmpty(chestPos);
    cache.markSourceEmpty(otherPos);

    cache.removeContainer(chestPos);
    BOOST_CHECK(!cache.shouldSkipPull(chestPos));
    BOOST_CHECK_EQUAL(cache.size(), 1u);

    cache.clearAll();
    BOOST_CHECK_EQUAL(cache.size(), 0u);
}

BOOST_AUTO_TEST_CASE(TestCoreCacheHoldsPolymorphicContainers) {
    CoreHopperCache cache(config);
    std::shared_ptr<HopperContainer> barrel = std::make_shared<TestBarrel>();
    cache.cacheContainer(chestPos, barrel);

    auto cached = cache.getContainer(chestPos);
    BOOST_REQUIRE(cached != nullptr);
    BOOST_CHECK(cached->isEmpty());
    BOOST_CHECK(!cached->isFull());
}

BOOST_AUTO_TEST_CASE(TestConcurrentLookups) {
    HopperCache<TestChest> cache(config);
    std::vector<std::shared_ptr<TestChest>> chests;
    for (int i = 0; i < 64; ++i) {
        chests.push_back(std::make_shared<TestChest>());
        cache.cacheContainer(blockKey(i, 64, 0), chests.back());
    }

    std::atomic<int> wrong{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int round = 0; round < 250; ++round) {
                const int i = round % 64;
                if (cache.getContainer(blockKey(i, 64, 0)) != chests[static_cast<size_t>(i)]) {
                    wrong.fetch_add(1);
                }
                cache.markDestFull(blockKey(i, 64, 0));
                cache.onContainerChanged(blockKey(i, 64, 0));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    BOOST_CHECK_EQUAL(wrong.load(), 0);
    BOOST_CHECK_EQUAL(cache.getHitCount(), 1000u);
}

BOOST_AUTO_TEST_SUITE_END()
