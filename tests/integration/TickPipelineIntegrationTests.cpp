/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE TickPipelineIntegrationTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "core/PerformanceCore.hpp"
#include "core/TickClock.hpp"

#include <atomic>
#include <memory>
#include <vector>

using namespace TickGuard;

namespace {

class Chest : public HopperContainer {
public:
    bool isEmpty() const override { return m_items == 0; }
    bool isFull() const override { return m_items >= CAPACITY; }

    static constexpr int CAPACITY = 5;
    int m_items{0};
};

} // namespace

/**
 * Drives a full PerformanceCore through many ticks with every component
 * active, the way a host server would.
 */
struct TickPipelineFixture {
    TickPipelineFixture() : clock(20.0, false) {
        TICKGUARD_ENABLE_BENCHMARK_MODE();

        settings.entityTracker.threads = 2;
        settings.mobSpawning.threads = 2;
        settings.entityTracker.shutdownGraceMs = 1000;
        settings.mobSpawning.shutdownGraceMs = 1000;
        settings.monitoring.reportIntervalTicks = 250;
        settings.mobSpawning.maxPerChunk = 6;
    }

    ~TickPipelineFixture() {
        core.shutdown();
        TICKGUARD_DISABLE_BENCHMARK_MODE();
    }

    void runRedstone(int64_t tick) {
        RedstoneThrottler& throttler = core.getRedstoneThrottler();
        // A dense clock in chunk (0, 0) and a quiet line in chunk (4, 4)
        const int dense = 100 + static_cast<int>(tick % 250);
        std::vector<PositionKey> updates;
        for (int i = 0; i < dense; ++i) {
            updates.push_back(blockKey(i % 16, 64 + i / 256, (i / 16) % 16));
        }
        const PositionKey denseChunk = chunkKey(0, 0);
        for (size_t i = 0; i < updates.size(); ++i) {
            throttler.trackUpdate(denseChunk);
        }
        for (PositionKey block : updates) {
            throttler.shouldUpdate(denseChunk, block, tick);
        }
        for (int i = 0; i < 8; ++i) {
            throttler.trackUpdate(chunkKey(4, 4));
            BOOST_CHECK(throttler.shouldUpdate(chunkKey(4, 4), blockKey(64 + i, 64, 64), tick));
        }
    }

    void runBlockTicks(int64_t tick) {
        ObserverDebounce& debounce = core.getObserverDebounce();
        TickCoalescer& coalescer = core.getTickCoalescer();
        for (int i = 0; i < 20; ++i) {
            const PositionKey pos = blockKey(i, 70, 0);
            if (debounce.shouldFire(pos, tick)) {
                ++observerFires;
            }
            // Every position is scheduled twice, only one runs
            coalescer.shouldTick(pos);
            coalescer.shouldTick(pos);
        }
    }

    void runEntities(int64_t tick) {
        EntityTrackerPool& tracker = core.getEntityTrackerPool();
        for (int id = 0; id < 40; ++id) {
            tracker.submitForEntity(id % 10 == 0 ? "CitizensNPC" : "Zombie",
                                    [this] { tracked.fetch_add(1); });
        }
        (void)tick;
    }

    void runSpawning(int64_t tick) {
        if (tick % 10 != 0) {
            return;
        }
        auto snapshot = std::make_shared<SpawnSnapshot>();
        snapshot->tick = tick;
        snapshot->chunkPopulation[chunkKey(0, 0)] = population;

        std::vector<SpawnRequest> requests;
        for (int i = 0; i < 4; ++i) {
            requests.push_back(SpawnRequest{"zombie", BlockPos(i, 64, i)});
        }
        const int seenPopulation = population;
        core.getMobSpawnPool().submit(
            snapshot, std::move(requests), [this, seenPopulation](const SpawnEvaluation& evaluation) {
                // Never more than the cap allowed on top of what the snapshot saw
                const int accepted = static_cast<int>(evaluation.candidates.size());
                if (seenPopulation + accepted > settings.mobSpawning.maxPerChunk && accepted > 0) {
                    ++capViolations;
                }
                population += accepted;
                ++spawnEvaluationsApplied;
            });
    }

    void runHoppers(int64_t tick) {
        CoreHopperCache& cache = core.getHopperCache();
        const PositionKey pos = blockKey(8, 64, 8);
        if (!cache.getContainer(pos)) {
            cache.cacheContainer(pos, chest);
        }
        if (cache.shouldSkipPush(pos)) {
            return;
        }
        if (chest->isFull()) {
            cache.markDestFull(pos);
        } else {
            ++chest->m_items;
        }
        // A player empties the chest now and then
        if (tick % 50 == 0) {
            chest->m_items = 0;
            cache.onContainerChanged(pos);
        }
    }

    TickClock clock;
    CoreSettings settings{};
    PerformanceCore core;
    std::shared_ptr<Chest> chest = std::make_shared<Chest>();

    int observerFires{0};
    std::atomic<int> tracked{0};
    int population{0};
    int spawnEvaluationsApplied{0};
    int capViolations{0};
    size_t explosionsApplied{0};
};

BOOST_FIXTURE_TEST_SUITE(TickPipelineTests, TickPipelineFixture)

BOOST_AUTO_TEST_CASE(TestThousandTicks) {
    BOOST_REQUIRE(core.init(settings));

    const int64_t ticks = 1000;
    for (int64_t i = 0; i < ticks; ++i) {
        const int64_t tick = clock.startTick();
        core.beginTick(tick);

        // Tick-scoped state never leaks into the next tick
        BOOST_CHECK_EQUAL(core.getTickCoalescer().getTickedThisTick(), 0u);
        BOOST_CHECK_EQUAL(core.getRedstoneThrottler().getTrackedChunkCount(), 0u);

        runRedstone(tick);
        runBlockTicks(tick);
        runEntities(tick);
        runSpawning(tick);
        runHoppers(tick);

        if (tick % 20 == 0) {
            for (int t = 0; t < 9; ++t) {
                core.getExplosionBatcher().enqueue(0.1 * t, 64.0, 0.0, 4.0f);
            }
        }

        explosionsApplied += core.endTick([](double, double, double, float) {});
        BOOST_CHECK_EQUAL(core.getExplosionBatcher().getQueueSize(), 0u);
        clock.endTick();
    }

    // Drain whatever phase 1 finished late
    for (int64_t extra = ticks; extra < ticks + 500 && core.getMobSpawnPool().getPendingCount() > 0;
         ++extra) {
        core.beginTick(extra);
        core.endTick([](double, double, double, float) {});
    }

    const RedstoneThrottlerStats redstone = core.getRedstoneThrottler().getStats();
    BOOST_CHECK_EQUAL(redstone.tracked, redstone.throttled + redstone.proceeded);
    BOOST_CHECK_GT(redstone.throttled, 0u);

    // 20 observers, one fire every 4 ticks each
    BOOST_CHECK_EQUAL(observerFires, 20 * 250);

    // Nine TNT within 1 block of the first collapse into one blast
    BOOST_CHECK_EQUAL(explosionsApplied, 50u);

    BOOST_CHECK_EQUAL(spawnEvaluationsApplied, 100);
    BOOST_CHECK_EQUAL(capViolations, 0);
    BOOST_CHECK_GT(population, 0);

    BOOST_CHECK_EQUAL(clock.getTick(), ticks);

    const auto& tracker = core.getEntityTrackerPool();
    BOOST_CHECK_EQUAL(tracker.getSyncTrackedCount(), 4000u);

    core.shutdown();
    BOOST_CHECK_EQUAL(tracked.load(), 40 * 1000);

    // Ticks were reported every 250, the shutdown report carries the tail
    auto report = core.getMonitor().getLatestReport();
    BOOST_REQUIRE(report != nullptr);
    BOOST_CHECK_GE(report->reportIndex, 5u);
}

BOOST_AUTO_TEST_CASE(TestEverythingDisabled) {
    settings.redstone.enabled = false;
    settings.observer.enabled = false;
    settings.explosions.enabled = false;
    settings.coalescerEnabled = false;
    settings.entityTracker.enabled = false;
    settings.mobSpawning.enabled = false;
    settings.hopper.optimizedCaching = false;
    settings.hopper.skipEmptyCheck = false;
    settings.hopper.throttleWhenFull = false;
    settings.entityAI.distanceTiers = false;
    settings.entityAI.goalSelectorThrottle = false;
    settings.entityAI.dabEnabled = false;
    BOOST_REQUIRE(core.init(settings));

    for (int64_t tick = 0; tick < 50; ++tick) {
        core.beginTick(tick);
        runRedstone(tick);
        runBlockTicks(tick);
        runEntities(tick);
        runSpawning(tick);
        BOOST_CHECK(core.getEntityActivationGate().shouldTickAI(1.0e9, tick, 1));
        core.endTick([](double, double, double, float) {});
    }

    // Every gate answered "proceed", every pool ran on the caller
    BOOST_CHECK_EQUAL(observerFires, 20 * 50);
    BOOST_CHECK_EQUAL(tracked.load(), 40 * 50);
    BOOST_CHECK_EQUAL(spawnEvaluationsApplied, 5);
    BOOST_CHECK_EQUAL(core.getRedstoneThrottler().getStats().throttled, 0u);
    BOOST_CHECK_EQUAL(core.getMonitor().counterValue(MonitorCategory::TICKS_COALESCED), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
