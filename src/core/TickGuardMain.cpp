/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/CoreSettings.hpp"
#include "core/Logger.hpp"
#include "core/PerformanceCore.hpp"
#include "core/PositionKey.hpp"
#include "core/TickClock.hpp"
#include "managers/SettingsManager.hpp"

#include <atomic>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace TickGuard;

namespace {

const std::string CONFIG_PATH{"res/tickguard.json"};
constexpr int64_t DEFAULT_TICKS{200};

// Synthetic workload shape
constexpr int CLOCK_UPDATES_PER_TICK{400}; // one dense redstone clock
constexpr int SPARSE_CHUNKS{32};
constexpr int OBSERVER_COUNT{64};
constexpr int ENTITY_COUNT{200};
constexpr int TNT_INTERVAL{20};
constexpr int SPAWN_INTERVAL{10};
constexpr int HOPPER_COUNT{48};

class DemoChest : public HopperContainer {
public:
  explicit DemoChest(int items) : m_items(items) {}

  bool isEmpty() const override { return m_items == 0; }
  bool isFull() const override { return m_items >= CAPACITY; }

  void take() {
    if (m_items > 0) {
      --m_items;
    }
  }

private:
  static constexpr int CAPACITY{27 * 64};
  int m_items;
};

struct DemoTotals {
  uint64_t redstoneRan{0};
  uint64_t observerFires{0};
  uint64_t blockTicks{0};
  uint64_t explosionsApplied{0};
  uint64_t aiTicks{0};
  uint64_t goalSelections{0};
  uint64_t hopperTransfers{0};
  uint64_t mobsSpawned{0};
  std::atomic<uint64_t> entitiesTracked{0};
};

void runRedstone(PerformanceCore &core, int64_t tick, DemoTotals &totals) {
  RedstoneThrottler &throttler = core.getRedstoneThrottler();
  ScopedTiming timing(&core.getMonitor(), MonitorCategory::REDSTONE);

  // Dense clock packed into chunk (0, 0)
  for (int i = 0; i < CLOCK_UPDATES_PER_TICK; ++i) {
    const BlockPos block{i % 16, 64 + i / 256, (i / 16) % 16};
    const PositionKey chunk = block.chunk().pack();
    throttler.trackUpdate(chunk);
    if (throttler.shouldUpdate(chunk, block.pack(), tick)) {
      ++totals.redstoneRan;
    }
  }

  // A few updates in each of many quiet chunks
  for (int c = 1; c <= SPARSE_CHUNKS; ++c) {
    const BlockPos block{c * 16 + 3, 70, -c * 16 + 5};
    const PositionKey chunk = block.chunk().pack();
    for (int i = 0; i < 4; ++i) {
      throttler.trackUpdate(chunk);
      if (throttler.shouldUpdate(chunk, block.pack(), tick)) {
        ++totals.redstoneRan;
      }
    }
  }
}

void runBlockTicks(PerformanceCore &core, int64_t tick, DemoTotals &totals) {
  ObserverDebounce &debounce = core.getObserverDebounce();
  TickCoalescer &coalescer = core.getTickCoalescer();
  ScopedTiming timing(&core.getMonitor(), MonitorCategory::BLOCKS);

  for (int i = 0; i < OBSERVER_COUNT; ++i) {
    if (debounce.shouldFire(blockKey(i * 2, 65, 40), tick)) {
      ++totals.observerFires;
      // Each fire schedules a tick on its neighbour, observers chain in pairs
      if (coalescer.shouldTick(blockKey(i * 2 + 1, 65, 40))) {
        ++totals.blockTicks;
      }
      if (coalescer.shouldTick(blockKey((i ^ 1) * 2 + 1, 65, 40))) {
        ++totals.blockTicks;
      }
    }
  }
}

void runTnt(PerformanceCore &core, int64_t tick) {
  if (tick % TNT_INTERVAL != 0) {
    return;
  }
  ExplosionBatcher &batcher = core.getExplosionBatcher();
  // 4x4 cannon barrel, 0.3 blocks apart, plus one stray charge
  for (int x = 0; x < 4; ++x) {
    for (int z = 0; z < 4; ++z) {
      batcher.enqueue(200.0 + x * 0.3, 64.0, 200.0 + z * 0.3, 4.0f);
    }
  }
  batcher.enqueue(260.0, 64.0, 260.0, 4.0f);
}

void runEntities(PerformanceCore &core, int64_t tick, DemoTotals &totals) {
  EntityActivationGate &gate = core.getEntityActivationGate();
  EntityTrackerPool &tracker = core.getEntityTrackerPool();
  ScopedTiming timing(&core.getMonitor(), MonitorCategory::ENTITIES);

  constexpr double ACTIVATION_RANGE_SQ = 128.0 * 128.0;
  for (int id = 0; id < ENTITY_COUNT; ++id) {
    // Spread from right next to the player out to 200 blocks
    const double distance = static_cast<double>(id);
    const double distanceSq = distance * distance;

    if (gate.shouldTickAI(distanceSq, tick, id) &&
        gate.shouldTickBrain(distanceSq, tick, id, ACTIVATION_RANGE_SQ)) {
      ++totals.aiTicks;
    }
    if (!gate.shouldThrottleGoalSelector(id % 5 == 0, tick, id)) {
      ++totals.goalSelections;
    }

    const std::string type = (id % 50 == 0) ? "CitizensNPC" : "Zombie";
    tracker.submitForEntity(type, [&totals] {
      totals.entitiesTracked.fetch_add(1, std::memory_order_relaxed);
    });
  }
}

void runSpawning(PerformanceCore &core, int64_t tick, DemoTotals &totals) {
  if (tick % SPAWN_INTERVAL != 0) {
    return;
  }

  auto snapshot = std::make_shared<SpawnSnapshot>();
  snapshot->tick = tick;
  snapshot->chunkPopulation[ChunkPos{0, 0}.pack()] = 48;
  snapshot->chunkPopulation[ChunkPos{1, 0}.pack()] = 5;

  std::vector<SpawnRequest> requests;
  for (int i = 0; i < 8; ++i) {
    requests.push_back(SpawnRequest{"Zombie", BlockPos{i, 64, 3}});
    requests.push_back(SpawnRequest{"Skeleton", BlockPos{16 + i, 64, 3}});
  }

  core.getMobSpawnPool().submit(
      snapshot, std::move(requests),
      [&totals](const SpawnEvaluation &evaluation) {
        totals.mobsSpawned += evaluation.candidates.size();
      },
      [](const SpawnSnapshot &, const SpawnRequest &request) {
        return request.position.y > 0;
      });
}

void runHoppers(PerformanceCore &core, int64_t tick,
                std::vector<std::shared_ptr<DemoChest>> &chests, DemoTotals &totals) {
  CoreHopperCache &cache = core.getHopperCache();

  for (int i = 0; i < HOPPER_COUNT; ++i) {
    const PositionKey source = blockKey(i, 60, -10);
    if (cache.shouldSkipPull(source)) {
      continue;
    }

    std::shared_ptr<HopperContainer> container = cache.getContainer(source);
    if (!container) {
      container = chests[static_cast<size_t>(i)];
      cache.cacheContainer(source, container);
    }

    if (container->isEmpty()) {
      cache.markSourceEmpty(source);
      continue;
    }
    chests[static_cast<size_t>(i)]->take();
    ++totals.hopperTransfers;
  }

  // Refill one chest now and then so its hint gets cleared
  if (tick % 50 == 0) {
    const size_t refill = static_cast<size_t>((tick / 50) % HOPPER_COUNT);
    chests[refill] = std::make_shared<DemoChest>(32);
    cache.removeContainer(blockKey(static_cast<int>(refill), 60, -10));
  }
}

int64_t parseTicks(const char *arg) {
  try {
    const long long ticks = std::stoll(arg);
    return ticks > 0 ? ticks : DEFAULT_TICKS;
  } catch (const std::exception &) {
    DEMO_WARN("Invalid tick count '" + std::string(arg) + "', using " +
              std::to_string(DEFAULT_TICKS));
    return DEFAULT_TICKS;
  }
}

} // namespace

int main(int argc, char *argv[]) {
  int64_t totalTicks = DEFAULT_TICKS;
  std::string configPath = CONFIG_PATH;
  bool pacing = true;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--no-pacing") {
      pacing = false;
    } else if (arg == "--config" && i + 1 < argc) {
      configPath = argv[++i];
    } else {
      totalTicks = parseTicks(argv[i]);
    }
  }

  DEMO_INFO("Starting TickGuard demo for " + std::to_string(totalTicks) + " ticks");

  SettingsManager settings;
  if (!settings.loadFromFile(configPath)) {
    DEMO_WARN("Failed to load " + configPath + " - using defaults");
  } else {
    DEMO_INFO("Settings loaded from " + configPath);
  }

  PerformanceCore core;
  if (!core.init(CoreSettings::fromSettings(settings))) {
    DEMO_CRITICAL("PerformanceCore failed to initialize");
    return EXIT_FAILURE;
  }

  std::vector<std::shared_ptr<DemoChest>> chests;
  chests.reserve(HOPPER_COUNT);
  for (int i = 0; i < HOPPER_COUNT; ++i) {
    chests.push_back(std::make_shared<DemoChest>(i % 3 == 0 ? 0 : 16));
  }

  DemoTotals totals;
  TickClock clock(TickClock::DEFAULT_TPS, pacing);

  while (clock.getTick() < totalTicks) {
    const int64_t tick = clock.startTick();

    core.beginTick(tick);
    runRedstone(core, tick, totals);
    runBlockTicks(core, tick, totals);
    runTnt(core, tick);
    runEntities(core, tick, totals);
    runSpawning(core, tick, totals);
    runHoppers(core, tick, chests, totals);

    totals.explosionsApplied +=
        core.endTick([](double, double, double, float) {});

    clock.endTick();
  }

  const RedstoneThrottlerStats redstone = core.getRedstoneThrottler().getStats();
  const uint64_t batched = core.getExplosionBatcher().getBatchedCount();
  const uint64_t debounced = core.getObserverDebounce().getDebouncedCount();
  const uint64_t coalesced = core.getTickCoalescer().getCoalescedCount();
  const uint64_t syncTracked = core.getEntityTrackerPool().getSyncTrackedCount();

  core.shutdown();

  DEMO_INFO("Redstone: " + std::to_string(redstone.tracked) + " tracked, " +
            std::to_string(redstone.throttled) + " throttled, " +
            std::to_string(redstone.proceeded) + " ran");
  DEMO_INFO("Observers: " + std::to_string(totals.observerFires) + " fired, " +
            std::to_string(debounced) + " debounced; block ticks " +
            std::to_string(totals.blockTicks) + " ran, " + std::to_string(coalesced) +
            " coalesced");
  DEMO_INFO("Explosions: " + std::to_string(totals.explosionsApplied) + " applied, " +
            std::to_string(batched) + " merged");
  DEMO_INFO("Entities: " + std::to_string(totals.aiTicks) + " AI ticks, " +
            std::to_string(totals.goalSelections) + " goal selections, " +
            std::to_string(totals.entitiesTracked.load()) + " tracking updates (" +
            std::to_string(syncTracked) + " synchronous), " +
            std::to_string(totals.mobsSpawned) + " mobs spawned");
  DEMO_INFO("Hoppers: " + std::to_string(totals.hopperTransfers) + " transfers");
  DEMO_INFO("Average TPS " + formatFixed(clock.getCurrentTPS()) + ", " +
            std::to_string(clock.getOverrunCount()) + " overrun ticks");

  return EXIT_SUCCESS;
}
