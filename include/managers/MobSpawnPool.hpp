/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOB_SPAWN_POOL_HPP
#define MOB_SPAWN_POOL_HPP

#include "core/PositionKey.hpp"
#include "core/WorkerPool.hpp"

#include <boost/container/flat_map.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace TickGuard {

class PerformanceMonitor;

struct MobSpawnConfig {
  bool enabled{true};
  int threads{0}; // 0 = 1 thread, otherwise clamped to [1, 2]
  size_t queueCapacity{1024};
  int maxPerChunk{50};
  int shutdownGraceMs{5000};
};

/**
 * @brief Read-only world state captured on the main thread for one evaluation
 *
 * Shared between the submitting thread and a worker, never mutated after
 * submission.
 */
struct SpawnSnapshot {
  int64_t tick{0};
  boost::container::flat_map<PositionKey, int> chunkPopulation{};
};

struct SpawnRequest {
  std::string mobType{};
  BlockPos position{};
};

struct SpawnCandidate {
  std::string mobType{};
  BlockPos position{};
};

/**
 * @brief Phase-1 result handed to phase 2
 */
struct SpawnEvaluation {
  uint64_t id{0};
  int64_t tick{0};
  std::vector<SpawnCandidate> candidates{};
  size_t rejectedByCap{0};
  size_t rejectedByFilter{0};
};

/**
 * @brief Two-phase mob spawn evaluation
 *
 * Phase 1 runs on a pool thread against an immutable SpawnSnapshot and
 * decides which requested spawns are allowed: the host's optional filter
 * must accept the request and the chunk must stay under maxPerChunk.
 * Phase 2 applies the result to the world and runs only on the thread that
 * calls drainCompleted(), after phase 1 of the same evaluation finished.
 */
class MobSpawnPool {
public:
  using SpawnFilter = std::function<bool(const SpawnSnapshot &, const SpawnRequest &)>;
  using ApplyFn = std::function<void(const SpawnEvaluation &)>;

  explicit MobSpawnPool(const MobSpawnConfig &config,
                        PerformanceMonitor *monitor = nullptr);
  ~MobSpawnPool();

  MobSpawnPool(const MobSpawnPool &) = delete;
  MobSpawnPool &operator=(const MobSpawnPool &) = delete;

  static size_t resolveThreadCount(int threadOverride);

  void start();

  /**
   * @brief Queues phase 1 for the given requests
   * @return Evaluation id passed back in SpawnEvaluation::id
   */
  uint64_t submit(std::shared_ptr<const SpawnSnapshot> snapshot,
                  std::vector<SpawnRequest> requests, ApplyFn applyFn,
                  SpawnFilter filter = {});

  /**
   * @brief Runs phase 2 for every evaluation whose phase 1 has finished
   * @return Number of evaluations applied
   */
  size_t drainCompleted();

  /**
   * @brief Evaluations submitted but not yet applied
   */
  size_t getPendingCount() const {
    return m_pending.load(std::memory_order_acquire);
  }

  bool shutdown();

  bool isEnabled() const { return m_config.enabled; }
  size_t getThreadCount() const { return m_pool ? m_pool->getThreadCount() : 0; }
  WorkerPoolStats getPoolStats() const {
    return m_pool ? m_pool->getStats() : WorkerPoolStats{};
  }
  const MobSpawnConfig &getConfig() const { return m_config; }

private:
  struct Completed {
    SpawnEvaluation evaluation;
    ApplyFn applyFn;
  };

  void evaluate(uint64_t id, const SpawnSnapshot &snapshot,
                const std::vector<SpawnRequest> &requests, ApplyFn &applyFn,
                const SpawnFilter &filter);

  MobSpawnConfig m_config;
  PerformanceMonitor *m_monitor;
  std::unique_ptr<WorkerPool> m_pool{};

  std::mutex m_completedMutex{};
  std::deque<Completed> m_completed{};
  std::atomic<uint64_t> m_nextId{1};
  std::atomic<size_t> m_pending{0};
};

} // namespace TickGuard

#endif // MOB_SPAWN_POOL_HPP
