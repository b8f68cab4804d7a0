/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/MobSpawnPool.hpp"
#include "core/Logger.hpp"
#include "utils/PerformanceMonitor.hpp"

#include <algorithm>
#include <stdexcept>

namespace TickGuard {

namespace {

// A throwing filter rejects the request instead of losing the evaluation
bool passesFilter(const MobSpawnPool::SpawnFilter &filter, const SpawnSnapshot &snapshot,
                  const SpawnRequest &request) {
  try {
    return filter(snapshot, request);
  } catch (const std::exception &e) {
    SPAWNER_ERROR("Spawn filter threw for " + request.mobType + ": " +
                  std::string(e.what()));
    return false;
  } catch (...) {
    SPAWNER_ERROR("Spawn filter threw a non-standard exception for " + request.mobType);
    return false;
  }
}

} // namespace

MobSpawnPool::MobSpawnPool(const MobSpawnConfig &config, PerformanceMonitor *monitor)
    : m_config(config), m_monitor(monitor) {
  if (m_config.threads < 0) {
    throw std::invalid_argument("mob spawn thread count must be >= 0");
  }
  if (m_config.queueCapacity == 0) {
    throw std::invalid_argument("mob spawn queue capacity must be positive");
  }
  if (m_config.maxPerChunk < 0) {
    throw std::invalid_argument("mob spawn max per chunk must be >= 0");
  }
  if (m_config.shutdownGraceMs < 0) {
    throw std::invalid_argument("mob spawn shutdown grace must be >= 0");
  }

  if (!m_config.enabled) {
    SPAWNER_INFO("Async mob spawning is disabled");
    return;
  }

  m_pool = std::make_unique<WorkerPool>("Spawner", resolveThreadCount(m_config.threads),
                                        m_config.queueCapacity);
}

MobSpawnPool::~MobSpawnPool() { shutdown(); }

size_t MobSpawnPool::resolveThreadCount(int threadOverride) {
  return static_cast<size_t>(std::clamp(threadOverride, 1, 2));
}

void MobSpawnPool::start() {
  if (!m_pool) {
    return;
  }
  m_pool->start();
  SPAWNER_INFO("Async mob spawner initialized with " +
               std::to_string(m_pool->getThreadCount()) + " threads");
}

uint64_t MobSpawnPool::submit(std::shared_ptr<const SpawnSnapshot> snapshot,
                              std::vector<SpawnRequest> requests, ApplyFn applyFn,
                              SpawnFilter filter) {
  if (!snapshot) {
    throw std::invalid_argument("mob spawn evaluation needs a snapshot");
  }
  if (!applyFn) {
    throw std::invalid_argument("mob spawn evaluation needs an apply function");
  }

  const uint64_t id = m_nextId.fetch_add(1, std::memory_order_relaxed);
  m_pending.fetch_add(1, std::memory_order_acq_rel);

  if (!m_pool) {
    // Disabled: phase 1 on the caller, phase 2 still waits for drainCompleted()
    evaluate(id, *snapshot, requests, applyFn, filter);
    return id;
  }

  SubmitResult result = SubmitResult::Rejected;
  try {
    result = m_pool->submit(
        [this, id, snapshot = std::move(snapshot), requests = std::move(requests),
         applyFn = std::move(applyFn), filter = std::move(filter)]() mutable {
          evaluate(id, *snapshot, requests, applyFn, filter);
        });
  } catch (const std::logic_error &) {
    // Not started yet
    m_pending.fetch_sub(1, std::memory_order_acq_rel);
    throw;
  }

  if (result == SubmitResult::RanInline && m_monitor) {
    m_monitor->increment(MonitorCategory::MOB_SPAWN_INLINE);
  } else if (result == SubmitResult::Rejected) {
    m_pending.fetch_sub(1, std::memory_order_acq_rel);
  }
  return id;
}

void MobSpawnPool::evaluate(uint64_t id, const SpawnSnapshot &snapshot,
                            const std::vector<SpawnRequest> &requests,
                            ApplyFn &applyFn, const SpawnFilter &filter) {
  ScopedTiming timing(m_monitor, MonitorCategory::MOB_SPAWNING);

  SpawnEvaluation evaluation;
  evaluation.id = id;
  evaluation.tick = snapshot.tick;
  evaluation.candidates.reserve(requests.size());

  // Counts accepted in this evaluation on top of the snapshot's population
  boost::container::flat_map<PositionKey, int> accepted;

  for (const auto &request : requests) {
    if (m_pool && m_pool->isCancellationRequested()) {
      SPAWNER_DEBUG("Evaluation " + std::to_string(id) + " abandoned on shutdown");
      m_pending.fetch_sub(1, std::memory_order_acq_rel);
      return;
    }

    if (filter && !passesFilter(filter, snapshot, request)) {
      ++evaluation.rejectedByFilter;
      continue;
    }

    const PositionKey chunk = request.position.chunk().pack();
    auto existing = snapshot.chunkPopulation.find(chunk);
    const int population =
        existing != snapshot.chunkPopulation.end() ? existing->second : 0;

    int &acceptedHere = accepted[chunk];
    if (population + acceptedHere >= m_config.maxPerChunk) {
      ++evaluation.rejectedByCap;
      continue;
    }

    ++acceptedHere;
    evaluation.candidates.push_back(SpawnCandidate{request.mobType, request.position});
  }

  std::lock_guard<std::mutex> lock(m_completedMutex);
  m_completed.push_back(Completed{std::move(evaluation), std::move(applyFn)});
}

size_t MobSpawnPool::drainCompleted() {
  std::deque<Completed> ready;
  {
    std::lock_guard<std::mutex> lock(m_completedMutex);
    ready.swap(m_completed);
  }

  size_t applied = 0;
  for (auto &entry : ready) {
    m_pending.fetch_sub(1, std::memory_order_acq_rel);
    try {
      entry.applyFn(entry.evaluation);
      ++applied;
    } catch (const std::exception &e) {
      SPAWNER_ERROR("Spawn apply for evaluation " +
                    std::to_string(entry.evaluation.id) +
                    " failed: " + std::string(e.what()));
    } catch (...) {
      SPAWNER_ERROR("Spawn apply for evaluation " +
                    std::to_string(entry.evaluation.id) +
                    " failed with a non-standard exception");
    }
  }
  return applied;
}

bool MobSpawnPool::shutdown() {
  if (!m_pool) {
    return true;
  }
  const uint64_t cancelledBefore = m_pool->getStats().cancelled;
  const bool drained =
      m_pool->shutdown(std::chrono::milliseconds(m_config.shutdownGraceMs));

  // Cancelled evaluations never reach the completed queue
  const uint64_t cancelled = m_pool->getStats().cancelled - cancelledBefore;
  if (cancelled > 0) {
    m_pending.fetch_sub(static_cast<size_t>(cancelled), std::memory_order_acq_rel);
    SPAWNER_WARN(std::to_string(cancelled) + " spawn evaluations cancelled on shutdown");
  }
  return drained;
}

} // namespace TickGuard
