/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace TickGuard {

/**
 * @brief Outcome of WorkerPool::submit
 */
enum class SubmitResult : uint8_t {
  Queued = 0,    // Accepted onto the bounded queue
  RanInline = 1, // Queue full, executed on the submitting thread
  Rejected = 2   // Pool shut down, task dropped and logged
};

/**
 * @brief Cumulative counters for one pool
 */
struct WorkerPoolStats {
  uint64_t queued{0};
  uint64_t ranInline{0};
  uint64_t completed{0};
  uint64_t failed{0};
  uint64_t cancelled{0};
  uint64_t rejected{0};
};

/**
 * @brief Fixed-size thread pool with a bounded FIFO queue
 *
 * Overflow policy is caller-runs: when the queue is at capacity the submitting
 * thread executes the task itself, so submission never blocks on pool
 * progress and never drops work while the pool is running.
 *
 * Lifecycle: construct, start(), submit(), shutdown(). Submitting before
 * start() throws std::logic_error. shutdown() is idempotent and also valid on
 * a pool that was never started; the destructor calls it.
 *
 * Tasks that need to stop early poll isCancellationRequested(). A task that
 * ignores the flag still runs to completion because threads are joined.
 */
class WorkerPool {
public:
  static constexpr std::chrono::milliseconds DEFAULT_SHUTDOWN_GRACE{5000};

  /**
   * @param name Pool name used for logging and worker thread names
   * @param numThreads Worker count, must be > 0
   * @param queueCapacity Maximum queued tasks, must be > 0
   * @throws std::invalid_argument on a zero thread count or capacity
   */
  WorkerPool(std::string name, size_t numThreads, size_t queueCapacity);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /**
   * @brief Spawns the worker threads. Calling start() twice has no effect.
   */
  void start();

  /**
   * @brief Hands a task to the pool
   * @throws std::logic_error if start() has not been called
   */
  SubmitResult submit(std::function<void()> task);

  /**
   * @brief Stops the pool
   *
   * Stops accepting work and waits up to grace for queued and in-flight tasks
   * to finish. Whatever is still queued after that is cancelled, the
   * cooperative cancellation flag is raised and the workers are joined.
   *
   * @return true if everything drained within the grace period
   */
  bool shutdown(std::chrono::milliseconds grace = DEFAULT_SHUTDOWN_GRACE);

  bool isRunning() const {
    return m_started.load(std::memory_order_acquire) &&
           !m_shutdown.load(std::memory_order_acquire);
  }

  bool isCancellationRequested() const {
    return m_cancelRequested.load(std::memory_order_acquire);
  }

  const std::string &getName() const { return m_name; }
  size_t getThreadCount() const { return m_threadCount; }
  size_t getQueueCapacity() const { return m_queueCapacity; }
  size_t getQueueSize() const;
  size_t getActiveTasks() const {
    return m_activeTasks.load(std::memory_order_relaxed);
  }

  WorkerPoolStats getStats() const;

private:
  void workerThread(size_t threadIndex);
  void runTask(std::function<void()> &task, const char *where);

  std::string m_name;
  size_t m_threadCount;
  size_t m_queueCapacity;

  std::vector<std::thread> m_workers{};
  std::deque<std::function<void()>> m_queue{};
  mutable std::mutex m_queueMutex{};
  std::condition_variable m_taskCondition{};
  std::condition_variable m_idleCondition{};

  std::atomic<bool> m_started{false};
  std::atomic<bool> m_shutdown{false};
  std::atomic<bool> m_cancelRequested{false};
  bool m_stopping{false}; // guarded by m_queueMutex
  std::atomic<size_t> m_activeTasks{0};

  std::atomic<uint64_t> m_queuedCount{0};
  std::atomic<uint64_t> m_inlineCount{0};
  std::atomic<uint64_t> m_completedCount{0};
  std::atomic<uint64_t> m_failedCount{0};
  std::atomic<uint64_t> m_cancelledCount{0};
  std::atomic<uint64_t> m_rejectedCount{0};
};

} // namespace TickGuard

#endif // WORKER_POOL_HPP
