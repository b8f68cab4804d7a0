/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/WorkerPool.hpp"
#include "core/Logger.hpp"

#include <stdexcept>

#if defined(__linux__) || defined(__APPLE__)
#include <pthread.h>
#endif

namespace TickGuard {

namespace {
// Tasks slower than this get a warning, they stall the pool for everyone
constexpr int64_t SLOW_TASK_MS = 100;
} // namespace

WorkerPool::WorkerPool(std::string name, size_t numThreads, size_t queueCapacity)
    : m_name(std::move(name)), m_threadCount(numThreads),
      m_queueCapacity(queueCapacity) {
  if (m_threadCount == 0) {
    throw std::invalid_argument(m_name + ": thread count must be positive");
  }
  if (m_queueCapacity == 0) {
    throw std::invalid_argument(m_name + ": queue capacity must be positive");
  }
}

WorkerPool::~WorkerPool() { shutdown(); }

void WorkerPool::start() {
  if (m_shutdown.load(std::memory_order_acquire)) {
    WORKERPOOL_WARN(m_name + " cannot be restarted after shutdown");
    return;
  }

  bool expected = false;
  if (!m_started.compare_exchange_strong(expected, true,
                                         std::memory_order_acq_rel)) {
    return;
  }

  m_workers.reserve(m_threadCount);
  for (size_t i = 0; i < m_threadCount; ++i) {
    m_workers.emplace_back([this, i] {
#if defined(__linux__) || defined(__APPLE__)
      // Thread names are capped at 15 characters on Linux
      std::string threadName = m_name + "-" + std::to_string(i);
      if (threadName.size() > 15) {
        threadName = threadName.substr(threadName.size() - 15);
      }
#if defined(__APPLE__)
      pthread_setname_np(threadName.c_str());
#else
      pthread_setname_np(pthread_self(), threadName.c_str());
#endif
#endif
      workerThread(i);
    });
  }

  WORKERPOOL_INFO(m_name + " started with " + std::to_string(m_threadCount) +
                  " threads, queue capacity " +
                  std::to_string(m_queueCapacity));
}

SubmitResult WorkerPool::submit(std::function<void()> task) {
  if (!task) {
    throw std::invalid_argument(m_name + ": empty task submitted");
  }

  if (m_shutdown.load(std::memory_order_acquire)) {
    m_rejectedCount.fetch_add(1, std::memory_order_relaxed);
    WORKERPOOL_WARN(m_name + " rejected a task after shutdown");
    return SubmitResult::Rejected;
  }

  if (!m_started.load(std::memory_order_acquire)) {
    throw std::logic_error(m_name + ": submit() called before start()");
  }

  {
    std::unique_lock<std::mutex> lock(m_queueMutex);
    if (m_stopping || m_shutdown.load(std::memory_order_acquire)) {
      lock.unlock();
      m_rejectedCount.fetch_add(1, std::memory_order_relaxed);
      WORKERPOOL_WARN(m_name + " rejected a task after shutdown");
      return SubmitResult::Rejected;
    }

    if (m_queue.size() < m_queueCapacity) {
      m_queue.push_back(std::move(task));
      m_queuedCount.fetch_add(1, std::memory_order_relaxed);
      lock.unlock();
      m_taskCondition.notify_one();
      return SubmitResult::Queued;
    }
  }

  // Queue full: caller runs
  m_inlineCount.fetch_add(1, std::memory_order_relaxed);
  runTask(task, "caller");
  return SubmitResult::RanInline;
}

bool WorkerPool::shutdown(std::chrono::milliseconds grace) {
  bool expected = false;
  if (!m_shutdown.compare_exchange_strong(expected, true,
                                          std::memory_order_acq_rel)) {
    return true;
  }

  if (!m_started.load(std::memory_order_acquire)) {
    WORKERPOOL_DEBUG(m_name + " shut down before it was started");
    return true;
  }

  bool drained = true;
  size_t cancelled = 0;
  {
    std::unique_lock<std::mutex> lock(m_queueMutex);
    drained = m_idleCondition.wait_for(lock, grace, [this] {
      return m_queue.empty() &&
             m_activeTasks.load(std::memory_order_relaxed) == 0;
    });

    if (!drained) {
      cancelled = m_queue.size();
      m_queue.clear();
      m_cancelRequested.store(true, std::memory_order_release);
    }
    m_stopping = true;
  }
  m_taskCondition.notify_all();

  if (cancelled > 0) {
    m_cancelledCount.fetch_add(cancelled, std::memory_order_relaxed);
  }
  if (!drained) {
    WORKERPOOL_WARN(m_name + " did not drain within " +
                    std::to_string(grace.count()) + "ms, cancelled " +
                    std::to_string(cancelled) +
                    " queued tasks and requested cancellation of running ones");
  }

  for (auto &worker : m_workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  m_workers.clear();

  WORKERPOOL_INFO(m_name + " shutdown completed (" +
                  std::to_string(m_completedCount.load(std::memory_order_relaxed)) +
                  " tasks completed)");
  return drained;
}

size_t WorkerPool::getQueueSize() const {
  std::lock_guard<std::mutex> lock(m_queueMutex);
  return m_queue.size();
}

WorkerPoolStats WorkerPool::getStats() const {
  WorkerPoolStats stats;
  stats.queued = m_queuedCount.load(std::memory_order_relaxed);
  stats.ranInline = m_inlineCount.load(std::memory_order_relaxed);
  stats.completed = m_completedCount.load(std::memory_order_relaxed);
  stats.failed = m_failedCount.load(std::memory_order_relaxed);
  stats.cancelled = m_cancelledCount.load(std::memory_order_relaxed);
  stats.rejected = m_rejectedCount.load(std::memory_order_relaxed);
  return stats;
}

void WorkerPool::runTask(std::function<void()> &task, const char *where) {
  auto taskStart = std::chrono::steady_clock::now();

  try {
    task();
    m_completedCount.fetch_add(1, std::memory_order_relaxed);
  } catch (const std::exception &e) {
    m_failedCount.fetch_add(1, std::memory_order_relaxed);
    WORKERPOOL_ERROR(m_name + " task failed on " + where + ": " +
                     std::string(e.what()));
  } catch (...) {
    m_failedCount.fetch_add(1, std::memory_order_relaxed);
    WORKERPOOL_ERROR(m_name + " task failed on " + where +
                     " with a non-standard exception");
  }

  auto taskMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - taskStart)
                    .count();
  if (taskMs > SLOW_TASK_MS) {
    WORKERPOOL_WARN(m_name + " slow task on " + where + ": " +
                    std::to_string(taskMs) + "ms");
  }

  task = nullptr;
}

void WorkerPool::workerThread(size_t threadIndex) {
  const std::string where = "worker " + std::to_string(threadIndex);

  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(m_queueMutex);
      m_taskCondition.wait(lock,
                           [this] { return m_stopping || !m_queue.empty(); });

      if (m_queue.empty()) {
        break; // stopping with nothing left
      }

      task = std::move(m_queue.front());
      m_queue.pop_front();
      m_activeTasks.fetch_add(1, std::memory_order_relaxed);
    }

    runTask(task, where.c_str());

    {
      std::lock_guard<std::mutex> lock(m_queueMutex);
      m_activeTasks.fetch_sub(1, std::memory_order_relaxed);
    }
    m_idleCondition.notify_all();
  }

  WORKERPOOL_DEBUG(m_name + " " + where + " exiting");
}

} // namespace TickGuard
