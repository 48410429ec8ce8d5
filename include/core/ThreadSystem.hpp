/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 *
 * Thread System: worker pool that runs queued REST actions and other
 * background client work
 */

#ifndef THREAD_SYSTEM_HPP
#define THREAD_SYSTEM_HPP

#include "core/Logger.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <format>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#if defined(__linux__) || defined(__APPLE__) || defined(_GNU_SOURCE)
#include <pthread.h>
#endif

namespace Chorus {

enum class TaskPriority {
  High = 0,   // Completion callbacks, anything a caller is blocked on
  Normal = 1, // Default for queued REST actions
  Low = 2     // Cache maintenance and other background work
};

constexpr size_t TASK_PRIORITY_COUNT = 3;

struct PrioritizedTask {
  std::function<void()> task;
  std::chrono::steady_clock::time_point enqueueTime;
  std::string description;
  std::function<void()> onCancel; // Runs instead of task if it is never popped

  PrioritizedTask(std::function<void()> t, std::string desc,
                  std::function<void()> cancel = nullptr)
      : task(std::move(t)), enqueueTime(std::chrono::steady_clock::now()),
        description(std::move(desc)), onCancel(std::move(cancel)) {}
};

/**
 * @brief Blocking task queue with one FIFO per priority level
 *
 * Workers always drain higher priorities first; order within a priority is
 * submission order. Every pushed task either runs or, if it is still queued
 * when stop() is called, has its cancel hook run on the stopping thread.
 */
class TaskQueue {
public:
  explicit TaskQueue(size_t capacityHint = 256) : m_capacityHint(capacityHint) {}

  void push(std::function<void()> task, TaskPriority priority,
            std::string description, std::function<void()> onCancel = nullptr) {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_queues[static_cast<size_t>(priority)].emplace_back(
          std::move(task), std::move(description), std::move(onCancel));
      m_size.fetch_add(1, std::memory_order_relaxed);
      m_totalEnqueued.fetch_add(1, std::memory_order_relaxed);
    }
    m_condition.notify_one();
  }

  // Blocks until a task is available or the queue is stopped
  bool pop(std::function<void()> &task) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_condition.wait(lock, [this] {
      return m_stopping.load(std::memory_order_acquire) ||
             m_size.load(std::memory_order_relaxed) > 0;
    });

    if (m_stopping.load(std::memory_order_acquire)) {
      return false;
    }

    for (auto &queue : m_queues) {
      if (queue.empty()) {
        continue;
      }
      PrioritizedTask next = std::move(queue.front());
      queue.pop_front();
      m_size.fetch_sub(1, std::memory_order_relaxed);

      const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - next.enqueueTime)
                              .count();
      if (waited > 100 && !next.description.empty()) {
        THREADSYSTEM_WARN(std::format("Task '{}' waited {}ms in queue",
                                      next.description, waited));
      }

      task = std::move(next.task);
      return true;
    }
    return false;
  }

  // Wakes all workers and cancels every task that was never popped
  void stop() {
    std::vector<PrioritizedTask> canceled;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_stopping.store(true, std::memory_order_release);
      for (auto &queue : m_queues) {
        for (auto &pending : queue) {
          canceled.push_back(std::move(pending));
        }
        queue.clear();
      }
      m_size.store(0, std::memory_order_relaxed);
    }
    m_condition.notify_all();

    for (auto &pending : canceled) {
      if (!pending.onCancel) {
        continue;
      }
      try {
        pending.onCancel();
      } catch (const std::exception &e) {
        THREADSYSTEM_ERROR(std::format("Cancel hook for '{}' threw: {}",
                                       pending.description, e.what()));
      }
    }
  }

  size_t size() const { return m_size.load(std::memory_order_relaxed); }
  bool isEmpty() const { return size() == 0; }
  size_t capacity() const { return m_capacityHint; }
  size_t getTotalEnqueued() const {
    return m_totalEnqueued.load(std::memory_order_relaxed);
  }

private:
  std::array<std::deque<PrioritizedTask>, TASK_PRIORITY_COUNT> m_queues{};
  mutable std::mutex m_mutex{};
  std::condition_variable m_condition{};
  std::atomic<bool> m_stopping{false};
  std::atomic<size_t> m_size{0};
  std::atomic<size_t> m_totalEnqueued{0};
  size_t m_capacityHint;
};

class ThreadPool {
public:
  ThreadPool(size_t numThreads, size_t queueCapacity)
      : m_taskQueue(queueCapacity) {
    m_workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
      m_workers.emplace_back([this, i] {
#if defined(__linux__) || defined(_GNU_SOURCE)
        std::string threadName = std::format("ChorusWorker-{}", i);
        pthread_setname_np(pthread_self(), threadName.c_str());
#elif defined(__APPLE__)
        std::string threadName = std::format("ChorusWorker-{}", i);
        pthread_setname_np(threadName.c_str());
#endif
        workerThread(i);
      });
    }
  }

  ~ThreadPool() {
    m_taskQueue.stop();
    for (auto &worker : m_workers) {
      if (worker.joinable()) {
        worker.join();
      }
    }
    THREADSYSTEM_INFO("ThreadPool shutdown completed");
  }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  void enqueue(std::function<void()> task, TaskPriority priority,
               std::string description, std::function<void()> onCancel) {
    m_taskQueue.push(std::move(task), priority, std::move(description),
                     std::move(onCancel));
  }

  bool busy() const {
    return !m_taskQueue.isEmpty() ||
           m_activeTasks.load(std::memory_order_relaxed) > 0;
  }

  const TaskQueue &getTaskQueue() const { return m_taskQueue; }

  size_t getTotalTasksProcessed() const {
    return m_totalProcessed.load(std::memory_order_relaxed);
  }

private:
  std::vector<std::thread> m_workers;
  TaskQueue m_taskQueue;
  std::atomic<size_t> m_activeTasks{0};
  std::atomic<size_t> m_totalProcessed{0};

  void workerThread(size_t threadIndex) {
    std::function<void()> task;
    size_t processed = 0;

    while (m_taskQueue.pop(task)) {
      m_activeTasks.fetch_add(1, std::memory_order_relaxed);
      const auto start = std::chrono::steady_clock::now();

      try {
        task();
        ++processed;
      } catch (const std::exception &e) {
        THREADSYSTEM_ERROR(std::format("Error in worker thread {}: {}",
                                       threadIndex, e.what()));
      }

      const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - start)
                                .count();
      if (duration > 100) {
        THREADSYSTEM_WARN(std::format("Worker {} - Slow task: {}ms",
                                      threadIndex, duration));
      }

      task = nullptr;
      m_totalProcessed.fetch_add(1, std::memory_order_relaxed);
      m_activeTasks.fetch_sub(1, std::memory_order_relaxed);
    }

    THREADSYSTEM_DEBUG(std::format("Worker {} exiting after processing {} tasks",
                                   threadIndex, processed));
    (void)processed;
  }
};

/**
 * @brief Process-wide worker pool singleton
 *
 * Usage:
 *   ThreadSystem::Instance().init();
 *   ThreadSystem::Instance().enqueueTask([] { ... });
 *   ThreadSystem::Instance().clean();
 *
 * Once clean() has run the system cannot be initialized again.
 */
class ThreadSystem {
public:
  static constexpr size_t DEFAULT_QUEUE_CAPACITY = 1024;

  static ThreadSystem &Instance() {
    static ThreadSystem instance;
    return instance;
  }

  static bool Exists() { return Instance().isInitialized(); }

  /**
   * @brief Starts the worker pool
   * @param queueCapacity Capacity hint for the task queue
   * @param customThreadCount Worker count, 0 picks hardware_concurrency - 1
   * @return true if the pool is running after the call
   */
  bool init(size_t queueCapacity = DEFAULT_QUEUE_CAPACITY,
            unsigned int customThreadCount = 0) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_isShutdown.load(std::memory_order_acquire)) {
      THREADSYSTEM_WARN("ThreadSystem already shut down, ignoring init request");
      return false;
    }
    if (m_threadPool) {
      return true;
    }

    if (customThreadCount > 0) {
      m_numThreads = customThreadCount;
    } else {
      const unsigned int hardwareThreads = std::thread::hardware_concurrency();
      m_numThreads = (hardwareThreads > 1) ? (hardwareThreads - 1) : 1;
    }
    m_queueCapacity = queueCapacity;

    try {
      m_threadPool = std::make_unique<ThreadPool>(m_numThreads, m_queueCapacity);
    } catch (const std::system_error &e) {
      THREADSYSTEM_ERROR(std::format("Failed to initialize ThreadSystem: {}", e.what()));
      return false;
    }

    THREADSYSTEM_INFO(std::format("ThreadSystem initialized with {} worker threads",
                                  m_numThreads));
    return true;
  }

  void clean() {
    std::unique_ptr<ThreadPool> pool;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_isShutdown.store(true, std::memory_order_release);
      pool = std::move(m_threadPool);
    }

    if (pool) {
      const size_t pending = pool->getTaskQueue().size();
      if (pending > 0) {
        THREADSYSTEM_INFO(std::format("Canceling {} pending tasks during shutdown", pending));
      }
      pool.reset();
      THREADSYSTEM_INFO("ThreadSystem resources cleaned!");
    }
  }

  ~ThreadSystem() { clean(); }

  /**
   * @brief Queues a task for a worker thread
   * @param onCancel Runs on the thread calling clean() if the task is still
   *        queued at shutdown
   * @return false if the pool is not running; neither task nor onCancel runs
   */
  bool enqueueTask(std::function<void()> task,
                   TaskPriority priority = TaskPriority::Normal,
                   std::string description = "",
                   std::function<void()> onCancel = nullptr) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_threadPool) {
      THREADSYSTEM_DEBUG("Ignoring task, ThreadSystem not running" +
                         (description.empty() ? "" : " (" + description + ")"));
      return false;
    }
    m_threadPool->enqueue(std::move(task), priority, std::move(description),
                          std::move(onCancel));
    return true;
  }

  /**
   * @brief Queues a task and returns a future for its result
   * @throws std::runtime_error if the pool is not running
   */
  template <class F>
  auto enqueueTaskWithResult(F &&f, TaskPriority priority = TaskPriority::Normal,
                             std::string description = "")
      -> std::future<std::invoke_result_t<F>> {
    using ResultType = std::invoke_result_t<F>;

    auto task = std::make_shared<std::packaged_task<ResultType()>>(std::forward<F>(f));
    std::future<ResultType> result = task->get_future();

    if (!enqueueTask([task]() { (*task)(); }, priority, std::move(description))) {
      throw std::runtime_error("ThreadSystem is not running");
    }
    return result;
  }

  bool isInitialized() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool != nullptr;
  }

  bool isShutdown() const { return m_isShutdown.load(std::memory_order_acquire); }

  bool isBusy() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool && m_threadPool->busy();
  }

  unsigned int getThreadCount() const { return m_numThreads; }

  size_t getQueueCapacity() const { return m_queueCapacity; }

  size_t getTotalTasksProcessed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool ? m_threadPool->getTotalTasksProcessed() : 0;
  }

private:
  std::unique_ptr<ThreadPool> m_threadPool{nullptr};
  unsigned int m_numThreads{0};
  size_t m_queueCapacity{DEFAULT_QUEUE_CAPACITY};
  std::atomic<bool> m_isShutdown{false};
  mutable std::mutex m_mutex{};

  ThreadSystem(const ThreadSystem &) = delete;
  ThreadSystem &operator=(const ThreadSystem &) = delete;

  ThreadSystem() = default;
};

} // namespace Chorus

#endif // THREAD_SYSTEM_HPP
