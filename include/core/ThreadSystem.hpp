/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 *
 * Thread System: shared worker pool used by parallel generation dispatch
 */

#ifndef THREAD_SYSTEM_HPP
#define THREAD_SYSTEM_HPP

#include "Logger.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
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

namespace GridForge {

// Task priority levels
enum class TaskPriority {
  Critical = 0, // Must execute ASAP (generation dispatch batches)
  High = 1,     // Work the caller is blocked on
  Normal = 2,   // Default priority for most tasks
  Low = 3,      // Background tasks
  Idle = 4      // Only execute when nothing else is pending
};

inline constexpr size_t TASK_PRIORITY_COUNT = 5;

struct PrioritizedTask {
  std::function<void()> task;
  TaskPriority priority{TaskPriority::Normal};
  std::chrono::steady_clock::time_point enqueueTime{
      std::chrono::steady_clock::now()};
  std::string description;

  PrioritizedTask() = default;

  PrioritizedTask(std::function<void()> t, TaskPriority p,
                  std::string desc = "")
      : task(std::move(t)), priority(p),
        enqueueTime(std::chrono::steady_clock::now()),
        description(std::move(desc)) {}
};

/**
 * @brief Thread-safe task queue with one FIFO deque per priority level
 *
 * Workers always drain the highest non-empty priority first; tasks of the
 * same priority run in submission order.
 */
class TaskQueue {
public:
  explicit TaskQueue(bool enableProfiling = false)
      : m_enableProfiling(enableProfiling) {}

  void push(std::function<void()> task,
            TaskPriority priority = TaskPriority::Normal,
            const std::string &description = "") {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_queues[static_cast<size_t>(priority)].emplace_back(
          std::move(task), priority, description);
      ++m_size;
      ++m_totalEnqueued;
    }
    m_condition.notify_one();
  }

  // Single lock acquisition for the whole batch
  void batchPush(std::vector<std::function<void()>> &tasks,
                 TaskPriority priority = TaskPriority::Normal,
                 const std::string &description = "") {
    if (tasks.empty()) {
      return;
    }
    const size_t batchSize = tasks.size();
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      auto &queue = m_queues[static_cast<size_t>(priority)];
      for (auto &task : tasks) {
        queue.emplace_back(std::move(task), priority, description);
      }
      m_size += batchSize;
      m_totalEnqueued += batchSize;
    }
    tasks.clear();

    if (m_enableProfiling && !description.empty()) {
      THREADSYSTEM_DEBUG("Batch enqueued " + std::to_string(batchSize) +
                         " tasks: " + description);
    }

    if (batchSize > 1) {
      m_condition.notify_all();
    } else {
      m_condition.notify_one();
    }
  }

  // Blocks until a task is available or the queue is stopped
  bool pop(std::function<void()> &task) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_condition.wait(lock, [this] { return m_stopping || m_size > 0; });
    if (m_stopping) {
      return false;
    }

    for (auto &queue : m_queues) {
      if (queue.empty()) {
        continue;
      }
      PrioritizedTask next = std::move(queue.front());
      queue.pop_front();
      --m_size;

      if (m_enableProfiling && next.priority <= TaskPriority::High) {
        const auto waitMs =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - next.enqueueTime)
                .count();
        if (waitMs > 100 && !next.description.empty()) {
          THREADSYSTEM_WARN("High priority task delayed: " +
                            next.description + " waited " +
                            std::to_string(waitMs) + "ms");
        }
      }

      task = std::move(next.task);
      return true;
    }
    return false;
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_stopping = true;
      for (auto &queue : m_queues) {
        queue.clear();
      }
      m_size = 0;
    }
    m_condition.notify_all();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_size;
  }

  bool isEmpty() const { return size() == 0; }

  size_t getTotalTasksEnqueued() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_totalEnqueued;
  }

private:
  std::array<std::deque<PrioritizedTask>, TASK_PRIORITY_COUNT> m_queues{};
  mutable std::mutex m_mutex{};
  std::condition_variable m_condition{};
  size_t m_size{0};
  size_t m_totalEnqueued{0};
  bool m_stopping{false};
  bool m_enableProfiling{false};
};

class ThreadPool {
public:
  explicit ThreadPool(size_t numThreads, bool enableProfiling = false)
      : m_taskQueue(enableProfiling) {
    m_workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
      m_workers.emplace_back([this, i] {
#if defined(__linux__) || defined(_GNU_SOURCE)
        std::string threadName = "Worker-" + std::to_string(i);
        pthread_setname_np(pthread_self(), threadName.c_str());
#elif defined(__APPLE__)
        std::string threadName = "Worker-" + std::to_string(i);
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

  void enqueue(std::function<void()> task,
               TaskPriority priority = TaskPriority::Normal,
               const std::string &description = "") {
    m_taskQueue.push(std::move(task), priority, description);
  }

  void batchEnqueue(std::vector<std::function<void()>> &tasks,
                    TaskPriority priority = TaskPriority::Normal,
                    const std::string &description = "") {
    m_taskQueue.batchPush(tasks, priority, description);
  }

  template <class F, class... Args>
  auto enqueueWithResult(F &&f, TaskPriority priority = TaskPriority::Normal,
                         const std::string &description = "", Args &&...args)
      -> std::future<std::invoke_result_t<F, Args...>> {
    using return_type = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    std::future<return_type> result = task->get_future();
    enqueue([task]() { (*task)(); }, priority, description);
    return result;
  }

  bool busy() const {
    return !m_taskQueue.isEmpty() ||
           m_activeTasks.load(std::memory_order_relaxed) > 0;
  }

  size_t getThreadCount() const { return m_workers.size(); }
  const TaskQueue &getTaskQueue() const { return m_taskQueue; }

  size_t getTotalTasksProcessed() const {
    return m_totalTasksProcessed.load(std::memory_order_relaxed);
  }

private:
  std::vector<std::thread> m_workers;
  TaskQueue m_taskQueue;
  std::atomic<size_t> m_activeTasks{0};
  std::atomic<size_t> m_totalTasksProcessed{0};

  void workerThread(size_t threadIndex) {
    std::function<void()> task;
    size_t tasksProcessed = 0;

    while (m_taskQueue.pop(task)) {
      m_activeTasks.fetch_add(1, std::memory_order_relaxed);
      try {
        task();
        ++tasksProcessed;
        m_totalTasksProcessed.fetch_add(1, std::memory_order_relaxed);
      } catch (const std::exception &e) {
        THREADSYSTEM_ERROR("Error in worker thread " +
                           std::to_string(threadIndex) + ": " + e.what());
      } catch (...) {
        THREADSYSTEM_ERROR("Unknown error in worker thread " +
                           std::to_string(threadIndex));
      }
      m_activeTasks.fetch_sub(1, std::memory_order_relaxed);
      task = nullptr;
    }

    THREADSYSTEM_DEBUG("Worker " + std::to_string(threadIndex) +
                       " exiting after processing " +
                       std::to_string(tasksProcessed) + " tasks");
    (void)tasksProcessed;
  }
};

// Singleton Thread System Manager
class ThreadSystem {
public:
  static ThreadSystem &Instance() {
    static ThreadSystem instance;
    return instance;
  }

  /**
   * @brief Starts the worker pool
   *
   * @param customThreadCount Exact worker count, 0 for hardware concurrency
   * minus one (minimum 1)
   * @param enableProfiling Log delayed high priority tasks
   * @return true if the pool is running after the call
   */
  bool init(unsigned int customThreadCount = 0, bool enableProfiling = false) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_threadPool) {
      THREADSYSTEM_WARN("ThreadSystem already initialized, ignoring init request");
      return true;
    }

    if (customThreadCount > 0) {
      m_numThreads = customThreadCount;
    } else {
      // The thread driving advanceGeneration() also blocks on the batches,
      // so leave it a core of its own.
      const unsigned int hardwareThreads = std::thread::hardware_concurrency();
      m_numThreads = (hardwareThreads > 1) ? (hardwareThreads - 1) : 1;
    }

    try {
      m_threadPool = std::make_unique<ThreadPool>(m_numThreads, enableProfiling);
      m_isShutdown.store(false, std::memory_order_release);
      THREADSYSTEM_INFO("ThreadSystem initialized with " +
                        std::to_string(m_numThreads) + " worker threads");
      return true;
    } catch (const std::exception &e) {
      THREADSYSTEM_ERROR(std::string("Failed to initialize ThreadSystem: ") +
                         e.what());
      m_threadPool.reset();
      return false;
    }
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
        THREADSYSTEM_INFO("Canceling " + std::to_string(pending) +
                          " pending tasks during shutdown...");
      }
      pool.reset();
      THREADSYSTEM_INFO("ThreadSystem resources cleaned!");
    }
  }

  ~ThreadSystem() { clean(); }

  bool isInitialized() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool != nullptr;
  }

  bool isShutdown() const {
    return m_isShutdown.load(std::memory_order_acquire);
  }

  void enqueueTask(std::function<void()> task,
                   TaskPriority priority = TaskPriority::Normal,
                   const std::string &description = "") {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_threadPool) {
      throw std::runtime_error("ThreadSystem is not running");
    }
    m_threadPool->enqueue(std::move(task), priority, description);
  }

  void batchEnqueueTasks(std::vector<std::function<void()>> &tasks,
                         TaskPriority priority = TaskPriority::Normal,
                         const std::string &description = "") {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_threadPool) {
      throw std::runtime_error("ThreadSystem is not running");
    }
    m_threadPool->batchEnqueue(tasks, priority, description);
  }

  /**
   * @brief Enqueue a task and get a future for its result
   * @throws std::runtime_error if the pool is not running
   */
  template <class F, class... Args>
  auto enqueueTaskWithResult(F &&f, TaskPriority priority = TaskPriority::Normal,
                             const std::string &description = "",
                             Args &&...args)
      -> std::future<std::invoke_result_t<F, Args...>> {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_threadPool) {
      throw std::runtime_error("ThreadSystem is not running");
    }
    return m_threadPool->enqueueWithResult(std::forward<F>(f), priority,
                                           description,
                                           std::forward<Args>(args)...);
  }

  bool isBusy() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool && m_threadPool->busy();
  }

  unsigned int getThreadCount() const { return m_numThreads; }

  size_t getQueueSize() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool ? m_threadPool->getTaskQueue().size() : 0;
  }

  size_t getTotalTasksProcessed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool ? m_threadPool->getTotalTasksProcessed() : 0;
  }

  size_t getTotalTasksEnqueued() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool ? m_threadPool->getTaskQueue().getTotalTasksEnqueued()
                        : 0;
  }

private:
  std::unique_ptr<ThreadPool> m_threadPool{nullptr};
  unsigned int m_numThreads{0};
  std::atomic<bool> m_isShutdown{false};
  mutable std::mutex m_mutex{};

  ThreadSystem(const ThreadSystem &) = delete;
  ThreadSystem &operator=(const ThreadSystem &) = delete;

  ThreadSystem() = default;
};

} // namespace GridForge

#endif // THREAD_SYSTEM_HPP
