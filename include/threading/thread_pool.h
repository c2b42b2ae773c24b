//include/threading/thread_pool.h
#pragma once

#include <vector>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>
#include <queue>
#include <string>
#include <array>
#include <optional>

namespace lakestore {
namespace threading {

// HIGH tasks always run before NORMAL, NORMAL before LOW.
enum class TaskPriority { HIGH = 0, NORMAL = 1, LOW = 2 };

/**
 * @class ThreadPool
 * @brief A fixed-size, priority-aware thread pool. Runs bucket compactions.
 *
 * One FIFO queue per priority. stop() lets the workers drain every queued
 * task before they exit; schedule() refuses new tasks from then on.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads, const std::string& name = "ThreadPool");
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Schedules a task for execution.
     * @param task The function to execute.
     * @param priority The priority of the task.
     * @return false if the pool is stopping and the task was not queued.
     */
    bool schedule(std::function<void()> task, TaskPriority priority = TaskPriority::NORMAL);

    /**
     * @brief Gracefully stops the thread pool, waiting for all threads to join.
     */
    void stop();

    size_t getQueueDepth() const;
    size_t getActiveThreads() const;
    size_t getThreadCount() const { return num_threads_; }
    const std::string& getName() const { return name_; }

private:
    void workerLoop();
    bool allQueuesAreEmpty() const; // Helper for wait predicate

    const size_t num_threads_;
    const std::string name_;

    std::vector<std::thread> workers_;
    std::array<std::queue<std::function<void()>>, 3> task_queues_;

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;

    std::atomic<bool> stop_{false};
    std::atomic<size_t> active_threads_{0};
};

} // namespace threading
} // namespace lakestore
