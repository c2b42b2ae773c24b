// src/threading/thread_pool.cpp
#include "../../include/threading/thread_pool.h"
#include "../../include/debug_utils.h" // For LOG_... macros

namespace lakestore {
namespace threading {

ThreadPool::ThreadPool(size_t num_threads, const std::string& name)
    : num_threads_(num_threads > 0 ? num_threads : 1),
      name_(name)
{
    for (size_t i = 0; i < num_threads_; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }
    LOG_INFO("[", name_, "] Created with ", num_threads_, " threads.");
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_.exchange(true)) {
            return; // Already stopping
        }
    }
    LOG_DEBUG(DEBUG, "[", name_, "] Stopping, draining ", getQueueDepth(), " queued task(s)...");
    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    LOG_DEBUG(DEBUG, "[", name_, "] All threads joined. Stopped.");
}

bool ThreadPool::schedule(std::function<void()> task, TaskPriority priority) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_.load()) {
            LOG_WARN("[", name_, "] scheduled a task after stop() was called. Task ignored.");
            return false;
        }
        task_queues_[static_cast<int>(priority)].push(std::move(task));
    }
    condition_.notify_one();
    return true;
}

void ThreadPool::workerLoop() {
    LOG_TRACE("[", name_, "] Worker thread ", std::this_thread::get_id(), " started.");
    while (true) {
        std::optional<std::function<void()>> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] {
                return stop_.load() || !allQueuesAreEmpty();
            });

            // Exit only once stopping and nothing is left to run.
            if (stop_.load() && allQueuesAreEmpty()) {
                break;
            }

            // Fetch a task, scanning from HIGH to LOW priority
            for (int i = 0; i < 3; ++i) {
                if (!task_queues_[i].empty()) {
                    task = std::move(task_queues_[i].front());
                    task_queues_[i].pop();
                    break;
                }
            }
        } // Mutex is released here

        if (task) {
            active_threads_++;
            try {
                (*task)();
            } catch (const std::exception& e) {
                LOG_ERROR("[", name_, "] Worker thread caught exception: ", e.what());
            }
            active_threads_--;
        }
    }
    LOG_TRACE("[", name_, "] Worker thread ", std::this_thread::get_id(), " stopped.");
}

size_t ThreadPool::getQueueDepth() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    size_t total = 0;
    for (const auto& q : task_queues_) {
        total += q.size();
    }
    return total;
}

size_t ThreadPool::getActiveThreads() const {
    return active_threads_.load();
}

bool ThreadPool::allQueuesAreEmpty() const {
    // Assumes queue_mutex_ is held by caller
    for (const auto& q : task_queues_) {
        if (!q.empty()) {
            return false;
        }
    }
    return true;
}

} // namespace threading
} // namespace lakestore
