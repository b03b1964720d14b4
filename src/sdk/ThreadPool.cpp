#include "veilrelay/sdk/ThreadPool.hpp"
#include "veilrelay/sdk/SecureLogger.hpp"
#include <chrono>
#include <thread>

namespace veilrelay {
namespace sdk {

ThreadPool::ThreadPool(size_t thread_count) {
    if (thread_count == 0) {
        thread_count = 1;
    }

    SecureLogger::instance().info("Initializing thread pool with " + std::to_string(thread_count) + " threads");
    running_ = true;

    for (size_t i = 0; i < thread_count; ++i) {
        workers_.emplace_back([this, i] { worker_loop(i); });
    }

    metrics_thread_ = std::thread([this] {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        while (running_) {
            metrics_cv_.wait_for(lock, std::chrono::seconds(60), [this] { return !running_; });
            if (!running_) break;

            SecureLogger::instance().debug("Thread pool metrics - Queued: " +
                                           std::to_string(tasks_.size()) +
                                           ", Active: " + std::to_string(active_tasks_) +
                                           ", Completed: " + std::to_string(completed_tasks_));
        }
    });
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::worker_loop(size_t index) {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            condition_.wait(lock, [this] {
                return !tasks_.empty() || !running_;
            });

            // Queued work is drained before exit
            if (tasks_.empty()) {
                return;
            }

            task = tasks_.top();
            tasks_.pop();
            ++active_tasks_;
        }

        // packaged_task stores exceptions in the future, this only catches
        // failures of the wrapper itself
        try {
            task.function();
        } catch (const std::exception& e) {
            SecureLogger::instance().error("Thread pool task exception on worker-" +
                                           std::to_string(index) + ": " + e.what());
        }

        --active_tasks_;
        ++completed_tasks_;
    }
}

void ThreadPool::shutdown() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (!running_ && workers_.empty()) {
            return;
        }
        running_ = false;
    }

    condition_.notify_all();
    metrics_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    if (metrics_thread_.joinable()) {
        metrics_thread_.join();
    }

    SecureLogger::instance().info("Thread pool shutdown complete");
}

size_t ThreadPool::get_queued_tasks() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

size_t ThreadPool::get_active_tasks() const {
    return active_tasks_;
}

size_t ThreadPool::get_completed_tasks() const {
    return completed_tasks_;
}

size_t ThreadPool::get_thread_count() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return workers_.size();
}

} // namespace sdk
} // namespace veilrelay
