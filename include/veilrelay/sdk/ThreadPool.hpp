#pragma once

#include "veilrelay/sdk/types.hpp"
#include "veilrelay/sdk/constants.hpp"
#include <thread>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <vector>
#include <functional>
#include <future>
#include <memory>
#include <atomic>
#include <stdexcept>

namespace veilrelay {
namespace sdk {

/**
 * @brief Thread pool with priority queue for task execution
 *
 * Runs proof-job processing. Tasks of equal priority run in submission order.
 */
class ThreadPool {
public:
    enum class Priority {
        LOW,
        NORMAL,
        HIGH,
        CRITICAL
    };

    struct Task {
        std::function<void()> function;
        Priority priority;
        std::chrono::steady_clock::time_point created_at;
        uint64_t sequence;

        bool operator<(const Task& other) const {
            if (priority != other.priority) {
                return priority < other.priority;
            }
            return sequence > other.sequence; // Older tasks first
        }
    };

    explicit ThreadPool(size_t thread_count = constants::DEFAULT_THREAD_POOL_SIZE);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Enqueue a task with priority
    template<typename F, typename... Args>
    auto enqueue(Priority priority, F&& f, Args&&... args)
        -> std::future<decltype(f(args...))> {
        using return_type = decltype(f(args...));

        auto task_promise = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> result = task_promise->get_future();

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            if (!running_) {
                throw std::runtime_error("Cannot enqueue on stopped ThreadPool");
            }

            tasks_.push({
                [task_promise]() { (*task_promise)(); },
                priority,
                std::chrono::steady_clock::now(),
                next_sequence_++
            });
        }

        condition_.notify_one();
        return result;
    }

    template<typename F, typename... Args>
    auto enqueue_normal(F&& f, Args&&... args) -> std::future<decltype(f(args...))> {
        return enqueue(Priority::NORMAL, std::forward<F>(f), std::forward<Args>(args)...);
    }

    /**
     * @brief Stop accepting work, drain the queue and join the workers
     */
    void shutdown();

    bool is_running() const { return running_; }

    // Get thread pool stats
    size_t get_queued_tasks() const;
    size_t get_active_tasks() const;
    size_t get_completed_tasks() const;
    size_t get_thread_count() const;

private:
    void worker_loop(size_t index);

    std::vector<std::thread> workers_;
    std::thread metrics_thread_;
    std::priority_queue<Task> tasks_;
    uint64_t next_sequence_ = 0;

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::condition_variable metrics_cv_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> active_tasks_{0};
    std::atomic<size_t> completed_tasks_{0};
};

} // namespace sdk
} // namespace veilrelay
