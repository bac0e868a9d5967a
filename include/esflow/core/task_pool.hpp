#pragma once

/**
 * @file task_pool.hpp
 * @brief Worker threads draining a bounded task queue
 */

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <vector>

#include "esflow/core/config.hpp"
#include "esflow/core/queue.hpp"

namespace esflow {

/**
 * @brief Worker thread statistics
 */
struct WorkerStats {
    std::uint64_t tasks_executed{0};
    std::uint64_t active_time_ns{0};
};

using Task = std::function<void()>;
using TaskQueue = BoundedQueue<Task, 1024>;

/**
 * @brief Individual worker thread
 */
class Worker {
public:
    Worker(std::uint32_t id, TaskQueue* queue)
        : id_(id)
        , queue_(queue) {}

    void start();

    /**
     * @brief Wait for the worker thread to finish (after the queue closes)
     */
    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    [[nodiscard]] std::uint32_t id() const noexcept { return id_; }

    [[nodiscard]] WorkerStats stats() const noexcept {
        return WorkerStats{
            tasks_executed_.load(std::memory_order_relaxed),
            active_time_ns_.load(std::memory_order_relaxed)
        };
    }

private:
    void run();

    std::uint32_t id_;
    TaskQueue* queue_;
    std::thread thread_;
    std::atomic<std::uint64_t> tasks_executed_{0};
    std::atomic<std::uint64_t> active_time_ns_{0};
};

/**
 * @brief Fixed pool of workers with future-returning submission
 *
 * A task submitted from inside a worker (of any pool) runs inline on the
 * calling thread, so nested fan-out cannot exhaust the workers and
 * deadlock. Tasks submitted after stop() also run inline.
 */
class TaskPool {
public:
    explicit TaskPool(TaskPoolConfig config = {});
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    void start();

    /**
     * @brief Close the queue, let workers drain it, and join them
     */
    void stop();

    /**
     * @brief Schedule a callable, returning a future for its result
     *
     * Exceptions thrown by the callable are delivered through the future.
     */
    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        auto future = task->get_future();

        if (!running_.load(std::memory_order_acquire) || on_worker_thread()) {
            (*task)();
            return future;
        }
        if (!queue_.push([task] { (*task)(); })) {
            (*task)();
        }
        return future;
    }

    /**
     * @brief True when the calling thread belongs to some TaskPool
     */
    [[nodiscard]] static bool on_worker_thread() noexcept;

    [[nodiscard]] std::uint32_t num_workers() const noexcept {
        return config_.num_workers;
    }

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::size_t pending() const {
        return queue_.size();
    }

    [[nodiscard]] std::vector<WorkerStats> stats() const;

private:
    TaskPoolConfig config_;
    TaskQueue queue_;
    std::vector<std::unique_ptr<Worker>> workers_;
    std::atomic<bool> running_{false};
};

} // namespace esflow
