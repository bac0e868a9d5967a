#include "esflow/core/task_pool.hpp"

#include <chrono>

namespace esflow {

namespace {

thread_local bool tls_on_worker = false;

} // namespace

void Worker::start() {
    thread_ = std::thread(&Worker::run, this);
}

void Worker::run() {
    tls_on_worker = true;
    while (auto task = queue_->pop()) {
        auto start = std::chrono::steady_clock::now();
        // packaged_task captures the callable's exceptions in its future
        (*task)();
        auto end = std::chrono::steady_clock::now();
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
        active_time_ns_.fetch_add(static_cast<std::uint64_t>(ns), std::memory_order_relaxed);
        tasks_executed_.fetch_add(1, std::memory_order_relaxed);
    }
}

TaskPool::TaskPool(TaskPoolConfig config)
    : config_(config) {
    auto status = config_.validate();
    if (!status.ok()) {
        throw ConfigurationError(status.error().to_string());
    }
    if (config_.num_workers == 0) {
        config_.num_workers = std::thread::hardware_concurrency();
        if (config_.num_workers == 0) {
            config_.num_workers = 4;  // Fallback
        }
    }
}

TaskPool::~TaskPool() {
    stop();
}

void TaskPool::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    workers_.reserve(config_.num_workers);
    for (std::uint32_t i = 0; i < config_.num_workers; i++) {
        workers_.push_back(std::make_unique<Worker>(i, &queue_));
        workers_.back()->start();
    }
}

void TaskPool::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    queue_.close();
    for (auto& worker : workers_) {
        worker->join();
    }
}

bool TaskPool::on_worker_thread() noexcept {
    return tls_on_worker;
}

std::vector<WorkerStats> TaskPool::stats() const {
    std::vector<WorkerStats> result;
    result.reserve(workers_.size());
    for (const auto& worker : workers_) {
        result.push_back(worker->stats());
    }
    return result;
}

} // namespace esflow
