#pragma once

/**
 * @file metrics.hpp
 * @brief Metrics collection and reporting
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace esflow {

/**
 * @brief Counter metric (monotonically increasing)
 */
class Counter {
public:
    void increment(std::uint64_t value = 1) noexcept {
        value_.fetch_add(value, std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t value() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

    void reset() noexcept {
        value_.store(0, std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> value_{0};
};

/**
 * @brief Gauge metric (can go up and down)
 */
class Gauge {
public:
    void set(std::int64_t value) noexcept {
        value_.store(value, std::memory_order_relaxed);
    }

    void increment(std::int64_t delta = 1) noexcept {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }

    void decrement(std::int64_t delta = 1) noexcept {
        value_.fetch_sub(delta, std::memory_order_relaxed);
    }

    [[nodiscard]] std::int64_t value() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::int64_t> value_{0};
};

/**
 * @brief Bucketed histogram for latency measurements (seconds)
 */
class Histogram {
public:
    explicit Histogram(std::vector<double> buckets = default_buckets())
        : buckets_(std::move(buckets))
        , counts_(buckets_.size() + 1, 0) {}

    void observe(double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        sum_ += value;
        count_++;
        if (value > max_) {
            max_ = value;
        }

        for (std::size_t i = 0; i < buckets_.size(); i++) {
            if (value <= buckets_[i]) {
                counts_[i]++;
                return;
            }
        }
        counts_.back()++;  // +Inf bucket
    }

    [[nodiscard]] double sum() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sum_;
    }

    [[nodiscard]] std::uint64_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

    [[nodiscard]] double mean() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_ > 0 ? sum_ / static_cast<double>(count_) : 0.0;
    }

    [[nodiscard]] double max() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_;
    }

    /**
     * @brief Per-bucket counts; the last entry is the +Inf bucket
     */
    [[nodiscard]] std::vector<std::uint64_t> bucket_counts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return counts_;
    }

    static std::vector<double> default_buckets() {
        return {0.0001, 0.0005, 0.001, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5};
    }

private:
    mutable std::mutex mutex_;
    std::vector<double> buckets_;
    std::vector<std::uint64_t> counts_;
    double sum_{0.0};
    double max_{0.0};
    std::uint64_t count_{0};
};

/**
 * @brief Event bus counters snapshot
 */
struct BusMetricsSnapshot {
    std::uint64_t published{0};
    std::uint64_t delivered{0};
    std::uint64_t failed{0};
    std::uint64_t retried{0};
    std::uint64_t duplicates{0};
    std::uint64_t dead_lettered{0};
    std::uint64_t short_circuited{0};
    double avg_dispatch_latency_ms{0.0};
    double max_dispatch_latency_ms{0.0};
};

/**
 * @brief Counters owned by an event bus
 */
class BusMetrics {
public:
    Counter& published() { return published_; }
    Counter& delivered() { return delivered_; }
    Counter& failed() { return failed_; }
    Counter& retried() { return retried_; }
    Counter& duplicates() { return duplicates_; }
    Counter& dead_lettered() { return dead_lettered_; }
    Counter& short_circuited() { return short_circuited_; }

    // Per-delivery latency, fed by TimingMiddleware
    Histogram& dispatch_latency() { return latency_; }

    [[nodiscard]] BusMetricsSnapshot snapshot() const {
        BusMetricsSnapshot m;
        m.published = published_.value();
        m.delivered = delivered_.value();
        m.failed = failed_.value();
        m.retried = retried_.value();
        m.duplicates = duplicates_.value();
        m.dead_lettered = dead_lettered_.value();
        m.short_circuited = short_circuited_.value();
        m.avg_dispatch_latency_ms = latency_.mean() * 1000.0;
        m.max_dispatch_latency_ms = latency_.max() * 1000.0;
        return m;
    }

    /**
     * @brief Format metrics as a single log line
     */
    [[nodiscard]] std::string format() const {
        auto m = snapshot();
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2);
        oss << "Published: " << m.published
            << " | Delivered: " << m.delivered
            << " | Failed: " << m.failed
            << " | Retried: " << m.retried
            << " | Duplicates: " << m.duplicates
            << " | Dead-lettered: " << m.dead_lettered
            << " | Latency: " << m.avg_dispatch_latency_ms << " ms";
        return oss.str();
    }

private:
    Counter published_;
    Counter delivered_;
    Counter failed_;
    Counter retried_;
    Counter duplicates_;
    Counter dead_lettered_;
    Counter short_circuited_;
    Histogram latency_;
};

} // namespace esflow
