#pragma once

/**
 * @file middleware.hpp
 * @brief Interceptors wrapped around every (event, subscription) delivery
 */

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "esflow/bus/subscription.hpp"
#include "esflow/core/config.hpp"
#include "esflow/core/logging.hpp"
#include "esflow/core/metrics.hpp"

namespace esflow {

/**
 * @brief One handler invocation as seen by middleware
 */
struct Delivery {
    const Event& event;
    const Subscription& subscription;
    std::uint32_t attempt{1};
};

using NextFn = std::function<Status(const Delivery&)>;

/**
 * @brief Base class for delivery middleware
 *
 * A middleware may act before and after `next`, or return without calling
 * it to short-circuit the delivery.
 */
class Middleware {
public:
    virtual ~Middleware() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    virtual Status handle(const Delivery& delivery, const NextFn& next) = 0;
};

/**
 * @brief Logs each delivery and its outcome
 */
class LoggingMiddleware : public Middleware {
public:
    LoggingMiddleware();

    [[nodiscard]] std::string_view name() const noexcept override { return "logging"; }

    Status handle(const Delivery& delivery, const NextFn& next) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief Measures handler latency into a bus metrics histogram
 */
class TimingMiddleware : public Middleware {
public:
    explicit TimingMiddleware(BusMetrics& metrics)
        : metrics_(metrics) {}

    [[nodiscard]] std::string_view name() const noexcept override { return "timing"; }

    Status handle(const Delivery& delivery, const NextFn& next) override;

private:
    BusMetrics& metrics_;
};

/**
 * @brief Per-event-type circuit breaker
 *
 * Closed until `failure_threshold` consecutive failures, then open: every
 * delivery fails fast. After `recovery_timeout` one probe runs half-open;
 * `success_threshold` successes close the circuit, a failure reopens it.
 */
class CircuitBreakerMiddleware : public Middleware {
public:
    enum class State { Closed, Open, HalfOpen };

    explicit CircuitBreakerMiddleware(CircuitBreakerConfig config = {}, BusMetrics* metrics = nullptr);

    [[nodiscard]] std::string_view name() const noexcept override { return "circuit_breaker"; }

    Status handle(const Delivery& delivery, const NextFn& next) override;

    [[nodiscard]] State state(const std::string& event_type) const;

private:
    struct Circuit {
        State state{State::Closed};
        std::uint32_t failures{0};
        std::uint32_t successes{0};
        std::chrono::steady_clock::time_point opened_at;
    };

    bool allow(const std::string& event_type);
    void record(const std::string& event_type, bool success);

    CircuitBreakerConfig config_;
    BusMetrics* metrics_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Circuit> circuits_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace esflow
