#include "esflow/bus/middleware.hpp"

namespace esflow {

LoggingMiddleware::LoggingMiddleware()
    : logger_(logging::get("esflow.bus")) {}

Status LoggingMiddleware::handle(const Delivery& delivery, const NextFn& next) {
    logger_->debug("Delivering {} ({}) to '{}' attempt {}",
                   delivery.event.event_type(), delivery.event.event_id(),
                   delivery.subscription.name, delivery.attempt);

    auto status = next(delivery);

    if (status.ok()) {
        logger_->debug("Handler '{}' accepted {} ({})",
                       delivery.subscription.name, delivery.event.event_type(), delivery.event.event_id());
    } else {
        logger_->warn("Handler '{}' failed on {} ({}): {}",
                      delivery.subscription.name, delivery.event.event_type(),
                      delivery.event.event_id(), status.error().to_string());
    }
    return status;
}

Status TimingMiddleware::handle(const Delivery& delivery, const NextFn& next) {
    auto start = std::chrono::steady_clock::now();
    auto status = next(delivery);
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);
    metrics_.dispatch_latency().observe(elapsed.count());
    return status;
}

CircuitBreakerMiddleware::CircuitBreakerMiddleware(CircuitBreakerConfig config, BusMetrics* metrics)
    : config_(config)
    , metrics_(metrics)
    , logger_(logging::get("esflow.bus")) {
    auto status = config_.validate();
    if (!status.ok()) {
        throw ConfigurationError(status.error().to_string());
    }
}

Status CircuitBreakerMiddleware::handle(const Delivery& delivery, const NextFn& next) {
    const auto& event_type = delivery.event.event_type();
    if (!allow(event_type)) {
        if (metrics_) {
            metrics_->short_circuited().increment();
        }
        logger_->warn("Circuit open for {}, rejecting delivery of {} to '{}'",
                      event_type, delivery.event.event_id(), delivery.subscription.name);
        return Error::handler("circuit breaker open for event type " + event_type)
            .with("event_type", event_type);
    }

    auto status = next(delivery);
    record(event_type, status.ok());
    return status;
}

CircuitBreakerMiddleware::State CircuitBreakerMiddleware::state(const std::string& event_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = circuits_.find(event_type);
    return it == circuits_.end() ? State::Closed : it->second.state;
}

bool CircuitBreakerMiddleware::allow(const std::string& event_type) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& circuit = circuits_[event_type];
    if (circuit.state != State::Open) {
        return true;
    }
    if (std::chrono::steady_clock::now() - circuit.opened_at >= config_.recovery_timeout) {
        circuit.state = State::HalfOpen;
        circuit.successes = 0;
        logger_->info("Circuit for {} half-open", event_type);
        return true;
    }
    return false;
}

void CircuitBreakerMiddleware::record(const std::string& event_type, bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& circuit = circuits_[event_type];

    if (success) {
        if (circuit.state == State::HalfOpen) {
            if (++circuit.successes >= config_.success_threshold) {
                circuit.state = State::Closed;
                circuit.failures = 0;
                logger_->info("Circuit for {} closed", event_type);
            }
        } else {
            circuit.failures = 0;
        }
        return;
    }

    if (circuit.state == State::HalfOpen ||
        (circuit.state == State::Closed && ++circuit.failures >= config_.failure_threshold)) {
        circuit.state = State::Open;
        circuit.opened_at = std::chrono::steady_clock::now();
        logger_->warn("Circuit for {} opened after {} failure(s)", event_type, circuit.failures);
    }
}

} // namespace esflow
