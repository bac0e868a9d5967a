#include "esflow/core/config.hpp"

namespace esflow {

namespace {

template<typename T>
void read_if_present(const nlohmann::json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        target = it->template get<T>();
    }
}

void read_ms_if_present(const nlohmann::json& j, const char* key, std::chrono::milliseconds& target) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        target = std::chrono::milliseconds(it->get<std::int64_t>());
    }
}

} // namespace

Status LoggingConfig::validate() const {
    if (pattern.empty()) {
        return Error::configuration("logging pattern must not be empty");
    }
    if (!console && file_path.empty()) {
        return Error::configuration("logging needs a console or a file sink");
    }
    return ok_status();
}

Status TaskPoolConfig::validate() const {
    if (num_workers > 1024) {
        return Error::configuration("task pool num_workers must be <= 1024");
    }
    return ok_status();
}

Status EventBusConfig::validate() const {
    if (batch_size == 0) {
        return Error::configuration("event bus batch_size must be positive");
    }
    if (retry_delay.count() < 0) {
        return Error::configuration("event bus retry_delay must not be negative");
    }
    return ok_status();
}

Status ReplayConfig::validate() const {
    return ok_status();
}

Status SagaManagerConfig::validate() const {
    if (max_conflict_retries == 0) {
        return Error::configuration("saga manager max_conflict_retries must be positive");
    }
    return ok_status();
}

Status OutboxRelayConfig::validate() const {
    if (poll_interval.count() <= 0) {
        return Error::configuration("outbox relay poll_interval must be positive");
    }
    if (batch_limit == 0) {
        return Error::configuration("outbox relay batch_limit must be positive");
    }
    return ok_status();
}

Status SqliteConfig::validate() const {
    if (path.empty()) {
        return Error::configuration("sqlite path must not be empty");
    }
    if (busy_timeout.count() < 0) {
        return Error::configuration("sqlite busy_timeout must not be negative");
    }
    return ok_status();
}

Status CircuitBreakerConfig::validate() const {
    if (failure_threshold == 0 || success_threshold == 0) {
        return Error::configuration("circuit breaker thresholds must be positive");
    }
    return ok_status();
}

void from_json(const nlohmann::json& j, LoggingConfig& config) {
    auto it = j.find("level");
    if (it != j.end()) {
        config.level = spdlog::level::from_str(it->get<std::string>());
    }
    read_if_present(j, "pattern", config.pattern);
    read_if_present(j, "console", config.console);
    read_if_present(j, "file_path", config.file_path);
}

void from_json(const nlohmann::json& j, TaskPoolConfig& config) {
    read_if_present(j, "num_workers", config.num_workers);
}

void from_json(const nlohmann::json& j, EventBusConfig& config) {
    read_if_present(j, "batch_size", config.batch_size);
    read_if_present(j, "max_concurrency", config.max_concurrency);
    read_if_present(j, "retry_attempts", config.retry_attempts);
    read_ms_if_present(j, "retry_delay_ms", config.retry_delay);
    read_if_present(j, "dead_letter_enabled", config.dead_letter_enabled);
}

void from_json(const nlohmann::json& j, ReplayConfig& config) {
    auto it = j.find("on_incompatible_snapshot");
    if (it != j.end()) {
        config.on_incompatible_snapshot = it->get<std::string>() == "fail"
            ? IncompatibleSnapshotPolicy::Fail
            : IncompatibleSnapshotPolicy::FullReplay;
    }
    read_if_present(j, "ignore_unknown_events", config.ignore_unknown_events);
}

void from_json(const nlohmann::json& j, SagaManagerConfig& config) {
    read_if_present(j, "max_conflict_retries", config.max_conflict_retries);
}

void from_json(const nlohmann::json& j, OutboxRelayConfig& config) {
    read_ms_if_present(j, "poll_interval_ms", config.poll_interval);
    read_if_present(j, "batch_limit", config.batch_limit);
}

void from_json(const nlohmann::json& j, SqliteConfig& config) {
    read_if_present(j, "path", config.path);
    read_ms_if_present(j, "busy_timeout_ms", config.busy_timeout);
    read_if_present(j, "wal", config.wal);
}

void from_json(const nlohmann::json& j, CircuitBreakerConfig& config) {
    read_if_present(j, "failure_threshold", config.failure_threshold);
    read_ms_if_present(j, "recovery_timeout_ms", config.recovery_timeout);
    read_if_present(j, "success_threshold", config.success_threshold);
}

} // namespace esflow
