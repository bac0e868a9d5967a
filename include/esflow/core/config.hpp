#pragma once

/**
 * @file config.hpp
 * @brief Configuration structs for every esflow component
 *
 * Plain structs with working defaults. Embedding applications that keep
 * their settings in JSON can decode them with nlohmann's get<T>().
 */

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include "esflow/core/result.hpp"

namespace esflow {

/**
 * @brief Logger level, pattern and sinks
 */
struct LoggingConfig {
    spdlog::level::level_enum level{spdlog::level::info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};
    bool console{true};
    std::string file_path;  // empty = no file sink

    [[nodiscard]] Status validate() const;
};

/**
 * @brief Worker threads behind batch and async dispatch
 */
struct TaskPoolConfig {
    std::uint32_t num_workers{0};  // 0 = auto-detect

    [[nodiscard]] Status validate() const;
};

struct EventBusConfig {
    std::size_t batch_size{10};       // events per publish_many window
    std::size_t max_concurrency{0};   // workers of an owned pool, 0 = auto-detect
    std::uint32_t retry_attempts{0};  // extra attempts after the first failure
    std::chrono::milliseconds retry_delay{100};
    bool dead_letter_enabled{true};

    [[nodiscard]] Status validate() const;
};

enum class IncompatibleSnapshotPolicy {
    FullReplay,  // ignore the snapshot and replay the whole stream
    Fail         // surface SnapshotIncompatible to the caller
};

struct ReplayConfig {
    IncompatibleSnapshotPolicy on_incompatible_snapshot{IncompatibleSnapshotPolicy::FullReplay};
    bool ignore_unknown_events{true};

    [[nodiscard]] Status validate() const;
};

struct SagaManagerConfig {
    std::uint32_t max_conflict_retries{5};

    [[nodiscard]] Status validate() const;
};

struct OutboxRelayConfig {
    std::chrono::milliseconds poll_interval{500};
    std::size_t batch_limit{100};

    [[nodiscard]] Status validate() const;
};

struct SqliteConfig {
    std::string path{":memory:"};
    std::chrono::milliseconds busy_timeout{5000};
    bool wal{true};  // ignored for :memory:

    [[nodiscard]] Status validate() const;
};

/**
 * @brief Circuit breaker thresholds (per event type)
 */
struct CircuitBreakerConfig {
    std::uint32_t failure_threshold{5};
    std::chrono::milliseconds recovery_timeout{30000};
    std::uint32_t success_threshold{1};  // half-open successes needed to close

    [[nodiscard]] Status validate() const;
};

void from_json(const nlohmann::json& j, LoggingConfig& config);
void from_json(const nlohmann::json& j, TaskPoolConfig& config);
void from_json(const nlohmann::json& j, EventBusConfig& config);
void from_json(const nlohmann::json& j, ReplayConfig& config);
void from_json(const nlohmann::json& j, SagaManagerConfig& config);
void from_json(const nlohmann::json& j, OutboxRelayConfig& config);
void from_json(const nlohmann::json& j, SqliteConfig& config);
void from_json(const nlohmann::json& j, CircuitBreakerConfig& config);

} // namespace esflow
