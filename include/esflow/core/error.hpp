#pragma once

/**
 * @file error.hpp
 * @brief Error taxonomy shared by every esflow component
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace esflow {

/// Position of an event within its aggregate stream (0 = empty stream)
using Version = std::uint64_t;

/**
 * @brief Domain error categories returned as values
 */
enum class ErrorCode {
    Validation,
    ConcurrencyConflict,
    Upcast,
    NotFound,
    Handler,
    SagaCompensation,
    SnapshotIncompatible,
    Cancelled,
    Configuration
};

[[nodiscard]] const char* to_string(ErrorCode code) noexcept;

/**
 * @brief Expected/actual versions of a failed optimistic write
 */
struct ConflictDetails {
    std::string aggregate_id;
    Version expected_version{0};
    Version actual_version{0};
};

/**
 * @brief Attempted upcast range and the first missing link
 */
struct UpcastDetails {
    std::string event_type;
    std::uint32_t from_version{0};
    std::uint32_t to_version{0};
    std::uint32_t missing_from_version{0};
};

/**
 * @brief One failed (handler, event) pair inside a dispatch
 */
struct HandlerFailure {
    std::uint64_t subscription_id{0};
    std::string handler_name;
    std::string event_id;
    std::string event_type;
    std::size_t batch_index{0};
    std::string message;
};

/**
 * @brief Outcome of compensating one completed saga step
 */
struct CompensationRecord {
    std::string step;
    std::string command_type;
    bool succeeded{false};
    std::string error;
    std::chrono::system_clock::time_point at;
};

using ErrorDetails = std::variant<
    std::monostate,
    ConflictDetails,
    UpcastDetails,
    std::vector<HandlerFailure>,
    std::vector<CompensationRecord>>;

/**
 * @brief A domain failure: code, message, key/value context and typed details
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code)
        , message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, ErrorDetails details)
        : code_(code)
        , message_(std::move(message))
        , details_(std::move(details)) {}

    /**
     * @brief Attach a context entry (chainable)
     */
    Error& with(std::string key, std::string value) {
        context_[std::move(key)] = std::move(value);
        return *this;
    }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return context_; }
    [[nodiscard]] const ErrorDetails& details() const noexcept { return details_; }

    [[nodiscard]] bool is(ErrorCode code) const noexcept { return code_ == code; }

    /**
     * @brief Typed access to the details payload, nullptr when absent
     */
    template<typename T>
    [[nodiscard]] const T* details_as() const noexcept {
        return std::get_if<T>(&details_);
    }

    /**
     * @brief Render as "[CODE] message (k=v, ...)"
     */
    [[nodiscard]] std::string to_string() const;

    static Error validation(std::string message);
    static Error not_found(std::string message);
    static Error cancelled(std::string message);
    static Error configuration(std::string message);
    static Error conflict(const std::string& aggregate_id, Version expected, Version actual);
    static Error upcast(UpcastDetails details, const std::string& reason);
    static Error handler(std::vector<HandlerFailure> failures);
    static Error handler(std::string message);
    static Error compensation(std::string message, std::vector<CompensationRecord> log);

private:
    ErrorCode code_;
    std::string message_;
    std::map<std::string, std::string> context_;
    ErrorDetails details_;
};

/**
 * @brief Programming or configuration mistake (duplicate registration etc.)
 */
class ConfigurationError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @brief Infrastructure failure of a persistence backend
 */
class StoreUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Raised by Result::value() / error() on the wrong alternative
 */
class BadResultAccess : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace esflow
