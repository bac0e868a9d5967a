#pragma once

/**
 * @file result.hpp
 * @brief Value-or-error outcome type for domain operations
 */

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "esflow/core/error.hpp"

namespace esflow {

/**
 * @brief Holds either a T or an Error
 *
 * Domain failures (conflicts, validation, missing records) travel as
 * values; exceptions are left for infrastructure and misuse.
 */
template<typename T>
class [[nodiscard]] Result {
public:
    using value_type = T;

    Result(T value)
        : data_(std::in_place_index<0>, std::move(value)) {}

    Result(Error error)
        : data_(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool ok() const noexcept { return data_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] T& value() & {
        check_value();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& value() const& {
        check_value();
        return std::get<0>(data_);
    }

    [[nodiscard]] T&& value() && {
        check_value();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] const Error& error() const {
        if (ok()) {
            throw BadResultAccess("Result holds a value, not an error");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T fallback) const& {
        return ok() ? std::get<0>(data_) : std::move(fallback);
    }

    /**
     * @brief Transform the value, passing errors through
     */
    template<typename F>
    auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>> {
        if (!ok()) {
            return error();
        }
        return std::forward<F>(f)(std::get<0>(data_));
    }

    /**
     * @brief Chain an operation that itself returns a Result
     */
    template<typename F>
    auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        if (!ok()) {
            return error();
        }
        return std::forward<F>(f)(std::get<0>(data_));
    }

private:
    void check_value() const {
        if (!ok()) {
            throw BadResultAccess("Result holds an error: " + std::get<1>(data_).to_string());
        }
    }

    std::variant<T, Error> data_;
};

/**
 * @brief Success-or-error outcome with no value
 */
template<>
class [[nodiscard]] Result<void> {
public:
    using value_type = void;

    Result() = default;

    Result(Error error)
        : error_(std::move(error)) {}

    [[nodiscard]] bool ok() const noexcept { return !error_.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] const Error& error() const {
        if (ok()) {
            throw BadResultAccess("Status is ok, not an error");
        }
        return *error_;
    }

    template<typename F>
    auto and_then(F&& f) const -> std::invoke_result_t<F> {
        if (!ok()) {
            return *error_;
        }
        return std::forward<F>(f)();
    }

private:
    std::optional<Error> error_;
};

using Status = Result<void>;

[[nodiscard]] inline Status ok_status() {
    return Status{};
}

} // namespace esflow
