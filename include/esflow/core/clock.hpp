#pragma once

/**
 * @file clock.hpp
 * @brief Wall-clock timestamps and their ISO-8601 wire form
 */

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace esflow {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/**
 * @brief Current UTC time truncated to milliseconds (the wire precision)
 */
[[nodiscard]] Timestamp now_utc() noexcept;

/**
 * @brief Format as "YYYY-MM-DDTHH:MM:SS.mmmZ"
 */
[[nodiscard]] std::string format_timestamp(Timestamp ts);

/**
 * @brief Parse the format produced by format_timestamp()
 * @return nullopt on malformed input
 */
[[nodiscard]] std::optional<Timestamp> parse_timestamp(std::string_view text);

} // namespace esflow
