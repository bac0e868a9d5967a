#pragma once

/**
 * @file dead_letter.hpp
 * @brief Parking place for deliveries that exhausted their retries
 */

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "esflow/bus/subscription.hpp"

namespace esflow {

enum class DeadLetterReason {
    HandlerError,        // failed with retries disabled
    MaxRetriesExceeded   // failed on every configured attempt
};

[[nodiscard]] const char* to_string(DeadLetterReason reason) noexcept;

struct DeadLetter {
    Event event;
    SubscriptionId subscription_id{0};
    std::string handler_name;
    DeadLetterReason reason{DeadLetterReason::HandlerError};
    std::string error;
    std::uint32_t attempts{0};
    Timestamp recorded_at;
};

/**
 * @brief Thread-safe, in-memory dead-letter list
 */
class DeadLetterQueue {
public:
    void record(DeadLetter letter);

    [[nodiscard]] std::vector<DeadLetter> entries() const;

    /**
     * @brief Remove and return every entry (for reprocessing)
     */
    std::vector<DeadLetter> drain();

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<DeadLetter> letters_;
};

} // namespace esflow
