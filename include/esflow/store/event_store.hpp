#pragma once

/**
 * @file event_store.hpp
 * @brief Append-only per-aggregate event log
 */

#include <cstdint>
#include <string>
#include <vector>

#include "esflow/core/cancellation.hpp"
#include "esflow/core/result.hpp"
#include "esflow/event/event.hpp"

namespace esflow {

/**
 * @brief An event together with its position in the global append order
 */
struct StoredEvent {
    std::uint64_t global_position{0};
    Event event;
};

/**
 * @brief Storage contract for event streams
 *
 * Implementations guarantee gapless, strictly increasing sequence numbers
 * per aggregate and all-or-nothing appends. Backend failures throw
 * StoreUnavailable; domain outcomes are returned.
 */
class EventStore {
public:
    virtual ~EventStore() = default;

    /**
     * @brief Append events if the stream is at `expected_version`
     * @return New stream version, ConcurrencyConflict on a version mismatch,
     *         Validation for a malformed batch, Cancelled if the token fired
     *         before the commit point
     */
    virtual Result<Version> append(
        const std::string& aggregate_id,
        Version expected_version,
        const std::vector<NewEvent>& events,
        const CancellationToken& cancel = {}) = 0;

    /**
     * @brief Events with sequence_number > from_version, ascending
     */
    [[nodiscard]] virtual Result<std::vector<Event>> read(
        const std::string& aggregate_id,
        Version from_version = 0) const = 0;

    /**
     * @brief Events in global append order after `after_position`
     * @param limit Maximum number of events, 0 = unlimited
     */
    [[nodiscard]] virtual Result<std::vector<StoredEvent>> read_all(
        std::uint64_t after_position = 0,
        std::size_t limit = 0) const = 0;

    /**
     * @brief Highest sequence number of the stream (0 if missing)
     */
    [[nodiscard]] virtual Result<Version> current_version(const std::string& aggregate_id) const = 0;

    /**
     * @brief Whether appends also write outbox rows in the same transaction
     */
    [[nodiscard]] virtual bool stages_outbox() const noexcept { return false; }
};

/**
 * @brief Shared batch validation: every event must target `aggregate_id`
 */
[[nodiscard]] Status validate_append_batch(const std::string& aggregate_id, const std::vector<NewEvent>& events);

} // namespace esflow
