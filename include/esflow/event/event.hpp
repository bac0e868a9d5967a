#pragma once

/**
 * @file event.hpp
 * @brief Immutable versioned domain events
 */

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "esflow/core/clock.hpp"
#include "esflow/core/result.hpp"

namespace esflow {

using Payload = nlohmann::json;
using SchemaVersion = std::uint32_t;

/**
 * @brief Causal links copied from the message that caused an event
 */
struct EventOrigin {
    std::string correlation_id;
    std::string causation_id;
};

/**
 * @brief Plain field set of an event envelope
 *
 * Used to hand records between stores and the Event type; sequence_number
 * is 0 until the event has been appended.
 */
struct EventRecord {
    std::string event_id;
    std::string aggregate_id;
    std::string aggregate_type;
    std::string event_type;
    SchemaVersion schema_version{1};
    Version sequence_number{0};
    Timestamp occurred_at;
    std::string correlation_id;
    std::string causation_id;
    Payload payload;
};

/**
 * @brief An event that has not been appended yet
 */
class NewEvent {
public:
    /**
     * @brief Build a validated pending event
     *
     * Requires non-empty aggregate_id, aggregate_type and event_type,
     * schema_version >= 1 and an object (or null) payload.
     */
    [[nodiscard]] static Result<NewEvent> create(
        std::string aggregate_id,
        std::string aggregate_type,
        std::string event_type,
        Payload payload,
        SchemaVersion schema_version = 1,
        EventOrigin origin = {});

    [[nodiscard]] const std::string& event_id() const noexcept { return record_.event_id; }
    [[nodiscard]] const std::string& aggregate_id() const noexcept { return record_.aggregate_id; }
    [[nodiscard]] const std::string& aggregate_type() const noexcept { return record_.aggregate_type; }
    [[nodiscard]] const std::string& event_type() const noexcept { return record_.event_type; }
    [[nodiscard]] SchemaVersion schema_version() const noexcept { return record_.schema_version; }
    [[nodiscard]] Timestamp occurred_at() const noexcept { return record_.occurred_at; }
    [[nodiscard]] const std::string& correlation_id() const noexcept { return record_.correlation_id; }
    [[nodiscard]] const std::string& causation_id() const noexcept { return record_.causation_id; }
    [[nodiscard]] const Payload& payload() const noexcept { return record_.payload; }

private:
    friend class Event;

    explicit NewEvent(EventRecord record)
        : record_(std::move(record)) {}

    EventRecord record_;
};

/**
 * @brief A persisted event with its position in the aggregate stream
 *
 * Immutable: every accessor is const and copies share nothing mutable.
 */
class Event {
public:
    /**
     * @brief The event a store produces when it appends `pending` at `sequence_number`
     */
    [[nodiscard]] static Event appended(const NewEvent& pending, Version sequence_number);

    /**
     * @brief Rebuild an event from stored fields (stores, decoders, tests)
     */
    [[nodiscard]] static Event rehydrate(EventRecord record);

    /**
     * @brief Copy with a migrated payload and schema version
     */
    [[nodiscard]] Event with_payload(Payload payload, SchemaVersion schema_version) const;

    [[nodiscard]] const std::string& event_id() const noexcept { return record_.event_id; }
    [[nodiscard]] const std::string& aggregate_id() const noexcept { return record_.aggregate_id; }
    [[nodiscard]] const std::string& aggregate_type() const noexcept { return record_.aggregate_type; }
    [[nodiscard]] const std::string& event_type() const noexcept { return record_.event_type; }
    [[nodiscard]] SchemaVersion schema_version() const noexcept { return record_.schema_version; }
    [[nodiscard]] Version sequence_number() const noexcept { return record_.sequence_number; }
    [[nodiscard]] Timestamp occurred_at() const noexcept { return record_.occurred_at; }
    [[nodiscard]] const std::string& correlation_id() const noexcept { return record_.correlation_id; }
    [[nodiscard]] const std::string& causation_id() const noexcept { return record_.causation_id; }
    [[nodiscard]] const Payload& payload() const noexcept { return record_.payload; }

    [[nodiscard]] const EventRecord& record() const noexcept { return record_; }

private:
    explicit Event(EventRecord record)
        : record_(std::move(record)) {}

    EventRecord record_;
};

/**
 * @brief Encode the full envelope (occurred_at as ISO-8601 UTC)
 */
[[nodiscard]] Payload event_to_json(const Event& event);

/**
 * @brief Decode an envelope produced by event_to_json()
 * @return Validation error on missing or mistyped fields
 */
[[nodiscard]] Result<Event> event_from_json(const Payload& json);

} // namespace esflow
