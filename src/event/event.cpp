#include "esflow/event/event.hpp"

#include "esflow/core/id.hpp"

namespace esflow {

Result<NewEvent> NewEvent::create(
    std::string aggregate_id,
    std::string aggregate_type,
    std::string event_type,
    Payload payload,
    SchemaVersion schema_version,
    EventOrigin origin) {
    if (aggregate_id.empty()) {
        return Error::validation("aggregate_id must not be empty");
    }
    if (aggregate_type.empty()) {
        return Error::validation("aggregate_type must not be empty").with("aggregate_id", aggregate_id);
    }
    if (event_type.empty()) {
        return Error::validation("event_type must not be empty").with("aggregate_id", aggregate_id);
    }
    if (schema_version < 1) {
        return Error::validation("schema_version must be >= 1").with("event_type", event_type);
    }
    if (payload.is_null()) {
        payload = Payload::object();
    }
    if (!payload.is_object()) {
        return Error::validation("payload must be a JSON object").with("event_type", event_type);
    }

    EventRecord record;
    record.event_id = generate_id();
    record.aggregate_id = std::move(aggregate_id);
    record.aggregate_type = std::move(aggregate_type);
    record.event_type = std::move(event_type);
    record.schema_version = schema_version;
    record.occurred_at = now_utc();
    record.correlation_id = std::move(origin.correlation_id);
    record.causation_id = std::move(origin.causation_id);
    record.payload = std::move(payload);
    return NewEvent(std::move(record));
}

Event Event::appended(const NewEvent& pending, Version sequence_number) {
    EventRecord record = pending.record_;
    record.sequence_number = sequence_number;
    return Event(std::move(record));
}

Event Event::rehydrate(EventRecord record) {
    return Event(std::move(record));
}

Event Event::with_payload(Payload payload, SchemaVersion schema_version) const {
    EventRecord record = record_;
    record.payload = std::move(payload);
    record.schema_version = schema_version;
    return Event(std::move(record));
}

Payload event_to_json(const Event& event) {
    return Payload{
        {"event_id", event.event_id()},
        {"aggregate_id", event.aggregate_id()},
        {"aggregate_type", event.aggregate_type()},
        {"event_type", event.event_type()},
        {"schema_version", event.schema_version()},
        {"sequence_number", event.sequence_number()},
        {"occurred_at", format_timestamp(event.occurred_at())},
        {"correlation_id", event.correlation_id()},
        {"causation_id", event.causation_id()},
        {"payload", event.payload()}
    };
}

Result<Event> event_from_json(const Payload& json) {
    if (!json.is_object()) {
        return Error::validation("event envelope must be a JSON object");
    }
    try {
        EventRecord record;
        record.event_id = json.at("event_id").get<std::string>();
        record.aggregate_id = json.at("aggregate_id").get<std::string>();
        record.aggregate_type = json.at("aggregate_type").get<std::string>();
        record.event_type = json.at("event_type").get<std::string>();
        record.schema_version = json.at("schema_version").get<SchemaVersion>();
        record.sequence_number = json.at("sequence_number").get<Version>();
        record.correlation_id = json.value("correlation_id", std::string{});
        record.causation_id = json.value("causation_id", std::string{});
        record.payload = json.at("payload");

        auto occurred = parse_timestamp(json.at("occurred_at").get<std::string>());
        if (!occurred) {
            return Error::validation("malformed occurred_at").with("event_id", record.event_id);
        }
        record.occurred_at = *occurred;

        if (record.event_id.empty() || record.aggregate_id.empty() || record.event_type.empty()) {
            return Error::validation("event envelope has empty identity fields");
        }
        if (record.schema_version < 1) {
            return Error::validation("schema_version must be >= 1").with("event_id", record.event_id);
        }
        return Event::rehydrate(std::move(record));
    } catch (const nlohmann::json::exception& e) {
        return Error::validation(std::string("malformed event envelope: ") + e.what());
    }
}

} // namespace esflow
