#include "esflow/event/command.hpp"

#include "esflow/core/id.hpp"

namespace esflow {

Command Command::make(std::string command_type, Payload payload, EventOrigin origin) {
    Command command;
    command.command_id = generate_id();
    command.command_type = std::move(command_type);
    command.correlation_id = std::move(origin.correlation_id);
    command.causation_id = std::move(origin.causation_id);
    command.payload = std::move(payload);
    command.issued_at = now_utc();
    return command;
}

Payload command_to_json(const Command& command) {
    return Payload{
        {"command_id", command.command_id},
        {"command_type", command.command_type},
        {"correlation_id", command.correlation_id},
        {"causation_id", command.causation_id},
        {"issued_at", format_timestamp(command.issued_at)},
        {"payload", command.payload}
    };
}

Result<Command> command_from_json(const Payload& json) {
    if (!json.is_object()) {
        return Error::validation("command envelope must be a JSON object");
    }
    try {
        Command command;
        command.command_id = json.at("command_id").get<std::string>();
        command.command_type = json.at("command_type").get<std::string>();
        command.correlation_id = json.value("correlation_id", std::string{});
        command.causation_id = json.value("causation_id", std::string{});
        command.payload = json.value("payload", Payload::object());

        auto issued = parse_timestamp(json.at("issued_at").get<std::string>());
        if (!issued) {
            return Error::validation("malformed issued_at").with("command_id", command.command_id);
        }
        command.issued_at = *issued;

        if (command.command_id.empty() || command.command_type.empty()) {
            return Error::validation("command envelope has empty identity fields");
        }
        return command;
    } catch (const nlohmann::json::exception& e) {
        return Error::validation(std::string("malformed command envelope: ") + e.what());
    }
}

} // namespace esflow
