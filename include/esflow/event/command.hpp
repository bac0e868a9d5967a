#pragma once

/**
 * @file command.hpp
 * @brief Commands routed through the command bus
 */

#include <string>

#include "esflow/event/event.hpp"

namespace esflow {

/**
 * @brief A request for one handler to act
 */
struct Command {
    std::string command_id;
    std::string command_type;
    std::string correlation_id;
    std::string causation_id;
    Payload payload = Payload::object();
    Timestamp issued_at;

    /**
     * @brief New command with a fresh id and the current time
     */
    [[nodiscard]] static Command make(std::string command_type,
                                      Payload payload = Payload::object(),
                                      EventOrigin origin = {});
};

[[nodiscard]] Payload command_to_json(const Command& command);

/**
 * @return Validation error on missing or mistyped fields
 */
[[nodiscard]] Result<Command> command_from_json(const Payload& json);

} // namespace esflow
