#include "esflow/command/command_bus.hpp"

#include <mutex>

namespace esflow {

CommandBus::CommandBus(std::shared_ptr<TaskPool> pool)
    : pool_(std::move(pool))
    , logger_(logging::get("esflow.command")) {
    if (!pool_) {
        pool_ = std::make_shared<TaskPool>();
    }
    pool_->start();
}

void CommandBus::register_handler(const std::string& command_type, CommandHandler handler) {
    if (command_type.empty()) {
        throw ConfigurationError("command type must not be empty");
    }
    if (!handler) {
        throw ConfigurationError("handler for command '" + command_type + "' is empty");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!handlers_.emplace(command_type, std::move(handler)).second) {
        throw ConfigurationError("command '" + command_type + "' already has a handler");
    }
    logger_->debug("Registered handler for {}", command_type);
}

bool CommandBus::has_handler(const std::string& command_type) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return handlers_.count(command_type) != 0;
}

CommandHandler CommandBus::find(const std::string& command_type) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = handlers_.find(command_type);
    return it == handlers_.end() ? CommandHandler{} : it->second;
}

Result<Payload> CommandBus::dispatch(const Command& command) {
    dispatched_.increment();

    if (command.command_type.empty()) {
        failed_.increment();
        return Error::validation("command type must not be empty")
            .with("command_id", command.command_id);
    }

    auto handler = find(command.command_type);
    if (!handler) {
        unhandled_.increment();
        logger_->warn("No handler for command {} ({})", command.command_type, command.command_id);
        return Error::not_found("no handler registered for command '" + command.command_type + "'")
            .with("command_id", command.command_id);
    }

    logger_->debug("Dispatching {} ({}) correlation={}",
                   command.command_type, command.command_id, command.correlation_id);

    Result<Payload> result = [&]() -> Result<Payload> {
        try {
            return handler(command);
        } catch (const std::exception& e) {
            return Error::handler(std::string("command handler threw: ") + e.what())
                .with("command_type", command.command_type)
                .with("command_id", command.command_id);
        }
    }();

    if (result.ok()) {
        succeeded_.increment();
    } else {
        failed_.increment();
        logger_->error("Command {} ({}) failed: {}",
                       command.command_type, command.command_id, result.error().to_string());
    }
    return result;
}

std::future<Result<Payload>> CommandBus::dispatch_async(Command command) {
    return pool_->submit([this, command = std::move(command)] {
        return dispatch(command);
    });
}

CommandBusStats CommandBus::stats() const noexcept {
    return CommandBusStats{
        dispatched_.value(),
        succeeded_.value(),
        failed_.value(),
        unhandled_.value()
    };
}

} // namespace esflow
