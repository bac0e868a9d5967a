#pragma once

/**
 * @file command_bus.hpp
 * @brief Routes each command type to exactly one handler
 */

#include <functional>
#include <future>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "esflow/core/logging.hpp"
#include "esflow/core/metrics.hpp"
#include "esflow/core/task_pool.hpp"
#include "esflow/event/command.hpp"

namespace esflow {

using CommandHandler = std::function<Result<Payload>(const Command&)>;

/**
 * @brief Dispatch counters
 */
struct CommandBusStats {
    std::uint64_t dispatched{0};
    std::uint64_t succeeded{0};
    std::uint64_t failed{0};
    std::uint64_t unhandled{0};
};

class CommandBus {
public:
    explicit CommandBus(std::shared_ptr<TaskPool> pool = nullptr);

    CommandBus(const CommandBus&) = delete;
    CommandBus& operator=(const CommandBus&) = delete;

    /**
     * @brief Register the handler for a command type
     * @throws ConfigurationError if the type already has a handler
     */
    void register_handler(const std::string& command_type, CommandHandler handler);

    [[nodiscard]] bool has_handler(const std::string& command_type) const;

    /**
     * @brief Run the command's handler on the calling thread
     *
     * Unknown types return NotFound; an exception escaping the handler is
     * returned as a Handler error. Errors returned by the handler pass
     * through unchanged.
     */
    Result<Payload> dispatch(const Command& command);

    /**
     * @brief Run dispatch() on the task pool
     */
    std::future<Result<Payload>> dispatch_async(Command command);

    [[nodiscard]] CommandBusStats stats() const noexcept;

private:
    [[nodiscard]] CommandHandler find(const std::string& command_type) const;

    std::shared_ptr<TaskPool> pool_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, CommandHandler> handlers_;

    Counter dispatched_;
    Counter succeeded_;
    Counter failed_;
    Counter unhandled_;

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace esflow
