#pragma once

/**
 * @file logging.hpp
 * @brief Named spdlog loggers sharing one set of sinks
 */

#include <memory>
#include <string>

#include <spdlog/logger.h>

#include "esflow/core/config.hpp"

namespace esflow::logging {

/**
 * @brief Install sinks, level and pattern for all esflow loggers
 *
 * Loggers created earlier are switched to the new sinks as well, so call
 * this at startup before components log from other threads.
 * @throws ConfigurationError if the config does not validate
 */
void configure(const LoggingConfig& config);

/**
 * @brief Get (or lazily create) the logger with the given name
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> get(const std::string& name);

} // namespace esflow::logging
