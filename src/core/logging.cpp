#include "esflow/core/logging.hpp"

#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace esflow::logging {

namespace {

struct LoggingState {
    std::mutex mutex;
    LoggingConfig config;
    std::vector<spdlog::sink_ptr> sinks;
    std::vector<std::shared_ptr<spdlog::logger>> loggers;
};

LoggingState& state() {
    static LoggingState instance;
    return instance;
}

std::vector<spdlog::sink_ptr> make_sinks(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!config.file_path.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file_path));
    }
    return sinks;
}

void apply(spdlog::logger& logger, const LoggingConfig& config) {
    logger.set_level(config.level);
    logger.set_pattern(config.pattern);
}

} // namespace

void configure(const LoggingConfig& config) {
    auto status = config.validate();
    if (!status.ok()) {
        throw ConfigurationError(status.error().to_string());
    }

    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.config = config;
    s.sinks = make_sinks(config);
    for (auto& logger : s.loggers) {
        logger->sinks() = s.sinks;
        apply(*logger, config);
    }
}

std::shared_ptr<spdlog::logger> get(const std::string& name) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    for (const auto& logger : s.loggers) {
        if (logger->name() == name) {
            return logger;
        }
    }

    if (s.sinks.empty()) {
        s.sinks = make_sinks(s.config);
    }
    auto logger = std::make_shared<spdlog::logger>(name, s.sinks.begin(), s.sinks.end());
    apply(*logger, s.config);
    s.loggers.push_back(logger);
    return logger;
}

} // namespace esflow::logging
