#include "esflow/core/error.hpp"

#include <sstream>

namespace esflow {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Validation: return "VALIDATION";
        case ErrorCode::ConcurrencyConflict: return "CONCURRENCY_CONFLICT";
        case ErrorCode::Upcast: return "UPCAST";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::Handler: return "HANDLER";
        case ErrorCode::SagaCompensation: return "SAGA_COMPENSATION";
        case ErrorCode::SnapshotIncompatible: return "SNAPSHOT_INCOMPATIBLE";
        case ErrorCode::Cancelled: return "CANCELLED";
        case ErrorCode::Configuration: return "CONFIGURATION";
    }
    return "UNKNOWN";
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << '[' << esflow::to_string(code_) << "] " << message_;
    if (!context_.empty()) {
        oss << " (";
        bool first = true;
        for (const auto& [key, value] : context_) {
            if (!first) {
                oss << ", ";
            }
            oss << key << '=' << value;
            first = false;
        }
        oss << ')';
    }
    return oss.str();
}

Error Error::validation(std::string message) {
    return Error(ErrorCode::Validation, std::move(message));
}

Error Error::not_found(std::string message) {
    return Error(ErrorCode::NotFound, std::move(message));
}

Error Error::cancelled(std::string message) {
    return Error(ErrorCode::Cancelled, std::move(message));
}

Error Error::configuration(std::string message) {
    return Error(ErrorCode::Configuration, std::move(message));
}

Error Error::conflict(const std::string& aggregate_id, Version expected, Version actual) {
    std::ostringstream oss;
    oss << "Concurrency conflict on '" << aggregate_id << "': expected version "
        << expected << ", actual " << actual;
    Error error(ErrorCode::ConcurrencyConflict, oss.str(),
                ConflictDetails{aggregate_id, expected, actual});
    error.with("aggregate_id", aggregate_id);
    return error;
}

Error Error::upcast(UpcastDetails details, const std::string& reason) {
    std::ostringstream oss;
    oss << "Failed to upcast event '" << details.event_type << "' from v"
        << details.from_version << " to v" << details.to_version << ": " << reason;
    std::string event_type = details.event_type;
    Error error(ErrorCode::Upcast, oss.str(), std::move(details));
    error.with("event_type", std::move(event_type));
    return error;
}

Error Error::handler(std::vector<HandlerFailure> failures) {
    std::ostringstream oss;
    oss << failures.size() << " handler failure(s)";
    if (!failures.empty()) {
        const auto& first = failures.front();
        oss << "; first: " << first.handler_name << " on " << first.event_type
            << " (" << first.event_id << "): " << first.message;
    }
    return Error(ErrorCode::Handler, oss.str(), std::move(failures));
}

Error Error::handler(std::string message) {
    return Error(ErrorCode::Handler, std::move(message));
}

Error Error::compensation(std::string message, std::vector<CompensationRecord> log) {
    return Error(ErrorCode::SagaCompensation, std::move(message), std::move(log));
}

} // namespace esflow
