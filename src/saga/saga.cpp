#include "esflow/saga/saga.hpp"

namespace esflow {

const char* to_string(SagaStatus status) noexcept {
    switch (status) {
        case SagaStatus::Started: return "STARTED";
        case SagaStatus::Waiting: return "WAITING";
        case SagaStatus::Compensating: return "COMPENSATING";
        case SagaStatus::Compensated: return "COMPENSATED";
        case SagaStatus::Completed: return "COMPLETED";
        case SagaStatus::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

std::optional<SagaStatus> saga_status_from_string(const std::string& text) {
    for (auto status : {SagaStatus::Started, SagaStatus::Waiting, SagaStatus::Compensating,
                        SagaStatus::Compensated, SagaStatus::Completed, SagaStatus::Failed}) {
        if (text == to_string(status)) {
            return status;
        }
    }
    return std::nullopt;
}

bool SagaContext::retry_step(Command command) {
    instance_.retry_count++;
    if (instance_.retry_count > max_retries_) {
        fail("step '" + command.command_type + "' exhausted " + std::to_string(max_retries_) + " retries");
        return false;
    }
    instance_.status = SagaStatus::Waiting;
    send(std::move(command));
    return true;
}

} // namespace esflow
