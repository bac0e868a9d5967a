#pragma once

/**
 * @file saga.hpp
 * @brief Saga instances, the per-delivery context and the Saga interface
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "esflow/event/command.hpp"

namespace esflow {

enum class SagaStatus {
    Started,
    Waiting,
    Compensating,
    Compensated,
    Completed,
    Failed
};

[[nodiscard]] const char* to_string(SagaStatus status) noexcept;
[[nodiscard]] std::optional<SagaStatus> saga_status_from_string(const std::string& text);

/**
 * @brief Completed, Compensated and Failed accept no further events
 */
[[nodiscard]] constexpr bool is_terminal(SagaStatus status) noexcept {
    return status == SagaStatus::Completed ||
           status == SagaStatus::Compensated ||
           status == SagaStatus::Failed;
}

/**
 * @brief Persisted state of one running process
 */
struct SagaInstance {
    std::string saga_id;
    std::string saga_type;
    SagaStatus status{SagaStatus::Started};
    Payload data = Payload::object();
    Version version{0};  // optimistic lock, 0 = never saved
    std::vector<std::string> completed_steps;
    std::vector<CompensationRecord> compensation_log;
    std::uint32_t retry_count{0};
    Timestamp updated_at;
    std::string failure_reason;
};

/**
 * @brief What a saga may do while handling one event
 *
 * Commands are queued here and dispatched by the manager after the
 * instance has been persisted.
 */
class SagaContext {
public:
    SagaContext(SagaInstance& instance, std::uint32_t max_retries)
        : instance_(instance)
        , max_retries_(max_retries) {}

    void send(Command command) {
        commands_.push_back(std::move(command));
    }

    void complete_step(std::string step) {
        instance_.completed_steps.push_back(std::move(step));
    }

    void complete() {
        instance_.status = SagaStatus::Completed;
    }

    /**
     * @brief Undo completed steps in reverse order once this delivery is saved
     */
    void compensate(std::string reason) {
        instance_.status = SagaStatus::Compensating;
        instance_.failure_reason = std::move(reason);
    }

    void fail(std::string reason) {
        instance_.status = SagaStatus::Failed;
        instance_.failure_reason = std::move(reason);
    }

    /**
     * @brief Re-send a timed-out step if the retry budget allows
     * @return true if re-sent (status Waiting), false if the saga failed
     */
    bool retry_step(Command command);

    [[nodiscard]] const std::vector<Command>& commands() const noexcept { return commands_; }

    [[nodiscard]] std::vector<Command> take_commands() { return std::move(commands_); }

private:
    SagaInstance& instance_;
    std::uint32_t max_retries_;
    std::vector<Command> commands_;
};

/**
 * @brief A process manager reacting to events with commands
 */
class Saga {
public:
    virtual ~Saga() = default;

    [[nodiscard]] virtual std::string saga_type() const = 0;

    [[nodiscard]] virtual bool handles(const std::string& event_type) const = 0;

    /**
     * @brief Whether this event type may create a new instance
     */
    [[nodiscard]] virtual bool starts_on(const std::string& event_type) const = 0;

    /**
     * @brief Key that routes an event to its instance
     *
     * Defaults to the correlation id, falling back to the aggregate id.
     */
    [[nodiscard]] virtual std::string correlation_key(const Event& event) const {
        return event.correlation_id().empty() ? event.aggregate_id() : event.correlation_id();
    }

    [[nodiscard]] virtual std::uint32_t max_retries() const { return 3; }

    virtual Status handle_event(SagaInstance& instance, const Event& event, SagaContext& context) = 0;

    /**
     * @brief Command that undoes `step`, or nullopt when it needs no undo
     */
    [[nodiscard]] virtual std::optional<Command> compensation_for(const std::string& step,
                                                                  const SagaInstance& instance) const = 0;
};

} // namespace esflow
