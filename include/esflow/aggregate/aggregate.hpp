#pragma once

/**
 * @file aggregate.hpp
 * @brief Event-sourced aggregate root
 */

#include <optional>
#include <string>
#include <vector>

#include "esflow/aggregate/replay_engine.hpp"

namespace esflow {

/**
 * @brief State plus the events raised since it was loaded
 *
 * The aggregate never mutates its state except through apply functions,
 * so the state after raise() equals the state a later replay produces.
 */
template<typename State>
class Aggregate {
public:
    Aggregate(std::string id,
              std::string type,
              const ApplyDispatch<State>& dispatch,
              const UpcasterRegistry& upcasters)
        : id_(std::move(id))
        , type_(std::move(type))
        , dispatch_(&dispatch)
        , upcasters_(&upcasters) {}

    /**
     * @brief Rehydrate from a loaded replay result
     */
    static Aggregate from_loaded(std::string id,
                                 std::string type,
                                 Loaded<State> loaded,
                                 const ApplyDispatch<State>& dispatch,
                                 const UpcasterRegistry& upcasters) {
        Aggregate aggregate(std::move(id), std::move(type), dispatch, upcasters);
        aggregate.state_ = std::move(loaded.state);
        aggregate.version_ = loaded.version;
        aggregate.snapshot_version_ = loaded.snapshot_version.value_or(0);
        aggregate.snapshot_taken_at_ = loaded.snapshot_taken_at;
        return aggregate;
    }

    /**
     * @brief Rehydrate from a complete, ordered history
     *
     * The history must belong to `id` and be gapless from sequence 1.
     */
    [[nodiscard]] static Result<Aggregate> from_history(std::string id,
                                                        std::string type,
                                                        const std::vector<Event>& events,
                                                        const ApplyDispatch<State>& dispatch,
                                                        const UpcasterRegistry& upcasters,
                                                        const ReplayEngine* engine = nullptr) {
        Aggregate aggregate(std::move(id), std::move(type), dispatch, upcasters);
        Version expected = 1;
        for (const auto& event : events) {
            if (event.aggregate_id() != aggregate.id_) {
                return Error::validation("history contains an event of another aggregate")
                    .with("aggregate_id", aggregate.id_)
                    .with("event_id", event.event_id());
            }
            if (event.sequence_number() != expected) {
                return Error::validation("history is not gapless")
                    .with("aggregate_id", aggregate.id_)
                    .with("expected_sequence", std::to_string(expected))
                    .with("actual_sequence", std::to_string(event.sequence_number()));
            }
            expected++;
        }

        if (engine) {
            auto applied = engine->apply_events(aggregate.state_, events, dispatch);
            if (!applied.ok()) {
                return applied.error();
            }
        } else {
            for (const auto& event : events) {
                auto upcasted = upcasters.upcast_event(event);
                if (!upcasted.ok()) {
                    return upcasted.error();
                }
                if (auto handler = dispatch.find(event.event_type())) {
                    (*handler)(aggregate.state_, upcasted.value().payload());
                }
            }
        }
        aggregate.version_ = events.size();
        return aggregate;
    }

    /**
     * @brief Record a new event and apply it to the state
     *
     * The event is stamped with the current schema version of its type.
     */
    Status raise(const std::string& event_type, Payload payload, EventOrigin origin = {}) {
        auto handler = dispatch_->find(event_type);
        if (!handler) {
            return Error::validation("aggregate has no apply handler for event type")
                .with("aggregate_type", type_)
                .with("event_type", event_type);
        }

        auto pending = NewEvent::create(id_, type_, event_type, std::move(payload),
                                        upcasters_->current_version(event_type), std::move(origin));
        if (!pending.ok()) {
            return pending.error();
        }

        try {
            (*handler)(state_, pending.value().payload());
        } catch (const nlohmann::json::exception& e) {
            return Error::validation(std::string("apply handler rejected payload: ") + e.what())
                .with("event_type", event_type);
        }
        pending_.push_back(std::move(pending).value());
        return ok_status();
    }

    /**
     * @brief Forget pending events once they are durably appended
     */
    void mark_committed(Version new_version) {
        pending_.clear();
        version_ = new_version;
    }

    void mark_snapshotted(Version version, Timestamp at) {
        snapshot_version_ = version;
        snapshot_taken_at_ = at;
    }

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& type() const noexcept { return type_; }
    [[nodiscard]] const State& state() const noexcept { return state_; }

    /// Version of the last persisted event (the expected version for the next append)
    [[nodiscard]] Version version() const noexcept { return version_; }

    [[nodiscard]] const std::vector<NewEvent>& pending_events() const noexcept { return pending_; }
    [[nodiscard]] bool has_pending() const noexcept { return !pending_.empty(); }

    [[nodiscard]] Version snapshot_version() const noexcept { return snapshot_version_; }
    [[nodiscard]] std::optional<Timestamp> snapshot_taken_at() const noexcept { return snapshot_taken_at_; }

private:
    std::string id_;
    std::string type_;
    const ApplyDispatch<State>* dispatch_;
    const UpcasterRegistry* upcasters_;
    State state_{};
    Version version_{0};
    std::vector<NewEvent> pending_;
    Version snapshot_version_{0};
    std::optional<Timestamp> snapshot_taken_at_;
};

} // namespace esflow
