#pragma once

/**
 * @file replay_engine.hpp
 * @brief Rebuild aggregate state from snapshot + tail events
 */

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "esflow/core/config.hpp"
#include "esflow/core/logging.hpp"
#include "esflow/event/upcaster.hpp"
#include "esflow/snapshot/snapshot.hpp"
#include "esflow/store/event_store.hpp"

namespace esflow {

/**
 * @brief Event-type to apply-function table for one state type
 */
template<typename State>
class ApplyDispatch {
public:
    using Handler = std::function<void(State&, const Payload&)>;

    /**
     * @brief Register the apply function for an event type
     * @throws ConfigurationError on a second registration for the same type
     */
    ApplyDispatch& on(const std::string& event_type, Handler handler) {
        if (!handler) {
            throw ConfigurationError("apply handler for '" + event_type + "' is empty");
        }
        if (!handlers_.emplace(event_type, std::move(handler)).second) {
            throw ConfigurationError("apply handler for '" + event_type + "' is already registered");
        }
        return *this;
    }

    [[nodiscard]] const Handler* find(const std::string& event_type) const {
        auto it = handlers_.find(event_type);
        return it == handlers_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] bool handles(const std::string& event_type) const {
        return handlers_.count(event_type) != 0;
    }

private:
    std::unordered_map<std::string, Handler> handlers_;
};

/**
 * @brief Outcome of a replay
 */
template<typename State>
struct Loaded {
    State state{};
    Version version{0};
    std::size_t events_replayed{0};
    std::optional<Version> snapshot_version;
    std::optional<Timestamp> snapshot_taken_at;

    [[nodiscard]] bool used_snapshot() const noexcept { return snapshot_version.has_value(); }
};

struct LoadOptions {
    SchemaVersion state_schema_version{1};
    bool use_snapshot{true};
};

/**
 * @brief Reconstructs aggregate state deterministically
 *
 * Loading is snapshot (when present and compatible) followed by every
 * later event, each upcast to its current schema version before apply.
 */
class ReplayEngine {
public:
    ReplayEngine(const EventStore& store,
                 const UpcasterRegistry& upcasters,
                 const SnapshotStore* snapshots = nullptr,
                 ReplayConfig config = {});

    template<typename State>
    [[nodiscard]] Result<Loaded<State>> load(
        const std::string& aggregate_id,
        const ApplyDispatch<State>& dispatch,
        LoadOptions options = {}) const {
        Loaded<State> loaded;

        if (options.use_snapshot && snapshots_) {
            auto restored = restore_snapshot<State>(aggregate_id, options.state_schema_version, loaded);
            if (!restored.ok()) {
                return restored.error();
            }
        }

        auto events = store_.read(aggregate_id, loaded.version);
        if (!events.ok()) {
            return events.error();
        }

        auto applied = apply_events(loaded.state, events.value(), dispatch);
        if (!applied.ok()) {
            return applied.error();
        }
        loaded.events_replayed = applied.value();
        if (!events.value().empty()) {
            loaded.version = events.value().back().sequence_number();
        }

        logger_->debug("Loaded '{}' at v{} ({} event(s) replayed, snapshot: {})",
                       aggregate_id, loaded.version, loaded.events_replayed,
                       loaded.used_snapshot() ? "yes" : "no");
        return loaded;
    }

    /**
     * @brief Replay the whole stream, ignoring snapshots
     */
    template<typename State>
    [[nodiscard]] Result<Loaded<State>> load_full(
        const std::string& aggregate_id,
        const ApplyDispatch<State>& dispatch,
        LoadOptions options = {}) const {
        options.use_snapshot = false;
        return load<State>(aggregate_id, dispatch, options);
    }

    /**
     * @brief Upcast and apply events in order
     * @return Number of events applied
     */
    template<typename State>
    [[nodiscard]] Result<std::size_t> apply_events(
        State& state,
        const std::vector<Event>& events,
        const ApplyDispatch<State>& dispatch) const {
        std::size_t applied = 0;
        for (const auto& event : events) {
            auto handler = dispatch.find(event.event_type());
            if (!handler) {
                if (config_.ignore_unknown_events) {
                    logger_->debug("No apply handler for '{}' (event {}), skipping",
                                   event.event_type(), event.event_id());
                    continue;
                }
                return Error::validation("no apply handler for event type")
                    .with("event_type", event.event_type())
                    .with("event_id", event.event_id());
            }

            auto upcasted = upcasters_.upcast_event(event);
            if (!upcasted.ok()) {
                logger_->error("Replay of '{}' aborted: {}", event.aggregate_id(),
                               upcasted.error().to_string());
                return upcasted.error();
            }

            try {
                (*handler)(state, upcasted.value().payload());
            } catch (const nlohmann::json::exception& e) {
                return Error::validation(std::string("apply handler rejected payload: ") + e.what())
                    .with("event_type", event.event_type())
                    .with("event_id", event.event_id());
            }
            applied++;
        }
        return applied;
    }

    [[nodiscard]] const UpcasterRegistry& upcasters() const noexcept { return upcasters_; }

private:
    template<typename State>
    Status restore_snapshot(const std::string& aggregate_id, SchemaVersion expected_schema, Loaded<State>& loaded) const {
        auto snapshot = snapshots_->load(aggregate_id, expected_schema);
        if (!snapshot.ok()) {
            const auto& error = snapshot.error();
            if (error.is(ErrorCode::NotFound)) {
                return ok_status();
            }
            if (error.is(ErrorCode::SnapshotIncompatible)) {
                return on_incompatible(aggregate_id, error);
            }
            return error;
        }

        try {
            loaded.state = snapshot.value().state_payload.template get<State>();
        } catch (const nlohmann::json::exception& e) {
            loaded.state = State{};
            return on_incompatible(aggregate_id,
                Error(ErrorCode::SnapshotIncompatible, std::string("snapshot state does not decode: ") + e.what())
                    .with("aggregate_id", aggregate_id));
        }
        loaded.version = snapshot.value().version;
        loaded.snapshot_version = snapshot.value().version;
        loaded.snapshot_taken_at = snapshot.value().created_at;
        return ok_status();
    }

    Status on_incompatible(const std::string& aggregate_id, const Error& error) const;

    const EventStore& store_;
    const UpcasterRegistry& upcasters_;
    const SnapshotStore* snapshots_;
    ReplayConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace esflow
