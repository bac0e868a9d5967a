#pragma once

/**
 * @file repository.hpp
 * @brief Loads aggregates by replay and saves them through a unit of work
 */

#include <chrono>
#include <memory>
#include <string>

#include "esflow/aggregate/aggregate.hpp"
#include "esflow/snapshot/snapshot_strategy.hpp"
#include "esflow/uow/unit_of_work.hpp"

namespace esflow {

/**
 * @brief Repository for one aggregate type
 *
 * Snapshots are taken after a successful commit when the strategy asks for
 * one; State needs nlohmann to_json/from_json for that.
 */
template<typename State>
class EventSourcedRepository {
public:
    EventSourcedRepository(std::string aggregate_type,
                           const ReplayEngine& engine,
                           const ApplyDispatch<State>& dispatch,
                           SnapshotStore* snapshots = nullptr,
                           std::shared_ptr<SnapshotStrategy> strategy = nullptr,
                           LoadOptions options = {})
        : aggregate_type_(std::move(aggregate_type))
        , engine_(engine)
        , dispatch_(dispatch)
        , snapshots_(snapshots)
        , strategy_(std::move(strategy))
        , options_(options)
        , logger_(logging::get("esflow.snapshot")) {}

    /**
     * @brief A new, empty aggregate (version 0)
     */
    [[nodiscard]] Aggregate<State> create(std::string aggregate_id) const {
        return Aggregate<State>(std::move(aggregate_id), aggregate_type_, dispatch_, engine_.upcasters());
    }

    /**
     * @return NotFound if the stream has no events
     */
    [[nodiscard]] Result<Aggregate<State>> load(const std::string& aggregate_id) const {
        auto loaded = engine_.load<State>(aggregate_id, dispatch_, options_);
        if (!loaded.ok()) {
            return loaded.error();
        }
        if (loaded.value().version == 0) {
            return Error::not_found("aggregate has no events")
                .with("aggregate_type", aggregate_type_)
                .with("aggregate_id", aggregate_id);
        }
        return Aggregate<State>::from_loaded(aggregate_id, aggregate_type_, std::move(loaded).value(),
                                             dispatch_, engine_.upcasters());
    }

    /**
     * @brief Stage the aggregate's pending events in `uow`
     *
     * The aggregate must outlive the commit: once it succeeds the aggregate
     * is marked committed and snapshotted if due.
     */
    Status save(Aggregate<State>& aggregate, UnitOfWork& uow) const {
        if (!aggregate.has_pending()) {
            return ok_status();
        }
        auto staged = uow.register_events(aggregate.id(), aggregate.version(), aggregate.pending_events());
        if (!staged.ok()) {
            return staged;
        }
        uow.on_committed([this, &aggregate](const CommitReceipt& receipt) {
            auto it = receipt.versions.find(aggregate.id());
            if (it == receipt.versions.end()) {
                return;
            }
            aggregate.mark_committed(it->second);
            snapshot_if_due(aggregate);
        });
        return ok_status();
    }

    [[nodiscard]] const std::string& aggregate_type() const noexcept { return aggregate_type_; }

private:
    void snapshot_if_due(Aggregate<State>& aggregate) const {
        if (!snapshots_ || !strategy_) {
            return;
        }

        auto now = now_utc();
        SnapshotContext context;
        context.aggregate_id = aggregate.id();
        context.events_since_last = aggregate.version() - aggregate.snapshot_version();
        if (auto taken = aggregate.snapshot_taken_at()) {
            context.time_since_last = std::chrono::duration_cast<std::chrono::milliseconds>(now - *taken);
        }
        if (!strategy_->should_snapshot(context)) {
            return;
        }

        Snapshot snapshot;
        snapshot.aggregate_id = aggregate.id();
        snapshot.aggregate_type = aggregate_type_;
        snapshot.version = aggregate.version();
        snapshot.state_schema_version = options_.state_schema_version;
        snapshot.state_payload = aggregate.state();
        snapshot.created_at = now;
        snapshots_->save(snapshot);
        aggregate.mark_snapshotted(snapshot.version, now);

        logger_->debug("Snapshotted '{}' at v{}", aggregate.id(), snapshot.version);
    }

    std::string aggregate_type_;
    const ReplayEngine& engine_;
    const ApplyDispatch<State>& dispatch_;
    SnapshotStore* snapshots_;
    std::shared_ptr<SnapshotStrategy> strategy_;
    LoadOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace esflow
