#include "esflow/aggregate/replay_engine.hpp"

namespace esflow {

ReplayEngine::ReplayEngine(const EventStore& store,
                           const UpcasterRegistry& upcasters,
                           const SnapshotStore* snapshots,
                           ReplayConfig config)
    : store_(store)
    , upcasters_(upcasters)
    , snapshots_(snapshots)
    , config_(config)
    , logger_(logging::get("esflow.replay")) {}

Status ReplayEngine::on_incompatible(const std::string& aggregate_id, const Error& error) const {
    if (config_.on_incompatible_snapshot == IncompatibleSnapshotPolicy::Fail) {
        return error;
    }
    logger_->warn("Ignoring snapshot of '{}', replaying full stream: {}", aggregate_id, error.to_string());
    return ok_status();
}

} // namespace esflow
