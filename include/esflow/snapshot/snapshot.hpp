#pragma once

/**
 * @file snapshot.hpp
 * @brief Materialized aggregate state keyed to a stream version
 */

#include <optional>
#include <string>

#include "esflow/core/result.hpp"
#include "esflow/event/event.hpp"

namespace esflow {

struct Snapshot {
    std::string aggregate_id;
    std::string aggregate_type;
    Version version{0};
    SchemaVersion state_schema_version{1};  // layout tag of state_payload
    Payload state_payload = Payload::object();
    Timestamp created_at;
};

/**
 * @brief Storage contract for snapshots
 *
 * At most one snapshot per aggregate is kept; saving an older version than
 * the stored one is a no-op.
 */
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    virtual void save(const Snapshot& snapshot) = 0;

    /**
     * @return NotFound if absent, SnapshotIncompatible if
     *         `expected_state_schema` is given and does not match
     */
    [[nodiscard]] virtual Result<Snapshot> load(
        const std::string& aggregate_id,
        std::optional<SchemaVersion> expected_state_schema = std::nullopt) const = 0;

    virtual void remove(const std::string& aggregate_id) = 0;
};

/**
 * @brief Shared schema-tag check used by the adapters
 */
[[nodiscard]] Result<Snapshot> check_snapshot_schema(
    Snapshot snapshot,
    std::optional<SchemaVersion> expected_state_schema);

} // namespace esflow
