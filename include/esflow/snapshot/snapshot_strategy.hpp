#pragma once

/**
 * @file snapshot_strategy.hpp
 * @brief Policies deciding when an aggregate gets a new snapshot
 */

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "esflow/core/error.hpp"

namespace esflow {

/**
 * @brief What a strategy gets to look at
 */
struct SnapshotContext {
    std::string aggregate_id;
    Version events_since_last{0};
    // nullopt when the aggregate has never been snapshotted
    std::optional<std::chrono::milliseconds> time_since_last;
};

class SnapshotStrategy {
public:
    virtual ~SnapshotStrategy() = default;

    [[nodiscard]] virtual bool should_snapshot(const SnapshotContext& context) const = 0;
};

/**
 * @brief Snapshot every `threshold` events
 */
class EventCountStrategy : public SnapshotStrategy {
public:
    explicit EventCountStrategy(Version threshold);

    [[nodiscard]] bool should_snapshot(const SnapshotContext& context) const override;

    [[nodiscard]] Version threshold() const noexcept { return threshold_; }

private:
    Version threshold_;
};

/**
 * @brief Snapshot when the last one is older than `interval`
 *
 * An aggregate that has events but no snapshot yet always qualifies.
 */
class TimeThresholdStrategy : public SnapshotStrategy {
public:
    explicit TimeThresholdStrategy(std::chrono::milliseconds interval);

    [[nodiscard]] bool should_snapshot(const SnapshotContext& context) const override;

private:
    std::chrono::milliseconds interval_;
};

/**
 * @brief Combines child strategies with any/all semantics
 *
 * Every child is evaluated on every call, so stateful children observe
 * each decision. An empty composite never snapshots.
 */
class CompositeStrategy : public SnapshotStrategy {
public:
    enum class Mode { Any, All };

    CompositeStrategy(std::vector<std::shared_ptr<SnapshotStrategy>> children, Mode mode = Mode::Any);

    [[nodiscard]] bool should_snapshot(const SnapshotContext& context) const override;

    [[nodiscard]] Mode mode() const noexcept { return mode_; }

private:
    std::vector<std::shared_ptr<SnapshotStrategy>> children_;
    Mode mode_;
};

} // namespace esflow
