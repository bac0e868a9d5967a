#include "esflow/snapshot/snapshot_strategy.hpp"

namespace esflow {

EventCountStrategy::EventCountStrategy(Version threshold)
    : threshold_(threshold) {
    if (threshold_ == 0) {
        throw ConfigurationError("EventCountStrategy threshold must be positive");
    }
}

bool EventCountStrategy::should_snapshot(const SnapshotContext& context) const {
    return context.events_since_last >= threshold_;
}

TimeThresholdStrategy::TimeThresholdStrategy(std::chrono::milliseconds interval)
    : interval_(interval) {
    if (interval_.count() < 0) {
        throw ConfigurationError("TimeThresholdStrategy interval must not be negative");
    }
}

bool TimeThresholdStrategy::should_snapshot(const SnapshotContext& context) const {
    if (!context.time_since_last) {
        return context.events_since_last > 0;
    }
    return *context.time_since_last >= interval_;
}

CompositeStrategy::CompositeStrategy(std::vector<std::shared_ptr<SnapshotStrategy>> children, Mode mode)
    : children_(std::move(children))
    , mode_(mode) {
    for (const auto& child : children_) {
        if (!child) {
            throw ConfigurationError("CompositeStrategy child must not be null");
        }
    }
}

bool CompositeStrategy::should_snapshot(const SnapshotContext& context) const {
    if (children_.empty()) {
        return false;
    }

    std::size_t votes = 0;
    for (const auto& child : children_) {
        if (child->should_snapshot(context)) {
            votes++;
        }
    }
    return mode_ == Mode::Any ? votes > 0 : votes == children_.size();
}

} // namespace esflow
