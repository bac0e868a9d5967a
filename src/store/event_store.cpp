#include "esflow/store/event_store.hpp"

#include <unordered_set>

namespace esflow {

Status validate_append_batch(const std::string& aggregate_id, const std::vector<NewEvent>& events) {
    if (aggregate_id.empty()) {
        return Error::validation("aggregate_id must not be empty");
    }
    std::unordered_set<std::string> ids;
    for (const auto& event : events) {
        if (event.aggregate_id() != aggregate_id) {
            return Error::validation("event targets a different aggregate")
                .with("aggregate_id", aggregate_id)
                .with("event_aggregate_id", event.aggregate_id())
                .with("event_id", event.event_id());
        }
        if (!ids.insert(event.event_id()).second) {
            return Error::validation("duplicate event_id in batch").with("event_id", event.event_id());
        }
    }
    return ok_status();
}

} // namespace esflow
