#include "esflow/saga/saga_store.hpp"

#include <algorithm>

namespace esflow {

Result<SagaInstance> MemorySagaStore::load(const std::string& saga_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instances_.find(saga_id);
    if (it == instances_.end()) {
        return Error::not_found("no saga instance").with("saga_id", saga_id);
    }
    return it->second;
}

Result<Version> MemorySagaStore::save(const SagaInstance& instance, Version expected_version) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instances_.find(instance.saga_id);
    Version actual = it == instances_.end() ? 0 : it->second.version;
    if (actual != expected_version) {
        return Error::conflict(instance.saga_id, expected_version, actual);
    }

    SagaInstance stored = instance;
    stored.version = expected_version + 1;
    instances_[instance.saga_id] = std::move(stored);
    return expected_version + 1;
}

std::vector<SagaInstance> MemorySagaStore::list_by_status(SagaStatus status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SagaInstance> result;
    for (const auto& [id, instance] : instances_) {
        if (instance.status == status) {
            result.push_back(instance);
        }
    }
    std::sort(result.begin(), result.end(), [](const SagaInstance& a, const SagaInstance& b) {
        return a.saga_id < b.saga_id;
    });
    return result;
}

bool MemorySagaStore::remove(const std::string& saga_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.erase(saga_id) != 0;
}

std::size_t MemorySagaStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.size();
}

} // namespace esflow
