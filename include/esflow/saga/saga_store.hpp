#pragma once

/**
 * @file saga_store.hpp
 * @brief Persistence of saga instances with optimistic locking
 */

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "esflow/saga/saga.hpp"

namespace esflow {

class SagaStore {
public:
    virtual ~SagaStore() = default;

    /**
     * @return NotFound when no instance has that id
     */
    [[nodiscard]] virtual Result<SagaInstance> load(const std::string& saga_id) const = 0;

    /**
     * @brief Persist `instance` if the stored version equals `expected_version`
     * @return the new version, or ConcurrencyConflict
     */
    virtual Result<Version> save(const SagaInstance& instance, Version expected_version) = 0;

    [[nodiscard]] virtual std::vector<SagaInstance> list_by_status(SagaStatus status) const = 0;

    virtual bool remove(const std::string& saga_id) = 0;
};

class MemorySagaStore : public SagaStore {
public:
    [[nodiscard]] Result<SagaInstance> load(const std::string& saga_id) const override;
    Result<Version> save(const SagaInstance& instance, Version expected_version) override;
    [[nodiscard]] std::vector<SagaInstance> list_by_status(SagaStatus status) const override;
    bool remove(const std::string& saga_id) override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, SagaInstance> instances_;
};

} // namespace esflow
