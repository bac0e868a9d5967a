#pragma once

/**
 * @file sqlite_saga_store.hpp
 * @brief Saga instances in the sagas table
 */

#include <memory>

#include "esflow/saga/saga_store.hpp"
#include "esflow/sqlite/database.hpp"

namespace esflow {

/**
 * @brief SagaStore over SQLite
 *
 * Completed steps, the compensation log, the retry count and the failure
 * reason are kept as one JSON document in the progress column.
 */
class SqliteSagaStore : public SagaStore {
public:
    explicit SqliteSagaStore(std::shared_ptr<sqlite::Database> db);

    [[nodiscard]] Result<SagaInstance> load(const std::string& saga_id) const override;
    Result<Version> save(const SagaInstance& instance, Version expected_version) override;
    [[nodiscard]] std::vector<SagaInstance> list_by_status(SagaStatus status) const override;
    bool remove(const std::string& saga_id) override;

private:
    std::shared_ptr<sqlite::Database> db_;
};

} // namespace esflow
