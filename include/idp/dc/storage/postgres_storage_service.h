/**
 * @file postgres_storage_service.h
 * @brief Storage service over a StorageRecords table
 *
 * Schema:
 *   StorageRecords(context VARCHAR(255), id VARCHAR(255), expires BIGINT NULL,
 *                  value TEXT NOT NULL, version BIGINT NOT NULL,
 *                  PRIMARY KEY (context, id))
 *
 * expires holds epoch milliseconds.
 */

#pragma once

#include <idp/dc/database/i_query_executor.h>
#include <idp/dc/storage/storage_service.h>

#include <memory>

namespace idp::dc {

class PostgresStorageService : public IStorageService {
public:
    /**
     * @throws std::invalid_argument if executor is nullptr
     */
    explicit PostgresStorageService(std::shared_ptr<IQueryExecutor> executor);

    /**
     * @brief Open the executor's connections and create the StorageRecords
     *        table if it does not exist
     */
    bool initialize() override;

    void shutdown() override;

    bool create(const std::string& context,
                const std::string& key,
                const std::string& value,
                std::optional<StorageRecord::TimePoint> expiration = std::nullopt) override;

    std::optional<StorageRecord> read(
        const std::string& context,
        const std::string& key,
        std::chrono::milliseconds timeout = std::chrono::milliseconds::zero()) override;

    bool update(const std::string& context,
                const std::string& key,
                const std::string& value,
                std::optional<StorageRecord::TimePoint> expiration = std::nullopt) override;

    bool deleteRecord(const std::string& context, const std::string& key) override;

    size_t reap(const std::string& context) override;

    std::string getType() const override { return "postgres"; }

private:
    std::shared_ptr<IQueryExecutor> executor_;

    void createSchema();
};

} // namespace idp::dc
