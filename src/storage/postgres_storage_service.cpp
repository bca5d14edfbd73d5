/**
 * @file postgres_storage_service.cpp
 */

#include <idp/dc/storage/postgres_storage_service.h>
#include <idp/dc/exceptions.h>

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace idp::dc {

namespace {

const char* const CREATE_TABLE_SQL =
    "CREATE TABLE IF NOT EXISTS StorageRecords ("
    " context VARCHAR(255) NOT NULL,"
    " id VARCHAR(255) NOT NULL,"
    " expires BIGINT NULL,"
    " value TEXT NOT NULL,"
    " version BIGINT NOT NULL,"
    " PRIMARY KEY (context, id))";

// An existing but expired record is replaced
const char* const CREATE_SQL =
    "INSERT INTO StorageRecords (context, id, expires, value, version) "
    "VALUES ($1, $2, NULLIF($3, '')::BIGINT, $4, 1) "
    "ON CONFLICT (context, id) DO UPDATE "
    "SET expires = EXCLUDED.expires, value = EXCLUDED.value, version = 1 "
    "WHERE StorageRecords.expires IS NOT NULL AND StorageRecords.expires <= $5::BIGINT";

const char* const READ_SQL =
    "SELECT value, version, expires FROM StorageRecords "
    "WHERE context = $1 AND id = $2 AND (expires IS NULL OR expires > $3::BIGINT)";

const char* const UPDATE_SQL =
    "UPDATE StorageRecords SET value = $3, version = version + 1, "
    "expires = NULLIF($4, '')::BIGINT "
    "WHERE context = $1 AND id = $2 AND (expires IS NULL OR expires > $5::BIGINT)";

const char* const DELETE_SQL =
    "DELETE FROM StorageRecords WHERE context = $1 AND id = $2";

const char* const REAP_SQL =
    "DELETE FROM StorageRecords "
    "WHERE context = $1 AND expires IS NOT NULL AND expires <= $2::BIGINT";

long long toEpochMillis(StorageRecord::TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string nowMillis() {
    return std::to_string(toEpochMillis(std::chrono::system_clock::now()));
}

std::string expirationParam(const std::optional<StorageRecord::TimePoint>& expiration) {
    return expiration ? std::to_string(toEpochMillis(*expiration)) : std::string();
}

} // namespace

PostgresStorageService::PostgresStorageService(std::shared_ptr<IQueryExecutor> executor)
    : executor_(std::move(executor))
{
    if (!executor_) {
        throw std::invalid_argument("PostgresStorageService: executor cannot be nullptr");
    }
}

bool PostgresStorageService::initialize() {
    if (!executor_->initialize()) {
        spdlog::error("StorageRecords database is unreachable");
        return false;
    }
    try {
        createSchema();
    } catch (const DataConnectorException& e) {
        spdlog::error("Unable to prepare StorageRecords table: {}", e.what());
        return false;
    }
    return true;
}

void PostgresStorageService::shutdown() {
    executor_->shutdown();
}

void PostgresStorageService::createSchema() {
    executor_->executeCommand(CREATE_TABLE_SQL, {});
    spdlog::info("StorageRecords table ready");
}

bool PostgresStorageService::create(const std::string& context,
                                    const std::string& key,
                                    const std::string& value,
                                    std::optional<StorageRecord::TimePoint> expiration) {
    int affected = executor_->executeCommand(
        CREATE_SQL, {context, key, expirationParam(expiration), value, nowMillis()});
    return affected > 0;
}

std::optional<StorageRecord> PostgresStorageService::read(const std::string& context,
                                                          const std::string& key,
                                                          std::chrono::milliseconds timeout) {
    Json::Value rows = executor_->executeQuery(READ_SQL, {context, key, nowMillis()}, timeout);
    if (rows.empty()) {
        return std::nullopt;
    }

    const Json::Value& row = rows[0];
    if (!row["value"].isString()) {
        throw ExecutionException("StorageRecords(" + context + ", " + key + ") has no value");
    }

    StorageRecord record;
    record.value = row["value"].asString();
    record.version = row["version"].isIntegral() ? row["version"].asInt64() : 1;
    if (row["expires"].isIntegral()) {
        record.expiration = StorageRecord::TimePoint(std::chrono::milliseconds(row["expires"].asInt64()));
    }
    return record;
}

bool PostgresStorageService::update(const std::string& context,
                                    const std::string& key,
                                    const std::string& value,
                                    std::optional<StorageRecord::TimePoint> expiration) {
    int affected = executor_->executeCommand(
        UPDATE_SQL, {context, key, value, expirationParam(expiration), nowMillis()});
    return affected > 0;
}

bool PostgresStorageService::deleteRecord(const std::string& context, const std::string& key) {
    return executor_->executeCommand(DELETE_SQL, {context, key}) > 0;
}

size_t PostgresStorageService::reap(const std::string& context) {
    int affected = executor_->executeCommand(REAP_SQL, {context, nowMillis()});
    if (affected > 0) {
        spdlog::debug("Reaped {} expired record(s) from context '{}'", affected, context);
    }
    return static_cast<size_t>(affected);
}

} // namespace idp::dc
