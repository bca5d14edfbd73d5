#pragma once

#include <idp/dc/database/i_query_executor.h>
#include <idp/dc/database/db_connection_pool.h>

#include <libpq-fe.h>

/**
 * @file postgresql_query_executor.h
 * @brief PostgreSQL Query Executor - libpq-based implementation
 *
 * Handles connection acquisition from the pool, parameterized execution
 * and conversion of PGresult to JSON.
 */

namespace idp::dc {

class PostgreSQLQueryExecutor : public IQueryExecutor {
public:
    /**
     * @param pool PostgreSQL connection pool
     * @throws std::invalid_argument if pool is nullptr
     */
    explicit PostgreSQLQueryExecutor(std::shared_ptr<DbConnectionPool> pool);

    ~PostgreSQLQueryExecutor() override = default;

    /**
     * @brief Warm the pool
     */
    bool initialize() override;

    void shutdown() override;

    /**
     * @brief Execute SELECT query with parameterized binding (PQexecParams)
     */
    Json::Value executeQuery(
        const std::string& query,
        const std::vector<std::string>& params = {},
        std::chrono::milliseconds timeout = std::chrono::milliseconds::zero()
    ) override;

    /**
     * @brief Execute INSERT/UPDATE/DELETE command
     * @return Number of affected rows (from PQcmdTuples)
     */
    int executeCommand(
        const std::string& query,
        const std::vector<std::string>& params
    ) override;

    /**
     * @brief Convert one field to JSON by type OID
     *
     * - INT2, INT4, INT8 → JSON integer
     * - FLOAT4, FLOAT8 → JSON number
     * - BOOL → JSON boolean
     * - Others → JSON string
     */
    static Json::Value fieldToJson(const char* value, Oid type);

private:
    std::shared_ptr<DbConnectionPool> pool_;

    Json::Value pgResultToJson(PGresult* res);

    /**
     * @brief Execute raw parameterized query on a leased connection
     *
     * Caller must PQclear() the result.
     */
    PGresult* executeRawQuery(
        DbConnection& conn,
        const std::string& query,
        const std::vector<std::string>& params
    );
};

} // namespace idp::dc
