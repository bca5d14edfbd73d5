#pragma once

#include <json/json.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

/**
 * @file i_query_executor.h
 * @brief Query Executor Interface - pool-backed SQL execution
 *
 * Used by components that talk to the database outside the connector
 * pipeline (the SQL-backed storage service). Results come back as JSON
 * rows so callers stay independent of libpq.
 */

namespace idp::dc {

/**
 * @brief Query Executor Interface
 *
 * Every call leases its own connection. Failures are reported as
 * ConnectionException (no connection) or ExecutionException (statement
 * failed).
 */
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /**
     * @brief Open the backing connections
     * @return false if the database is unreachable
     */
    virtual bool initialize() = 0;

    /**
     * @brief Close the backing connections; later calls throw ConnectionException
     */
    virtual void shutdown() = 0;

    /**
     * @brief Execute SELECT query and return results as JSON array
     *
     * @param query SQL query string with $1, $2 placeholders
     * @param params Query parameters
     * @param timeout Statement timeout (zero = none); exceeding it throws TimeoutException
     * @return Array of rows, each a JSON object of column name-value pairs
     *
     * Example result:
     * [
     *   {"id": "123", "value": "x", "version": 3},
     *   {"id": "456", "value": "y", "version": 1}
     * ]
     */
    virtual Json::Value executeQuery(
        const std::string& query,
        const std::vector<std::string>& params = {},
        std::chrono::milliseconds timeout = std::chrono::milliseconds::zero()
    ) = 0;

    /**
     * @brief Execute INSERT/UPDATE/DELETE command
     * @return Number of affected rows
     */
    virtual int executeCommand(
        const std::string& query,
        const std::vector<std::string>& params
    ) = 0;
};

} // namespace idp::dc
