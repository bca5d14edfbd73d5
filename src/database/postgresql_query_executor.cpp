#include <idp/dc/database/postgresql_query_executor.h>
#include <idp/dc/database/statement_timeout.h>
#include <idp/dc/exceptions.h>

#include <spdlog/spdlog.h>
#include <cstdlib>
#include <stdexcept>

namespace idp::dc {

// ============================================================================
// Constructor
// ============================================================================

PostgreSQLQueryExecutor::PostgreSQLQueryExecutor(std::shared_ptr<DbConnectionPool> pool)
    : pool_(std::move(pool))
{
    if (!pool_) {
        throw std::invalid_argument("PostgreSQLQueryExecutor: pool cannot be nullptr");
    }
    spdlog::debug("[PostgreSQLQueryExecutor] Initialized");
}

// ============================================================================
// Public Interface Implementation
// ============================================================================

bool PostgreSQLQueryExecutor::initialize() {
    return pool_->initialize();
}

void PostgreSQLQueryExecutor::shutdown() {
    pool_->shutdown();
}

Json::Value PostgreSQLQueryExecutor::executeQuery(
    const std::string& query,
    const std::vector<std::string>& params,
    std::chrono::milliseconds timeout
)
{
    spdlog::debug("[PostgreSQLQueryExecutor] Query: {} (params: {})", query, params.size());

    auto conn = pool_->acquire();
    StatementTimeoutScope timeoutScope(conn->get(), timeout);
    PGresult* res = executeRawQuery(*conn, query, params);

    Json::Value result = pgResultToJson(res);
    PQclear(res);
    return result;
}

int PostgreSQLQueryExecutor::executeCommand(
    const std::string& query,
    const std::vector<std::string>& params
)
{
    spdlog::debug("[PostgreSQLQueryExecutor] Command: {} (params: {})", query, params.size());

    auto conn = pool_->acquire();
    PGresult* res = executeRawQuery(*conn, query, params);

    const char* affectedRowsStr = PQcmdTuples(res);
    int affectedRows = 0;
    if (affectedRowsStr && affectedRowsStr[0] != '\0') {
        affectedRows = std::atoi(affectedRowsStr);
    }

    PQclear(res);

    spdlog::debug("[PostgreSQLQueryExecutor] Command executed, affected rows: {}", affectedRows);
    return affectedRows;
}

Json::Value PostgreSQLQueryExecutor::fieldToJson(const char* value, Oid type) {
    switch (type) {
        case 20:   // INT8
        case 21:   // INT2
        case 23:   // INT4
            return Json::Value(static_cast<Json::Int64>(std::strtoll(value, nullptr, 10)));
        case 700:  // FLOAT4
        case 701:  // FLOAT8
            return Json::Value(std::atof(value));
        case 16:   // BOOL
            return Json::Value(value[0] == 't');
        default:
            return Json::Value(value);
    }
}

// ============================================================================
// Private Implementation
// ============================================================================

PGresult* PostgreSQLQueryExecutor::executeRawQuery(
    DbConnection& conn,
    const std::string& query,
    const std::vector<std::string>& params
)
{
    std::vector<const char*> paramValues;
    for (const auto& param : params) {
        paramValues.push_back(param.c_str());
    }

    PGresult* res = PQexecParams(
        conn.get(),                    // Connection
        query.c_str(),                 // Query string
        static_cast<int>(params.size()),
        nullptr,                       // Parameter types (nullptr = infer)
        paramValues.data(),            // Parameter values
        nullptr,                       // Parameter lengths (nullptr = text)
        nullptr,                       // Parameter formats (nullptr = text)
        0                              // Result format (0 = text)
    );

    if (!res) {
        throw ExecutionException(std::string("[PostgreSQLQueryExecutor] null result: ") +
                                 PQerrorMessage(conn.get()));
    }

    ExecStatusType status = PQresultStatus(res);
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        std::string error = PQerrorMessage(conn.get());
        bool canceled = isQueryCanceled(res);
        PQclear(res);
        if (canceled) {
            throw TimeoutException("[PostgreSQLQueryExecutor] statement timed out: " + error);
        }
        throw ExecutionException("[PostgreSQLQueryExecutor] query failed: " + error);
    }

    return res;
}

Json::Value PostgreSQLQueryExecutor::pgResultToJson(PGresult* res)
{
    Json::Value array = Json::arrayValue;

    int rows = PQntuples(res);
    int cols = PQnfields(res);

    spdlog::debug("[PostgreSQLQueryExecutor] pgResultToJson: rows={}, cols={}", rows, cols);

    for (int i = 0; i < rows; ++i) {
        Json::Value row(Json::objectValue);
        for (int j = 0; j < cols; ++j) {
            const char* fieldName = PQfname(res, j);

            if (PQgetisnull(res, i, j)) {
                row[fieldName] = Json::nullValue;
                continue;
            }

            row[fieldName] = fieldToJson(PQgetvalue(res, i, j), PQftype(res, j));
        }
        array.append(row);
    }

    return array;
}

} // namespace idp::dc
