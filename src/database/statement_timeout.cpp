/**
 * @file statement_timeout.cpp
 */

#include <idp/dc/database/statement_timeout.h>
#include <idp/dc/exceptions.h>

#include <cstring>
#include <spdlog/spdlog.h>
#include <string>

namespace idp::dc {

namespace {

const char* const SQLSTATE_QUERY_CANCELED = "57014";

/**
 * @brief Run a utility statement; failures are returned, not thrown
 */
bool runUtility(PGconn* conn, const std::string& sql, std::string& error) {
    PGresult* res = PQexec(conn, sql.c_str());
    bool ok = res && PQresultStatus(res) == PGRES_COMMAND_OK;
    if (!ok) {
        error = PQerrorMessage(conn);
    }
    if (res) {
        PQclear(res);
    }
    return ok;
}

} // namespace

StatementTimeoutScope::StatementTimeoutScope(PGconn* conn, std::chrono::milliseconds timeout)
    : conn_(conn), active_(timeout.count() > 0)
{
    if (!active_) {
        return;
    }
    std::string error;
    if (!runUtility(conn_, "SET statement_timeout = " + std::to_string(timeout.count()), error)) {
        throw ExecutionException("unable to set statement_timeout: " + error);
    }
}

StatementTimeoutScope::~StatementTimeoutScope() {
    if (!active_) {
        return;
    }
    std::string error;
    if (!runUtility(conn_, "RESET statement_timeout", error)) {
        spdlog::warn("Failed to reset statement_timeout: {}", error);
    }
}

bool isQueryCanceled(const PGresult* res) {
    if (!res) {
        return false;
    }
    const char* sqlState = PQresultErrorField(res, PG_DIAG_SQLSTATE);
    return sqlState && std::strcmp(sqlState, SQLSTATE_QUERY_CANCELED) == 0;
}

} // namespace idp::dc
