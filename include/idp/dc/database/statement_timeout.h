/**
 * @file statement_timeout.h
 * @brief Per-statement timeout on a leased PostgreSQL connection
 */

#pragma once

#include <libpq-fe.h>

#include <chrono>

namespace idp::dc {

/**
 * @brief Applies statement_timeout for one statement and resets it afterwards
 *
 * A zero or negative timeout leaves the session setting untouched.
 *
 * @throws ExecutionException if the timeout cannot be set
 */
class StatementTimeoutScope {
public:
    StatementTimeoutScope(PGconn* conn, std::chrono::milliseconds timeout);
    ~StatementTimeoutScope();

    StatementTimeoutScope(const StatementTimeoutScope&) = delete;
    StatementTimeoutScope& operator=(const StatementTimeoutScope&) = delete;

private:
    PGconn* conn_;
    bool active_;
};

/**
 * @brief True if the statement was canceled (SQLSTATE 57014), e.g. by statement_timeout
 */
bool isQueryCanceled(const PGresult* res);

} // namespace idp::dc
