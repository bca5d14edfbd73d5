/**
 * @file sql_statement.cpp
 */

#include <idp/dc/database/sql_statement.h>
#include <idp/dc/database/db_connection_pool.h>
#include <idp/dc/database/statement_timeout.h>
#include <idp/dc/exceptions.h>

#include <spdlog/spdlog.h>

namespace idp::dc {

std::unique_ptr<IRawResult> SqlStatement::execute(IConnection& conn,
                                                  std::chrono::milliseconds timeout) const {
    DbConnection& dbConn = connectionCast<DbConnection>(conn);
    PGconn* pg = dbConn.get();

    StatementTimeoutScope timeoutScope(pg, timeout);

    spdlog::debug("SQL: {}", sql_);
    PGresult* res = PQexec(pg, sql_.c_str());
    if (!res) {
        throw ExecutionException(std::string("null result: ") + PQerrorMessage(pg));
    }

    ExecStatusType status = PQresultStatus(res);
    if (status != PGRES_TUPLES_OK) {
        std::string error = status == PGRES_COMMAND_OK
            ? std::string("statement returned no result set")
            : std::string(PQresultErrorMessage(res));
        bool canceled = isQueryCanceled(res);
        PQclear(res);

        if (canceled) {
            throw TimeoutException("SQL statement exceeded " + std::to_string(timeout.count()) + "ms");
        }
        throw ExecutionException("SQL statement failed: " + error);
    }

    int rows = PQntuples(res);
    int cols = PQnfields(res);

    std::vector<SqlColumn> columns;
    columns.reserve(cols);
    for (int j = 0; j < cols; ++j) {
        columns.push_back(SqlColumn{PQfname(res, j), PQftype(res, j)});
    }

    std::vector<SqlResultSet::Row> data;
    data.reserve(rows);
    for (int i = 0; i < rows; ++i) {
        SqlResultSet::Row row;
        row.reserve(cols);
        for (int j = 0; j < cols; ++j) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, i, j), PQgetlength(res, i, j)));
            }
        }
        data.push_back(std::move(row));
    }

    PQclear(res);
    spdlog::debug("SQL returned {} row(s), {} column(s)", rows, cols);
    return std::make_unique<SqlResultSet>(std::move(columns), std::move(data));
}

SqlStatementBuilder::SqlStatementBuilder(std::string sqlTemplate)
    : template_(std::move(sqlTemplate), escapeSqlLiteral)
{
    if (template_.getText().empty()) {
        throw ConfigurationException("SQL template cannot be empty");
    }
}

std::unique_ptr<IExecutableQuery> SqlStatementBuilder::build(const ResolutionContext& context) const {
    return std::make_unique<SqlStatement>(template_.render(context));
}

} // namespace idp::dc
