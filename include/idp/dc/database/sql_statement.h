/**
 * @file sql_statement.h
 * @brief Relational query, its builder and its raw result
 */

#pragma once

#include <idp/dc/executable_query.h>
#include <idp/dc/query_template.h>
#include <idp/dc/strategies.h>

#include <optional>
#include <string>
#include <vector>

namespace idp::dc {

struct SqlColumn {
    std::string name;
    unsigned int typeOid = 0;  ///< PostgreSQL type OID, 0 if unknown
};

/**
 * @brief Owned copy of a query result in text format
 *
 * A nullopt field is SQL NULL.
 */
class SqlResultSet : public IRawResult {
public:
    using Row = std::vector<std::optional<std::string>>;

    SqlResultSet(std::vector<SqlColumn> columns, std::vector<Row> rows)
        : columns_(std::move(columns)), rows_(std::move(rows)) {}

    const std::vector<SqlColumn>& getColumns() const { return columns_; }
    const std::vector<Row>& getRows() const { return rows_; }

    std::string getBackendType() const override { return "postgres"; }
    bool isEmpty() const override { return rows_.empty(); }

private:
    std::vector<SqlColumn> columns_;
    std::vector<Row> rows_;
};

/**
 * @brief Fully rendered SQL statement. The cache key is the SQL text.
 */
class SqlStatement : public IExecutableQuery {
public:
    explicit SqlStatement(std::string sql) : sql_(std::move(sql)) {}

    const std::string& getSql() const { return sql_; }

    std::string getResultCacheKey() const override { return sql_; }

    /**
     * @brief Run on a DbConnection with statement_timeout applied
     *
     * SQLSTATE 57014 (query_canceled) raises TimeoutException.
     */
    std::unique_ptr<IRawResult> execute(IConnection& conn,
                                        std::chrono::milliseconds timeout) const override;

private:
    std::string sql_;
};

/**
 * @brief Builds SqlStatement queries from a SQL template
 *
 * Substituted values are escaped as SQL string literals; templates quote
 * them, e.g. "SELECT mail FROM people WHERE uid = '{principal}'".
 */
class SqlStatementBuilder : public IQueryBuilder {
public:
    explicit SqlStatementBuilder(std::string sqlTemplate);

    std::unique_ptr<IExecutableQuery> build(const ResolutionContext& context) const override;

private:
    QueryTemplate template_;
};

} // namespace idp::dc
