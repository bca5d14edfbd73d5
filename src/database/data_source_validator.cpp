/**
 * @file data_source_validator.cpp
 */

#include <idp/dc/database/data_source_validator.h>
#include <idp/dc/exceptions.h>

#include <spdlog/spdlog.h>

namespace idp::dc {

DataSourceValidator::DataSourceValidator(std::shared_ptr<DbConnectionPool> pool,
                                         std::string validationQuery)
    : pool_(std::move(pool)), validationQuery_(std::move(validationQuery))
{
    if (!pool_) {
        throw std::invalid_argument("DataSourceValidator: pool cannot be nullptr");
    }
    if (validationQuery_.empty()) {
        validationQuery_ = "SELECT 1";
    }
}

void DataSourceValidator::validate() const {
    std::unique_ptr<DbConnection> conn;
    try {
        conn = pool_->acquire();
    } catch (const ConnectionException& e) {
        throw ValidationException(std::string("database unreachable: ") + e.what());
    }

    PGresult* res = PQexec(conn->get(), validationQuery_.c_str());
    if (!res) {
        throw ValidationException(std::string("validation query failed: ") + PQerrorMessage(conn->get()));
    }

    ExecStatusType status = PQresultStatus(res);
    if (status != PGRES_TUPLES_OK) {
        std::string error = PQresultErrorMessage(res);
        PQclear(res);
        throw ValidationException("validation query '" + validationQuery_ + "' failed: " + error);
    }

    int rows = PQntuples(res);
    PQclear(res);
    if (rows == 0) {
        throw ValidationException("validation query '" + validationQuery_ + "' returned no rows");
    }
    spdlog::debug("Database validation succeeded");
}

} // namespace idp::dc
