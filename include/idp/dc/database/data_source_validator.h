/**
 * @file data_source_validator.h
 * @brief Relational health check
 */

#pragma once

#include <idp/dc/database/db_connection_pool.h>
#include <idp/dc/strategies.h>

#include <memory>
#include <string>

namespace idp::dc {

/**
 * @brief Runs a validation query that must return at least one row
 */
class DataSourceValidator : public IValidator {
public:
    explicit DataSourceValidator(std::shared_ptr<DbConnectionPool> pool,
                                 std::string validationQuery = "SELECT 1");

    void validate() const override;

private:
    std::shared_ptr<DbConnectionPool> pool_;
    std::string validationQuery_;
};

} // namespace idp::dc
