/**
 * @file ldap_validator.h
 * @brief Directory health check
 */

#pragma once

#include <idp/dc/ldap/ldap_connection_pool.h>
#include <idp/dc/strategies.h>

#include <memory>

namespace idp::dc {

/**
 * @brief Leases a connection and reads the root DSE
 */
class LdapConnectionValidator : public IValidator {
public:
    explicit LdapConnectionValidator(std::shared_ptr<LdapConnectionPool> pool, int timeoutSec = 2);

    void validate() const override;

private:
    std::shared_ptr<LdapConnectionPool> pool_;
    int timeoutSec_;
};

} // namespace idp::dc
