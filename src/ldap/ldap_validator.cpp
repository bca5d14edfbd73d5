/**
 * @file ldap_validator.cpp
 */

#include <idp/dc/ldap/ldap_validator.h>
#include <idp/dc/exceptions.h>

#include <spdlog/spdlog.h>

namespace idp::dc {

LdapConnectionValidator::LdapConnectionValidator(std::shared_ptr<LdapConnectionPool> pool, int timeoutSec)
    : pool_(std::move(pool)), timeoutSec_(timeoutSec)
{
    if (!pool_) {
        throw std::invalid_argument("LdapConnectionValidator: pool cannot be nullptr");
    }
}

void LdapConnectionValidator::validate() const {
    std::unique_ptr<LdapConnection> conn;
    try {
        conn = pool_->acquire();
    } catch (const ConnectionException& e) {
        throw ValidationException(std::string("LDAP server unreachable: ") + e.what());
    }

    LDAPMessage* result = nullptr;
    struct timeval timeout = {timeoutSec_, 0};
    int rc = ldap_search_ext_s(conn->get(), "", LDAP_SCOPE_BASE, "(objectClass=*)",
                               nullptr, 0, nullptr, nullptr, &timeout, 1, &result);
    if (result) {
        ldap_msgfree(result);
    }

    if (rc != LDAP_SUCCESS) {
        throw ValidationException(std::string("root DSE search failed: ") + ldap_err2string(rc));
    }
    spdlog::debug("LDAP validation succeeded ({})", pool_->getConfig().uri);
}

} // namespace idp::dc
