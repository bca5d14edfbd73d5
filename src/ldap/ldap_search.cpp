/**
 * @file ldap_search.cpp
 * @brief Directory search execution
 */

#include <idp/dc/ldap/ldap_search.h>
#include <idp/dc/ldap/ldap_connection_pool.h>
#include <idp/dc/exceptions.h>
#include <idp/dc/util/string_util.h>

#include <spdlog/spdlog.h>

namespace idp::dc {

LdapScope parseLdapScope(const std::string& value) {
    std::string lower = util::toLower(value);

    if (lower == "base" || lower == "object") {
        return LdapScope::Base;
    } else if (lower == "one" || lower == "onelevel") {
        return LdapScope::OneLevel;
    } else if (lower == "sub" || lower == "subtree") {
        return LdapScope::Subtree;
    }
    throw ConfigurationException("unknown LDAP search scope '" + value + "'");
}

namespace {

int toNativeScope(LdapScope scope) {
    switch (scope) {
        case LdapScope::Base:     return LDAP_SCOPE_BASE;
        case LdapScope::OneLevel: return LDAP_SCOPE_ONELEVEL;
        case LdapScope::Subtree:  return LDAP_SCOPE_SUBTREE;
    }
    return LDAP_SCOPE_SUBTREE;
}

/**
 * @brief Copy every entry of a search response into owned memory
 */
std::vector<LdapEntry> copyEntries(LDAP* ld, LDAPMessage* res) {
    std::vector<LdapEntry> entries;

    for (LDAPMessage* entry = ldap_first_entry(ld, res);
         entry != nullptr;
         entry = ldap_next_entry(ld, entry)) {
        LdapEntry copy;

        char* dn = ldap_get_dn(ld, entry);
        if (dn) {
            copy.dn = dn;
            ldap_memfree(dn);
        }

        BerElement* ber = nullptr;
        for (char* attr = ldap_first_attribute(ld, entry, &ber);
             attr != nullptr;
             attr = ldap_next_attribute(ld, entry, ber)) {
            std::vector<std::string> values;

            struct berval** vals = ldap_get_values_len(ld, entry, attr);
            if (vals) {
                for (int i = 0; vals[i] != nullptr; i++) {
                    values.emplace_back(vals[i]->bv_val, vals[i]->bv_len);
                }
                ldap_value_free_len(vals);
            }

            copy.attributes.emplace_back(attr, std::move(values));
            ldap_memfree(attr);
        }
        if (ber) {
            ber_free(ber, 0);
        }

        entries.push_back(std::move(copy));
    }

    return entries;
}

} // namespace

// --- LdapSearch ---

LdapSearch::LdapSearch(std::string filter,
                       std::string baseDn,
                       LdapScope scope,
                       std::vector<std::string> returnAttributes,
                       int sizeLimit)
    : filter_(std::move(filter)),
      baseDn_(std::move(baseDn)),
      scope_(scope),
      returnAttributes_(std::move(returnAttributes)),
      sizeLimit_(sizeLimit)
{
}

std::unique_ptr<IRawResult> LdapSearch::execute(IConnection& conn,
                                                std::chrono::milliseconds timeout) const {
    LdapConnection& ldapConn = connectionCast<LdapConnection>(conn);
    LDAP* ld = ldapConn.get();

    std::vector<char*> attrs;
    for (const auto& attr : returnAttributes_) {
        attrs.push_back(const_cast<char*>(attr.c_str()));
    }
    attrs.push_back(nullptr);

    struct timeval tv = {0, 0};
    struct timeval* tvPtr = nullptr;
    if (timeout.count() > 0) {
        tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
        tvPtr = &tv;
    }

    spdlog::debug("LDAP search: base='{}', scope={}, filter='{}'",
                  baseDn_, static_cast<int>(scope_), filter_);

    LDAPMessage* res = nullptr;
    int rc = ldap_search_ext_s(ld, baseDn_.c_str(), toNativeScope(scope_), filter_.c_str(),
                               returnAttributes_.empty() ? nullptr : attrs.data(),
                               0, nullptr, nullptr, tvPtr, sizeLimit_, &res);

    if (rc == LDAP_SUCCESS || rc == LDAP_SIZELIMIT_EXCEEDED) {
        std::vector<LdapEntry> entries = res ? copyEntries(ld, res) : std::vector<LdapEntry>();
        if (res) {
            ldap_msgfree(res);
        }
        bool truncated = rc == LDAP_SIZELIMIT_EXCEEDED;
        if (truncated) {
            spdlog::warn("LDAP search '{}' hit the size limit, {} entries returned",
                         filter_, entries.size());
        }
        return std::make_unique<LdapSearchResult>(std::move(entries), truncated);
    }

    if (res) {
        ldap_msgfree(res);
    }

    switch (rc) {
        case LDAP_NO_SUCH_OBJECT:
            spdlog::debug("LDAP search base '{}' does not exist", baseDn_);
            return std::make_unique<LdapSearchResult>(std::vector<LdapEntry>());
        case LDAP_TIMEOUT:
        case LDAP_TIMELIMIT_EXCEEDED:
            throw TimeoutException("LDAP search '" + filter_ + "' exceeded " +
                                   std::to_string(timeout.count()) + "ms");
        default:
            throw ExecutionException("LDAP search '" + filter_ + "' failed: " +
                                     ldap_err2string(rc) + " (" + std::to_string(rc) + ")");
    }
}

// --- LdapSearchBuilder ---

LdapSearchBuilder::LdapSearchBuilder(std::string filterTemplate,
                                     std::string baseDn,
                                     LdapScope scope,
                                     std::vector<std::string> returnAttributes,
                                     int sizeLimit)
    : filter_(std::move(filterTemplate), escapeLdapFilterValue),
      baseDn_(std::move(baseDn)),
      scope_(scope),
      returnAttributes_(std::move(returnAttributes)),
      sizeLimit_(sizeLimit)
{
    if (filter_.getText().empty()) {
        throw ConfigurationException("LDAP filter template cannot be empty");
    }
    if (sizeLimit_ < 0) {
        throw ConfigurationException("LDAP size limit must not be negative");
    }
}

std::unique_ptr<IExecutableQuery> LdapSearchBuilder::build(const ResolutionContext& context) const {
    return std::make_unique<LdapSearch>(filter_.render(context), baseDn_, scope_,
                                        returnAttributes_, sizeLimit_);
}

} // namespace idp::dc
