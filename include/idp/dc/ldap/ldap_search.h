/**
 * @file ldap_search.h
 * @brief Directory search query, its builder and its raw result
 */

#pragma once

#include <idp/dc/executable_query.h>
#include <idp/dc/query_template.h>
#include <idp/dc/strategies.h>

#include <string>
#include <utility>
#include <vector>

namespace idp::dc {

enum class LdapScope { Base, OneLevel, Subtree };

/**
 * @brief Parse "base", "one"/"onelevel" or "sub"/"subtree" (case-insensitive)
 * @throws ConfigurationException on any other value
 */
LdapScope parseLdapScope(const std::string& value);

/**
 * @brief One directory entry copied out of the LDAP result message
 */
struct LdapEntry {
    std::string dn;
    /// Attribute description to values, in the order the server returned them
    std::vector<std::pair<std::string, std::vector<std::string>>> attributes;
};

/**
 * @brief Owned copy of a search result
 */
class LdapSearchResult : public IRawResult {
public:
    explicit LdapSearchResult(std::vector<LdapEntry> entries, bool truncated = false)
        : entries_(std::move(entries)), truncated_(truncated) {}

    const std::vector<LdapEntry>& getEntries() const { return entries_; }

    /**
     * @brief True if the server stopped at the size limit
     */
    bool isTruncated() const { return truncated_; }

    std::string getBackendType() const override { return "ldap"; }
    bool isEmpty() const override { return entries_.empty(); }

private:
    std::vector<LdapEntry> entries_;
    bool truncated_;
};

/**
 * @brief Fully rendered search request
 *
 * The cache key is the rendered filter.
 */
class LdapSearch : public IExecutableQuery {
public:
    LdapSearch(std::string filter,
               std::string baseDn,
               LdapScope scope,
               std::vector<std::string> returnAttributes,
               int sizeLimit);

    const std::string& getFilter() const { return filter_; }
    const std::string& getBaseDn() const { return baseDn_; }
    LdapScope getScope() const { return scope_; }
    const std::vector<std::string>& getReturnAttributes() const { return returnAttributes_; }
    int getSizeLimit() const { return sizeLimit_; }

    std::string getResultCacheKey() const override { return filter_; }

    /**
     * @brief Run ldap_search_ext_s on an LdapConnection
     *
     * LDAP_NO_SUCH_OBJECT yields an empty result. LDAP_TIMEOUT and
     * LDAP_TIMELIMIT_EXCEEDED raise TimeoutException.
     */
    std::unique_ptr<IRawResult> execute(IConnection& conn,
                                        std::chrono::milliseconds timeout) const override;

private:
    std::string filter_;
    std::string baseDn_;
    LdapScope scope_;
    std::vector<std::string> returnAttributes_;
    int sizeLimit_;
};

/**
 * @brief Builds LdapSearch queries from a filter template
 *
 * Substituted values are escaped per RFC 4515.
 */
class LdapSearchBuilder : public IQueryBuilder {
public:
    /**
     * @param filterTemplate e.g. "(&(objectClass=person)(uid={principal}))"
     * @param baseDn Search base
     * @param scope Search scope
     * @param returnAttributes Attributes to request, empty for all user attributes
     * @param sizeLimit Maximum entries, 0 for the server default
     */
    LdapSearchBuilder(std::string filterTemplate,
                      std::string baseDn,
                      LdapScope scope = LdapScope::Subtree,
                      std::vector<std::string> returnAttributes = {},
                      int sizeLimit = 0);

    std::unique_ptr<IExecutableQuery> build(const ResolutionContext& context) const override;

private:
    QueryTemplate filter_;
    std::string baseDn_;
    LdapScope scope_;
    std::vector<std::string> returnAttributes_;
    int sizeLimit_;
};

} // namespace idp::dc
