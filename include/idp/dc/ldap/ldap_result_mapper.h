/**
 * @file ldap_result_mapper.h
 * @brief Maps directory entries to attributes
 */

#pragma once

#include <idp/dc/strategies.h>

#include <map>
#include <set>
#include <string>

namespace idp::dc {

struct LdapMapperOptions {
    /// Attribute names (case-insensitive) whose values are binary
    std::set<std::string> binaryAttributes;

    /// Attribute name (case-insensitive) to output attribute id
    std::map<std::string, std::string> renaming;

    /// More than one entry raises MappingException
    bool multipleResultsIsError = false;
};

/**
 * @brief Every attribute of every entry becomes an output attribute
 *
 * Values are appended in entry order. Attributes listed as binary, or
 * returned with the ";binary" option, yield Binary values; the option is
 * stripped from the attribute id. Zero-length values yield Empty values.
 */
class LdapResultMapper : public IResultMapper {
public:
    explicit LdapResultMapper(LdapMapperOptions options = LdapMapperOptions());

    AttributeMap map(const IRawResult& raw) const override;

private:
    std::set<std::string> binaryAttributes_;  // lower case
    std::map<std::string, std::string> renaming_;  // lower-case key
    bool multipleResultsIsError_;
};

} // namespace idp::dc
