/**
 * @file ldap_result_mapper.cpp
 */

#include <idp/dc/ldap/ldap_result_mapper.h>
#include <idp/dc/ldap/ldap_search.h>
#include <idp/dc/exceptions.h>
#include <idp/dc/util/string_util.h>

namespace idp::dc {

namespace {

const char* const BINARY_OPTION = ";binary";

} // namespace

LdapResultMapper::LdapResultMapper(LdapMapperOptions options)
    : multipleResultsIsError_(options.multipleResultsIsError)
{
    for (const auto& name : options.binaryAttributes) {
        binaryAttributes_.insert(util::toLower(name));
    }
    for (const auto& [from, to] : options.renaming) {
        renaming_[util::toLower(from)] = to;
    }
}

AttributeMap LdapResultMapper::map(const IRawResult& raw) const {
    const auto& result = resultCast<LdapSearchResult>(raw);
    const auto& entries = result.getEntries();

    if (multipleResultsIsError_ && entries.size() > 1) {
        throw MappingException("search returned " + std::to_string(entries.size()) +
                               " entries, expected at most one");
    }

    AttributeMap attributes;
    for (const auto& entry : entries) {
        for (const auto& [description, values] : entry.attributes) {
            std::string name = description;
            bool binary = false;

            std::string lower = util::toLower(description);
            size_t option = lower.find(BINARY_OPTION);
            if (option != std::string::npos) {
                name = description.substr(0, option) +
                       description.substr(option + std::char_traits<char>::length(BINARY_OPTION));
                binary = true;
            }

            std::string lowerName = util::toLower(name);
            if (binaryAttributes_.count(lowerName) > 0) {
                binary = true;
            }

            auto renamed = renaming_.find(lowerName);
            const std::string& id = renamed != renaming_.end() ? renamed->second : name;

            AttributeValues& target = attributes[id];
            for (const auto& value : values) {
                if (value.empty()) {
                    target.push_back(AttributeValue::empty());
                } else if (binary) {
                    target.push_back(AttributeValue::ofBinary(value));
                } else {
                    target.push_back(AttributeValue::ofString(value));
                }
            }
        }
    }

    return attributes;
}

} // namespace idp::dc
