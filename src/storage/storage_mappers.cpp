/**
 * @file storage_mappers.cpp
 */

#include <idp/dc/storage/storage_mappers.h>
#include <idp/dc/storage/storage_search.h>
#include <idp/dc/exceptions.h>
#include <idp/dc/util/base64.h>

#include <json/json.h>
#include <sstream>

namespace idp::dc {

// --- SimpleStorageMapper ---

SimpleStorageMapper::SimpleStorageMapper(std::string generatedAttributeId)
    : generatedAttributeId_(std::move(generatedAttributeId))
{
    if (generatedAttributeId_.empty()) {
        throw ConfigurationException("generated attribute id cannot be empty");
    }
}

AttributeMap SimpleStorageMapper::map(const IRawResult& raw) const {
    const auto& result = resultCast<StorageLookupResult>(raw);

    AttributeMap attributes;
    if (result.getRecord()) {
        attributes[generatedAttributeId_].push_back(AttributeValue::ofString(result.getRecord()->value));
    }
    return attributes;
}

// --- JsonStorageMapper ---

namespace {

AttributeValue toAttributeValue(const std::string& id, const Json::Value& element) {
    if (element.isString()) {
        return AttributeValue::ofString(element.asString());
    }
    if (element.isObject() && element.size() == 1 && element["base64"].isString()) {
        try {
            return AttributeValue::ofBinary(util::base64Decode(element["base64"].asString()));
        } catch (const std::invalid_argument& e) {
            throw MappingException("attribute '" + id + "' has invalid base64: " + e.what());
        }
    }
    throw MappingException("attribute '" + id + "' has an unsupported value type");
}

} // namespace

AttributeMap JsonStorageMapper::map(const IRawResult& raw) const {
    const auto& result = resultCast<StorageLookupResult>(raw);

    AttributeMap attributes;
    if (!result.getRecord()) {
        return attributes;
    }

    Json::Value root;
    Json::CharReaderBuilder reader;
    std::string errs;
    std::istringstream iss(result.getRecord()->value);
    if (!Json::parseFromStream(reader, iss, &root, &errs)) {
        throw MappingException("record '" + result.getContext() + "!" + result.getKey() +
                               "' is not valid JSON: " + errs);
    }
    if (!root.isObject()) {
        throw MappingException("record '" + result.getContext() + "!" + result.getKey() +
                               "' is not a JSON object");
    }

    for (const auto& id : root.getMemberNames()) {
        const Json::Value& member = root[id];
        if (member.isNull()) {
            continue;
        }

        AttributeValues values;
        if (member.isArray()) {
            for (const auto& element : member) {
                // null elements are how attributeMapToJson renders Empty values
                values.push_back(element.isNull() ? AttributeValue::empty()
                                                  : toAttributeValue(id, element));
            }
        } else {
            values.push_back(toAttributeValue(id, member));
        }

        if (!values.empty()) {
            attributes[id] = std::move(values);
        }
    }

    return attributes;
}

} // namespace idp::dc
