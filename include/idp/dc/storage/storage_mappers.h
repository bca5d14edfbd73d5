/**
 * @file storage_mappers.h
 * @brief Result mappers for storage lookups
 */

#pragma once

#include <idp/dc/strategies.h>

#include <string>

namespace idp::dc {

/**
 * @brief Puts the record value into a single attribute
 */
class SimpleStorageMapper : public IResultMapper {
public:
    explicit SimpleStorageMapper(std::string generatedAttributeId);

    AttributeMap map(const IRawResult& raw) const override;

private:
    std::string generatedAttributeId_;
};

/**
 * @brief Parses the record value as a JSON object of attributes
 *
 * Member forms:
 *   "id": "value"                one string value
 *   "id": ["v1", "v2"]           several values (elements as above)
 *   "id": {"base64": "..."}      one binary value
 *   "id": null                   skipped
 * Anything else raises MappingException.
 */
class JsonStorageMapper : public IResultMapper {
public:
    AttributeMap map(const IRawResult& raw) const override;
};

} // namespace idp::dc
