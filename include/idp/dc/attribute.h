/**
 * @file attribute.h
 * @brief Attribute value model and the connector output map
 */

#pragma once

#include <map>
#include <string>
#include <vector>
#include <json/json.h>

namespace idp::dc {

/**
 * @brief Opaque attribute value
 *
 * String and binary values carry their bytes; an Empty value stands for a
 * present-but-null datum (SQL NULL, zero-length directory value).
 */
class AttributeValue {
public:
    enum class Type { String, Binary, Empty };

    static AttributeValue ofString(std::string value) {
        return AttributeValue(Type::String, std::move(value));
    }

    static AttributeValue ofBinary(std::string bytes) {
        return AttributeValue(Type::Binary, std::move(bytes));
    }

    static AttributeValue empty() {
        return AttributeValue(Type::Empty, std::string());
    }

    Type getType() const { return type_; }

    /**
     * @brief Raw bytes (empty for Empty values)
     */
    const std::string& getValue() const { return value_; }

    bool isEmpty() const { return type_ == Type::Empty; }

    /**
     * @brief Display form: string as-is, binary Base64 encoded, Empty as ""
     */
    std::string toString() const;

    /**
     * @brief JSON form: string, {"base64": ...} or null
     */
    Json::Value toJson() const;

    bool operator==(const AttributeValue& other) const {
        return type_ == other.type_ && value_ == other.value_;
    }

    bool operator!=(const AttributeValue& other) const { return !(*this == other); }

private:
    AttributeValue(Type type, std::string value)
        : type_(type), value_(std::move(value)) {}

    Type type_;
    std::string value_;
};

using AttributeValues = std::vector<AttributeValue>;

/**
 * @brief Attribute id to ordered values. A missing key means no value.
 */
using AttributeMap = std::map<std::string, AttributeValues>;

/**
 * @brief Render an attribute map as a JSON object of value arrays
 */
Json::Value attributeMapToJson(const AttributeMap& attributes);

} // namespace idp::dc
