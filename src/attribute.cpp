/**
 * @file attribute.cpp
 */

#include <idp/dc/attribute.h>
#include <idp/dc/util/base64.h>

namespace idp::dc {

std::string AttributeValue::toString() const {
    switch (type_) {
        case Type::String:
            return value_;
        case Type::Binary:
            return util::base64Encode(value_);
        case Type::Empty:
        default:
            return "";
    }
}

Json::Value AttributeValue::toJson() const {
    switch (type_) {
        case Type::String:
            return Json::Value(value_);
        case Type::Binary: {
            Json::Value wrapped(Json::objectValue);
            wrapped["base64"] = util::base64Encode(value_);
            return wrapped;
        }
        case Type::Empty:
        default:
            return Json::Value(Json::nullValue);
    }
}

Json::Value attributeMapToJson(const AttributeMap& attributes) {
    Json::Value root(Json::objectValue);
    for (const auto& [id, values] : attributes) {
        Json::Value array(Json::arrayValue);
        for (const auto& value : values) {
            array.append(value.toJson());
        }
        root[id] = array;
    }
    return root;
}

} // namespace idp::dc
