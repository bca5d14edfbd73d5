/**
 * @file resolution_context.cpp
 */

#include <idp/dc/resolution_context.h>

namespace idp::dc {

namespace {

AttributeValues builtIn(const std::string& value) {
    if (value.empty()) {
        return {};
    }
    return {AttributeValue::ofString(value)};
}

} // namespace

void ResolutionContext::addDependencyAttribute(const std::string& id, AttributeValues values) {
    auto& existing = dependencies_[id];
    existing.insert(existing.end(),
                    std::make_move_iterator(values.begin()),
                    std::make_move_iterator(values.end()));
}

std::optional<AttributeValues> ResolutionContext::lookup(const std::string& name) const {
    if (name == "principal") {
        return builtIn(principal_);
    }
    if (name == "requester") {
        return builtIn(requesterId_);
    }
    if (name == "issuer") {
        return builtIn(issuerId_);
    }

    auto it = dependencies_.find(name);
    if (it == dependencies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace idp::dc
