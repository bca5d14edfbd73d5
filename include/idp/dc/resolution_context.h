/**
 * @file resolution_context.h
 * @brief Per-request input to a data connector
 */

#pragma once

#include <idp/dc/attribute.h>

#include <optional>
#include <string>

namespace idp::dc {

/**
 * @brief Subject being resolved plus attributes gathered upstream
 *
 * Owned by the caller and never modified by a connector.
 */
class ResolutionContext {
public:
    ResolutionContext() = default;

    explicit ResolutionContext(std::string principal,
                               std::string requesterId = "",
                               std::string issuerId = "")
        : principal_(std::move(principal)),
          requesterId_(std::move(requesterId)),
          issuerId_(std::move(issuerId)) {}

    const std::string& getPrincipal() const { return principal_; }
    const std::string& getRequesterId() const { return requesterId_; }
    const std::string& getIssuerId() const { return issuerId_; }

    /**
     * @brief Upstream attributes keyed by attribute id
     */
    const AttributeMap& getDependencyAttributes() const { return dependencies_; }

    void setPrincipal(std::string principal) { principal_ = std::move(principal); }
    void setRequesterId(std::string requesterId) { requesterId_ = std::move(requesterId); }
    void setIssuerId(std::string issuerId) { issuerId_ = std::move(issuerId); }

    /**
     * @brief Add (append) values for an upstream attribute
     */
    void addDependencyAttribute(const std::string& id, AttributeValues values);

    /**
     * @brief Values a template variable refers to
     *
     * "principal", "requester" and "issuer" name the built-in fields (an
     * unset field has no value); any other name is a dependency attribute.
     *
     * @return nullopt if the name is unknown
     */
    std::optional<AttributeValues> lookup(const std::string& name) const;

private:
    std::string principal_;
    std::string requesterId_;
    std::string issuerId_;
    AttributeMap dependencies_;
};

} // namespace idp::dc
