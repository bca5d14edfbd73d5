/**
 * @file query_template.h
 * @brief Substitution templates for query builders
 *
 * Syntax:
 *   {name}     first value of variable "name"
 *   {name[i]}  i-th (zero-based) value
 *   {{ and }}  literal braces
 *
 * Variables resolve through ResolutionContext::lookup(). Each substituted
 * value passes through the template's escaper.
 */

#pragma once

#include <idp/dc/resolution_context.h>

#include <functional>
#include <string>

namespace idp::dc {

using ValueEscaper = std::function<std::string(const std::string&)>;

/**
 * @brief RFC 4515 filter value escaping: * ( ) \ NUL
 */
std::string escapeLdapFilterValue(const std::string& value);

/**
 * @brief SQL string literal escaping: ' becomes ''
 */
std::string escapeSqlLiteral(const std::string& value);

/**
 * @brief Identity escaper
 */
std::string noEscape(const std::string& value);

class QueryTemplate {
public:
    /**
     * @param text Template text
     * @param escaper Applied to every substituted value
     */
    explicit QueryTemplate(std::string text, ValueEscaper escaper = noEscape);

    const std::string& getText() const { return text_; }

    /**
     * @brief Render against a context
     * @throws QueryConstructionException on a malformed token, an unknown
     *         variable, a missing value or an out-of-range index
     */
    std::string render(const ResolutionContext& context) const;

private:
    std::string text_;
    ValueEscaper escaper_;
};

} // namespace idp::dc
