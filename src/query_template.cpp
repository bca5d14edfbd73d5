/**
 * @file query_template.cpp
 */

#include <idp/dc/query_template.h>
#include <idp/dc/exceptions.h>

#include <cctype>

namespace idp::dc {

std::string escapeLdapFilterValue(const std::string& value) {
    std::string result;
    result.reserve(value.length() * 2);

    for (char c : value) {
        switch (c) {
            case '*':
                result += "\\2a";
                break;
            case '(':
                result += "\\28";
                break;
            case ')':
                result += "\\29";
                break;
            case '\\':
                result += "\\5c";
                break;
            case '\0':
                result += "\\00";
                break;
            default:
                result += c;
        }
    }

    return result;
}

std::string escapeSqlLiteral(const std::string& value) {
    std::string result;
    result.reserve(value.length() + 8);

    for (char c : value) {
        if (c == '\'') {
            result += "''";
        } else {
            result += c;
        }
    }

    return result;
}

std::string noEscape(const std::string& value) {
    return value;
}

QueryTemplate::QueryTemplate(std::string text, ValueEscaper escaper)
    : text_(std::move(text)),
      escaper_(escaper ? std::move(escaper) : ValueEscaper(noEscape))
{
}

namespace {

struct Token {
    std::string name;
    size_t index = 0;
};

Token parseToken(const std::string& body) {
    Token token;

    size_t bracket = body.find('[');
    if (bracket == std::string::npos) {
        token.name = body;
    } else {
        if (body.back() != ']' || bracket + 2 > body.size() - 1) {
            throw QueryConstructionException("malformed index in '{" + body + "}'");
        }
        token.name = body.substr(0, bracket);
        std::string digits = body.substr(bracket + 1, body.size() - bracket - 2);
        if (digits.size() > 9) {
            throw QueryConstructionException("index out of range in '{" + body + "}'");
        }
        for (char d : digits) {
            if (!std::isdigit(static_cast<unsigned char>(d))) {
                throw QueryConstructionException("malformed index in '{" + body + "}'");
            }
        }
        token.index = std::stoul(digits);
    }

    if (token.name.empty()) {
        throw QueryConstructionException("empty variable name in '{" + body + "}'");
    }
    return token;
}

} // namespace

std::string QueryTemplate::render(const ResolutionContext& context) const {
    std::string out;
    out.reserve(text_.size() + 32);

    size_t pos = 0;
    while (pos < text_.size()) {
        char c = text_[pos];

        if (c == '}') {
            if (pos + 1 < text_.size() && text_[pos + 1] == '}') {
                out += '}';
                pos += 2;
                continue;
            }
            throw QueryConstructionException("unmatched '}' at offset " + std::to_string(pos) +
                                             " in template '" + text_ + "'");
        }

        if (c != '{') {
            out += c;
            ++pos;
            continue;
        }

        if (pos + 1 < text_.size() && text_[pos + 1] == '{') {
            out += '{';
            pos += 2;
            continue;
        }

        size_t close = text_.find('}', pos + 1);
        if (close == std::string::npos) {
            throw QueryConstructionException("no closing '}' for substitution at offset " +
                                             std::to_string(pos) + " in template '" + text_ + "'");
        }

        std::string body = text_.substr(pos + 1, close - pos - 1);
        if (body.find('{') != std::string::npos) {
            throw QueryConstructionException("nested '{' in substitution '" + body + "'");
        }
        Token token = parseToken(body);

        auto values = context.lookup(token.name);
        if (!values) {
            throw QueryConstructionException("unknown variable '" + token.name + "'");
        }
        if (values->empty()) {
            throw QueryConstructionException("variable '" + token.name + "' has no value");
        }
        if (token.index >= values->size()) {
            throw QueryConstructionException("variable '" + token.name + "' has " +
                                             std::to_string(values->size()) + " value(s), index " +
                                             std::to_string(token.index) + " requested");
        }

        out += escaper_((*values)[token.index].toString());
        pos = close + 1;
    }

    return out;
}

} // namespace idp::dc
