/**
 * @file sql_result_mapper.cpp
 */

#include <idp/dc/database/sql_result_mapper.h>
#include <idp/dc/database/sql_statement.h>
#include <idp/dc/exceptions.h>
#include <idp/dc/util/string_util.h>

#include <cctype>

namespace idp::dc {

namespace {

constexpr unsigned int BYTEA_OID = 17;

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/**
 * @brief Decode bytea hex output ("\x0a1b...")
 */
std::string decodeBytea(const std::string& column, const std::string& text) {
    if (text.size() < 2 || text[0] != '\\' || text[1] != 'x' || text.size() % 2 != 0) {
        throw MappingException("column '" + column + "' is not in bytea hex format");
    }

    std::string bytes;
    bytes.reserve((text.size() - 2) / 2);
    for (size_t i = 2; i < text.size(); i += 2) {
        int hi = hexDigit(text[i]);
        int lo = hexDigit(text[i + 1]);
        if (hi < 0 || lo < 0) {
            throw MappingException("column '" + column + "' contains invalid hex digits");
        }
        bytes += static_cast<char>((hi << 4) | lo);
    }
    return bytes;
}

std::string normalizeInteger(const std::string& column, const std::string& text) {
    size_t start = (!text.empty() && (text[0] == '-' || text[0] == '+')) ? 1 : 0;
    if (start == text.size()) {
        throw MappingException("column '" + column + "' value '" + text + "' is not an integer");
    }
    for (size_t i = start; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw MappingException("column '" + column + "' value '" + text + "' is not an integer");
        }
    }
    return text[0] == '+' ? text.substr(1) : text;
}

std::string normalizeBoolean(const std::string& column, const std::string& text) {
    std::string lower = util::toLower(text);
    if (lower == "t" || lower == "true" || lower == "1") {
        return "true";
    }
    if (lower == "f" || lower == "false" || lower == "0") {
        return "false";
    }
    throw MappingException("column '" + column + "' value '" + text + "' is not a boolean");
}

} // namespace

SqlDataType parseSqlDataType(const std::string& value) {
    std::string lower = util::toLower(value);
    if (lower == "string") return SqlDataType::String;
    if (lower == "integer") return SqlDataType::Integer;
    if (lower == "boolean") return SqlDataType::Boolean;
    if (lower == "binary") return SqlDataType::Binary;
    throw ConfigurationException("unknown column data type '" + value + "'");
}

SqlResultMapper::SqlResultMapper(SqlMapperOptions options)
    : multipleResultsIsError_(options.multipleResultsIsError)
{
    for (auto& [column, descriptor] : options.columnDescriptors) {
        descriptors_[util::toLower(column)] = std::move(descriptor);
    }
}

AttributeMap SqlResultMapper::map(const IRawResult& raw) const {
    const auto& result = resultCast<SqlResultSet>(raw);
    const auto& columns = result.getColumns();
    const auto& rows = result.getRows();

    if (multipleResultsIsError_ && rows.size() > 1) {
        throw MappingException("query returned " + std::to_string(rows.size()) +
                               " rows, expected at most one");
    }

    AttributeMap attributes;
    if (rows.empty()) {
        return attributes;
    }

    struct ColumnPlan {
        std::string attributeId;
        SqlDataType dataType;
    };

    std::vector<ColumnPlan> plan;
    plan.reserve(columns.size());
    for (const auto& column : columns) {
        ColumnPlan p{column.name,
                     column.typeOid == BYTEA_OID ? SqlDataType::Binary : SqlDataType::String};
        auto it = descriptors_.find(util::toLower(column.name));
        if (it != descriptors_.end()) {
            if (!it->second.attributeId.empty()) {
                p.attributeId = it->second.attributeId;
            }
            p.dataType = it->second.dataType;
        }
        plan.push_back(std::move(p));
    }

    for (const auto& row : rows) {
        if (row.size() != columns.size()) {
            throw MappingException("row has " + std::to_string(row.size()) + " fields, expected " +
                                   std::to_string(columns.size()));
        }

        for (size_t j = 0; j < columns.size(); ++j) {
            const std::string& name = columns[j].name;
            AttributeValues& values = attributes[plan[j].attributeId];

            if (!row[j]) {
                values.push_back(AttributeValue::empty());
                continue;
            }

            const std::string& text = *row[j];
            switch (plan[j].dataType) {
                case SqlDataType::String:
                    values.push_back(AttributeValue::ofString(text));
                    break;
                case SqlDataType::Integer:
                    values.push_back(AttributeValue::ofString(normalizeInteger(name, text)));
                    break;
                case SqlDataType::Boolean:
                    values.push_back(AttributeValue::ofString(normalizeBoolean(name, text)));
                    break;
                case SqlDataType::Binary:
                    values.push_back(AttributeValue::ofBinary(decodeBytea(name, text)));
                    break;
            }
        }
    }

    return attributes;
}

} // namespace idp::dc
