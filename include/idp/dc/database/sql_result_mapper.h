/**
 * @file sql_result_mapper.h
 * @brief Maps relational result sets to attributes (column-per-row)
 */

#pragma once

#include <idp/dc/strategies.h>

#include <map>
#include <string>

namespace idp::dc {

enum class SqlDataType { String, Integer, Boolean, Binary };

/**
 * @brief Parse "string", "integer", "boolean" or "binary" (case-insensitive)
 * @throws ConfigurationException on any other value
 */
SqlDataType parseSqlDataType(const std::string& value);

/**
 * @brief Declared shape of one result column
 */
struct SqlColumnDescriptor {
    std::string attributeId;  ///< Output attribute id, empty to keep the column name
    SqlDataType dataType = SqlDataType::String;
};

struct SqlMapperOptions {
    /// Column name (case-insensitive) to descriptor
    std::map<std::string, SqlColumnDescriptor> columnDescriptors;

    /// More than one row raises MappingException
    bool multipleResultsIsError = false;
};

/**
 * @brief Column-per-row mapping
 *
 * Each column becomes an attribute; each row contributes one value to every
 * column's attribute, in row order. SQL NULL yields an Empty value. bytea
 * columns, and columns declared Binary, yield Binary values decoded from
 * the hex text format. Integer and Boolean columns are checked and
 * normalized ("t"/"f" become "true"/"false").
 */
class SqlResultMapper : public IResultMapper {
public:
    explicit SqlResultMapper(SqlMapperOptions options = SqlMapperOptions());

    AttributeMap map(const IRawResult& raw) const override;

private:
    std::map<std::string, SqlColumnDescriptor> descriptors_;  // lower-case key
    bool multipleResultsIsError_;
};

} // namespace idp::dc
