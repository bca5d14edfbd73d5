/**
 * @file test_sql_connector.cpp
 * @brief Unit tests for the relational statement builder, result mapper and pool settings
 *
 * Result sets are constructed in memory; no PostgreSQL server is needed.
 */

#include <gtest/gtest.h>
#include <idp/dc/database/db_connection_pool.h>
#include <idp/dc/database/postgresql_query_executor.h>
#include <idp/dc/database/sql_result_mapper.h>
#include <idp/dc/database/sql_statement.h>
#include <idp/dc/exceptions.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace idp::dc;

namespace {

constexpr unsigned int TEXT_OID = 25;
constexpr unsigned int BYTEA_OID = 17;
constexpr unsigned int INT4_OID = 23;
constexpr unsigned int BOOL_OID = 16;

SqlResultSet::Row row(std::initializer_list<std::optional<std::string>> fields) {
    return SqlResultSet::Row(fields);
}

} // namespace

// ============================================================================
// Statement builder
// ============================================================================

TEST(SqlStatementBuilderTest, RendersStatementForPrincipal) {
    SqlStatementBuilder builder("SELECT uid, mail, cn FROM people WHERE uid = '{principal}'");

    auto query = builder.build(ResolutionContext("alice"));
    auto* statement = dynamic_cast<const SqlStatement*>(query.get());

    ASSERT_NE(statement, nullptr);
    EXPECT_EQ(statement->getSql(), "SELECT uid, mail, cn FROM people WHERE uid = 'alice'");
    EXPECT_EQ(query->getResultCacheKey(), statement->getSql());
}

TEST(SqlStatementBuilderTest, EscapesQuotesInValues) {
    SqlStatementBuilder builder("SELECT mail FROM people WHERE uid = '{principal}'");

    auto query = builder.build(ResolutionContext("x' OR '1'='1"));

    EXPECT_EQ(query->getResultCacheKey(),
              "SELECT mail FROM people WHERE uid = 'x'' OR ''1''=''1'");
}

TEST(SqlStatementBuilderTest, InvalidTemplate_Throws) {
    EXPECT_THROW(SqlStatementBuilder(""), ConfigurationException);

    SqlStatementBuilder builder("SELECT * FROM people WHERE dept = '{department}'");
    EXPECT_THROW(builder.build(ResolutionContext("alice")), QueryConstructionException);
}

// ============================================================================
// Result mapper
// ============================================================================

TEST(SqlResultMapperTest, SingleRowBecomesOneValuePerColumn) {
    SqlResultSet result({{"uid", TEXT_OID}, {"mail", TEXT_OID}, {"cn", TEXT_OID}},
                        {row({"alice", "a@x.org", "Alice A"})});

    AttributeMap attributes = SqlResultMapper().map(result);

    AttributeMap expected;
    expected["uid"] = {AttributeValue::ofString("alice")};
    expected["mail"] = {AttributeValue::ofString("a@x.org")};
    expected["cn"] = {AttributeValue::ofString("Alice A")};
    EXPECT_EQ(attributes, expected);
}

TEST(SqlResultMapperTest, RowsAppendInOrder) {
    SqlResultSet result({{"entitlement", TEXT_OID}},
                        {row({"urn:a"}), row({"urn:b"}), row({"urn:c"})});

    AttributeMap attributes = SqlResultMapper().map(result);

    ASSERT_EQ(attributes["entitlement"].size(), 3u);
    EXPECT_EQ(attributes["entitlement"][2].getValue(), "urn:c");
}

TEST(SqlResultMapperTest, NoRowsGivesEmptyMap) {
    SqlResultSet result({{"uid", TEXT_OID}}, {});

    EXPECT_TRUE(SqlResultMapper().map(result).empty());
}

TEST(SqlResultMapperTest, NullBecomesEmptyValue) {
    SqlResultSet result({{"uid", TEXT_OID}, {"phone", TEXT_OID}},
                        {row({"alice", std::nullopt})});

    AttributeMap attributes = SqlResultMapper().map(result);

    ASSERT_EQ(attributes["phone"].size(), 1u);
    EXPECT_TRUE(attributes["phone"][0].isEmpty());
}

TEST(SqlResultMapperTest, ByteaColumnDecodesHex) {
    SqlResultSet result({{"photo", BYTEA_OID}}, {row({"\\x00ff10"})});

    AttributeMap attributes = SqlResultMapper().map(result);

    EXPECT_EQ(attributes["photo"][0], AttributeValue::ofBinary(std::string("\x00\xff\x10", 3)));
}

TEST(SqlResultMapperTest, MalformedBytea_Throws) {
    SqlResultSet badPrefix({{"photo", BYTEA_OID}}, {row({"00ff"})});
    SqlResultSet badDigit({{"photo", BYTEA_OID}}, {row({"\\x0g"})});

    EXPECT_THROW(SqlResultMapper().map(badPrefix), MappingException);
    EXPECT_THROW(SqlResultMapper().map(badDigit), MappingException);
}

TEST(SqlResultMapperTest, DescriptorsRenameAndNormalize) {
    SqlMapperOptions options;
    options.columnDescriptors["EMPLOYEE_NO"] = {"employeeNumber", SqlDataType::Integer};
    options.columnDescriptors["active"] = {"", SqlDataType::Boolean};

    SqlResultSet result({{"employee_no", INT4_OID}, {"active", BOOL_OID}},
                        {row({"+42", "t"}), row({"-7", "f"})});

    AttributeMap attributes = SqlResultMapper(options).map(result);

    ASSERT_EQ(attributes.count("employee_no"), 0u);
    ASSERT_EQ(attributes["employeeNumber"].size(), 2u);
    EXPECT_EQ(attributes["employeeNumber"][0].getValue(), "42");
    EXPECT_EQ(attributes["employeeNumber"][1].getValue(), "-7");
    EXPECT_EQ(attributes["active"][0].getValue(), "true");
    EXPECT_EQ(attributes["active"][1].getValue(), "false");
}

TEST(SqlResultMapperTest, TypeMismatch_Throws) {
    SqlMapperOptions options;
    options.columnDescriptors["age"] = {"", SqlDataType::Integer};
    options.columnDescriptors["vip"] = {"", SqlDataType::Boolean};

    SqlResultSet badInteger({{"age", TEXT_OID}}, {row({"forty"})});
    SqlResultSet badBoolean({{"vip", TEXT_OID}}, {row({"maybe"})});

    EXPECT_THROW(SqlResultMapper(options).map(badInteger), MappingException);
    EXPECT_THROW(SqlResultMapper(options).map(badBoolean), MappingException);
}

TEST(SqlResultMapperTest, MultipleRows_ThrowWhenConfigured) {
    SqlMapperOptions options;
    options.multipleResultsIsError = true;
    SqlResultSet result({{"uid", TEXT_OID}}, {row({"a"}), row({"b"})});

    EXPECT_THROW(SqlResultMapper(options).map(result), MappingException);
}

TEST(SqlResultMapperTest, RowWidthMismatch_Throws) {
    SqlResultSet result({{"uid", TEXT_OID}, {"mail", TEXT_OID}}, {row({"alice"})});

    EXPECT_THROW(SqlResultMapper().map(result), MappingException);
}

TEST(SqlResultMapperTest, ParseDataType) {
    EXPECT_EQ(parseSqlDataType("Integer"), SqlDataType::Integer);
    EXPECT_EQ(parseSqlDataType("binary"), SqlDataType::Binary);
    EXPECT_THROW(parseSqlDataType("date"), ConfigurationException);
}

// ============================================================================
// Pool settings and executor helpers
// ============================================================================

TEST(DbPoolConfigTest, ConnStringQuotesValues) {
    DbPoolConfig config;
    config.host = "db.example.org";
    config.port = 6432;
    config.database = "idp";
    config.user = "reader";
    config.password = "it's secret";

    std::string conn = config.buildConnString();

    EXPECT_NE(conn.find("host='db.example.org'"), std::string::npos);
    EXPECT_NE(conn.find("port=6432"), std::string::npos);
    EXPECT_NE(conn.find("dbname='idp'"), std::string::npos);
    EXPECT_NE(conn.find("password='it\\'s secret'"), std::string::npos);
}

TEST(DbConnectionPoolTest, AcquireAfterShutdown_Throws) {
    DbPoolConfig config;
    config.database = "idp";
    DbConnectionPool pool(config);

    pool.shutdown();

    EXPECT_THROW(pool.acquireGeneric(), ConnectionException);
    EXPECT_EQ(pool.getBackendType(), "postgres");
}

TEST(DbConnectionPoolTest, FailedConnectWakesWaitingCallers) {
    // Nothing listens on port 1, so every connect attempt is refused at once
    DbConnectionPool pool("host=127.0.0.1 port=1 dbname=idp connect_timeout=1", 0, 1, 10);
    std::atomic<int> failures{0};

    auto start = std::chrono::steady_clock::now();
    std::vector<std::thread> callers;
    for (int i = 0; i < 4; ++i) {
        callers.emplace_back([&pool, &failures] {
            try {
                pool.acquire();
            } catch (const ConnectionException&) {
                failures++;
            }
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(failures.load(), 4);
    EXPECT_EQ(pool.getStats().totalConnections, 0u);
    // A caller waiting on the single slot is woken when it is handed back
    EXPECT_LT(elapsed, std::chrono::seconds(8));
}

TEST(PostgreSQLQueryExecutorTest, FieldToJsonByType) {
    EXPECT_EQ(PostgreSQLQueryExecutor::fieldToJson("42", INT4_OID).asInt64(), 42);
    EXPECT_TRUE(PostgreSQLQueryExecutor::fieldToJson("t", BOOL_OID).asBool());
    EXPECT_DOUBLE_EQ(PostgreSQLQueryExecutor::fieldToJson("1.5", 701).asDouble(), 1.5);
    EXPECT_EQ(PostgreSQLQueryExecutor::fieldToJson("alice", TEXT_OID).asString(), "alice");
}
