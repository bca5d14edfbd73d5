/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading and the connector factory
 *
 * Factory tests never initialize directory or database connectors, so no
 * server is contacted.
 */

#include <gtest/gtest.h>
#include <idp/dc/config/config_manager.h>
#include <idp/dc/data_connector_factory.h>
#include <idp/dc/exceptions.h>
#include <idp/dc/logging/logger.h>

#include <filesystem>
#include <fstream>

using namespace idp::dc;

// ============================================================================
// ConfigManager
// ============================================================================

TEST(ConfigManagerTest, TypedGetters) {
    ConfigManager config;
    config.set("NUMBER", "42");
    config.set("BAD_NUMBER", "forty-two");
    config.set("FLAG", "Yes");
    config.set("LIST", " mail, cn ,,uid ");

    EXPECT_EQ(config.getInt("NUMBER"), 42);
    EXPECT_EQ(config.getInt("BAD_NUMBER", 7), 7);
    EXPECT_EQ(config.getInt("MISSING", 3), 3);
    EXPECT_TRUE(config.getBool("FLAG"));
    EXPECT_TRUE(config.getBool("MISSING", true));
    config.set("ACCENTED", "\xC3\x89T\xC3\x89");
    EXPECT_FALSE(config.getBool("ACCENTED", false));
    config.set("UPPER", "OFF");
    EXPECT_FALSE(config.getBool("UPPER", true));
    EXPECT_EQ(config.getList("LIST"), (std::vector<std::string>{"mail", "cn", "uid"}));
    EXPECT_TRUE(config.getList("MISSING").empty());
    EXPECT_TRUE(config.has("FLAG"));
    EXPECT_FALSE(config.has("MISSING"));
}

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = std::filesystem::temp_directory_path() /
               ("idp_dc_config_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".conf");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    void write(const std::string& content) {
        std::ofstream out(path);
        out << content;
    }

    std::filesystem::path path;
};

TEST_F(ConfigFileTest, LoadsKeyValueLines) {
    write("# connector\n"
          "DC_BACKEND = ldap\n"
          "\n"
          "LDAP_FILTER=\"(uid={principal})\"\n"
          "LDAP_BIND_PASSWORD=a=b\n");
    ConfigManager config;

    config.loadFromFile(path.string());

    EXPECT_EQ(config.getString(ConfigManager::DC_BACKEND), "ldap");
    EXPECT_EQ(config.getString(ConfigManager::LDAP_FILTER), "(uid={principal})");
    EXPECT_EQ(config.getString(ConfigManager::LDAP_BIND_PASSWORD), "a=b");
}

TEST_F(ConfigFileTest, LoadLogsToStderrOnly) {
    write("DC_BACKEND=storage\n");
    Logger::initialize("config-test", "info");
    ConfigManager config;

    ::testing::internal::CaptureStdout();
    ::testing::internal::CaptureStderr();
    config.loadFromFile(path.string());
    Logger::flush();
    std::string out = ::testing::internal::GetCapturedStdout();
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_TRUE(out.empty()) << out;
    EXPECT_NE(err.find("Configuration loaded from"), std::string::npos);
}

TEST_F(ConfigFileTest, MalformedLine_Throws) {
    write("DC_BACKEND=ldap\nnot a setting\n");
    ConfigManager config;

    EXPECT_THROW(config.loadFromFile(path.string()), ConfigurationException);
}

TEST_F(ConfigFileTest, MissingFile_Throws) {
    ConfigManager config;

    EXPECT_THROW(config.loadFromFile(path.string()), ConfigurationException);
}

TEST(ConnectorConfigTest, FromConfig) {
    ConfigManager config;
    ConnectorConfig defaults = ConnectorConfig::fromConfig(config);
    EXPECT_FALSE(defaults.noResultIsError);
    EXPECT_FALSE(defaults.failFastInitialize);
    EXPECT_EQ(defaults.queryTimeout.count(), 3000);

    config.set(ConfigManager::DC_NO_RESULT_IS_ERROR, "true");
    config.set(ConfigManager::DC_QUERY_TIMEOUT_MS, "0");
    ConnectorConfig custom = ConnectorConfig::fromConfig(config);
    EXPECT_TRUE(custom.noResultIsError);
    EXPECT_EQ(custom.queryTimeout.count(), 0);

    config.set(ConfigManager::DC_QUERY_TIMEOUT_MS, "-5");
    EXPECT_THROW(ConnectorConfig::fromConfig(config), ConfigurationException);
}

// ============================================================================
// DataConnectorFactory
// ============================================================================

TEST(DataConnectorFactoryTest, NormalizeBackend) {
    EXPECT_EQ(DataConnectorFactory::normalizeBackend("LDAP"), "ldap");
    EXPECT_EQ(DataConnectorFactory::normalizeBackend(" postgresql "), "rdbms");
    EXPECT_EQ(DataConnectorFactory::normalizeBackend("storage"), "storage");
    EXPECT_EQ(DataConnectorFactory::normalizeBackend("mongodb"), "");
}

TEST(DataConnectorFactoryTest, MissingOrUnknownBackend_Throws) {
    ConfigManager config;
    EXPECT_THROW(DataConnectorFactory::create(config), ConfigurationException);

    config.set(ConfigManager::DC_BACKEND, "mongodb");
    EXPECT_THROW(DataConnectorFactory::create(config), ConfigurationException);
}

TEST(DataConnectorFactoryTest, StorageConnectorEndToEnd) {
    ConfigManager config;
    config.set(ConfigManager::DC_BACKEND, "storage");
    config.set(ConfigManager::DC_ID, "consent");
    config.set(ConfigManager::DC_CACHE_ENABLED, "true");
    config.set(ConfigManager::STORAGE_CONTEXT, "consent:{requester}");
    config.set(ConfigManager::STORAGE_KEY, "{principal}");
    config.set(ConfigManager::STORAGE_GENERATED_ATTRIBUTE, "consent");

    auto connector = DataConnectorFactory::create(config);
    ASSERT_NE(connector, nullptr);
    EXPECT_EQ(connector->getId(), "consent");

    connector->initialize();
    EXPECT_TRUE(connector->isValidated());

    AttributeMap attributes = connector->retrieveAttributes(
        ResolutionContext("alice", "https://sp.example.org"));
    EXPECT_TRUE(attributes.empty());

    connector->destroy();
    EXPECT_EQ(connector->getState(), DataConnector::State::Destroyed);
}

TEST(DataConnectorFactoryTest, StorageSettingsAreChecked) {
    ConfigManager config;
    config.set(ConfigManager::DC_BACKEND, "storage");
    config.set(ConfigManager::STORAGE_CONTEXT, "ctx");
    config.set(ConfigManager::STORAGE_KEY, "{principal}");

    // simple mapping needs a generated attribute id
    EXPECT_THROW(DataConnectorFactory::create(config), ConfigurationException);

    config.set(ConfigManager::STORAGE_MAPPING, "json");
    EXPECT_NO_THROW(DataConnectorFactory::create(config));

    config.set(ConfigManager::STORAGE_TYPE, "redis");
    EXPECT_THROW(DataConnectorFactory::create(config), ConfigurationException);
}

TEST(DataConnectorFactoryTest, LdapConnectorIsBoundWithoutConnecting) {
    ConfigManager config;
    config.set(ConfigManager::DC_BACKEND, "ldap");
    config.set(ConfigManager::LDAP_URI, "ldap://directory.invalid:389");
    config.set(ConfigManager::LDAP_BASE_DN, "ou=people,dc=example,dc=org");
    config.set(ConfigManager::LDAP_FILTER, "(uid={principal})");
    config.set(ConfigManager::LDAP_RENAME, "mail=email, cn=displayName");

    auto connector = DataConnectorFactory::create(config);

    EXPECT_EQ(connector->getId(), "ldap");
    EXPECT_EQ(connector->getState(), DataConnector::State::Uninitialized);
}

TEST(DataConnectorFactoryTest, LdapSettingsAreChecked) {
    ConfigManager config;
    config.set(ConfigManager::DC_BACKEND, "ldap");
    config.set(ConfigManager::LDAP_BASE_DN, "dc=example,dc=org");
    EXPECT_THROW(DataConnectorFactory::create(config), ConfigurationException);

    config.set(ConfigManager::LDAP_FILTER, "(uid={principal})");
    config.set(ConfigManager::LDAP_SEARCH_SCOPE, "children");
    EXPECT_THROW(DataConnectorFactory::create(config), ConfigurationException);

    config.set(ConfigManager::LDAP_SEARCH_SCOPE, "one");
    config.set(ConfigManager::LDAP_RENAME, "mail");
    EXPECT_THROW(DataConnectorFactory::create(config), ConfigurationException);
}

TEST(DataConnectorFactoryTest, RdbmsSettingsAreChecked) {
    ConfigManager config;
    config.set(ConfigManager::DC_BACKEND, "postgres");
    config.set(ConfigManager::DB_QUERY, "SELECT mail FROM people WHERE uid = '{principal}'");

    // DB_NAME is required
    EXPECT_THROW(DataConnectorFactory::create(config), ConfigurationException);

    config.set(ConfigManager::DB_NAME, "idp");
    config.set(ConfigManager::DB_COLUMNS, "mail=email, active=isActive:boolean");
    auto connector = DataConnectorFactory::create(config);
    EXPECT_EQ(connector->getId(), "rdbms");

    config.set(ConfigManager::DB_COLUMNS, "age=age:date");
    EXPECT_THROW(DataConnectorFactory::create(config), ConfigurationException);
}
