/**
 * @file data_connector_factory.cpp
 */

#include <idp/dc/data_connector_factory.h>
#include <idp/dc/config/config_manager.h>
#include <idp/dc/database/data_source_validator.h>
#include <idp/dc/database/db_connection_pool.h>
#include <idp/dc/database/postgresql_query_executor.h>
#include <idp/dc/database/sql_result_mapper.h>
#include <idp/dc/database/sql_statement.h>
#include <idp/dc/exceptions.h>
#include <idp/dc/ldap/ldap_connection_pool.h>
#include <idp/dc/ldap/ldap_result_mapper.h>
#include <idp/dc/ldap/ldap_search.h>
#include <idp/dc/ldap/ldap_validator.h>
#include <idp/dc/storage/memory_storage_service.h>
#include <idp/dc/storage/postgres_storage_service.h>
#include <idp/dc/storage/storage_mappers.h>
#include <idp/dc/storage/storage_search.h>
#include <idp/dc/storage/storage_validator.h>
#include <idp/dc/util/string_util.h>

#include <spdlog/spdlog.h>

namespace idp::dc {

namespace {

std::string require(const ConfigManager& config, const char* key) {
    std::string value = config.getString(key);
    if (value.empty()) {
        throw ConfigurationException(std::string(key) + " is required");
    }
    return value;
}

/**
 * @brief Split "left=right" list entries
 */
std::pair<std::string, std::string> splitPair(const char* key, const std::string& entry) {
    size_t eq = entry.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == entry.size()) {
        throw ConfigurationException(std::string(key) + " entry '" + entry + "' must be NAME=VALUE");
    }
    return {util::trim(entry.substr(0, eq)), util::trim(entry.substr(eq + 1))};
}

} // namespace

std::string DataConnectorFactory::normalizeBackend(const std::string& backend) {
    std::string lower = util::toLower(util::trim(backend));
    if (lower == "ldap" || lower == "directory") {
        return "ldap";
    }
    if (lower == "rdbms" || lower == "postgres" || lower == "postgresql" || lower == "sql") {
        return "rdbms";
    }
    if (lower == "storage") {
        return "storage";
    }
    return "";
}

std::unique_ptr<DataConnector> DataConnectorFactory::create(const ConfigManager& config) {
    std::string requested = require(config, ConfigManager::DC_BACKEND);
    std::string backend = normalizeBackend(requested);
    if (backend.empty()) {
        throw ConfigurationException("unsupported backend '" + requested + "'");
    }

    std::string id = config.getString(ConfigManager::DC_ID, backend);
    auto connector = std::make_unique<DataConnector>(id, ConnectorConfig::fromConfig(config));

    if (backend == "ldap") {
        bindLdap(*connector, config);
    } else if (backend == "rdbms") {
        bindRdbms(*connector, config);
    } else {
        bindStorage(*connector, config);
    }

    connector->setResultCache(ResultCache::fromConfig(config));

    spdlog::info("[DataConnectorFactory] Created {} connector '{}'", backend, id);
    return connector;
}

void DataConnectorFactory::bindLdap(DataConnector& connector, const ConfigManager& config) {
    auto pool = std::make_shared<LdapConnectionPool>(LdapPoolConfig::fromConfig(config));

    LdapScope scope = parseLdapScope(config.getString(ConfigManager::LDAP_SEARCH_SCOPE, "sub"));
    int sizeLimit = config.getInt(ConfigManager::LDAP_SIZE_LIMIT, 0);

    auto builder = std::make_shared<LdapSearchBuilder>(
        require(config, ConfigManager::LDAP_FILTER),
        require(config, ConfigManager::LDAP_BASE_DN),
        scope,
        config.getList(ConfigManager::LDAP_RETURN_ATTRIBUTES),
        sizeLimit);

    LdapMapperOptions options;
    for (const auto& name : config.getList(ConfigManager::LDAP_BINARY_ATTRIBUTES)) {
        options.binaryAttributes.insert(name);
    }
    for (const auto& entry : config.getList(ConfigManager::LDAP_RENAME)) {
        options.renaming.insert(splitPair(ConfigManager::LDAP_RENAME, entry));
    }
    options.multipleResultsIsError = config.getBool(ConfigManager::DC_MULTIPLE_RESULTS_IS_ERROR, false);

    connector.setConnectionProvider(pool);
    connector.setQueryBuilder(builder);
    connector.setResultMapper(std::make_shared<LdapResultMapper>(options));
    connector.setValidator(std::make_shared<LdapConnectionValidator>(pool));
}

void DataConnectorFactory::bindRdbms(DataConnector& connector, const ConfigManager& config) {
    auto pool = std::make_shared<DbConnectionPool>(DbPoolConfig::fromConfig(config));

    SqlMapperOptions options;
    // DB_COLUMNS entries: column=attributeId[:type]
    for (const auto& entry : config.getList(ConfigManager::DB_COLUMNS)) {
        auto [column, target] = splitPair(ConfigManager::DB_COLUMNS, entry);
        SqlColumnDescriptor descriptor;
        size_t colon = target.find(':');
        if (colon == std::string::npos) {
            descriptor.attributeId = target;
        } else {
            descriptor.attributeId = util::trim(target.substr(0, colon));
            descriptor.dataType = parseSqlDataType(util::trim(target.substr(colon + 1)));
        }
        options.columnDescriptors[column] = descriptor;
    }
    options.multipleResultsIsError = config.getBool(ConfigManager::DC_MULTIPLE_RESULTS_IS_ERROR, false);

    connector.setConnectionProvider(pool);
    connector.setQueryBuilder(std::make_shared<SqlStatementBuilder>(require(config, ConfigManager::DB_QUERY)));
    connector.setResultMapper(std::make_shared<SqlResultMapper>(options));
    connector.setValidator(std::make_shared<DataSourceValidator>(
        pool, config.getString(ConfigManager::DB_VALIDATION_QUERY, "SELECT 1")));
}

void DataConnectorFactory::bindStorage(DataConnector& connector, const ConfigManager& config) {
    std::string type = util::toLower(config.getString(ConfigManager::STORAGE_TYPE, "memory"));

    std::shared_ptr<IStorageService> service;
    if (type == "memory") {
        service = std::make_shared<MemoryStorageService>();
    } else if (type == "postgres" || type == "postgresql") {
        auto pool = std::make_shared<DbConnectionPool>(DbPoolConfig::fromConfig(config));
        service = std::make_shared<PostgresStorageService>(std::make_shared<PostgreSQLQueryExecutor>(pool));
    } else {
        throw ConfigurationException("unsupported storage type '" + type + "'");
    }

    std::string mapping = util::toLower(config.getString(ConfigManager::STORAGE_MAPPING, "simple"));
    std::shared_ptr<IResultMapper> mapper;
    if (mapping == "simple") {
        mapper = std::make_shared<SimpleStorageMapper>(
            require(config, ConfigManager::STORAGE_GENERATED_ATTRIBUTE));
    } else if (mapping == "json") {
        mapper = std::make_shared<JsonStorageMapper>();
    } else {
        throw ConfigurationException("unsupported storage mapping '" + mapping + "'");
    }

    connector.setConnectionProvider(std::make_shared<StorageServiceProvider>(service));
    connector.setQueryBuilder(std::make_shared<StorageSearchBuilder>(
        require(config, ConfigManager::STORAGE_CONTEXT),
        require(config, ConfigManager::STORAGE_KEY)));
    connector.setResultMapper(mapper);
    connector.setValidator(std::make_shared<StorageServiceValidator>(service));
}

} // namespace idp::dc
