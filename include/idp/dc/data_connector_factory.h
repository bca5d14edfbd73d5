/**
 * @file data_connector_factory.h
 * @brief Builds fully bound connectors from configuration
 *
 * Usage Example:
 * @code
 * auto& config = ConfigManager::getInstance();
 * config.loadFromFile("/etc/idp/dc.conf");
 * auto connector = DataConnectorFactory::create(config);
 * connector->initialize();
 * AttributeMap attrs = connector->retrieveAttributes(ResolutionContext("alice"));
 * @endcode
 */

#pragma once

#include <idp/dc/data_connector.h>

#include <memory>
#include <string>

namespace idp::dc {

class ConfigManager;

class DataConnectorFactory {
public:
    /**
     * @brief Create an uninitialized connector for DC_BACKEND
     *
     * Backends: "ldap", "rdbms" (alias "postgres"), "storage".
     *
     * @throws ConfigurationException on an unknown backend or missing keys
     */
    static std::unique_ptr<DataConnector> create(const ConfigManager& config);

    /**
     * @brief Normalize a backend name ("LDAP", "postgresql", ...)
     * @return "ldap", "rdbms" or "storage", empty if unknown
     */
    static std::string normalizeBackend(const std::string& backend);

private:
    static void bindLdap(DataConnector& connector, const ConfigManager& config);
    static void bindRdbms(DataConnector& connector, const ConfigManager& config);
    static void bindStorage(DataConnector& connector, const ConfigManager& config);
};

} // namespace idp::dc
