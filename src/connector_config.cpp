/**
 * @file connector_config.cpp
 */

#include <idp/dc/connector_config.h>
#include <idp/dc/config/config_manager.h>
#include <idp/dc/exceptions.h>

namespace idp::dc {

ConnectorConfig ConnectorConfig::fromConfig(const ConfigManager& config) {
    ConnectorConfig result;
    result.noResultIsError = config.getBool(ConfigManager::DC_NO_RESULT_IS_ERROR,
                                            result.noResultIsError);
    result.failFastInitialize = config.getBool(ConfigManager::DC_FAIL_FAST_INITIALIZE,
                                               result.failFastInitialize);

    int timeoutMs = config.getInt(ConfigManager::DC_QUERY_TIMEOUT_MS,
                                  static_cast<int>(result.queryTimeout.count()));
    if (timeoutMs < 0) {
        throw ConfigurationException(std::string(ConfigManager::DC_QUERY_TIMEOUT_MS) +
                                     " must not be negative");
    }
    result.queryTimeout = std::chrono::milliseconds(timeoutMs);
    return result;
}

} // namespace idp::dc
