/**
 * @file connector_config.h
 * @brief Per-connector policy settings
 */

#pragma once

#include <chrono>

namespace idp::dc {

class ConfigManager;

struct ConnectorConfig {
    /// Zero matches raise NoResultException instead of returning an empty map
    bool noResultIsError = false;

    /// A failed start-up validation moves the connector to Failed
    bool failFastInitialize = false;

    /// Per-query execution deadline, zero for none
    std::chrono::milliseconds queryTimeout{3000};

    /**
     * @brief Read DC_NO_RESULT_IS_ERROR, DC_FAIL_FAST_INITIALIZE, DC_QUERY_TIMEOUT_MS
     * @throws ConfigurationException on a negative timeout
     */
    static ConnectorConfig fromConfig(const ConfigManager& config);
};

} // namespace idp::dc
