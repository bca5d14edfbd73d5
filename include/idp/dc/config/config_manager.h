/**
 * @file config_manager.h
 * @brief Centralized configuration for data connectors
 *
 * Values come from three places, highest precedence first:
 * - explicit set() calls and KEY=VALUE files loaded with loadFromFile()
 * - the process environment (process-wide instance only)
 * - the default passed by the caller
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace idp::dc {

/**
 * @brief Configuration Manager
 *
 * getInstance() returns the process-wide instance backed by the
 * environment. Standalone instances only see values set on them.
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    bool useEnvironment_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

public:
    /**
     * @param useEnvironment Fall back to environment variables on lookup
     */
    explicit ConfigManager(bool useEnvironment = false);

    /**
     * @brief Get process-wide instance (environment loaded)
     */
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value
     *
     * Unparseable values are logged and the default is returned.
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get boolean configuration value (true/false, 1/0, yes/no, on/off)
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Get comma-separated list, entries trimmed, empty entries dropped
     */
    std::vector<std::string> getList(const std::string& key) const;

    /**
     * @brief Check if configuration key exists
     */
    bool has(const std::string& key) const;

    /**
     * @brief Set configuration value
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Copy every known key present in the environment
     */
    void loadFromEnvironment();

    /**
     * @brief Load KEY=VALUE lines; blank lines and '#' comments are ignored
     * @throws ConfigurationException if the file cannot be read or a line is malformed
     */
    void loadFromFile(const std::string& path);

    /**
     * @brief Get environment variable
     */
    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");

    /// @name Predefined Configuration Keys

    // Connector
    static constexpr const char* DC_ID = "DC_ID";
    static constexpr const char* DC_BACKEND = "DC_BACKEND";
    static constexpr const char* DC_NO_RESULT_IS_ERROR = "DC_NO_RESULT_IS_ERROR";
    static constexpr const char* DC_MULTIPLE_RESULTS_IS_ERROR = "DC_MULTIPLE_RESULTS_IS_ERROR";
    static constexpr const char* DC_FAIL_FAST_INITIALIZE = "DC_FAIL_FAST_INITIALIZE";
    static constexpr const char* DC_QUERY_TIMEOUT_MS = "DC_QUERY_TIMEOUT_MS";
    static constexpr const char* DC_CACHE_ENABLED = "DC_CACHE_ENABLED";
    static constexpr const char* DC_CACHE_MAX_ENTRIES = "DC_CACHE_MAX_ENTRIES";
    static constexpr const char* DC_CACHE_TTL_SEC = "DC_CACHE_TTL_SEC";
    static constexpr const char* DC_CACHE_EXPIRE_AFTER_WRITE = "DC_CACHE_EXPIRE_AFTER_WRITE";

    // LDAP
    static constexpr const char* LDAP_URI = "LDAP_URI";
    static constexpr const char* LDAP_BASE_DN = "LDAP_BASE_DN";
    static constexpr const char* LDAP_BIND_DN = "LDAP_BIND_DN";
    static constexpr const char* LDAP_BIND_PASSWORD = "LDAP_BIND_PASSWORD";
    static constexpr const char* LDAP_POOL_MIN = "LDAP_POOL_MIN";
    static constexpr const char* LDAP_POOL_MAX = "LDAP_POOL_MAX";
    static constexpr const char* LDAP_POOL_TIMEOUT_SEC = "LDAP_POOL_TIMEOUT_SEC";
    static constexpr const char* LDAP_NETWORK_TIMEOUT_SEC = "LDAP_NETWORK_TIMEOUT_SEC";
    static constexpr const char* LDAP_START_TLS = "LDAP_START_TLS";
    static constexpr const char* LDAP_FILTER = "LDAP_FILTER";
    static constexpr const char* LDAP_SEARCH_SCOPE = "LDAP_SEARCH_SCOPE";
    static constexpr const char* LDAP_RETURN_ATTRIBUTES = "LDAP_RETURN_ATTRIBUTES";
    static constexpr const char* LDAP_BINARY_ATTRIBUTES = "LDAP_BINARY_ATTRIBUTES";
    static constexpr const char* LDAP_SIZE_LIMIT = "LDAP_SIZE_LIMIT";
    static constexpr const char* LDAP_RENAME = "LDAP_RENAME";

    // Database
    static constexpr const char* DB_HOST = "DB_HOST";
    static constexpr const char* DB_PORT = "DB_PORT";
    static constexpr const char* DB_NAME = "DB_NAME";
    static constexpr const char* DB_USER = "DB_USER";
    static constexpr const char* DB_PASSWORD = "DB_PASSWORD";
    static constexpr const char* DB_POOL_MIN = "DB_POOL_MIN";
    static constexpr const char* DB_POOL_MAX = "DB_POOL_MAX";
    static constexpr const char* DB_POOL_TIMEOUT_SEC = "DB_POOL_TIMEOUT_SEC";
    static constexpr const char* DB_QUERY = "DB_QUERY";
    static constexpr const char* DB_VALIDATION_QUERY = "DB_VALIDATION_QUERY";
    static constexpr const char* DB_COLUMNS = "DB_COLUMNS";

    // Storage
    static constexpr const char* STORAGE_TYPE = "STORAGE_TYPE";
    static constexpr const char* STORAGE_CONTEXT = "STORAGE_CONTEXT";
    static constexpr const char* STORAGE_KEY = "STORAGE_KEY";
    static constexpr const char* STORAGE_MAPPING = "STORAGE_MAPPING";
    static constexpr const char* STORAGE_GENERATED_ATTRIBUTE = "STORAGE_GENERATED_ATTRIBUTE";

    // Logging
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_FILE = "LOG_FILE";
};

} // namespace idp::dc
