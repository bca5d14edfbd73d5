/**
 * @file config_manager.cpp
 * @brief Implementation of Configuration Manager
 */

#include <idp/dc/config/config_manager.h>
#include <idp/dc/exceptions.h>
#include <idp/dc/util/string_util.h>

#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

namespace idp::dc {

std::unique_ptr<ConfigManager> ConfigManager::instance_ = nullptr;
std::once_flag ConfigManager::initFlag_;

namespace {

const char* const KNOWN_KEYS[] = {
    ConfigManager::DC_ID, ConfigManager::DC_BACKEND,
    ConfigManager::DC_NO_RESULT_IS_ERROR, ConfigManager::DC_MULTIPLE_RESULTS_IS_ERROR,
    ConfigManager::DC_FAIL_FAST_INITIALIZE, ConfigManager::DC_QUERY_TIMEOUT_MS,
    ConfigManager::DC_CACHE_ENABLED, ConfigManager::DC_CACHE_MAX_ENTRIES,
    ConfigManager::DC_CACHE_TTL_SEC, ConfigManager::DC_CACHE_EXPIRE_AFTER_WRITE,

    ConfigManager::LDAP_URI, ConfigManager::LDAP_BASE_DN,
    ConfigManager::LDAP_BIND_DN, ConfigManager::LDAP_BIND_PASSWORD,
    ConfigManager::LDAP_POOL_MIN, ConfigManager::LDAP_POOL_MAX,
    ConfigManager::LDAP_POOL_TIMEOUT_SEC, ConfigManager::LDAP_NETWORK_TIMEOUT_SEC,
    ConfigManager::LDAP_START_TLS, ConfigManager::LDAP_FILTER,
    ConfigManager::LDAP_SEARCH_SCOPE, ConfigManager::LDAP_RETURN_ATTRIBUTES,
    ConfigManager::LDAP_BINARY_ATTRIBUTES, ConfigManager::LDAP_SIZE_LIMIT,
    ConfigManager::LDAP_RENAME,

    ConfigManager::DB_HOST, ConfigManager::DB_PORT, ConfigManager::DB_NAME,
    ConfigManager::DB_USER, ConfigManager::DB_PASSWORD,
    ConfigManager::DB_POOL_MIN, ConfigManager::DB_POOL_MAX,
    ConfigManager::DB_POOL_TIMEOUT_SEC, ConfigManager::DB_QUERY,
    ConfigManager::DB_VALIDATION_QUERY, ConfigManager::DB_COLUMNS,

    ConfigManager::STORAGE_TYPE, ConfigManager::STORAGE_CONTEXT,
    ConfigManager::STORAGE_KEY, ConfigManager::STORAGE_MAPPING,
    ConfigManager::STORAGE_GENERATED_ATTRIBUTE,

    ConfigManager::LOG_LEVEL, ConfigManager::LOG_FILE,
};

} // namespace

ConfigManager::ConfigManager(bool useEnvironment)
    : useEnvironment_(useEnvironment)
{
}

ConfigManager& ConfigManager::getInstance() {
    std::call_once(initFlag_, []() {
        instance_.reset(new ConfigManager(true));
        instance_->loadFromEnvironment();
    });
    return *instance_;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = config_.find(key);
    if (it != config_.end()) {
        return it->second;
    }

    if (useEnvironment_) {
        const char* env = std::getenv(key.c_str());
        if (env) {
            return std::string(env);
        }
    }

    return defaultValue;
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    try {
        return std::stoi(value);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse integer config '{}': {} (using default: {})",
                     key, e.what(), defaultValue);
        return defaultValue;
    }
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    std::string lowerValue = util::toLower(value);

    if (lowerValue == "true" || lowerValue == "1" || lowerValue == "yes" || lowerValue == "on") {
        return true;
    } else if (lowerValue == "false" || lowerValue == "0" || lowerValue == "no" || lowerValue == "off") {
        return false;
    }

    spdlog::warn("Invalid boolean config '{}': {} (using default: {})",
                 key, value, defaultValue);
    return defaultValue;
}

std::vector<std::string> ConfigManager::getList(const std::string& key) const {
    std::vector<std::string> items;
    std::string value = getString(key);

    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) {
            comma = value.size();
        }
        std::string item = util::trim(value.substr(start, comma - start));
        if (!item.empty()) {
            items.push_back(item);
        }
        start = comma + 1;
    }
    return items;
}

bool ConfigManager::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.find(key) != config_.end()) {
        return true;
    }
    return useEnvironment_ && std::getenv(key.c_str()) != nullptr;
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_[key] = value;
    if (key.find("PASSWORD") != std::string::npos) {
        spdlog::debug("Config set: {} = ********", key);
    } else {
        spdlog::debug("Config set: {} = {}", key, value);
    }
}

void ConfigManager::loadFromEnvironment() {
    size_t loaded = 0;
    for (const char* key : KNOWN_KEYS) {
        if (const char* env = std::getenv(key)) {
            set(key, env);
            ++loaded;
        }
    }
    spdlog::info("Configuration loaded from environment ({} keys)", loaded);
}

void ConfigManager::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationException("cannot read configuration file '" + path + "'");
    }

    std::string line;
    int lineNumber = 0;
    size_t loaded = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        std::string trimmed = util::trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        size_t eq = trimmed.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw ConfigurationException(path + ":" + std::to_string(lineNumber) +
                                         ": expected KEY=VALUE");
        }

        std::string key = util::trim(trimmed.substr(0, eq));
        std::string value = util::trim(trimmed.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        set(key, value);
        ++loaded;
    }

    spdlog::info("Configuration loaded from {} ({} keys)", path, loaded);
}

std::string ConfigManager::getEnv(const std::string& key, const std::string& defaultValue) {
    const char* env = std::getenv(key.c_str());
    return env ? std::string(env) : defaultValue;
}

} // namespace idp::dc
