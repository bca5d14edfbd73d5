/**
 * @file ldap_connection_pool.cpp
 * @brief Implementation of LDAP Connection Pool
 */

#include <idp/dc/ldap/ldap_connection_pool.h>
#include <idp/dc/config/config_manager.h>
#include <idp/dc/exceptions.h>

#include <spdlog/spdlog.h>

namespace idp::dc {

// --- LdapPoolConfig ---

LdapPoolConfig LdapPoolConfig::fromConfig(const ConfigManager& config) {
    LdapPoolConfig c;
    c.uri = config.getString(ConfigManager::LDAP_URI, c.uri);
    c.bindDn = config.getString(ConfigManager::LDAP_BIND_DN);
    c.bindPassword = config.getString(ConfigManager::LDAP_BIND_PASSWORD);

    int minSize = config.getInt(ConfigManager::LDAP_POOL_MIN, static_cast<int>(c.minSize));
    int maxSize = config.getInt(ConfigManager::LDAP_POOL_MAX, static_cast<int>(c.maxSize));
    if (minSize < 0 || maxSize <= 0 || minSize > maxSize) {
        throw ConfigurationException("invalid LDAP pool size (min=" + std::to_string(minSize) +
                                     ", max=" + std::to_string(maxSize) + ")");
    }
    c.minSize = static_cast<size_t>(minSize);
    c.maxSize = static_cast<size_t>(maxSize);

    c.acquireTimeoutSec = config.getInt(ConfigManager::LDAP_POOL_TIMEOUT_SEC, c.acquireTimeoutSec);
    c.networkTimeoutSec = config.getInt(ConfigManager::LDAP_NETWORK_TIMEOUT_SEC, c.networkTimeoutSec);
    c.startTls = config.getBool(ConfigManager::LDAP_START_TLS, c.startTls);
    return c;
}

// --- LdapConnection Implementation ---

LdapConnection::~LdapConnection() {
    if (!released_ && ld_) {
        release();
    }
}

void LdapConnection::release() {
    if (!released_ && ld_ && pool_) {
        pool_->releaseConnection(ld_);
        ld_ = nullptr;
        released_ = true;
    }
}

// --- LdapConnectionPool Implementation ---

LdapConnectionPool::LdapConnectionPool(LdapPoolConfig config)
    : config_(std::move(config)),
      totalConnections_(0),
      shutdown_(false)
{
    if (config_.maxSize == 0 || config_.minSize > config_.maxSize) {
        throw ConfigurationException("invalid LDAP pool size");
    }
    spdlog::info("LdapConnectionPool created: uri={}, minSize={}, maxSize={}, timeout={}s, startTls={}",
                 config_.uri, config_.minSize, config_.maxSize,
                 config_.acquireTimeoutSec, config_.startTls);
}

LdapConnectionPool::~LdapConnectionPool() {
    shutdown();
}

bool LdapConnectionPool::initialize() {
    spdlog::info("Initializing LDAP connection pool (min={}, max={})", config_.minSize, config_.maxSize);

    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        spdlog::error("LDAP connection pool already shut down");
        return false;
    }

    while (totalConnections_ < config_.minSize) {
        LDAP* ld = createConnection();
        if (!ld) {
            spdlog::error("Failed to create initial LDAP connection {}/{}",
                          totalConnections_.load() + 1, config_.minSize);
            return false;
        }
        availableConnections_.push(ld);
        totalConnections_++;
    }

    spdlog::info("LDAP connection pool initialized with {} connections", totalConnections_.load());
    return true;
}

std::unique_ptr<LdapConnection> LdapConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config_.acquireTimeoutSec);

    while (true) {
        if (shutdown_) {
            throw ConnectionException("LDAP pool is shut down");
        }

        if (!availableConnections_.empty()) {
            LDAP* ld = availableConnections_.front();
            availableConnections_.pop();

            if (isConnectionHealthy(ld)) {
                spdlog::debug("Acquired LDAP connection from pool (available={}, total={})",
                              availableConnections_.size(), totalConnections_.load());
                return std::make_unique<LdapConnection>(ld, this);
            }
            spdlog::warn("Unhealthy LDAP connection detected, discarding");
            ldap_unbind_ext_s(ld, nullptr, nullptr);
            totalConnections_--;
        }

        // Reserve a slot before unlocking so concurrent callers cannot exceed maxSize
        if (totalConnections_ < config_.maxSize) {
            totalConnections_++;
            lock.unlock();
            LDAP* ld = createConnection();
            lock.lock();

            if (ld) {
                spdlog::info("Created new LDAP connection (total={})", totalConnections_.load());
                return std::make_unique<LdapConnection>(ld, this);
            }
            totalConnections_--;
            cv_.notify_one();
            throw ConnectionException("unable to connect to " + config_.uri);
        }

        spdlog::debug("Waiting for LDAP connection (available={}, total={}, max={})",
                      availableConnections_.size(), totalConnections_.load(), config_.maxSize);

        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout &&
            availableConnections_.empty()) {
            spdlog::error("Timeout waiting for LDAP connection");
            throw ConnectionException("LDAP pool exhausted (max=" + std::to_string(config_.maxSize) +
                                      ", waited " + std::to_string(config_.acquireTimeoutSec) + "s)");
        }
    }
}

IConnectionProvider::Stats LdapConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Stats{
        availableConnections_.size(),
        totalConnections_.load(),
        config_.maxSize
    };
}

void LdapConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        return;
    }
    shutdown_ = true;

    spdlog::info("Shutting down LDAP connection pool");

    while (!availableConnections_.empty()) {
        LDAP* ld = availableConnections_.front();
        availableConnections_.pop();
        ldap_unbind_ext_s(ld, nullptr, nullptr);
        totalConnections_--;
    }

    cv_.notify_all();
    spdlog::info("LDAP connection pool shutdown complete");
}

LDAP* LdapConnectionPool::createConnection() {
    LDAP* ld = nullptr;
    int rc;

    rc = ldap_initialize(&ld, config_.uri.c_str());
    if (rc != LDAP_SUCCESS) {
        spdlog::error("ldap_initialize failed: {}", ldap_err2string(rc));
        return nullptr;
    }

    int version = LDAP_VERSION3;
    rc = ldap_set_option(ld, LDAP_OPT_PROTOCOL_VERSION, &version);
    if (rc != LDAP_SUCCESS) {
        spdlog::error("ldap_set_option PROTOCOL_VERSION failed: {}", ldap_err2string(rc));
        ldap_unbind_ext_s(ld, nullptr, nullptr);
        return nullptr;
    }

    struct timeval timeout = {config_.networkTimeoutSec, 0};
    rc = ldap_set_option(ld, LDAP_OPT_NETWORK_TIMEOUT, &timeout);
    if (rc != LDAP_SUCCESS) {
        spdlog::warn("ldap_set_option NETWORK_TIMEOUT failed: {}", ldap_err2string(rc));
    }

    // Referrals are not chased with the bind credentials
    rc = ldap_set_option(ld, LDAP_OPT_REFERRALS, LDAP_OPT_OFF);
    if (rc != LDAP_SUCCESS) {
        spdlog::warn("ldap_set_option REFERRALS failed: {}", ldap_err2string(rc));
    }

    if (config_.startTls) {
        rc = ldap_start_tls_s(ld, nullptr, nullptr);
        if (rc != LDAP_SUCCESS) {
            spdlog::error("ldap_start_tls_s failed: {}", ldap_err2string(rc));
            ldap_unbind_ext_s(ld, nullptr, nullptr);
            return nullptr;
        }
    }

    // ber_str2bv with dup=1 so the berval owns its copy
    struct berval* cred = ber_str2bv(config_.bindPassword.c_str(), 0, 1, nullptr);
    if (!cred) {
        spdlog::error("ber_str2bv failed to create berval");
        ldap_unbind_ext_s(ld, nullptr, nullptr);
        return nullptr;
    }

    rc = ldap_sasl_bind_s(ld,
                          config_.bindDn.empty() ? nullptr : config_.bindDn.c_str(),
                          LDAP_SASL_SIMPLE, cred, nullptr, nullptr, nullptr);

    ber_bvfree(cred);

    if (rc != LDAP_SUCCESS) {
        spdlog::error("ldap_sasl_bind_s failed: {}", ldap_err2string(rc));
        ldap_unbind_ext_s(ld, nullptr, nullptr);
        return nullptr;
    }

    spdlog::debug("Created new LDAP connection to {}", config_.uri);
    return ld;
}

bool LdapConnectionPool::isConnectionHealthy(LDAP* ld) {
    if (!ld) return false;

    // Root DSE: empty base DN, scope base
    LDAPMessage* result = nullptr;
    struct timeval timeout = {config_.healthCheckTimeoutSec, 0};

    int rc = ldap_search_ext_s(ld, "", LDAP_SCOPE_BASE, "(objectClass=*)",
                               nullptr, 0, nullptr, nullptr, &timeout, 1, &result);

    if (result) {
        ldap_msgfree(result);
    }

    if (rc == LDAP_SUCCESS) {
        return true;
    }
    spdlog::warn("LDAP connection health check failed: {}", ldap_err2string(rc));
    return false;
}

void LdapConnectionPool::releaseConnection(LDAP* ld) {
    if (!ld) return;

    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        ldap_unbind_ext_s(ld, nullptr, nullptr);
        totalConnections_--;
        return;
    }

    availableConnections_.push(ld);
    spdlog::debug("Released LDAP connection to pool (available={}, total={})",
                  availableConnections_.size(), totalConnections_.load());
    cv_.notify_one();
}

} // namespace idp::dc
