/**
 * @file ldap_connection_pool.h
 * @brief LDAP Connection Pool
 *
 * Thread-safe connection pooling for directory servers
 * Features:
 * - Configurable pool size (min/max connections)
 * - Acquire timeout
 * - Optional StartTLS before bind
 * - Root DSE health check of pooled connections on acquire
 */

#pragma once

#include <idp/dc/connection.h>

#include <ldap.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace idp::dc {

class ConfigManager;
class LdapConnectionPool;

/**
 * @brief LDAP pool settings
 */
struct LdapPoolConfig {
    std::string uri = "ldap://localhost:389";
    std::string bindDn;         ///< Empty for anonymous bind
    std::string bindPassword;
    size_t minSize = 2;
    size_t maxSize = 10;
    int acquireTimeoutSec = 5;
    int networkTimeoutSec = 5;
    int healthCheckTimeoutSec = 2;
    bool startTls = false;

    /**
     * @brief Read LDAP_URI, LDAP_BIND_DN, LDAP_BIND_PASSWORD, LDAP_POOL_*,
     *        LDAP_NETWORK_TIMEOUT_SEC, LDAP_START_TLS
     * @throws ConfigurationException on invalid pool sizes
     */
    static LdapPoolConfig fromConfig(const ConfigManager& config);
};

/**
 * @brief RAII lease of a pooled LDAP handle
 *
 * Returns the handle to the pool when released or destroyed.
 */
class LdapConnection : public IConnection {
private:
    LDAP* ld_;
    LdapConnectionPool* pool_;  // Non-owning pointer to pool
    bool released_;

public:
    LdapConnection(LDAP* ld, LdapConnectionPool* pool)
        : ld_(ld), pool_(pool), released_(false) {}

    ~LdapConnection() override;

    LdapConnection(const LdapConnection&) = delete;
    LdapConnection& operator=(const LdapConnection&) = delete;

    /**
     * @brief Get raw LDAP handle
     */
    LDAP* get() const { return ld_; }

    bool isValid() const override {
        return ld_ != nullptr && !released_;
    }

    std::string getBackendType() const override { return "ldap"; }

    void release() override;
};

/**
 * @brief LDAP Connection Pool
 */
class LdapConnectionPool : public IConnectionProvider {
private:
    LdapPoolConfig config_;

    std::queue<LDAP*> availableConnections_;
    std::atomic<size_t> totalConnections_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    bool shutdown_;

    friend class LdapConnection;

public:
    explicit LdapConnectionPool(LdapPoolConfig config);

    /**
     * @brief Destructor - closes all connections
     */
    ~LdapConnectionPool() override;

    LdapConnectionPool(const LdapConnectionPool&) = delete;
    LdapConnectionPool& operator=(const LdapConnectionPool&) = delete;

    /**
     * @brief Create the minimum number of connections
     * @return true if all of them could be opened and bound
     */
    bool initialize() override;

    /**
     * @brief Acquire connection from pool
     * @throws ConnectionException on timeout, pool exhaustion or shutdown
     */
    std::unique_ptr<LdapConnection> acquire();

    std::unique_ptr<IConnection> acquireGeneric() override { return acquire(); }

    Stats getStats() const override;

    /**
     * @brief Shutdown pool and close all idle connections
     *
     * Leased connections are closed when they are returned.
     */
    void shutdown() override;

    std::string getBackendType() const override { return "ldap"; }

    const LdapPoolConfig& getConfig() const { return config_; }

private:
    /**
     * @brief Open, configure and bind a new handle
     * @return nullptr on failure (logged)
     */
    LDAP* createConnection();

    bool isConnectionHealthy(LDAP* ld);

    /**
     * @brief Return connection to pool (called by LdapConnection)
     */
    void releaseConnection(LDAP* ld);
};

} // namespace idp::dc
