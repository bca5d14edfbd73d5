/**
 * @file db_connection_pool.h
 * @brief PostgreSQL Connection Pool
 *
 * Thread-safe connection pooling for PostgreSQL
 * Features:
 * - Configurable pool size (min/max connections)
 * - Acquire timeout
 * - Health check on acquire and on release
 */

#pragma once

#include <idp/dc/connection.h>

#include <libpq-fe.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace idp::dc {

class ConfigManager;
class DbConnectionPool;

/**
 * @brief Connection pool configuration
 */
struct DbPoolConfig {
    size_t minSize = 2;
    size_t maxSize = 10;
    int acquireTimeoutSec = 5;
    int connectTimeoutSec = 5;

    std::string host = "localhost";
    int port = 5432;
    std::string database;
    std::string user;
    std::string password;

    /**
     * @brief Build libpq keyword/value connection string
     */
    std::string buildConnString() const;

    /**
     * @brief Read DB_HOST, DB_PORT, DB_NAME, DB_USER, DB_PASSWORD, DB_POOL_*
     * @throws ConfigurationException on a missing database name or invalid pool size
     */
    static DbPoolConfig fromConfig(const ConfigManager& config);
};

/**
 * @brief RAII lease of a pooled PostgreSQL connection
 *
 * Automatically returns connection to pool when destroyed
 */
class DbConnection : public IConnection {
private:
    PGconn* conn_;
    DbConnectionPool* pool_;  // Non-owning pointer to pool
    bool released_;

public:
    DbConnection(PGconn* conn, DbConnectionPool* pool)
        : conn_(conn), pool_(pool), released_(false) {}

    ~DbConnection() override;

    DbConnection(const DbConnection&) = delete;
    DbConnection& operator=(const DbConnection&) = delete;

    /**
     * @brief Get raw PostgreSQL connection
     */
    PGconn* get() const { return conn_; }

    bool isValid() const override {
        return conn_ != nullptr && !released_;
    }

    std::string getBackendType() const override {
        return "postgres";
    }

    void release() override;
};

/**
 * @brief PostgreSQL Connection Pool
 */
class DbConnectionPool : public IConnectionProvider {
private:
    std::string connString_;
    size_t minSize_;
    size_t maxSize_;
    std::chrono::seconds acquireTimeout_;

    std::queue<PGconn*> availableConnections_;
    std::atomic<size_t> totalConnections_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    bool shutdown_;

    friend class DbConnection;

public:
    /**
     * @param connString PostgreSQL connection string
     * @param minSize Minimum number of connections to maintain
     * @param maxSize Maximum number of connections allowed
     * @param acquireTimeoutSec Timeout for acquiring connection (seconds)
     */
    explicit DbConnectionPool(
        const std::string& connString,
        size_t minSize = 2,
        size_t maxSize = 10,
        int acquireTimeoutSec = 5
    );

    explicit DbConnectionPool(const DbPoolConfig& config);

    /**
     * @brief Destructor - closes all connections
     */
    ~DbConnectionPool() override;

    DbConnectionPool(const DbConnectionPool&) = delete;
    DbConnectionPool& operator=(const DbConnectionPool&) = delete;

    /**
     * @brief Create the minimum number of connections
     * @return true if all of them could be opened
     */
    bool initialize() override;

    /**
     * @brief Acquire connection from pool
     * @throws ConnectionException on connect failure, timeout or shutdown
     */
    std::unique_ptr<DbConnection> acquire();

    std::unique_ptr<IConnection> acquireGeneric() override { return acquire(); }

    Stats getStats() const override;

    /**
     * @brief Shutdown pool and close all idle connections
     */
    void shutdown() override;

    std::string getBackendType() const override {
        return "postgres";
    }

private:
    PGconn* createConnection();

    bool isConnectionHealthy(PGconn* conn);

    /**
     * @brief Return connection to pool (called by DbConnection)
     */
    void releaseConnection(PGconn* conn);
};

} // namespace idp::dc
