/**
 * @file db_connection_pool.cpp
 * @brief Implementation of PostgreSQL Connection Pool
 */

#include <idp/dc/database/db_connection_pool.h>
#include <idp/dc/config/config_manager.h>
#include <idp/dc/exceptions.h>

#include <spdlog/spdlog.h>

namespace idp::dc {

// =============================================================================
// DbPoolConfig
// =============================================================================

namespace {

/**
 * @brief Quote a libpq connection string value
 */
std::string quoteConnValue(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    quoted += "'";
    return quoted;
}

} // namespace

std::string DbPoolConfig::buildConnString() const {
    std::string conn = "host=" + quoteConnValue(host) +
                       " port=" + std::to_string(port) +
                       " dbname=" + quoteConnValue(database) +
                       " connect_timeout=" + std::to_string(connectTimeoutSec);
    if (!user.empty()) {
        conn += " user=" + quoteConnValue(user);
    }
    if (!password.empty()) {
        conn += " password=" + quoteConnValue(password);
    }
    return conn;
}

DbPoolConfig DbPoolConfig::fromConfig(const ConfigManager& config) {
    DbPoolConfig c;
    c.host = config.getString(ConfigManager::DB_HOST, c.host);
    c.port = config.getInt(ConfigManager::DB_PORT, c.port);
    c.database = config.getString(ConfigManager::DB_NAME);
    c.user = config.getString(ConfigManager::DB_USER);
    c.password = config.getString(ConfigManager::DB_PASSWORD);

    if (c.database.empty()) {
        throw ConfigurationException(std::string(ConfigManager::DB_NAME) + " is required");
    }

    int minSize = config.getInt(ConfigManager::DB_POOL_MIN, static_cast<int>(c.minSize));
    int maxSize = config.getInt(ConfigManager::DB_POOL_MAX, static_cast<int>(c.maxSize));
    if (minSize < 0 || maxSize <= 0 || minSize > maxSize) {
        throw ConfigurationException("invalid database pool size (min=" + std::to_string(minSize) +
                                     ", max=" + std::to_string(maxSize) + ")");
    }
    c.minSize = static_cast<size_t>(minSize);
    c.maxSize = static_cast<size_t>(maxSize);
    c.acquireTimeoutSec = config.getInt(ConfigManager::DB_POOL_TIMEOUT_SEC, c.acquireTimeoutSec);
    return c;
}

// =============================================================================
// DbConnection Implementation
// =============================================================================

DbConnection::~DbConnection() {
    if (!released_ && conn_) {
        release();
    }
}

void DbConnection::release() {
    if (released_ || !conn_) {
        return;
    }

    if (pool_) {
        pool_->releaseConnection(conn_);
    }

    conn_ = nullptr;
    released_ = true;
}

// =============================================================================
// DbConnectionPool Implementation
// =============================================================================

DbConnectionPool::DbConnectionPool(
    const std::string& connString,
    size_t minSize,
    size_t maxSize,
    int acquireTimeoutSec)
    : connString_(connString)
    , minSize_(minSize)
    , maxSize_(maxSize)
    , acquireTimeout_(acquireTimeoutSec)
    , totalConnections_(0)
    , shutdown_(false)
{
    if (maxSize == 0 || minSize > maxSize) {
        throw ConfigurationException("invalid database pool size (min=" + std::to_string(minSize) +
                                     ", max=" + std::to_string(maxSize) + ")");
    }

    spdlog::info("DbConnectionPool created: minSize={}, maxSize={}, timeout={}s",
                 minSize_, maxSize_, acquireTimeoutSec);
}

DbConnectionPool::DbConnectionPool(const DbPoolConfig& config)
    : DbConnectionPool(config.buildConnString(), config.minSize, config.maxSize,
                       config.acquireTimeoutSec)
{
}

DbConnectionPool::~DbConnectionPool() {
    shutdown();
}

bool DbConnectionPool::initialize() {
    spdlog::info("Initializing DbConnectionPool with {} minimum connections", minSize_);

    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        spdlog::error("DbConnectionPool already shut down");
        return false;
    }

    while (totalConnections_ < minSize_) {
        PGconn* conn = createConnection();
        if (!conn) {
            spdlog::error("Failed to create minimum connection {}/{}",
                          totalConnections_.load() + 1, minSize_);
            return false;
        }

        availableConnections_.push(conn);
        totalConnections_++;
    }

    spdlog::info("DbConnectionPool initialized with {} connections", totalConnections_.load());
    return true;
}

std::unique_ptr<DbConnection> DbConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    auto deadline = std::chrono::steady_clock::now() + acquireTimeout_;

    while (true) {
        if (shutdown_) {
            throw ConnectionException("database connection pool is shut down");
        }

        if (!availableConnections_.empty()) {
            PGconn* conn = availableConnections_.front();
            availableConnections_.pop();

            if (isConnectionHealthy(conn)) {
                spdlog::debug("Acquired connection from pool (available: {})", availableConnections_.size());
                return std::make_unique<DbConnection>(conn, this);
            }
            spdlog::warn("Connection from pool is unhealthy, closing and retrying");
            PQfinish(conn);
            totalConnections_--;
            continue;
        }

        // Reserve the slot before unlocking
        if (totalConnections_ < maxSize_) {
            totalConnections_++;
            lock.unlock();
            PGconn* conn = createConnection();
            lock.lock();

            if (conn) {
                spdlog::info("Created new connection (total: {})", totalConnections_.load());
                return std::make_unique<DbConnection>(conn, this);
            }
            totalConnections_--;
            cv_.notify_one();
            throw ConnectionException("failed to create database connection");
        }

        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout &&
            availableConnections_.empty()) {
            spdlog::warn("Timeout waiting for database connection (timeout: {}s)", acquireTimeout_.count());
            throw ConnectionException("timeout acquiring database connection after " +
                                      std::to_string(acquireTimeout_.count()) + "s");
        }
    }
}

IConnectionProvider::Stats DbConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    return Stats{
        availableConnections_.size(),
        totalConnections_.load(),
        maxSize_
    };
}

void DbConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        return;
    }

    spdlog::info("Shutting down DbConnectionPool");
    shutdown_ = true;

    while (!availableConnections_.empty()) {
        PGconn* conn = availableConnections_.front();
        availableConnections_.pop();
        PQfinish(conn);
        totalConnections_--;
    }

    cv_.notify_all();

    spdlog::info("DbConnectionPool shutdown complete");
}

PGconn* DbConnectionPool::createConnection() {
    spdlog::debug("Creating new PostgreSQL connection");

    PGconn* conn = PQconnectdb(connString_.c_str());

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string error = PQerrorMessage(conn);
        spdlog::error("Failed to create PostgreSQL connection: {}", error);
        PQfinish(conn);
        return nullptr;
    }

    spdlog::debug("PostgreSQL connection created successfully");
    return conn;
}

bool DbConnectionPool::isConnectionHealthy(PGconn* conn) {
    if (!conn) {
        return false;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        spdlog::debug("Connection status is not OK");
        return false;
    }

    // A connection left inside a failed transaction cannot be reused
    if (PQtransactionStatus(conn) != PQTRANS_IDLE) {
        spdlog::debug("Connection is not idle");
        return false;
    }

    PGresult* res = PQexec(conn, "SELECT 1");
    if (!res || PQresultStatus(res) != PGRES_TUPLES_OK) {
        if (res) {
            PQclear(res);
        }
        spdlog::debug("Connection health check query failed");
        return false;
    }

    PQclear(res);
    return true;
}

void DbConnectionPool::releaseConnection(PGconn* conn) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        PQfinish(conn);
        totalConnections_--;
        return;
    }

    if (isConnectionHealthy(conn)) {
        availableConnections_.push(conn);
        spdlog::debug("Connection returned to pool (available: {})", availableConnections_.size());
    } else {
        spdlog::warn("Released connection is unhealthy, closing");
        PQfinish(conn);
        totalConnections_--;
    }

    cv_.notify_one();
}

} // namespace idp::dc
