/**
 * @file connection.h
 * @brief Backend-agnostic connection and connection provider interfaces
 *
 * A provider leases connections to one backend (directory, relational
 * database, storage service). Leases are exclusive to the code between
 * acquisition and release and must never be shared across concurrent
 * operations.
 */

#pragma once

#include <idp/dc/exceptions.h>

#include <cstddef>
#include <memory>
#include <string>

namespace idp::dc {

/**
 * @brief Leased backend connection
 */
class IConnection {
public:
    virtual ~IConnection() = default;

    /**
     * @brief Check if the lease still holds a live handle
     */
    virtual bool isValid() const = 0;

    /**
     * @brief Backend identifier ("ldap", "postgres", "storage")
     */
    virtual std::string getBackendType() const = 0;

    /**
     * @brief Return the handle to its provider. Idempotent.
     */
    virtual void release() = 0;

protected:
    IConnection() = default;
};

/**
 * @brief Source of leased connections with its own lifecycle
 *
 * Implementations must be safe for concurrent acquire/release.
 */
class IConnectionProvider {
public:
    virtual ~IConnectionProvider() = default;

    /**
     * @brief Prepare backend-wide resources (e.g. warm a pool)
     * @return true if the provider is ready to lease
     */
    virtual bool initialize() = 0;

    /**
     * @brief Lease a connection
     * @throws ConnectionException if the backend is unreachable, the pool is
     *         exhausted within the acquire timeout, or the provider is shut down
     */
    virtual std::unique_ptr<IConnection> acquireGeneric() = 0;

    /**
     * @brief Return a lease. Idempotent; never throws.
     *
     * Failures while returning the handle are logged and swallowed.
     */
    virtual void releaseGeneric(IConnection& conn) noexcept;

    struct Stats {
        size_t availableConnections;
        size_t totalConnections;
        size_t maxConnections;
    };

    virtual Stats getStats() const = 0;

    /**
     * @brief Release backend-wide resources; later acquisitions fail
     */
    virtual void shutdown() = 0;

    virtual std::string getBackendType() const = 0;

protected:
    IConnectionProvider() = default;
};

/**
 * @brief Downcast a generic lease to the backend type a query expects
 * @throws ExecutionException on a foreign or released connection
 */
template <typename T>
T& connectionCast(IConnection& conn) {
    auto* typed = dynamic_cast<T*>(&conn);
    if (!typed) {
        throw ExecutionException("Connection of type '" + conn.getBackendType() +
                                 "' cannot run this query");
    }
    if (!typed->isValid()) {
        throw ExecutionException("Connection is no longer valid");
    }
    return *typed;
}

} // namespace idp::dc
