/**
 * @file executable_query.h
 * @brief Immutable, ready-to-run backend queries and their raw results
 */

#pragma once

#include <idp/dc/connection.h>

#include <chrono>
#include <memory>
#include <string>

namespace idp::dc {

/**
 * @brief Backend-native result of one query execution
 *
 * Transient: consumed once by a result mapper and then discarded.
 */
class IRawResult {
public:
    virtual ~IRawResult() = default;

    virtual std::string getBackendType() const = 0;

    /**
     * @brief True if the backend reported zero matches
     */
    virtual bool isEmpty() const = 0;

protected:
    IRawResult() = default;
};

/**
 * @brief Query produced by a query builder for one resolution context
 *
 * Immutable and connection-free. Equal queries have equal cache keys.
 */
class IExecutableQuery {
public:
    virtual ~IExecutableQuery() = default;

    /**
     * @brief Deterministic key for an external result cache
     */
    virtual std::string getResultCacheKey() const = 0;

    /**
     * @brief Run the query on a leased connection
     * @param conn Lease from the matching provider
     * @param timeout Execution deadline, zero for none
     * @throws ExecutionException on backend failure
     * @throws TimeoutException when the deadline is exceeded
     */
    virtual std::unique_ptr<IRawResult> execute(IConnection& conn,
                                                std::chrono::milliseconds timeout) const = 0;

protected:
    IExecutableQuery() = default;
};

/**
 * @brief Downcast a raw result to the type a mapper expects
 * @throws MappingException on a foreign result type
 */
template <typename T>
const T& resultCast(const IRawResult& raw) {
    auto* typed = dynamic_cast<const T*>(&raw);
    if (!typed) {
        throw MappingException("Unexpected raw result of type '" + raw.getBackendType() + "'");
    }
    return *typed;
}

} // namespace idp::dc
