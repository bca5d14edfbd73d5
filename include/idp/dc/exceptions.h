/**
 * @file exceptions.h
 * @brief Data connector exception hierarchy
 *
 * Every failure a connector reports derives from DataConnectorException.
 * Retrieval failures derive from ResolutionException so that an
 * orchestration layer can treat them uniformly.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace idp::dc {

/**
 * @brief Base exception for all data connector errors
 */
class DataConnectorException : public std::runtime_error {
public:
    explicit DataConnectorException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Missing or invalid bindings, fatal at initialization
 */
class ConfigurationException : public DataConnectorException {
public:
    explicit ConfigurationException(const std::string& message)
        : DataConnectorException("Configuration error: " + message) {}
};

/**
 * @brief Backend unreachable or misconfigured (health check failed)
 */
class ValidationException : public DataConnectorException {
public:
    explicit ValidationException(const std::string& message)
        : DataConnectorException("Validation error: " + message) {}
};

/**
 * @brief Operation invoked outside its valid lifecycle state
 */
class StateException : public DataConnectorException {
public:
    explicit StateException(const std::string& message)
        : DataConnectorException("State error: " + message) {}
};

/**
 * @brief Base for failures of a single retrieval call
 */
class ResolutionException : public DataConnectorException {
public:
    explicit ResolutionException(const std::string& message)
        : DataConnectorException(message) {}
};

/**
 * @brief Resolution context lacks data the query template requires
 */
class QueryConstructionException : public ResolutionException {
public:
    explicit QueryConstructionException(const std::string& message)
        : ResolutionException("Query construction error: " + message) {}
};

/**
 * @brief Connection acquisition failed or the pool is exhausted
 */
class ConnectionException : public ResolutionException {
public:
    explicit ConnectionException(const std::string& message)
        : ResolutionException("Connection error: " + message) {}
};

/**
 * @brief Query failed at the backend
 */
class ExecutionException : public ResolutionException {
public:
    explicit ExecutionException(const std::string& message)
        : ResolutionException("Execution error: " + message) {}

protected:
    struct Raw {};
    ExecutionException(const std::string& message, Raw)
        : ResolutionException(message) {}
};

/**
 * @brief Query exceeded its deadline
 */
class TimeoutException : public ExecutionException {
public:
    explicit TimeoutException(const std::string& message)
        : ExecutionException("Timeout: " + message, Raw{}) {}
};

/**
 * @brief Raw result shape could not be interpreted
 */
class MappingException : public ResolutionException {
public:
    explicit MappingException(const std::string& message)
        : ResolutionException("Mapping error: " + message) {}
};

/**
 * @brief Zero matches while the no-result policy treats that as an error
 */
class NoResultException : public ResolutionException {
public:
    explicit NoResultException(const std::string& message)
        : ResolutionException("No result: " + message) {}
};

} // namespace idp::dc
