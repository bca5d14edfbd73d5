/**
 * @file data_connector.h
 * @brief Backend-agnostic data connector orchestrator
 *
 * A DataConnector composes a connection provider, a query builder and a
 * result mapper (plus an optional validator and result cache) and runs the
 * retrieval pipeline:
 *
 *   build query -> [cache lookup] -> acquire connection -> execute -> map
 *   -> apply no-result policy
 *
 * Lifecycle:
 *
 *   Uninitialized --initialize()--> Initializing --+--> Ready --destroy()--> Destroyed
 *                                                  +--> Failed (fail-fast validation)
 *
 * Bindings and policies can only be changed while Uninitialized. After
 * initialize() the connector is read-only and retrieveAttributes() may be
 * called concurrently.
 */

#pragma once

#include <idp/dc/attribute.h>
#include <idp/dc/connection.h>
#include <idp/dc/connector_config.h>
#include <idp/dc/resolution_context.h>
#include <idp/dc/result_cache.h>
#include <idp/dc/strategies.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace idp::dc {

class DataConnector {
public:
    enum class State {
        Uninitialized,
        Initializing,
        Ready,
        Failed,
        Destroyed
    };

    /**
     * @param id Connector identifier used in log lines and cache keys
     * @param config Policy settings, frozen at initialize()
     */
    explicit DataConnector(std::string id, ConnectorConfig config = ConnectorConfig());

    ~DataConnector();

    DataConnector(const DataConnector&) = delete;
    DataConnector& operator=(const DataConnector&) = delete;

    /// @name Bindings (Uninitialized only, otherwise StateException)
    /// @{
    void setConnectionProvider(std::shared_ptr<IConnectionProvider> provider);
    void setQueryBuilder(std::shared_ptr<IQueryBuilder> builder);
    void setResultMapper(std::shared_ptr<IResultMapper> mapper);
    void setValidator(std::shared_ptr<IValidator> validator);
    void setResultCache(std::shared_ptr<ResultCache> cache);
    void setConfig(const ConnectorConfig& config);
    void setNoResultIsError(bool value);
    void setFailFastInitialize(bool value);
    void setQueryTimeout(std::chrono::milliseconds timeout);
    /// @}

    /**
     * @brief Bring the connector to Ready
     *
     * Initializes the connection provider and runs the validator (a
     * ConnectionProviderValidator if none is bound). A validation failure
     * leaves the connector Ready but not validated, unless fail-fast is set.
     *
     * @throws StateException if not Uninitialized
     * @throws ConfigurationException if a required binding is missing (state
     *         unchanged) or fail-fast validation failed (state Failed)
     */
    void initialize();

    /**
     * @brief Re-run the validator
     * @throws StateException if not Ready
     * @throws ValidationException if the backend is unusable
     */
    void validate();

    /**
     * @brief Resolve attributes for one context
     *
     * A connector whose last validation failed re-validates first.
     *
     * @return Attribute map, empty for zero matches unless noResultIsError
     * @throws StateException if not Ready
     * @throws ValidationException if a pending re-validation fails
     * @throws ResolutionException subclasses for per-call failures
     */
    AttributeMap retrieveAttributes(const ResolutionContext& context) const;

    /**
     * @brief Release backend-wide resources. Idempotent; never throws.
     */
    void destroy() noexcept;

    const std::string& getId() const { return id_; }
    State getState() const { return state_.load(); }

    /**
     * @brief False while Ready in degraded mode (last validation failed)
     */
    bool isValidated() const { return validated_.load(); }

    const ConnectorConfig& getConfig() const { return config_; }

    static const char* stateName(State state);

private:
    void requireUninitialized(const char* operation) const;
    void runValidator() const;
    void shutdownProvider() noexcept;
    AttributeMap applyNoResultPolicy(AttributeMap result, const std::string& cacheKey) const;

    std::string id_;
    ConnectorConfig config_;

    std::shared_ptr<IConnectionProvider> provider_;
    std::shared_ptr<IQueryBuilder> builder_;
    std::shared_ptr<IResultMapper> mapper_;
    std::shared_ptr<IValidator> validator_;
    std::shared_ptr<ResultCache> cache_;

    std::atomic<State> state_{State::Uninitialized};
    mutable std::atomic<bool> validated_{false};
    std::atomic<bool> providerShutdown_{false};
    std::mutex lifecycleMutex_;
};

} // namespace idp::dc
