/**
 * @file data_connector.cpp
 * @brief DataConnector lifecycle and retrieval pipeline
 */

#include <idp/dc/data_connector.h>
#include <idp/dc/exceptions.h>

#include <spdlog/spdlog.h>

namespace idp::dc {

namespace {

/**
 * @brief Scoped connection lease; returns the connection exactly once
 */
class ConnectionLease {
public:
    ConnectionLease(IConnectionProvider& provider, std::unique_ptr<IConnection> conn)
        : provider_(provider), conn_(std::move(conn)) {}

    ~ConnectionLease() {
        if (conn_) {
            provider_.releaseGeneric(*conn_);
        }
    }

    ConnectionLease(const ConnectionLease&) = delete;
    ConnectionLease& operator=(const ConnectionLease&) = delete;

    IConnection& get() { return *conn_; }

private:
    IConnectionProvider& provider_;
    std::unique_ptr<IConnection> conn_;
};

} // namespace

DataConnector::DataConnector(std::string id, ConnectorConfig config)
    : id_(std::move(id)), config_(config)
{
    if (id_.empty()) {
        throw ConfigurationException("data connector id cannot be empty");
    }
}

DataConnector::~DataConnector() {
    destroy();
}

const char* DataConnector::stateName(State state) {
    switch (state) {
        case State::Uninitialized: return "Uninitialized";
        case State::Initializing:  return "Initializing";
        case State::Ready:         return "Ready";
        case State::Failed:        return "Failed";
        case State::Destroyed:     return "Destroyed";
    }
    return "Unknown";
}

void DataConnector::requireUninitialized(const char* operation) const {
    State state = state_.load();
    if (state != State::Uninitialized) {
        throw StateException("[" + id_ + "] " + operation + " not allowed in state " +
                             stateName(state));
    }
}

// --- Bindings ---

void DataConnector::setConnectionProvider(std::shared_ptr<IConnectionProvider> provider) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    requireUninitialized("setConnectionProvider");
    provider_ = std::move(provider);
}

void DataConnector::setQueryBuilder(std::shared_ptr<IQueryBuilder> builder) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    requireUninitialized("setQueryBuilder");
    builder_ = std::move(builder);
}

void DataConnector::setResultMapper(std::shared_ptr<IResultMapper> mapper) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    requireUninitialized("setResultMapper");
    mapper_ = std::move(mapper);
}

void DataConnector::setValidator(std::shared_ptr<IValidator> validator) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    requireUninitialized("setValidator");
    validator_ = std::move(validator);
}

void DataConnector::setResultCache(std::shared_ptr<ResultCache> cache) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    requireUninitialized("setResultCache");
    cache_ = std::move(cache);
}

void DataConnector::setConfig(const ConnectorConfig& config) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    requireUninitialized("setConfig");
    config_ = config;
}

void DataConnector::setNoResultIsError(bool value) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    requireUninitialized("setNoResultIsError");
    config_.noResultIsError = value;
}

void DataConnector::setFailFastInitialize(bool value) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    requireUninitialized("setFailFastInitialize");
    config_.failFastInitialize = value;
}

void DataConnector::setQueryTimeout(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    requireUninitialized("setQueryTimeout");
    if (timeout.count() < 0) {
        throw ConfigurationException("[" + id_ + "] query timeout must not be negative");
    }
    config_.queryTimeout = timeout;
}

// --- Lifecycle ---

void DataConnector::initialize() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    requireUninitialized("initialize");

    if (!provider_) {
        throw ConfigurationException("[" + id_ + "] no connection provider bound");
    }
    if (!builder_) {
        throw ConfigurationException("[" + id_ + "] no query builder bound");
    }
    if (!mapper_) {
        throw ConfigurationException("[" + id_ + "] no result mapper bound");
    }

    state_ = State::Initializing;
    spdlog::info("[DataConnector:{}] Initializing ({} backend, noResultIsError={}, failFast={}, timeout={}ms)",
                 id_, provider_->getBackendType(), config_.noResultIsError,
                 config_.failFastInitialize, config_.queryTimeout.count());

    try {
        if (!provider_->initialize()) {
            spdlog::error("[DataConnector:{}] Connection provider initialization failed", id_);
        }
    } catch (const std::exception& e) {
        spdlog::error("[DataConnector:{}] Connection provider initialization failed: {}", id_, e.what());
    }

    if (!validator_) {
        validator_ = std::make_shared<ConnectionProviderValidator>(provider_);
    }

    try {
        runValidator();
        validated_ = true;
    } catch (const ValidationException& e) {
        validated_ = false;
        if (config_.failFastInitialize) {
            state_ = State::Failed;
            spdlog::error("[DataConnector:{}] Validation failed, connector unusable: {}", id_, e.what());
            throw ConfigurationException("[" + id_ + "] fail-fast validation failed: " + e.what());
        }
        spdlog::warn("[DataConnector:{}] Validation failed, starting degraded: {}", id_, e.what());
    }

    state_ = State::Ready;
    spdlog::info("[DataConnector:{}] Ready{}", id_, validated_ ? "" : " (not validated)");
}

void DataConnector::runValidator() const {
    try {
        validator_->validate();
    } catch (const ValidationException&) {
        throw;
    } catch (const std::exception& e) {
        throw ValidationException("[" + id_ + "] " + e.what());
    }
}

void DataConnector::validate() {
    State state = state_.load();
    if (state != State::Ready) {
        throw StateException("[" + id_ + "] validate not allowed in state " + stateName(state));
    }

    try {
        runValidator();
    } catch (const ValidationException& e) {
        if (validated_.exchange(false)) {
            spdlog::warn("[DataConnector:{}] Validation failed: {}", id_, e.what());
        }
        throw;
    }

    if (!validated_.exchange(true)) {
        spdlog::info("[DataConnector:{}] Validation succeeded", id_);
    }
}

void DataConnector::shutdownProvider() noexcept {
    if (!provider_ || providerShutdown_.exchange(true)) {
        return;
    }
    try {
        provider_->shutdown();
    } catch (const std::exception& e) {
        spdlog::warn("[DataConnector:{}] Connection provider shutdown failed: {}", id_, e.what());
    }
}

void DataConnector::destroy() noexcept {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);

    switch (state_.load()) {
        case State::Ready:
            state_ = State::Destroyed;
            shutdownProvider();
            spdlog::info("[DataConnector:{}] Destroyed", id_);
            break;
        case State::Uninitialized:
            state_ = State::Destroyed;
            break;
        case State::Failed:
            shutdownProvider();
            break;
        case State::Initializing:
        case State::Destroyed:
            break;
    }
}

// --- Retrieval ---

AttributeMap DataConnector::applyNoResultPolicy(AttributeMap result, const std::string& cacheKey) const {
    if (result.empty()) {
        if (config_.noResultIsError) {
            throw NoResultException("[" + id_ + "] no result for query '" + cacheKey + "'");
        }
        spdlog::debug("[DataConnector:{}] No result for query '{}'", id_, cacheKey);
    }
    return result;
}

AttributeMap DataConnector::retrieveAttributes(const ResolutionContext& context) const {
    State state = state_.load();
    if (state != State::Ready) {
        throw StateException("[" + id_ + "] retrieveAttributes not allowed in state " +
                             stateName(state));
    }

    if (!validated_.load()) {
        try {
            runValidator();
        } catch (const ValidationException& e) {
            throw ConnectionException("[" + id_ + "] backend not validated: " + e.what());
        }
        if (!validated_.exchange(true)) {
            spdlog::info("[DataConnector:{}] Re-validation succeeded", id_);
        }
    }

    // 1. Build
    std::unique_ptr<IExecutableQuery> query;
    try {
        query = builder_->build(context);
    } catch (const DataConnectorException&) {
        throw;
    } catch (const std::exception& e) {
        throw QueryConstructionException("[" + id_ + "] " + e.what());
    }
    if (!query) {
        throw QueryConstructionException("[" + id_ + "] query builder returned no query");
    }

    std::string queryKey = query->getResultCacheKey();
    std::string cacheKey = id_ + "|" + queryKey;

    if (cache_) {
        if (auto cached = cache_->get(cacheKey)) {
            spdlog::debug("[DataConnector:{}] Cache hit for '{}'", id_, queryKey);
            return applyNoResultPolicy(std::move(*cached), queryKey);
        }
    }

    // 2. Acquire
    std::unique_ptr<IConnection> conn;
    try {
        conn = provider_->acquireGeneric();
    } catch (const DataConnectorException&) {
        throw;
    } catch (const std::exception& e) {
        throw ConnectionException("[" + id_ + "] " + e.what());
    }
    if (!conn) {
        throw ConnectionException("[" + id_ + "] connection provider returned no connection");
    }
    ConnectionLease lease(*provider_, std::move(conn));

    // 3. Execute
    std::unique_ptr<IRawResult> raw;
    try {
        raw = query->execute(lease.get(), config_.queryTimeout);
    } catch (const DataConnectorException&) {
        throw;
    } catch (const std::exception& e) {
        throw ExecutionException("[" + id_ + "] " + e.what());
    }
    if (!raw) {
        throw ExecutionException("[" + id_ + "] query returned no result");
    }

    // 4. Map
    AttributeMap result;
    try {
        result = mapper_->map(*raw);
    } catch (const DataConnectorException&) {
        throw;
    } catch (const std::exception& e) {
        throw MappingException("[" + id_ + "] " + e.what());
    }

    spdlog::debug("[DataConnector:{}] Query '{}' resolved {} attribute(s)", id_, queryKey, result.size());

    if (cache_) {
        cache_->put(cacheKey, result);
    }

    // 5. No-result policy
    return applyNoResultPolicy(std::move(result), queryKey);
}

} // namespace idp::dc
