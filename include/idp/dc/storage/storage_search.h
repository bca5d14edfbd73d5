/**
 * @file storage_search.h
 * @brief Storage service connection provider, lookup query and builder
 */

#pragma once

#include <idp/dc/executable_query.h>
#include <idp/dc/query_template.h>
#include <idp/dc/storage/storage_service.h>
#include <idp/dc/strategies.h>

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace idp::dc {

class StorageServiceProvider;

/**
 * @brief Lease of a storage service
 */
class StorageSession : public IConnection {
public:
    StorageSession(std::shared_ptr<IStorageService> service, StorageServiceProvider* provider)
        : service_(std::move(service)), provider_(provider), released_(false) {}

    ~StorageSession() override;

    StorageSession(const StorageSession&) = delete;
    StorageSession& operator=(const StorageSession&) = delete;

    IStorageService& service() const { return *service_; }

    bool isValid() const override { return service_ != nullptr && !released_; }

    std::string getBackendType() const override { return "storage"; }

    void release() override;

private:
    std::shared_ptr<IStorageService> service_;
    StorageServiceProvider* provider_;  // Non-owning
    bool released_;
};

/**
 * @brief Connection provider over a single storage service
 *
 * Sessions are not pooled; maxConnections is reported as 0 (unbounded).
 */
class StorageServiceProvider : public IConnectionProvider {
public:
    explicit StorageServiceProvider(std::shared_ptr<IStorageService> service);

    bool initialize() override;

    /**
     * @throws ConnectionException after shutdown()
     */
    std::unique_ptr<StorageSession> acquire();

    std::unique_ptr<IConnection> acquireGeneric() override { return acquire(); }

    Stats getStats() const override;

    void shutdown() override;

    std::string getBackendType() const override { return "storage"; }

    const std::shared_ptr<IStorageService>& getService() const { return service_; }

private:
    friend class StorageSession;

    std::shared_ptr<IStorageService> service_;
    std::atomic<size_t> activeSessions_{0};
    std::atomic<bool> shutdown_{false};
};

/**
 * @brief Result of a storage lookup; empty if no live record exists
 */
class StorageLookupResult : public IRawResult {
public:
    StorageLookupResult(std::string context, std::string key, std::optional<StorageRecord> record)
        : context_(std::move(context)), key_(std::move(key)), record_(std::move(record)) {}

    const std::string& getContext() const { return context_; }
    const std::string& getKey() const { return key_; }
    const std::optional<StorageRecord>& getRecord() const { return record_; }

    std::string getBackendType() const override { return "storage"; }
    bool isEmpty() const override { return !record_.has_value(); }

private:
    std::string context_;
    std::string key_;
    std::optional<StorageRecord> record_;
};

/**
 * @brief Lookup of one (context, key). The cache key is "context!key".
 */
class StorageSearch : public IExecutableQuery {
public:
    StorageSearch(std::string context, std::string key)
        : context_(std::move(context)), key_(std::move(key)) {}

    const std::string& getContext() const { return context_; }
    const std::string& getKey() const { return key_; }

    std::string getResultCacheKey() const override { return context_ + "!" + key_; }

    std::unique_ptr<IRawResult> execute(IConnection& conn,
                                        std::chrono::milliseconds timeout) const override;

private:
    std::string context_;
    std::string key_;
};

/**
 * @brief Builds StorageSearch queries from context and key templates
 *
 * Values are substituted without escaping. An empty rendered context or
 * key raises QueryConstructionException.
 */
class StorageSearchBuilder : public IQueryBuilder {
public:
    StorageSearchBuilder(std::string contextTemplate, std::string keyTemplate);

    std::unique_ptr<IExecutableQuery> build(const ResolutionContext& context) const override;

private:
    QueryTemplate context_;
    QueryTemplate key_;
};

} // namespace idp::dc
