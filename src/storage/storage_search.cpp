/**
 * @file storage_search.cpp
 */

#include <idp/dc/storage/storage_search.h>
#include <idp/dc/exceptions.h>

#include <spdlog/spdlog.h>

namespace idp::dc {

// --- StorageSession ---

StorageSession::~StorageSession() {
    if (!released_) {
        release();
    }
}

void StorageSession::release() {
    if (released_) {
        return;
    }
    released_ = true;
    if (provider_) {
        provider_->activeSessions_--;
    }
}

// --- StorageServiceProvider ---

StorageServiceProvider::StorageServiceProvider(std::shared_ptr<IStorageService> service)
    : service_(std::move(service))
{
    if (!service_) {
        throw std::invalid_argument("StorageServiceProvider: service cannot be nullptr");
    }
}

bool StorageServiceProvider::initialize() {
    if (shutdown_) {
        spdlog::error("Storage service provider already shut down");
        return false;
    }
    if (!service_->initialize()) {
        spdlog::error("Storage service '{}' failed to initialize", service_->getType());
        return false;
    }
    spdlog::info("Storage service provider ready ({})", service_->getType());
    return true;
}

std::unique_ptr<StorageSession> StorageServiceProvider::acquire() {
    if (shutdown_) {
        throw ConnectionException("storage service provider is shut down");
    }
    activeSessions_++;
    return std::make_unique<StorageSession>(service_, this);
}

IConnectionProvider::Stats StorageServiceProvider::getStats() const {
    return Stats{0, activeSessions_.load(), 0};
}

void StorageServiceProvider::shutdown() {
    if (!shutdown_.exchange(true)) {
        service_->shutdown();
        spdlog::info("Storage service provider shut down");
    }
}

// --- StorageSearch ---

std::unique_ptr<IRawResult> StorageSearch::execute(IConnection& conn,
                                                   std::chrono::milliseconds timeout) const {
    StorageSession& session = connectionCast<StorageSession>(conn);

    std::optional<StorageRecord> record;
    try {
        record = session.service().read(context_, key_, timeout);
    } catch (const DataConnectorException&) {
        throw;
    } catch (const std::exception& e) {
        throw ExecutionException("storage read of '" + getResultCacheKey() + "' failed: " + e.what());
    }

    spdlog::debug("Storage lookup '{}': {}", getResultCacheKey(), record ? "found" : "no record");
    return std::make_unique<StorageLookupResult>(context_, key_, std::move(record));
}

// --- StorageSearchBuilder ---

StorageSearchBuilder::StorageSearchBuilder(std::string contextTemplate, std::string keyTemplate)
    : context_(std::move(contextTemplate), noEscape),
      key_(std::move(keyTemplate), noEscape)
{
    if (context_.getText().empty() || key_.getText().empty()) {
        throw ConfigurationException("storage context and key templates are required");
    }
}

std::unique_ptr<IExecutableQuery> StorageSearchBuilder::build(const ResolutionContext& context) const {
    std::string ctx = context_.render(context);
    if (ctx.empty()) {
        throw QueryConstructionException("storage context rendered empty from '" + context_.getText() + "'");
    }
    std::string key = key_.render(context);
    if (key.empty()) {
        throw QueryConstructionException("storage key rendered empty from '" + key_.getText() + "'");
    }
    return std::make_unique<StorageSearch>(std::move(ctx), std::move(key));
}

} // namespace idp::dc
