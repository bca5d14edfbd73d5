/**
 * @file strategies.cpp
 */

#include <idp/dc/strategies.h>

#include <spdlog/spdlog.h>

namespace idp::dc {

ConnectionProviderValidator::ConnectionProviderValidator(std::shared_ptr<IConnectionProvider> provider)
    : provider_(std::move(provider))
{
    if (!provider_) {
        throw std::invalid_argument("ConnectionProviderValidator: provider cannot be nullptr");
    }
}

void ConnectionProviderValidator::validate() const {
    std::unique_ptr<IConnection> conn;
    try {
        conn = provider_->acquireGeneric();
    } catch (const std::exception& e) {
        throw ValidationException("unable to acquire " + provider_->getBackendType() +
                                  " connection: " + e.what());
    }

    bool valid = conn && conn->isValid();
    if (conn) {
        provider_->releaseGeneric(*conn);
    }
    if (!valid) {
        throw ValidationException(provider_->getBackendType() + " provider returned an invalid connection");
    }
    spdlog::debug("{} connection provider validated", provider_->getBackendType());
}

} // namespace idp::dc
