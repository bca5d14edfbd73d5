/**
 * @file storage_validator.cpp
 */

#include <idp/dc/storage/storage_validator.h>
#include <idp/dc/exceptions.h>

#include <spdlog/spdlog.h>

namespace idp::dc {

StorageServiceValidator::StorageServiceValidator(std::shared_ptr<IStorageService> service,
                                                 std::string probeContext,
                                                 std::string probeKey)
    : service_(std::move(service)),
      probeContext_(std::move(probeContext)),
      probeKey_(std::move(probeKey))
{
    if (!service_) {
        throw std::invalid_argument("StorageServiceValidator: service cannot be nullptr");
    }
}

void StorageServiceValidator::validate() const {
    try {
        service_->read(probeContext_, probeKey_);
    } catch (const std::exception& e) {
        throw ValidationException(service_->getType() + " storage service probe failed: " + e.what());
    }
    spdlog::debug("{} storage service validated", service_->getType());
}

} // namespace idp::dc
