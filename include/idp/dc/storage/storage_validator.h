/**
 * @file storage_validator.h
 * @brief Storage service health check
 */

#pragma once

#include <idp/dc/storage/storage_service.h>
#include <idp/dc/strategies.h>

#include <memory>
#include <string>

namespace idp::dc {

/**
 * @brief Performs a probe read; any failure marks the service unusable
 */
class StorageServiceValidator : public IValidator {
public:
    explicit StorageServiceValidator(std::shared_ptr<IStorageService> service,
                                     std::string probeContext = "idp.dc.validation",
                                     std::string probeKey = "probe");

    void validate() const override;

private:
    std::shared_ptr<IStorageService> service_;
    std::string probeContext_;
    std::string probeKey_;
};

} // namespace idp::dc
