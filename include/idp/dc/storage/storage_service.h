/**
 * @file storage_service.h
 * @brief Key/value storage service abstraction
 *
 * Records are addressed by (context, key). An expired record behaves as
 * if it did not exist.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace idp::dc {

struct StorageRecord {
    using TimePoint = std::chrono::system_clock::time_point;

    std::string value;
    long long version = 1;
    std::optional<TimePoint> expiration;  ///< nullopt = never expires

    bool isExpired(TimePoint now) const {
        return expiration && *expiration <= now;
    }
};

/**
 * @brief Storage service interface
 *
 * Implementations must be thread-safe.
 */
class IStorageService {
public:
    virtual ~IStorageService() = default;

    /**
     * @brief Open backing resources (connections, schema)
     * @return false if the service is unusable
     */
    virtual bool initialize() { return true; }

    /**
     * @brief Release backing resources
     */
    virtual void shutdown() {}

    /**
     * @brief Create a record
     * @return false if a live record already exists
     */
    virtual bool create(const std::string& context,
                        const std::string& key,
                        const std::string& value,
                        std::optional<StorageRecord::TimePoint> expiration = std::nullopt) = 0;

    /**
     * @param timeout Upper bound for a remote lookup (zero = none)
     * @return nullopt if no live record exists
     */
    virtual std::optional<StorageRecord> read(
        const std::string& context,
        const std::string& key,
        std::chrono::milliseconds timeout = std::chrono::milliseconds::zero()) = 0;

    /**
     * @brief Replace a live record's value and bump its version
     * @return false if no live record exists
     */
    virtual bool update(const std::string& context,
                        const std::string& key,
                        const std::string& value,
                        std::optional<StorageRecord::TimePoint> expiration = std::nullopt) = 0;

    /**
     * @return false if nothing was deleted
     */
    virtual bool deleteRecord(const std::string& context, const std::string& key) = 0;

    /**
     * @brief Remove expired records of a context
     * @return Number of records removed
     */
    virtual size_t reap(const std::string& context) = 0;

    /**
     * @brief Implementation name ("memory", "postgres")
     */
    virtual std::string getType() const = 0;

protected:
    IStorageService() = default;
};

} // namespace idp::dc
