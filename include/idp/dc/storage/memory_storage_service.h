/**
 * @file memory_storage_service.h
 * @brief In-process storage service
 */

#pragma once

#include <idp/dc/storage/storage_service.h>

#include <functional>
#include <map>
#include <mutex>

namespace idp::dc {

class MemoryStorageService : public IStorageService {
public:
    using ClockFn = std::function<StorageRecord::TimePoint()>;

    /**
     * @param clock Time source (tests inject a fake)
     */
    explicit MemoryStorageService(ClockFn clock = nullptr);

    bool create(const std::string& context,
                const std::string& key,
                const std::string& value,
                std::optional<StorageRecord::TimePoint> expiration = std::nullopt) override;

    std::optional<StorageRecord> read(
        const std::string& context,
        const std::string& key,
        std::chrono::milliseconds timeout = std::chrono::milliseconds::zero()) override;

    bool update(const std::string& context,
                const std::string& key,
                const std::string& value,
                std::optional<StorageRecord::TimePoint> expiration = std::nullopt) override;

    bool deleteRecord(const std::string& context, const std::string& key) override;

    size_t reap(const std::string& context) override;

    std::string getType() const override { return "memory"; }

private:
    ClockFn clock_;
    std::map<std::string, std::map<std::string, StorageRecord>> contexts_;
    std::mutex mutex_;
};

} // namespace idp::dc
