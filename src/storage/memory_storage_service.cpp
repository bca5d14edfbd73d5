/**
 * @file memory_storage_service.cpp
 */

#include <idp/dc/storage/memory_storage_service.h>

#include <spdlog/spdlog.h>

namespace idp::dc {

MemoryStorageService::MemoryStorageService(ClockFn clock)
    : clock_(clock ? std::move(clock)
                   : ClockFn([]() { return std::chrono::system_clock::now(); }))
{
}

bool MemoryStorageService::create(const std::string& context,
                                  const std::string& key,
                                  const std::string& value,
                                  std::optional<StorageRecord::TimePoint> expiration) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& records = contexts_[context];
    auto it = records.find(key);
    if (it != records.end() && !it->second.isExpired(clock_())) {
        return false;
    }

    records[key] = StorageRecord{value, 1, expiration};
    return true;
}

// In-process lookups never block; the timeout does not apply
std::optional<StorageRecord> MemoryStorageService::read(const std::string& context,
                                                        const std::string& key,
                                                        std::chrono::milliseconds /*timeout*/) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto ctx = contexts_.find(context);
    if (ctx == contexts_.end()) {
        return std::nullopt;
    }
    auto it = ctx->second.find(key);
    if (it == ctx->second.end()) {
        return std::nullopt;
    }
    if (it->second.isExpired(clock_())) {
        ctx->second.erase(it);
        return std::nullopt;
    }
    return it->second;
}

bool MemoryStorageService::update(const std::string& context,
                                  const std::string& key,
                                  const std::string& value,
                                  std::optional<StorageRecord::TimePoint> expiration) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto ctx = contexts_.find(context);
    if (ctx == contexts_.end()) {
        return false;
    }
    auto it = ctx->second.find(key);
    if (it == ctx->second.end() || it->second.isExpired(clock_())) {
        return false;
    }

    it->second.value = value;
    it->second.version++;
    it->second.expiration = expiration;
    return true;
}

bool MemoryStorageService::deleteRecord(const std::string& context, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto ctx = contexts_.find(context);
    if (ctx == contexts_.end()) {
        return false;
    }
    return ctx->second.erase(key) > 0;
}

size_t MemoryStorageService::reap(const std::string& context) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto ctx = contexts_.find(context);
    if (ctx == contexts_.end()) {
        return 0;
    }

    auto now = clock_();
    size_t removed = 0;
    for (auto it = ctx->second.begin(); it != ctx->second.end();) {
        if (it->second.isExpired(now)) {
            it = ctx->second.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        spdlog::debug("Reaped {} expired record(s) from context '{}'", removed, context);
    }
    return removed;
}

} // namespace idp::dc
