/**
 * @file result_cache.cpp
 */

#include <idp/dc/result_cache.h>
#include <idp/dc/config/config_manager.h>
#include <idp/dc/exceptions.h>

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace idp::dc {

ResultCache::ResultCache(size_t maxEntries,
                         std::chrono::seconds ttl,
                         Expiry expiry,
                         ClockFn clock)
    : maxEntries_(maxEntries),
      ttl_(ttl),
      expiry_(expiry),
      clock_(clock ? std::move(clock) : ClockFn([]() { return Clock::now(); }))
{
    if (maxEntries_ == 0) {
        throw std::invalid_argument("ResultCache: maxEntries must be positive");
    }
    if (ttl_.count() <= 0) {
        throw std::invalid_argument("ResultCache: ttl must be positive");
    }
}

std::shared_ptr<ResultCache> ResultCache::fromConfig(const ConfigManager& config) {
    if (!config.getBool(ConfigManager::DC_CACHE_ENABLED, false)) {
        return nullptr;
    }

    int maxEntries = config.getInt(ConfigManager::DC_CACHE_MAX_ENTRIES,
                                   static_cast<int>(DEFAULT_MAX_ENTRIES));
    int ttlSec = config.getInt(ConfigManager::DC_CACHE_TTL_SEC,
                               static_cast<int>(DEFAULT_TTL.count()));
    bool afterWrite = config.getBool(ConfigManager::DC_CACHE_EXPIRE_AFTER_WRITE, false);

    if (maxEntries <= 0 || ttlSec <= 0) {
        throw ConfigurationException("result cache size and TTL must be positive");
    }

    spdlog::info("Result cache enabled: maxEntries={}, ttl={}s, expiry={}",
                 maxEntries, ttlSec, afterWrite ? "afterWrite" : "afterAccess");

    return std::make_shared<ResultCache>(static_cast<size_t>(maxEntries),
                                         std::chrono::seconds(ttlSec),
                                         afterWrite ? Expiry::AfterWrite : Expiry::AfterAccess);
}

std::optional<AttributeMap> ResultCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(key);
    if (it == index_.end()) {
        return std::nullopt;
    }

    auto now = clock_();
    if (now >= it->second->expiresAt) {
        entries_.erase(it->second);
        index_.erase(it);
        return std::nullopt;
    }

    entries_.splice(entries_.begin(), entries_, it->second);
    if (expiry_ == Expiry::AfterAccess) {
        it->second->expiresAt = now + ttl_;
    }
    return it->second->value;
}

void ResultCache::put(const std::string& key, const AttributeMap& value) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto expiresAt = clock_() + ttl_;

    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->value = value;
        it->second->expiresAt = expiresAt;
        entries_.splice(entries_.begin(), entries_, it->second);
        return;
    }

    entries_.push_front(Entry{key, value, expiresAt});
    index_[key] = entries_.begin();

    while (entries_.size() > maxEntries_) {
        index_.erase(entries_.back().key);
        entries_.pop_back();
    }
}

void ResultCache::invalidate(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(key);
    if (it != index_.end()) {
        entries_.erase(it->second);
        index_.erase(it);
    }
}

void ResultCache::invalidateAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    index_.clear();
}

size_t ResultCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace idp::dc
