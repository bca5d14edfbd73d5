/**
 * @file result_cache.h
 * @brief Thread-safe LRU cache of connector results keyed by query cache key
 */

#pragma once

#include <idp/dc/attribute.h>

#include <chrono>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace idp::dc {

class ConfigManager;

class ResultCache {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    enum class Expiry {
        AfterAccess,  ///< TTL restarts on every hit
        AfterWrite    ///< TTL counts from insertion
    };

    static constexpr size_t DEFAULT_MAX_ENTRIES = 500;
    static constexpr std::chrono::seconds DEFAULT_TTL{4 * 60 * 60};

    /**
     * @param maxEntries Capacity; least recently used entries are evicted
     * @param ttl Entry lifetime
     * @param expiry Expiry policy
     * @param clock Time source (tests inject a fake)
     */
    explicit ResultCache(size_t maxEntries = DEFAULT_MAX_ENTRIES,
                         std::chrono::seconds ttl = DEFAULT_TTL,
                         Expiry expiry = Expiry::AfterAccess,
                         ClockFn clock = nullptr);

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    /**
     * @brief Create from DC_CACHE_* settings
     * @return nullptr unless DC_CACHE_ENABLED is set
     */
    static std::shared_ptr<ResultCache> fromConfig(const ConfigManager& config);

    std::optional<AttributeMap> get(const std::string& key);

    void put(const std::string& key, const AttributeMap& value);

    void invalidate(const std::string& key);

    void invalidateAll();

    size_t size() const;

private:
    struct Entry {
        std::string key;
        AttributeMap value;
        Clock::time_point expiresAt;
    };

    using EntryList = std::list<Entry>;

    size_t maxEntries_;
    std::chrono::seconds ttl_;
    Expiry expiry_;
    ClockFn clock_;

    EntryList entries_;  // front = most recently used
    std::unordered_map<std::string, EntryList::iterator> index_;
    mutable std::mutex mutex_;
};

} // namespace idp::dc
