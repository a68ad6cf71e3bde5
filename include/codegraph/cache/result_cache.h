#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <condition_variable>
#include <list>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <codegraph/cache/cache_key.h>
#include <codegraph/cache/cache_stats.h>
#include <codegraph/core/config.h>

namespace codegraph::cache {

/**
 * @brief Thread-safe LRU cache for query results
 *
 * Values are JSON documents; an entry's size is the length of its serialized
 * form. Entries larger than a quarter of the byte bound are never admitted.
 * Expired entries read as absent and are also removed by a background sweep
 * running every quarter TTL, capped at the configured maximum interval.
 */
class ResultCache {
public:
    struct CacheEntry {
        nlohmann::json data;
        std::chrono::steady_clock::time_point insertTime;
        size_t memorySize = 0;
        std::list<CacheKey>::iterator lruPosition;
    };

    explicit ResultCache(const config::CacheConfig& config = {});
    ~ResultCache();

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    // ===== Core Operations =====

    /**
     * @brief Get a cached value
     * @return nullopt if not found or expired
     */
    std::optional<nlohmann::json> get(const CacheKey& key);

    /**
     * @brief Store a value
     * @return false when the value was refused by the admission bound
     */
    bool set(const CacheKey& key, nlohmann::json value);

    std::optional<nlohmann::json> get(std::string_view operation, const nlohmann::json& params) {
        return get(CacheKey::fromOperation(operation, params));
    }

    bool set(std::string_view operation, const nlohmann::json& params, nlohmann::json value) {
        return set(CacheKey::fromOperation(operation, params), std::move(value));
    }

    /**
     * @brief Remove one entry
     * @return true if an entry was removed
     */
    bool invalidate(const CacheKey& key);

    /**
     * @brief Remove every entry whose key contains @p pattern
     */
    size_t invalidatePattern(std::string_view pattern);

    void clear();

    // ===== Cache Management =====

    size_t size() const;
    size_t memoryUsage() const;

    /**
     * @brief Remove expired entries now
     */
    size_t removeExpired();

    // ===== Statistics =====

    CacheStats getStats() const;
    void resetStats();

    const config::CacheConfig& getConfig() const { return config_; }

    /// Period of the background expiry sweep
    std::chrono::milliseconds sweepInterval() const;

private:
    mutable std::shared_mutex mutex_;
    config::CacheConfig config_;

    std::list<CacheKey> lruList_; ///< Most recently used at the front
    std::unordered_map<CacheKey, CacheEntry, CacheKeyHash> cache_;
    size_t currentMemoryUsage_ = 0;

    mutable CacheStats stats_;

    std::mutex sweepMutex_;
    std::condition_variable_any sweepCv_;
    std::jthread sweeper_;

    bool isExpired(const CacheEntry& entry, std::chrono::steady_clock::time_point now) const;

    // Callers hold the unique lock
    void eraseLocked(std::unordered_map<CacheKey, CacheEntry, CacheKeyHash>::iterator it);
    void evictForLocked(size_t incomingSize);

    void sweepLoop(std::stop_token stop);
};

} // namespace codegraph::cache
