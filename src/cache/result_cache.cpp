#include <spdlog/spdlog.h>
#include <algorithm>
#include <codegraph/cache/result_cache.h>

namespace codegraph::cache {

ResultCache::ResultCache(const config::CacheConfig& config) : config_(config) {
    if (config_.maxEntries == 0) {
        config_.maxEntries = 1;
    }
    stats_.maxSize = config_.maxEntries;
    stats_.maxMemory = config_.maxBytes;

    if (config_.ttl.count() > 0) {
        sweeper_ = std::jthread([this](std::stop_token stop) { sweepLoop(stop); });
    }

    spdlog::debug("Result cache initialized (maxEntries={}, ttl={}ms, maxBytes={})",
                  config_.maxEntries, config_.ttl.count(), config_.maxBytes);
}

ResultCache::~ResultCache() {
    if (sweeper_.joinable()) {
        sweeper_.request_stop();
        sweepCv_.notify_all();
    }
}

std::chrono::milliseconds ResultCache::sweepInterval() const {
    auto quarter = config_.ttl / 4;
    if (quarter.count() <= 0)
        quarter = std::chrono::milliseconds(1);
    return std::min(quarter, config_.maxSweepInterval);
}

bool ResultCache::isExpired(const CacheEntry& entry,
                            std::chrono::steady_clock::time_point now) const {
    return config_.ttl.count() > 0 && (now - entry.insertTime) > config_.ttl;
}

std::optional<nlohmann::json> ResultCache::get(const CacheKey& key) {
    // Hits reorder the LRU list, so lookups take the write lock
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_.find(key);
    if (it == cache_.end()) {
        if (config_.enableStatistics) {
            stats_.misses.fetch_add(1);
        }
        return std::nullopt;
    }

    if (isExpired(it->second, std::chrono::steady_clock::now())) {
        eraseLocked(it);
        if (config_.enableStatistics) {
            stats_.ttlExpirations.fetch_add(1);
            stats_.misses.fetch_add(1);
        }
        return std::nullopt;
    }

    lruList_.splice(lruList_.begin(), lruList_, it->second.lruPosition);

    if (config_.enableStatistics) {
        stats_.hits.fetch_add(1);
    }
    return it->second.data;
}

bool ResultCache::set(const CacheKey& key, nlohmann::json value) {
    const size_t size = value.dump().size();

    if (size > config_.maxBytes / 4) {
        spdlog::debug("Skipping cache for '{}': {} bytes exceeds admission bound {}",
                      key.toString().substr(0, 100), size, config_.maxBytes / 4);
        if (config_.enableStatistics) {
            stats_.rejections.fetch_add(1);
        }
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    // Replacing an entry must not count against the bounds
    if (auto existing = cache_.find(key); existing != cache_.end()) {
        eraseLocked(existing);
    }

    if (cache_.size() >= config_.maxEntries || currentMemoryUsage_ + size > config_.maxBytes) {
        evictForLocked(size);
    }

    lruList_.push_front(key);
    CacheEntry entry;
    entry.data = std::move(value);
    entry.insertTime = std::chrono::steady_clock::now();
    entry.memorySize = size;
    entry.lruPosition = lruList_.begin();
    cache_.emplace(key, std::move(entry));

    currentMemoryUsage_ += size;
    stats_.currentSize.store(cache_.size());
    stats_.memoryUsage.store(currentMemoryUsage_);
    if (config_.enableStatistics) {
        stats_.insertions.fetch_add(1);
    }
    return true;
}

void ResultCache::eraseLocked(std::unordered_map<CacheKey, CacheEntry, CacheKeyHash>::iterator it) {
    currentMemoryUsage_ -= it->second.memorySize;
    lruList_.erase(it->second.lruPosition);
    cache_.erase(it);
    stats_.currentSize.store(cache_.size());
    stats_.memoryUsage.store(currentMemoryUsage_);
}

void ResultCache::evictForLocked(size_t incomingSize) {
    size_t evicted = 0;
    size_t freed = 0;
    // Evict down to half the entry bound and until the incoming entry fits
    while (!lruList_.empty()) {
        if (cache_.size() <= config_.maxEntries / 2 &&
            currentMemoryUsage_ + incomingSize <= config_.maxBytes) {
            break;
        }
        auto it = cache_.find(lruList_.back());
        if (it == cache_.end()) {
            lruList_.pop_back();
            continue;
        }
        freed += it->second.memorySize;
        eraseLocked(it);
        ++evicted;
    }

    if (evicted > 0) {
        stats_.evictions.fetch_add(evicted);
        spdlog::debug("Evicted {} LRU cache entries ({} bytes, {} remaining)", evicted, freed,
                      cache_.size());
    }
}

bool ResultCache::invalidate(const CacheKey& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end())
        return false;
    eraseLocked(it);
    if (config_.enableStatistics) {
        stats_.invalidations.fetch_add(1);
    }
    return true;
}

size_t ResultCache::invalidatePattern(std::string_view pattern) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    size_t count = 0;
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (it->first.matchesPattern(pattern)) {
            auto victim = it++;
            eraseLocked(victim);
            ++count;
        } else {
            ++it;
        }
    }

    if (count > 0) {
        if (config_.enableStatistics) {
            stats_.invalidations.fetch_add(count);
        }
        spdlog::debug("Invalidated {} cache entries matching '{}'", count, pattern);
    }
    return count;
}

void ResultCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_.clear();
    lruList_.clear();
    currentMemoryUsage_ = 0;
    stats_.currentSize.store(0);
    stats_.memoryUsage.store(0);
}

size_t ResultCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_.size();
}

size_t ResultCache::memoryUsage() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return currentMemoryUsage_;
}

size_t ResultCache::removeExpired() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    const auto now = std::chrono::steady_clock::now();
    size_t count = 0;
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (isExpired(it->second, now)) {
            auto victim = it++;
            eraseLocked(victim);
            ++count;
        } else {
            ++it;
        }
    }

    if (count > 0) {
        if (config_.enableStatistics) {
            stats_.ttlExpirations.fetch_add(count);
        }
        spdlog::debug("Removed {} expired cache entries, {} remaining", count, cache_.size());
    }
    return count;
}

CacheStats ResultCache::getStats() const {
    return stats_;
}

void ResultCache::resetStats() {
    stats_.reset();
}

void ResultCache::sweepLoop(std::stop_token stop) {
    const auto interval = sweepInterval();
    while (!stop.stop_requested()) {
        {
            std::unique_lock<std::mutex> lock(sweepMutex_);
            if (sweepCv_.wait_for(lock, stop, interval, [&stop] { return stop.stop_requested(); })) {
                break;
            }
        }
        removeExpired();
    }
}

} // namespace codegraph::cache
