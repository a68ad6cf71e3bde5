#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace codegraph::cache {

/**
 * @brief Statistics for cache performance monitoring
 */
struct CacheStats {
    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> misses{0};
    std::atomic<uint64_t> evictions{0};
    std::atomic<uint64_t> invalidations{0};
    std::atomic<uint64_t> insertions{0};
    std::atomic<uint64_t> rejections{0};     ///< Entries refused by the admission bound
    std::atomic<uint64_t> ttlExpirations{0};

    std::atomic<size_t> currentSize{0}; ///< Current number of entries
    std::atomic<size_t> memoryUsage{0}; ///< Current aggregate serialized size in bytes
    size_t maxSize = 0;
    size_t maxMemory = 0;

    CacheStats() = default;

    // Copy constructor (needed because of atomic members)
    CacheStats(const CacheStats& other) { *this = other; }

    CacheStats& operator=(const CacheStats& other) {
        if (this != &other) {
            hits.store(other.hits.load());
            misses.store(other.misses.load());
            evictions.store(other.evictions.load());
            invalidations.store(other.invalidations.load());
            insertions.store(other.insertions.load());
            rejections.store(other.rejections.load());
            ttlExpirations.store(other.ttlExpirations.load());
            currentSize.store(other.currentSize.load());
            memoryUsage.store(other.memoryUsage.load());
            maxSize = other.maxSize;
            maxMemory = other.maxMemory;
        }
        return *this;
    }

    double hitRate() const {
        uint64_t total = hits.load() + misses.load();
        return total > 0 ? static_cast<double>(hits.load()) / static_cast<double>(total) : 0.0;
    }

    void reset() {
        hits.store(0);
        misses.store(0);
        evictions.store(0);
        invalidations.store(0);
        insertions.store(0);
        rejections.store(0);
        ttlExpirations.store(0);
    }
};

} // namespace codegraph::cache
