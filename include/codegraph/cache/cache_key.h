#pragma once

#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <string_view>

namespace codegraph::cache {

/**
 * @brief Key of a memoized read: operation name plus canonical parameters
 *
 * Parameters are serialized with object keys sorted at every level, so two
 * parameter sets that differ only in key order produce the same key.
 */
class CacheKey {
public:
    CacheKey() = default;

    static CacheKey fromOperation(std::string_view operation, const nlohmann::json& params);

    size_t hash() const { return hashValue_; }

    const std::string& toString() const { return keyString_; }

    bool operator==(const CacheKey& other) const {
        return hashValue_ == other.hashValue_ && keyString_ == other.keyString_;
    }

    bool operator!=(const CacheKey& other) const { return !(*this == other); }

    /**
     * @brief Substring match used by pattern invalidation
     */
    bool matchesPattern(std::string_view pattern) const;

private:
    explicit CacheKey(std::string keyString);

    std::string keyString_;
    size_t hashValue_ = 0;
};

struct CacheKeyHash {
    size_t operator()(const CacheKey& key) const { return key.hash(); }
};

} // namespace codegraph::cache
