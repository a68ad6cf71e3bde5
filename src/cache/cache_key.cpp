#include <codegraph/cache/cache_key.h>

namespace codegraph::cache {

CacheKey::CacheKey(std::string keyString)
    : keyString_(std::move(keyString)), hashValue_(std::hash<std::string>{}(keyString_)) {}

CacheKey CacheKey::fromOperation(std::string_view operation, const nlohmann::json& params) {
    // nlohmann::json objects are ordered maps, so dump() is already key-sorted
    std::string key;
    key.reserve(operation.size() + 64);
    key.append(operation);
    key.push_back(':');
    key.append(params.dump());
    return CacheKey(std::move(key));
}

bool CacheKey::matchesPattern(std::string_view pattern) const {
    if (pattern.empty())
        return true;
    return keyString_.find(pattern) != std::string::npos;
}

} // namespace codegraph::cache
