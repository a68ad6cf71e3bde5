#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace codegraph::config {

// Environment helpers
std::optional<std::string> getEnv(const char* name);
std::optional<long long> parseInteger(std::string_view value);
std::optional<bool> parseBool(std::string_view value);

/**
 * @brief Result cache policy
 */
struct CacheConfig {
    size_t maxEntries = 1000;                 ///< Entry-count bound
    std::chrono::milliseconds ttl{300000};    ///< Per-entry time to live (5 minutes)
    size_t maxBytes = 50 * 1024 * 1024;       ///< Aggregate serialized size bound
    bool enableStatistics = true;             ///< Track hits/misses/evictions
    std::chrono::milliseconds maxSweepInterval{60000}; ///< Upper bound on the expiry sweep period
};

/**
 * @brief Batch sizes used by ingestion
 */
struct IngestionConfig {
    size_t symbolBatchSize = 50;
    size_t dependencyBatchSize = 1000;
    size_t fileDependencyBatchSize = 1000;
};

/**
 * @brief Traversal defaults and limits
 */
struct TraversalConfig {
    int defaultMaxDepth = 10;
    int maxDepthCap = 20; ///< Requests above this depth are clamped
    size_t defaultLimit = 1000;
    std::chrono::milliseconds queryTimeout{30000};
};

/**
 * @brief Analysis run settings
 */
struct AnalysisConfig {
    size_t parseConcurrency = 10;  ///< Worker-pool limit for parser calls
    size_t parseChunkSize = 100;   ///< Files handed to the pool per chunk
    std::chrono::milliseconds resolutionTimeout{30000};
};

/**
 * @brief Top-level configuration for a codegraph instance
 */
struct GraphConfig {
    std::string dbPath = "codegraph.db";
    CacheConfig cache;
    IngestionConfig ingestion;
    TraversalConfig traversal;
    AnalysisConfig analysis;

    /**
     * @brief Build a configuration from defaults overridden by CODEGRAPH_* variables.
     *
     * Malformed values are logged and ignored.
     */
    static GraphConfig fromEnvironment();
};

} // namespace codegraph::config
