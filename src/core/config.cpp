#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <codegraph/core/config.h>

namespace codegraph::config {

namespace {

std::string trimmed(std::string_view s) {
    auto begin = std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); });
    auto end = std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) {
                   return !std::isspace(ch);
               }).base();
    if (begin >= end)
        return {};
    return std::string(begin, end);
}

template <typename T> void overrideCount(const char* name, T& target, long long minValue) {
    auto raw = getEnv(name);
    if (!raw)
        return;
    auto parsed = parseInteger(*raw);
    if (!parsed || *parsed < minValue) {
        spdlog::warn("Ignoring invalid value '{}' for {}", *raw, name);
        return;
    }
    target = static_cast<T>(*parsed);
}

void overrideMillis(const char* name, std::chrono::milliseconds& target) {
    auto raw = getEnv(name);
    if (!raw)
        return;
    auto parsed = parseInteger(*raw);
    if (!parsed || *parsed <= 0) {
        spdlog::warn("Ignoring invalid value '{}' for {}", *raw, name);
        return;
    }
    target = std::chrono::milliseconds(*parsed);
}

} // namespace

std::optional<std::string> getEnv(const char* name) {
    if (const char* env = std::getenv(name); env && *env) {
        return std::string(env);
    }
    return std::nullopt;
}

std::optional<long long> parseInteger(std::string_view value) {
    auto s = trimmed(value);
    if (s.empty())
        return std::nullopt;
    long long out = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc{} || ptr != s.data() + s.size())
        return std::nullopt;
    return out;
}

std::optional<bool> parseBool(std::string_view value) {
    auto s = trimmed(value);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "1" || s == "true" || s == "on" || s == "yes")
        return true;
    if (s == "0" || s == "false" || s == "off" || s == "no")
        return false;
    return std::nullopt;
}

GraphConfig GraphConfig::fromEnvironment() {
    GraphConfig cfg;

    if (auto path = getEnv("CODEGRAPH_DB_PATH")) {
        cfg.dbPath = *path;
    }

    overrideCount("CODEGRAPH_CACHE_MAX_ENTRIES", cfg.cache.maxEntries, 1);
    overrideMillis("CODEGRAPH_CACHE_TTL_MS", cfg.cache.ttl);
    overrideCount("CODEGRAPH_CACHE_MAX_BYTES", cfg.cache.maxBytes, 1);
    if (auto raw = getEnv("CODEGRAPH_CACHE_STATS")) {
        if (auto b = parseBool(*raw)) {
            cfg.cache.enableStatistics = *b;
        } else {
            spdlog::warn("Ignoring invalid value '{}' for CODEGRAPH_CACHE_STATS", *raw);
        }
    }

    overrideCount("CODEGRAPH_SYMBOL_BATCH_SIZE", cfg.ingestion.symbolBatchSize, 1);
    overrideCount("CODEGRAPH_DEPENDENCY_BATCH_SIZE", cfg.ingestion.dependencyBatchSize, 1);
    cfg.ingestion.fileDependencyBatchSize = cfg.ingestion.dependencyBatchSize;

    overrideCount("CODEGRAPH_TRAVERSAL_MAX_DEPTH", cfg.traversal.defaultMaxDepth, 1);
    overrideCount("CODEGRAPH_TRAVERSAL_LIMIT", cfg.traversal.defaultLimit, 1);
    overrideMillis("CODEGRAPH_QUERY_TIMEOUT_MS", cfg.traversal.queryTimeout);
    cfg.analysis.resolutionTimeout = cfg.traversal.queryTimeout;

    overrideCount("CODEGRAPH_PARSE_CONCURRENCY", cfg.analysis.parseConcurrency, 1);

    spdlog::debug("codegraph config: db='{}' cache(entries={}, ttl={}ms, bytes={}) "
                  "batches(symbols={}, deps={}) traversal(depth={}, limit={}, timeout={}ms) "
                  "parse_concurrency={}",
                  cfg.dbPath, cfg.cache.maxEntries, cfg.cache.ttl.count(), cfg.cache.maxBytes,
                  cfg.ingestion.symbolBatchSize, cfg.ingestion.dependencyBatchSize,
                  cfg.traversal.defaultMaxDepth, cfg.traversal.defaultLimit,
                  cfg.traversal.queryTimeout.count(), cfg.analysis.parseConcurrency);
    return cfg;
}

} // namespace codegraph::config
