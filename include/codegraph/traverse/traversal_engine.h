#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <codegraph/cache/result_cache.h>
#include <codegraph/core/config.h>
#include <codegraph/core/types.h>
#include <codegraph/store/graph_store.h>

namespace codegraph::traverse {

struct TraversalRequest {
    SymbolId symbolId = 0;
    store::TraversalDirection direction = store::TraversalDirection::Callers;
    std::optional<int> maxDepth;          ///< Configured default when unset, clamped to the cap
    std::vector<store::DependencyKind> kinds; ///< Empty means all kinds
    std::optional<size_t> limit;          ///< Configured default when unset
};

struct TraversalResult {
    std::vector<store::TraversalEdge> edges; ///< Depth ascending, then newest edge first
    int maxDepth = 0;                        ///< Depth actually used
    size_t limit = 0;
    bool truncated = false; ///< The result hit the limit
    bool fromCache = false;
};

/**
 * @brief Calls into one symbol sharing the same argument pattern
 */
struct ParameterVariation {
    std::string parameterContext; ///< "no-parameters" when the call site recorded none
    std::optional<std::vector<std::string>> parameterTypes;
    std::vector<std::string> callInstanceIds;
    std::vector<int> lineNumbers;
    std::vector<store::CallSite> callers;

    size_t callCount() const { return callers.size(); }
};

struct ParameterContextGroups {
    SymbolId symbolId = 0;
    std::string methodName;
    size_t totalCalls = 0;
    std::vector<ParameterVariation> variations; ///< In order of first call site
};

/**
 * @brief Transitive caller/dependency queries over the stored graph
 *
 * Each traversal is a single bounded store query. Results are memoized in the
 * optional result cache under the "traverse" operation.
 */
class TraversalEngine {
public:
    TraversalEngine(store::GraphStore& store, config::TraversalConfig config,
                    cache::ResultCache* cache = nullptr);

    /**
     * @brief All edges reachable from the seed within the depth bound
     *
     * Fails with ErrorCode::Timeout when the store query exceeds the
     * configured timeout.
     */
    Result<TraversalResult> traverse(const TraversalRequest& request);

    /**
     * @brief Group the direct calls into @p symbolId by parameter context
     */
    Result<ParameterContextGroups> groupCallsByParameterContext(SymbolId symbolId);

    /**
     * @brief Shortest symbol path from @p from to @p to
     * @return Both endpoints included; empty when unreachable within @p maxDepth
     */
    Result<std::vector<SymbolId>> shortestPath(SymbolId from, SymbolId to,
                                               store::TraversalDirection direction,
                                               int maxDepth);

    /**
     * @brief Drop every cached traversal that touches @p symbolId
     *
     * A traversal touches the seed and every symbol on either end of a
     * returned edge.
     * @return Number of cache entries removed
     */
    size_t invalidateSymbol(SymbolId symbolId);

    static cache::CacheKey cacheKey(const TraversalRequest& resolved);

private:
    store::GraphStore& store_;
    config::TraversalConfig config_;
    cache::ResultCache* cache_;

    std::mutex touchedMutex_;
    std::unordered_map<SymbolId, std::unordered_set<cache::CacheKey, cache::CacheKeyHash>>
        touched_;

    TraversalRequest applyDefaults(const TraversalRequest& request) const;
    void recordTouched(const cache::CacheKey& key, SymbolId seed,
                       const std::vector<store::TraversalEdge>& edges);
};

} // namespace codegraph::traverse
