#pragma once

#include <chrono>
#include <cstddef>
#include <codegraph/core/types.h>
#include <codegraph/store/graph_store.h>

namespace codegraph::resolve {

/**
 * @brief Row counts of one resolution pass
 */
struct ResolutionCounts {
    size_t deduplicated = 0; ///< Redundant unresolved edges removed before binding
    size_t resolved = 0;     ///< Edges bound to a symbol
    store::OrphanCleanupCounts orphans;
};

/**
 * @brief Binds qualified-name edges to symbols for one repository
 *
 * The steps always run in the order dedup, bind, orphan cleanup. Each step
 * is idempotent and bounded by the configured timeout.
 */
class ResolutionPass {
public:
    ResolutionPass(store::GraphStore& store, std::chrono::milliseconds timeout)
        : store_(store), timeout_(timeout) {}

    Result<ResolutionCounts> run(RepositoryId repoId);

    /**
     * @brief Dedup and bind, without orphan cleanup
     * @return Number of edges bound
     */
    Result<size_t> resolveQualifiedNames(RepositoryId repoId);

    /**
     * @return Number of edges deleted
     */
    Result<size_t> cleanupOrphans(RepositoryId repoId);

private:
    store::GraphStore& store_;
    std::chrono::milliseconds timeout_;
};

} // namespace codegraph::resolve
