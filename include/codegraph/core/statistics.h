#pragma once

#include <atomic>
#include <cstdint>

namespace codegraph {

/**
 * @brief Counters for records skipped during one analysis context
 *
 * Owned by whoever drives the run and passed by reference to the components
 * that skip records; there is no process-wide instance.
 */
struct AnalysisStatistics {
    std::atomic<uint64_t> parseFailures{0};      ///< Files the parser could not handle
    std::atomic<uint64_t> validationFailures{0}; ///< Records with a malformed payload
    std::atomic<uint64_t> unmatchedEdges{0};     ///< Edges with no source symbol in their file
    std::atomic<uint64_t> recoveredConflicts{0}; ///< Dependency batches recovered by re-query

    void reset() {
        parseFailures.store(0);
        validationFailures.store(0);
        unmatchedEdges.store(0);
        recoveredConflicts.store(0);
    }
};

} // namespace codegraph
