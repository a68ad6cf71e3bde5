#pragma once

#include <utility>
#include <vector>
#include <codegraph/core/types.h>
#include <codegraph/store/graph_store.h>

namespace codegraph::ingest {

/**
 * @brief Assigns parent symbols by line-range containment within a file
 *
 * Methods and properties are linked to the first class, interface or trait
 * of the same file whose range fully contains theirs. Links are plain ids.
 */
class SymbolHierarchyLinker {
public:
    explicit SymbolHierarchyLinker(store::GraphStore& store) : store_(store) {}

    /**
     * @brief Link every symbol of a repository and persist changed parents
     * @return Number of symbols whose parent was updated
     */
    Result<size_t> link(RepositoryId repoId);

    /**
     * @brief Link a set of stored symbols; containment never crosses files
     */
    Result<size_t> linkSymbols(const std::vector<store::Symbol>& symbols);

    /**
     * @brief (child, parent) pairs for symbols whose parent differs from the computed one
     */
    static std::vector<std::pair<SymbolId, SymbolId>>
    computeLinks(const std::vector<store::Symbol>& symbols);

private:
    store::GraphStore& store_;
};

} // namespace codegraph::ingest
