#include <spdlog/spdlog.h>
#include <codegraph/resolve/resolution_pass.h>

namespace codegraph::resolve {

Result<ResolutionCounts> ResolutionPass::run(RepositoryId repoId) {
    ResolutionCounts counts;

    auto deduplicated = store_.deduplicateUnresolved(repoId, timeout_);
    if (!deduplicated) {
        spdlog::error("Unresolved edge dedup failed for repository {}: {}", repoId,
                      deduplicated.error().message);
        return deduplicated.error();
    }
    counts.deduplicated = deduplicated.value();

    auto bound = store_.bindQualifiedNames(repoId, timeout_);
    if (!bound) {
        spdlog::error("Qualified name binding failed for repository {}: {}", repoId,
                      bound.error().message);
        return bound.error();
    }
    counts.resolved = bound.value();

    auto orphans = store_.deleteOrphanDependencies(repoId, timeout_);
    if (!orphans) {
        spdlog::error("Orphan cleanup failed for repository {}: {}", repoId,
                      orphans.error().message);
        return orphans.error();
    }
    counts.orphans = orphans.value();

    spdlog::info("Resolution for repository {}: {} deduplicated, {} resolved, {} orphans removed "
                 "({} without target, {} unmatched)",
                 repoId, counts.deduplicated, counts.resolved, counts.orphans.total(),
                 counts.orphans.withoutTarget, counts.orphans.unmatched);
    return counts;
}

Result<size_t> ResolutionPass::resolveQualifiedNames(RepositoryId repoId) {
    auto deduplicated = store_.deduplicateUnresolved(repoId, timeout_);
    if (!deduplicated)
        return deduplicated.error();

    auto bound = store_.bindQualifiedNames(repoId, timeout_);
    if (!bound)
        return bound.error();

    spdlog::info("Resolved {} qualified names in repository {} ({} duplicates dropped)",
                 bound.value(), repoId, deduplicated.value());
    return bound;
}

Result<size_t> ResolutionPass::cleanupOrphans(RepositoryId repoId) {
    auto orphans = store_.deleteOrphanDependencies(repoId, timeout_);
    if (!orphans)
        return orphans.error();

    const size_t total = orphans.value().total();
    if (total > 0) {
        spdlog::info("Removed {} orphaned edges from repository {}", total, repoId);
    }
    return total;
}

} // namespace codegraph::resolve
