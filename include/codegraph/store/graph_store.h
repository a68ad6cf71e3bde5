#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <codegraph/core/types.h>
#include <codegraph/store/entities.h>

namespace codegraph::store {

/**
 * @brief Configuration for a graph store backend
 */
struct GraphStoreConfig {
    bool enableWAL = true;
    size_t maxConnections = 4;
    std::chrono::milliseconds busyTimeout{5000};
};

/**
 * @brief Persistent entity store for the code dependency graph
 *
 * All rows crossing this boundary are typed records. Write operations on a
 * single call are transactional; callers must serialize writers per repository.
 */
class GraphStore {
public:
    virtual ~GraphStore() = default;

    // ===== Repositories =====

    /**
     * @brief Return the repository registered at @p path, creating it if needed
     */
    virtual Result<Repository> getOrCreateRepository(const std::string& name,
                                                     const std::string& path) = 0;
    virtual Result<std::optional<Repository>> getRepository(RepositoryId id) = 0;
    virtual Result<std::optional<Repository>> findRepositoryByPath(const std::string& path) = 0;
    virtual Result<std::optional<Repository>> findRepositoryByName(const std::string& name) = 0;
    virtual Result<void> updateLastIndexed(RepositoryId id, TimePoint when) = 0;

    /**
     * @brief Remove every file, symbol and edge of a repository and clear last_indexed
     */
    virtual Result<void> clearRepositoryData(RepositoryId id) = 0;

    /**
     * @brief Delete a repository and, by cascade, all of its data
     * @return false if no such repository exists
     */
    virtual Result<bool> deleteRepository(RepositoryId id) = 0;

    // ===== Files =====

    /**
     * @brief Insert or update files by (repoId, path)
     * @return The persisted rows with ids, in input order
     */
    virtual Result<std::vector<File>> upsertFiles(const std::vector<File>& files) = 0;
    virtual Result<std::vector<File>> getFilesByRepository(RepositoryId repoId) = 0;
    virtual Result<std::optional<File>> findFileByPath(RepositoryId repoId,
                                                       const std::string& path) = 0;

    /**
     * @brief Delete files; symbols and edges go with them by cascade
     */
    virtual Result<size_t> deleteFiles(const std::vector<FileId>& fileIds) = 0;

    /**
     * @brief Remove outgoing edges, file edges and symbols of files about to be re-ingested
     */
    virtual Result<FileCleanupCounts> cleanupFileData(const std::vector<FileId>& fileIds) = 0;

    // ===== Symbols =====

    /**
     * @brief Insert or update symbols by (fileId, name, kind, startLine)
     * @return The persisted rows with ids, in input order
     */
    virtual Result<std::vector<Symbol>> upsertSymbols(const std::vector<Symbol>& symbols) = 0;
    virtual Result<std::optional<Symbol>> getSymbol(SymbolId id) = 0;
    virtual Result<std::vector<Symbol>> getSymbolsByFile(FileId fileId) = 0;
    virtual Result<std::vector<Symbol>> getSymbolsByRepository(RepositoryId repoId) = 0;
    virtual Result<std::vector<Symbol>> findSymbolsByName(RepositoryId repoId,
                                                          const std::string& name) = 0;
    virtual Result<std::vector<Symbol>>
    findSymbolsByQualifiedName(RepositoryId repoId, const std::string& qualifiedName) = 0;

    /**
     * @brief Set parent_symbol_id for (child, parent) pairs
     * @return Number of rows updated
     */
    virtual Result<size_t>
    updateSymbolParents(const std::vector<std::pair<SymbolId, SymbolId>>& links) = 0;

    // ===== Dependencies =====

    /**
     * @brief Merge a batch of edges in one transaction
     *
     * Existing rows with the same key get their mutable fields refreshed. A
     * unique-key conflict is reported as ErrorCode::ConstraintViolation with the
     * batch rolled back.
     */
    virtual Result<DependencyUpsertResult>
    upsertDependencies(const std::vector<Dependency>& dependencies) = 0;

    /**
     * @brief Read back persisted rows matching the keys of @p keys
     */
    virtual Result<std::vector<Dependency>>
    findDependenciesByKeys(const std::vector<Dependency>& keys) = 0;

    virtual Result<std::vector<Dependency>> getDependenciesByRepository(RepositoryId repoId) = 0;
    virtual Result<std::vector<DependencyWithContext>> getDependenciesFrom(SymbolId symbolId) = 0;
    virtual Result<std::vector<DependencyWithContext>> getDependenciesTo(SymbolId symbolId) = 0;

    // ===== File dependencies =====

    /**
     * @brief Merge file edges by (fromFileId, toFileId, kind)
     * @return Number of rows written
     */
    virtual Result<size_t>
    upsertFileDependencies(const std::vector<FileDependency>& dependencies) = 0;
    virtual Result<std::vector<FileDependency>> getFileDependencies(RepositoryId repoId) = 0;

    // ===== Resolution =====

    /**
     * @brief Keep only the newest unresolved edge per (from, qualified name, kind, line)
     * @return Number of rows deleted
     */
    virtual Result<size_t> deduplicateUnresolved(RepositoryId repoId,
                                                 std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Bind unresolved edges whose qualified name matches exactly one symbol
     * @return Number of edges bound
     */
    virtual Result<size_t> bindQualifiedNames(RepositoryId repoId,
                                              std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Delete edges that can never be resolved; imports are kept
     */
    virtual Result<OrphanCleanupCounts> deleteOrphanDependencies(RepositoryId repoId,
                                                                 std::chrono::milliseconds timeout) = 0;

    // ===== Traversal =====

    /**
     * @brief Bounded, cycle-safe transitive closure in a single query
     *
     * Fails with ErrorCode::Timeout when the query exceeds @p timeout.
     */
    virtual Result<std::vector<TraversalEdge>> queryTransitive(const TraversalQuery& query,
                                                               std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Raw caller edges into @p symbolId with call-site context
     */
    virtual Result<std::vector<CallSite>> getCallSites(SymbolId symbolId,
                                                       std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Distinct neighbour ids one hop away in @p direction
     */
    virtual Result<std::vector<SymbolId>> getNeighbors(SymbolId symbolId,
                                                       TraversalDirection direction,
                                                       const std::vector<DependencyKind>& kinds) = 0;

    // ===== Statistics =====

    virtual Result<GraphStats> getGraphStats(RepositoryId repoId) = 0;
};

/**
 * @brief Open (creating and migrating if needed) a SQLite-backed graph store
 */
Result<std::unique_ptr<GraphStore>> makeSqliteGraphStore(const std::string& dbPath,
                                                         const GraphStoreConfig& cfg = {});

} // namespace codegraph::store
