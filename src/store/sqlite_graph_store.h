#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <codegraph/store/connection_pool.h>
#include <codegraph/store/graph_store.h>

namespace codegraph::store {

namespace detail {

inline constexpr const char* kSymbolColumns =
    "s.id, s.file_id, s.name, s.qualified_name, s.parent_symbol_id, s.symbol_type, "
    "s.start_line, s.end_line, s.is_exported, s.signature, s.description";
inline constexpr int kSymbolColumnCount = 11;

inline constexpr const char* kDependencyColumns =
    "d.id, d.from_symbol_id, d.to_symbol_id, d.dependency_type, d.line_number, "
    "d.to_qualified_name, d.calling_object, d.resolved_class, d.qualified_context, "
    "d.parameter_context, d.parameter_types, d.call_instance_id";
inline constexpr int kDependencyColumnCount = 12;

inline constexpr const char* kFileColumns =
    "f.id, f.repo_id, f.path, f.language, f.size, f.content_hash, f.last_modified, "
    "f.is_generated, f.is_test";

int64_t nowMillis();

/// Comma-separated id list for IN (...) clauses; ids are integers only
std::string joinIds(const std::vector<int64_t>& ids);

std::optional<std::string> encodeParameterTypes(const std::optional<std::vector<std::string>>& types);
std::optional<std::vector<std::string>> decodeParameterTypes(const std::optional<std::string>& json);

Repository readRepository(const Statement& stmt);
File readFile(const Statement& stmt, int offset = 0);
Symbol readSymbol(const Statement& stmt, int offset = 0);
Dependency readDependency(const Statement& stmt, int offset = 0);

/// Reads (id, name, symbol_type, file path) starting at @p offset; empty when id is NULL
std::optional<SymbolRef> readSymbolRef(const Statement& stmt, int offset);

std::string kindFilterClause(const std::vector<DependencyKind>& kinds, const char* column);

} // namespace detail

/**
 * @brief SQLite implementation of GraphStore
 */
class SqliteGraphStore final : public GraphStore {
public:
    static Result<std::unique_ptr<SqliteGraphStore>> create(const std::string& dbPath,
                                                            const GraphStoreConfig& cfg);

    // Repositories
    Result<Repository> getOrCreateRepository(const std::string& name,
                                             const std::string& path) override;
    Result<std::optional<Repository>> getRepository(RepositoryId id) override;
    Result<std::optional<Repository>> findRepositoryByPath(const std::string& path) override;
    Result<std::optional<Repository>> findRepositoryByName(const std::string& name) override;
    Result<void> updateLastIndexed(RepositoryId id, TimePoint when) override;
    Result<void> clearRepositoryData(RepositoryId id) override;
    Result<bool> deleteRepository(RepositoryId id) override;

    // Files
    Result<std::vector<File>> upsertFiles(const std::vector<File>& files) override;
    Result<std::vector<File>> getFilesByRepository(RepositoryId repoId) override;
    Result<std::optional<File>> findFileByPath(RepositoryId repoId,
                                               const std::string& path) override;
    Result<size_t> deleteFiles(const std::vector<FileId>& fileIds) override;
    Result<FileCleanupCounts> cleanupFileData(const std::vector<FileId>& fileIds) override;

    // Symbols
    Result<std::vector<Symbol>> upsertSymbols(const std::vector<Symbol>& symbols) override;
    Result<std::optional<Symbol>> getSymbol(SymbolId id) override;
    Result<std::vector<Symbol>> getSymbolsByFile(FileId fileId) override;
    Result<std::vector<Symbol>> getSymbolsByRepository(RepositoryId repoId) override;
    Result<std::vector<Symbol>> findSymbolsByName(RepositoryId repoId,
                                                  const std::string& name) override;
    Result<std::vector<Symbol>> findSymbolsByQualifiedName(RepositoryId repoId,
                                                           const std::string& qualifiedName) override;
    Result<size_t>
    updateSymbolParents(const std::vector<std::pair<SymbolId, SymbolId>>& links) override;

    // Dependencies
    Result<DependencyUpsertResult>
    upsertDependencies(const std::vector<Dependency>& dependencies) override;
    Result<std::vector<Dependency>>
    findDependenciesByKeys(const std::vector<Dependency>& keys) override;
    Result<std::vector<Dependency>> getDependenciesByRepository(RepositoryId repoId) override;
    Result<std::vector<DependencyWithContext>> getDependenciesFrom(SymbolId symbolId) override;
    Result<std::vector<DependencyWithContext>> getDependenciesTo(SymbolId symbolId) override;

    // File dependencies
    Result<size_t> upsertFileDependencies(const std::vector<FileDependency>& dependencies) override;
    Result<std::vector<FileDependency>> getFileDependencies(RepositoryId repoId) override;

    // Resolution
    Result<size_t> deduplicateUnresolved(RepositoryId repoId,
                                         std::chrono::milliseconds timeout) override;
    Result<size_t> bindQualifiedNames(RepositoryId repoId,
                                      std::chrono::milliseconds timeout) override;
    Result<OrphanCleanupCounts> deleteOrphanDependencies(RepositoryId repoId,
                                                         std::chrono::milliseconds timeout) override;

    // Traversal
    Result<std::vector<TraversalEdge>> queryTransitive(const TraversalQuery& query,
                                                       std::chrono::milliseconds timeout) override;
    Result<std::vector<CallSite>> getCallSites(SymbolId symbolId,
                                               std::chrono::milliseconds timeout) override;
    Result<std::vector<SymbolId>> getNeighbors(SymbolId symbolId, TraversalDirection direction,
                                               const std::vector<DependencyKind>& kinds) override;

    Result<GraphStats> getGraphStats(RepositoryId repoId) override;

private:
    explicit SqliteGraphStore(std::unique_ptr<ConnectionPool> pool) : pool_(std::move(pool)) {}

    Result<std::vector<DependencyWithContext>> queryDependenciesWithContext(SymbolId symbolId,
                                                                            bool outgoing);

    std::unique_ptr<ConnectionPool> pool_;
};

} // namespace codegraph::store
