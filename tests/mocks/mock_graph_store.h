#pragma once

#include <gmock/gmock.h>
#include <utility>
#include <vector>
#include <codegraph/store/graph_store.h>

namespace codegraph::test {

using ParentLinks = std::vector<std::pair<SymbolId, SymbolId>>;

class MockGraphStore : public store::GraphStore {
public:
    MOCK_METHOD(Result<store::Repository>, getOrCreateRepository,
                (const std::string& name, const std::string& path), (override));
    MOCK_METHOD(Result<std::optional<store::Repository>>, getRepository, (RepositoryId id),
                (override));
    MOCK_METHOD(Result<std::optional<store::Repository>>, findRepositoryByPath,
                (const std::string& path), (override));
    MOCK_METHOD(Result<std::optional<store::Repository>>, findRepositoryByName,
                (const std::string& name), (override));
    MOCK_METHOD(Result<void>, updateLastIndexed, (RepositoryId id, TimePoint when), (override));
    MOCK_METHOD(Result<void>, clearRepositoryData, (RepositoryId id), (override));
    MOCK_METHOD(Result<bool>, deleteRepository, (RepositoryId id), (override));

    MOCK_METHOD(Result<std::vector<store::File>>, upsertFiles,
                (const std::vector<store::File>& files), (override));
    MOCK_METHOD(Result<std::vector<store::File>>, getFilesByRepository, (RepositoryId repoId),
                (override));
    MOCK_METHOD(Result<std::optional<store::File>>, findFileByPath,
                (RepositoryId repoId, const std::string& path), (override));
    MOCK_METHOD(Result<size_t>, deleteFiles, (const std::vector<FileId>& fileIds), (override));
    MOCK_METHOD(Result<store::FileCleanupCounts>, cleanupFileData,
                (const std::vector<FileId>& fileIds), (override));

    MOCK_METHOD(Result<std::vector<store::Symbol>>, upsertSymbols,
                (const std::vector<store::Symbol>& symbols), (override));
    MOCK_METHOD(Result<std::optional<store::Symbol>>, getSymbol, (SymbolId id), (override));
    MOCK_METHOD(Result<std::vector<store::Symbol>>, getSymbolsByFile, (FileId fileId),
                (override));
    MOCK_METHOD(Result<std::vector<store::Symbol>>, getSymbolsByRepository,
                (RepositoryId repoId), (override));
    MOCK_METHOD(Result<std::vector<store::Symbol>>, findSymbolsByName,
                (RepositoryId repoId, const std::string& name), (override));
    MOCK_METHOD(Result<std::vector<store::Symbol>>, findSymbolsByQualifiedName,
                (RepositoryId repoId, const std::string& qualifiedName), (override));
    MOCK_METHOD(Result<size_t>, updateSymbolParents, (const ParentLinks& links), (override));

    MOCK_METHOD(Result<store::DependencyUpsertResult>, upsertDependencies,
                (const std::vector<store::Dependency>& dependencies), (override));
    MOCK_METHOD(Result<std::vector<store::Dependency>>, findDependenciesByKeys,
                (const std::vector<store::Dependency>& keys), (override));
    MOCK_METHOD(Result<std::vector<store::Dependency>>, getDependenciesByRepository,
                (RepositoryId repoId), (override));
    MOCK_METHOD(Result<std::vector<store::DependencyWithContext>>, getDependenciesFrom,
                (SymbolId symbolId), (override));
    MOCK_METHOD(Result<std::vector<store::DependencyWithContext>>, getDependenciesTo,
                (SymbolId symbolId), (override));

    MOCK_METHOD(Result<size_t>, upsertFileDependencies,
                (const std::vector<store::FileDependency>& dependencies), (override));
    MOCK_METHOD(Result<std::vector<store::FileDependency>>, getFileDependencies,
                (RepositoryId repoId), (override));

    MOCK_METHOD(Result<size_t>, deduplicateUnresolved,
                (RepositoryId repoId, std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(Result<size_t>, bindQualifiedNames,
                (RepositoryId repoId, std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(Result<store::OrphanCleanupCounts>, deleteOrphanDependencies,
                (RepositoryId repoId, std::chrono::milliseconds timeout), (override));

    MOCK_METHOD(Result<std::vector<store::TraversalEdge>>, queryTransitive,
                (const store::TraversalQuery& query, std::chrono::milliseconds timeout),
                (override));
    MOCK_METHOD(Result<std::vector<store::CallSite>>, getCallSites,
                (SymbolId symbolId, std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(Result<std::vector<SymbolId>>, getNeighbors,
                (SymbolId symbolId, store::TraversalDirection direction,
                 const std::vector<store::DependencyKind>& kinds),
                (override));

    MOCK_METHOD(Result<store::GraphStats>, getGraphStats, (RepositoryId repoId), (override));
};

} // namespace codegraph::test
