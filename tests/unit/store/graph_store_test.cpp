#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <codegraph/store/graph_store.h>
#include "../../utils/test_helpers.h"

using namespace codegraph;
using namespace codegraph::store;
using namespace codegraph::test;

class SqliteGraphStoreTest : public GraphStoreTest {};

TEST_F(SqliteGraphStoreTest, RepositoryIsCreatedOncePerPath) {
    auto first = graph->getOrCreateRepository("app", "/srv/app");
    ASSERT_TRUE(first.has_value());
    auto second = graph->getOrCreateRepository("app-renamed", "/srv/app");
    ASSERT_TRUE(second.has_value());

    EXPECT_EQ(first.value().id, second.value().id);
    EXPECT_FALSE(second.value().lastIndexed.has_value());

    auto byPath = graph->findRepositoryByPath("/srv/app");
    ASSERT_TRUE(byPath.has_value());
    ASSERT_TRUE(byPath.value().has_value());
    EXPECT_EQ(byPath.value()->id, first.value().id);

    auto missing = graph->findRepositoryByPath("/srv/other");
    ASSERT_TRUE(missing.has_value());
    EXPECT_FALSE(missing.value().has_value());
}

TEST_F(SqliteGraphStoreTest, UpdateLastIndexedRoundTripsMillis) {
    auto repo = makeRepository();
    const auto when = fromEpochMillis(1700000000123);

    ASSERT_TRUE(graph->updateLastIndexed(repo.id, when).has_value());
    auto loaded = graph->getRepository(repo.id);
    ASSERT_TRUE(loaded.has_value() && loaded.value().has_value());
    ASSERT_TRUE(loaded.value()->lastIndexed.has_value());
    EXPECT_EQ(toEpochMillis(*loaded.value()->lastIndexed), 1700000000123);

    EXPECT_THAT(graph->updateLastIndexed(repo.id + 100, when), HasErrorCode(ErrorCode::NotFound));
}

TEST_F(SqliteGraphStoreTest, FileUpsertUpdatesInPlace) {
    auto repo = makeRepository();
    File f;
    f.repoId = repo.id;
    f.path = "src/a.ts";
    f.size = 10;
    f.contentHash = "aaa";

    auto first = graph->upsertFiles({f});
    ASSERT_TRUE(first.has_value());

    f.size = 20;
    f.contentHash = "bbb";
    auto second = graph->upsertFiles({f});
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first.value()[0].id, second.value()[0].id);

    auto files = graph->getFilesByRepository(repo.id);
    ASSERT_TRUE(files.has_value());
    ASSERT_EQ(files.value().size(), 1u);
    EXPECT_EQ(files.value()[0].size, 20);
    EXPECT_EQ(files.value()[0].contentHash, "bbb");
}

TEST_F(SqliteGraphStoreTest, SymbolUpsertIsIdempotentOnPhysicalKey) {
    auto repo = makeRepository();
    auto file = makeFile(repo.id, "a.ts");

    Symbol s;
    s.fileId = file.id;
    s.name = "foo";
    s.qualifiedName = "a.foo";
    s.startLine = 3;
    s.endLine = 8;

    auto first = graph->upsertSymbols({s});
    ASSERT_TRUE(first.has_value());
    s.signature = "foo(): void";
    auto second = graph->upsertSymbols({s});
    ASSERT_TRUE(second.has_value());

    EXPECT_EQ(first.value()[0].id, second.value()[0].id);
    auto symbols = graph->getSymbolsByFile(file.id);
    ASSERT_TRUE(symbols.has_value());
    ASSERT_EQ(symbols.value().size(), 1u);
    EXPECT_EQ(symbols.value()[0].signature, "foo(): void");
}

TEST_F(SqliteGraphStoreTest, SymbolLookupsByNameAndQualifiedName) {
    auto repo = makeRepository();
    auto file = makeFile(repo.id, "a.ts");
    auto foo = makeSymbol(file.id, "foo", "a.foo");
    makeSymbol(file.id, "bar", "a.bar", SymbolKind::Function, 12, 20);

    auto byName = graph->findSymbolsByName(repo.id, "foo");
    ASSERT_TRUE(byName.has_value());
    ASSERT_EQ(byName.value().size(), 1u);
    EXPECT_EQ(byName.value()[0].id, foo.id);

    auto byQn = graph->findSymbolsByQualifiedName(repo.id, "a.bar");
    ASSERT_TRUE(byQn.has_value());
    ASSERT_EQ(byQn.value().size(), 1u);
    EXPECT_EQ(byQn.value()[0].name, "bar");
}

TEST_F(SqliteGraphStoreTest, DependencyUpsertMergesOnKey) {
    auto repo = makeRepository();
    auto file = makeFile(repo.id, "a.ts");
    auto caller = makeSymbol(file.id, "caller", "a.caller", SymbolKind::Function, 1, 5);
    auto callee = makeSymbol(file.id, "callee", "a.callee", SymbolKind::Function, 6, 9);

    Dependency d;
    d.fromSymbolId = caller.id;
    d.toSymbolId = callee.id;
    d.lineNumber = 3;
    d.parameterContext = "1, 2";

    auto first = graph->upsertDependencies({d});
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value().created, 1u);
    EXPECT_EQ(first.value().updated, 0u);

    d.parameterContext = "3, 4";
    d.parameterTypes = std::vector<std::string>{"number", "number"};
    auto second = graph->upsertDependencies({d});
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value().created, 0u);
    EXPECT_EQ(second.value().updated, 1u);
    EXPECT_EQ(second.value().rows[0].id, first.value().rows[0].id);

    auto all = graph->getDependenciesByRepository(repo.id);
    ASSERT_TRUE(all.has_value());
    ASSERT_EQ(all.value().size(), 1u);
    EXPECT_EQ(all.value()[0].parameterContext, "3, 4");
    ASSERT_TRUE(all.value()[0].parameterTypes.has_value());
    EXPECT_EQ(all.value()[0].parameterTypes->size(), 2u);
}

TEST_F(SqliteGraphStoreTest, UnresolvedDependencyReingestIsIdempotent) {
    auto repo = makeRepository();
    auto file = makeFile(repo.id, "b.ts");
    auto caller = makeSymbol(file.id, "caller");

    auto first = makeUnresolvedEdge(caller.id, "a.foo", 4);
    auto second = makeUnresolvedEdge(caller.id, "a.foo", 4);
    EXPECT_EQ(first.id, second.id);

    auto stats = graph->getGraphStats(repo.id);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats.value().dependencies, 1);
    EXPECT_EQ(stats.value().unresolvedDependencies, 1);
    EXPECT_EQ(stats.value().resolvedDependencies, 0);
}

TEST_F(SqliteGraphStoreTest, FindDependenciesByKeysReadsPersistedRows) {
    auto repo = makeRepository();
    auto file = makeFile(repo.id, "a.ts");
    auto a = makeSymbol(file.id, "a", std::nullopt, SymbolKind::Function, 1, 5);
    auto b = makeSymbol(file.id, "b", std::nullopt, SymbolKind::Function, 6, 9);
    auto resolved = makeEdge(a.id, b.id, 2);
    auto unresolved = makeUnresolvedEdge(a.id, "lib.fn", 3);

    Dependency k1;
    k1.fromSymbolId = a.id;
    k1.toSymbolId = b.id;
    k1.lineNumber = 2;
    Dependency k2;
    k2.fromSymbolId = a.id;
    k2.toQualifiedName = "lib.fn";
    k2.lineNumber = 3;
    Dependency missing;
    missing.fromSymbolId = a.id;
    missing.toSymbolId = b.id;
    missing.lineNumber = 99;

    auto found = graph->findDependenciesByKeys({k1, k2, missing});
    ASSERT_TRUE(found.has_value());
    ASSERT_EQ(found.value().size(), 2u);
    std::vector<DependencyId> ids{found.value()[0].id, found.value()[1].id};
    EXPECT_NE(std::find(ids.begin(), ids.end(), resolved.id), ids.end());
    EXPECT_NE(std::find(ids.begin(), ids.end(), unresolved.id), ids.end());
}

TEST_F(SqliteGraphStoreTest, DependenciesCarryEndpointContext) {
    auto repo = makeRepository();
    auto fa = makeFile(repo.id, "a.ts");
    auto fb = makeFile(repo.id, "b.ts");
    auto foo = makeSymbol(fa.id, "foo", "a.foo");
    auto caller = makeSymbol(fb.id, "caller", "b.caller");
    makeEdge(caller.id, foo.id, 7);

    auto into = graph->getDependenciesTo(foo.id);
    ASSERT_TRUE(into.has_value());
    ASSERT_EQ(into.value().size(), 1u);
    ASSERT_TRUE(into.value()[0].from.has_value());
    EXPECT_EQ(into.value()[0].from->name, "caller");
    EXPECT_EQ(into.value()[0].from->filePath, "b.ts");
    ASSERT_TRUE(into.value()[0].to.has_value());
    EXPECT_EQ(into.value()[0].to->filePath, "a.ts");

    auto out = graph->getDependenciesFrom(caller.id);
    ASSERT_TRUE(out.has_value());
    ASSERT_EQ(out.value().size(), 1u);
    EXPECT_EQ(out.value()[0].dependency.lineNumber, 7);
}

TEST_F(SqliteGraphStoreTest, UpdateSymbolParentsSkipsSelfLinks) {
    auto repo = makeRepository();
    auto file = makeFile(repo.id, "a.ts");
    auto cls = makeSymbol(file.id, "Cart", "Cart", SymbolKind::Class, 1, 30);
    auto method = makeSymbol(file.id, "add", "Cart.add", SymbolKind::Method, 3, 8);

    auto updated = graph->updateSymbolParents({{method.id, cls.id}, {cls.id, cls.id}});
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated.value(), 1u);

    auto loaded = graph->getSymbol(method.id);
    ASSERT_TRUE(loaded.has_value() && loaded.value().has_value());
    EXPECT_EQ(loaded.value()->parentSymbolId, cls.id);
}

TEST_F(SqliteGraphStoreTest, CleanupFileDataRemovesOutgoingEdgesAndSymbols) {
    auto repo = makeRepository();
    auto fa = makeFile(repo.id, "a.ts");
    auto fb = makeFile(repo.id, "b.ts");
    auto foo = makeSymbol(fa.id, "foo", "a.foo");
    auto caller = makeSymbol(fb.id, "caller", "b.caller");
    makeEdge(caller.id, foo.id, 2);
    ASSERT_TRUE(graph->upsertFileDependencies({{0, fb.id, fa.id, DependencyKind::Calls, 2}})
                    .has_value());

    auto cleaned = graph->cleanupFileData({fb.id});
    ASSERT_TRUE(cleaned.has_value());
    EXPECT_EQ(cleaned.value().dependencies, 1u);
    EXPECT_EQ(cleaned.value().fileDependencies, 1u);
    EXPECT_EQ(cleaned.value().symbols, 1u);

    auto files = graph->getFilesByRepository(repo.id);
    ASSERT_TRUE(files.has_value());
    EXPECT_EQ(files.value().size(), 2u);
    auto symbols = graph->getSymbolsByRepository(repo.id);
    ASSERT_TRUE(symbols.has_value());
    ASSERT_EQ(symbols.value().size(), 1u);
    EXPECT_EQ(symbols.value()[0].id, foo.id);
}

TEST_F(SqliteGraphStoreTest, RemovingTargetSymbolRevertsEdgeToUnresolved) {
    auto repo = makeRepository();
    auto fa = makeFile(repo.id, "a.ts");
    auto fb = makeFile(repo.id, "b.ts");
    auto foo = makeSymbol(fa.id, "foo", "a.foo");
    auto caller = makeSymbol(fb.id, "caller", "b.caller");

    Dependency d;
    d.fromSymbolId = caller.id;
    d.toSymbolId = foo.id;
    d.toQualifiedName = "a.foo";
    d.lineNumber = 5;
    ASSERT_TRUE(graph->upsertDependencies({d}).has_value());

    auto deleted = graph->deleteFiles({fa.id});
    ASSERT_TRUE(deleted.has_value());
    EXPECT_EQ(deleted.value(), 1u);

    auto deps = graph->getDependenciesByRepository(repo.id);
    ASSERT_TRUE(deps.has_value());
    ASSERT_EQ(deps.value().size(), 1u);
    EXPECT_FALSE(deps.value()[0].toSymbolId.has_value());
    EXPECT_EQ(deps.value()[0].toQualifiedName, "a.foo");
}

TEST_F(SqliteGraphStoreTest, DeleteRepositoryCascades) {
    auto repo = makeRepository();
    auto file = makeFile(repo.id, "a.ts");
    auto a = makeSymbol(file.id, "a", std::nullopt, SymbolKind::Function, 1, 5);
    auto b = makeSymbol(file.id, "b", std::nullopt, SymbolKind::Function, 6, 9);
    makeEdge(a.id, b.id, 2);

    auto deleted = graph->deleteRepository(repo.id);
    ASSERT_TRUE(deleted.has_value());
    EXPECT_TRUE(deleted.value());

    auto stats = graph->getGraphStats(repo.id);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats.value().files, 0);
    EXPECT_EQ(stats.value().symbols, 0);
    EXPECT_EQ(stats.value().dependencies, 0);

    auto again = graph->deleteRepository(repo.id);
    ASSERT_TRUE(again.has_value());
    EXPECT_FALSE(again.value());
}

TEST_F(SqliteGraphStoreTest, ClearRepositoryDataKeepsRepository) {
    auto repo = makeRepository();
    makeFile(repo.id, "a.ts");
    ASSERT_TRUE(graph->updateLastIndexed(repo.id, std::chrono::system_clock::now()).has_value());

    ASSERT_TRUE(graph->clearRepositoryData(repo.id).has_value());

    auto loaded = graph->getRepository(repo.id);
    ASSERT_TRUE(loaded.has_value() && loaded.value().has_value());
    EXPECT_FALSE(loaded.value()->lastIndexed.has_value());
    auto files = graph->getFilesByRepository(repo.id);
    ASSERT_TRUE(files.has_value());
    EXPECT_TRUE(files.value().empty());
}

TEST_F(SqliteGraphStoreTest, FileDependencyUpsertMergesOnKey) {
    auto repo = makeRepository();
    auto fa = makeFile(repo.id, "a.ts");
    auto fb = makeFile(repo.id, "b.ts");

    ASSERT_TRUE(graph->upsertFileDependencies({{0, fa.id, fb.id, DependencyKind::Imports, 1}})
                    .has_value());
    ASSERT_TRUE(graph->upsertFileDependencies({{0, fa.id, fb.id, DependencyKind::Imports, 4}})
                    .has_value());

    auto deps = graph->getFileDependencies(repo.id);
    ASSERT_TRUE(deps.has_value());
    ASSERT_EQ(deps.value().size(), 1u);
    EXPECT_EQ(deps.value()[0].lineNumber, 4);
}
