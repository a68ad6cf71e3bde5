#include <gtest/gtest.h>
#include <codegraph/resolve/resolution_pass.h>
#include <codegraph/store/database.h>
#include "../../utils/test_helpers.h"

using namespace codegraph;
using namespace codegraph::resolve;
using namespace std::chrono_literals;
using codegraph::store::DependencyKind;

class ResolutionPassTest : public test::GraphStoreTest {
protected:
    void SetUp() override {
        GraphStoreTest::SetUp();
        repo = makeRepository();
        fileA = makeFile(repo.id, "src/a.ts");
        fileB = makeFile(repo.id, "src/b.ts");
        foo = makeSymbol(fileA.id, "foo", "a.foo");
        bar = makeSymbol(fileB.id, "bar", "b.bar");
    }

    // Writes bypassing the store, for rows its upsert path never produces
    void rawExecute(const std::string& sql) {
        store::Database db;
        ASSERT_TRUE(db.open((testDir / "graph.db").string()).has_value());
        auto r = db.execute(sql);
        ASSERT_TRUE(r.has_value()) << r.error().message;
    }

    std::vector<store::Dependency> dependencies() {
        auto deps = graph->getDependenciesByRepository(repo.id);
        EXPECT_TRUE(deps.has_value());
        return deps.value();
    }

    store::Repository repo;
    store::File fileA;
    store::File fileB;
    store::Symbol foo;
    store::Symbol bar;
};

TEST_F(ResolutionPassTest, BindsAcrossFilesAndConverges) {
    makeUnresolvedEdge(foo.id, "b.bar", 3);
    ResolutionPass pass(*graph, 5s);

    auto first = pass.run(repo.id);
    ASSERT_TRUE(first.has_value()) << first.error().message;
    EXPECT_EQ(first.value().resolved, 1u);
    EXPECT_EQ(first.value().orphans.total(), 0u);

    auto deps = dependencies();
    ASSERT_EQ(deps.size(), 1u);
    EXPECT_EQ(deps[0].toSymbolId, bar.id);
    EXPECT_EQ(deps[0].toQualifiedName, "b.bar");

    auto second = pass.run(repo.id);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value().deduplicated, 0u);
    EXPECT_EQ(second.value().resolved, 0u);
    EXPECT_EQ(second.value().orphans.total(), 0u);
    EXPECT_EQ(dependencies().size(), 1u);
}

TEST_F(ResolutionPassTest, AmbiguousNamesStayUnresolved) {
    auto fileC = makeFile(repo.id, "src/c.ts");
    makeSymbol(fileA.id, "dup", "x.dup", store::SymbolKind::Function, 20, 25);
    makeSymbol(fileC.id, "dup", "x.dup");
    makeUnresolvedEdge(foo.id, "x.dup", 4);

    ResolutionPass pass(*graph, 5s);
    auto counts = pass.run(repo.id);
    ASSERT_TRUE(counts.has_value());
    EXPECT_EQ(counts.value().resolved, 0u);
    EXPECT_EQ(counts.value().orphans.total(), 0u);

    auto deps = dependencies();
    ASSERT_EQ(deps.size(), 1u);
    EXPECT_TRUE(deps[0].isUnresolved());
}

TEST_F(ResolutionPassTest, OrphanCleanupKeepsExternalImports) {
    makeUnresolvedEdge(foo.id, "lodash", 1, DependencyKind::Imports);
    makeUnresolvedEdge(foo.id, "nowhere.fn", 5);

    ResolutionPass pass(*graph, 5s);
    auto counts = pass.run(repo.id);
    ASSERT_TRUE(counts.has_value());
    EXPECT_EQ(counts.value().orphans.unmatched, 1u);
    EXPECT_EQ(counts.value().orphans.withoutTarget, 0u);

    auto deps = dependencies();
    ASSERT_EQ(deps.size(), 1u);
    EXPECT_EQ(deps[0].kind, DependencyKind::Imports);
    EXPECT_EQ(deps[0].toQualifiedName, "lodash");
}

TEST_F(ResolutionPassTest, DuplicatesCollapseBeforeBinding) {
    const std::string insert =
        "INSERT INTO dependencies (from_symbol_id, to_symbol_id, dependency_type, line_number, "
        "to_qualified_name, created_at, updated_at) VALUES (" +
        std::to_string(foo.id) + ", NULL, 'calls', 7, 'b.bar', 1, 1)";
    rawExecute(insert);
    rawExecute(insert);
    ASSERT_EQ(dependencies().size(), 2u);

    ResolutionPass pass(*graph, 5s);
    auto counts = pass.run(repo.id);
    ASSERT_TRUE(counts.has_value()) << counts.error().message;
    EXPECT_EQ(counts.value().deduplicated, 1u);
    EXPECT_EQ(counts.value().resolved, 1u);

    auto deps = dependencies();
    ASSERT_EQ(deps.size(), 1u);
    EXPECT_EQ(deps[0].toSymbolId, bar.id);
}

TEST_F(ResolutionPassTest, ResolvedTwinWinsOverUnresolvedCopy) {
    makeEdge(foo.id, bar.id, 3);
    makeUnresolvedEdge(foo.id, "b.bar", 3);

    ResolutionPass pass(*graph, 5s);
    auto bound = pass.resolveQualifiedNames(repo.id);
    ASSERT_TRUE(bound.has_value()) << bound.error().message;
    EXPECT_EQ(bound.value(), 0u);

    auto deps = dependencies();
    ASSERT_EQ(deps.size(), 1u);
    EXPECT_EQ(deps[0].toSymbolId, bar.id);
}

TEST_F(ResolutionPassTest, EdgesWithoutAnyTargetAreRemoved) {
    rawExecute("INSERT INTO dependencies (from_symbol_id, to_symbol_id, dependency_type, "
               "line_number, to_qualified_name, created_at, updated_at) VALUES (" +
               std::to_string(foo.id) + ", NULL, 'calls', 9, NULL, 1, 1)");

    ResolutionPass pass(*graph, 5s);
    auto removed = pass.cleanupOrphans(repo.id);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed.value(), 1u);
    EXPECT_TRUE(dependencies().empty());
}

TEST_F(ResolutionPassTest, RebindsWhenTargetMovesToAnotherFile) {
    store::Dependency edge;
    edge.fromSymbolId = foo.id;
    edge.toSymbolId = bar.id;
    edge.toQualifiedName = "b.bar";
    edge.lineNumber = 3;
    ASSERT_TRUE(graph->upsertDependencies({edge}).has_value());

    ASSERT_TRUE(graph->deleteFiles({fileB.id}).has_value());
    ASSERT_TRUE(dependencies().at(0).isUnresolved());

    auto fileC = makeFile(repo.id, "src/c.ts");
    auto moved = makeSymbol(fileC.id, "bar", "b.bar");

    ResolutionPass pass(*graph, 5s);
    auto counts = pass.run(repo.id);
    ASSERT_TRUE(counts.has_value());
    EXPECT_EQ(counts.value().resolved, 1u);

    auto deps = dependencies();
    ASSERT_EQ(deps.size(), 1u);
    EXPECT_EQ(deps[0].toSymbolId, moved.id);
}

TEST_F(ResolutionPassTest, OtherRepositoriesAreUntouched) {
    auto other = makeRepository("other");
    auto otherFile = makeFile(other.id, "src/x.ts");
    auto otherSym = makeSymbol(otherFile.id, "x", "x.x");
    makeUnresolvedEdge(otherSym.id, "b.bar", 2);

    ResolutionPass pass(*graph, 5s);
    ASSERT_TRUE(pass.run(repo.id).has_value());

    auto deps = graph->getDependenciesByRepository(other.id);
    ASSERT_TRUE(deps.has_value());
    ASSERT_EQ(deps.value().size(), 1u);
    EXPECT_TRUE(deps.value()[0].isUnresolved());
}
