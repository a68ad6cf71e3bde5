#include <gtest/gtest.h>
#include <map>
#include <mutex>
#include <stdexcept>
#include <codegraph/analysis/graph_analyzer.h>
#include <codegraph/traverse/traversal_engine.h>
#include "../../utils/test_helpers.h"

using namespace codegraph;
using namespace codegraph::analysis;
using namespace codegraph::test;
using namespace std::chrono_literals;
using codegraph::store::DependencyKind;
using codegraph::store::SymbolKind;

namespace {

// Parser returning canned results per path
class ScriptedParser : public ingest::SourceParser {
public:
    Result<ingest::ParseResult> parse(const std::string& relativePath,
                                      const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        if (throwing_.count(relativePath))
            throw std::runtime_error("grammar crashed");
        if (failing_.count(relativePath))
            return Error{ErrorCode::InvalidData, "unsupported syntax"};
        auto it = results_.find(relativePath);
        if (it == results_.end())
            return ingest::ParseResult{};
        return it->second;
    }

    void set(const std::string& path, ingest::ParseResult result) {
        std::lock_guard<std::mutex> lock(mutex_);
        results_[path] = std::move(result);
    }
    void fail(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_[path] = true;
    }
    void crash(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        throwing_[path] = true;
    }
    size_t calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    std::mutex mutex_;
    std::map<std::string, ingest::ParseResult> results_;
    std::map<std::string, bool> failing_;
    std::map<std::string, bool> throwing_;
    size_t calls_ = 0;
};

ingest::ParsedSymbol parsedSymbol(const std::string& name, const std::string& qn, int start,
                                  int end) {
    ingest::ParsedSymbol s;
    s.name = name;
    s.qualifiedName = qn;
    s.kind = SymbolKind::Function;
    s.startLine = start;
    s.endLine = end;
    s.isExported = true;
    return s;
}

} // namespace

class GraphAnalyzerTest : public GraphStoreTest {
protected:
    void SetUp() override {
        GraphStoreTest::SetUp();
        root = testDir / "project";
        writeFile("project/src/a.ts", "import { helper } from './b';\nhelper();\n");
        writeFile("project/src/b.ts", "export function helper() {}\n");

        ingest::ParseResult a;
        a.symbols = {parsedSymbol("main", "a.main", 1, 5)};
        ingest::ParsedImport imp;
        imp.source = "./b";
        imp.importedNames = {"helper"};
        imp.lineNumber = 1;
        a.imports = {imp};
        ingest::ParsedDependency call;
        call.fromSymbol = "main";
        call.toSymbol = "b.helper";
        call.lineNumber = 2;
        call.parameterContext = "()";
        a.dependencies = {call};
        parser.set("src/a.ts", a);

        ingest::ParseResult b;
        b.symbols = {parsedSymbol("helper", "b.helper", 1, 3)};
        parser.set("src/b.ts", b);

        config.analysis.parseChunkSize = 1;
        config.analysis.parseConcurrency = 2;
        config.analysis.resolutionTimeout = 5s;
    }

    // Files on disk are older than any run unless bumped
    detect::StatFunction stat() {
        return [this](const std::string& path) -> Result<std::optional<TimePoint>> {
            std::lock_guard<std::mutex> lock(statMutex);
            if (!std::filesystem::exists(path))
                return std::optional<TimePoint>{};
            auto it = bumped.find(path);
            if (it != bumped.end())
                return std::optional<TimePoint>(it->second);
            return std::optional<TimePoint>(TimePoint(std::chrono::hours(24 * 365 * 50)));
        };
    }

    void bump(const std::string& relative) {
        std::lock_guard<std::mutex> lock(statMutex);
        bumped[(root / relative).string()] = std::chrono::system_clock::now() + 1h;
    }

    Result<AnalysisResult> analyze(bool forceFull = false, cache::ResultCache* cache = nullptr) {
        GraphAnalyzer analyzer(*graph, parser, discovery, config, cache, &stats, stat());
        return analyzer.analyzeRepository(root.string(), "project", forceFull);
    }

    std::optional<store::Symbol> symbolByQualifiedName(RepositoryId repoId, const std::string& qn) {
        auto found = graph->findSymbolsByQualifiedName(repoId, qn);
        EXPECT_TRUE(found.has_value());
        if (!found || found.value().empty())
            return std::nullopt;
        return found.value().front();
    }

    std::filesystem::path root;
    ScriptedParser parser;
    detect::FilesystemDiscovery discovery;
    config::GraphConfig config;
    AnalysisStatistics stats;
    std::mutex statMutex;
    std::map<std::string, TimePoint> bumped;
};

TEST_F(GraphAnalyzerTest, FirstRunResolvesAcrossFiles) {
    auto result = analyze();
    ASSERT_TRUE(result.has_value()) << result.error().message;

    const auto& r = result.value();
    EXPECT_TRUE(r.fullAnalysis);
    EXPECT_EQ(r.filesNew, 2u);
    EXPECT_EQ(r.filesParsed, 2u);
    EXPECT_EQ(r.parseFailures, 0u);
    EXPECT_EQ(r.ingest.symbols, 2u);
    EXPECT_EQ(r.edgesBuilt, 1u);
    EXPECT_EQ(r.resolution.resolved, 1u);
    ASSERT_TRUE(r.repository.lastIndexed.has_value());

    auto helper = symbolByQualifiedName(r.repository.id, "b.helper");
    auto caller = symbolByQualifiedName(r.repository.id, "a.main");
    ASSERT_TRUE(helper && caller);

    traverse::TraversalEngine engine(*graph, config.traversal);
    traverse::TraversalRequest request;
    request.symbolId = helper->id;
    request.maxDepth = 1;
    auto callers = engine.traverse(request);
    ASSERT_TRUE(callers.has_value());
    ASSERT_EQ(callers.value().edges.size(), 1u);
    EXPECT_EQ(callers.value().edges[0].fromSymbolId, caller->id);

    auto files = graph->getFilesByRepository(r.repository.id);
    ASSERT_TRUE(files.has_value());
    ASSERT_EQ(files.value().size(), 2u);
    for (const auto& f : files.value()) {
        EXPECT_EQ(f.language, "typescript");
        EXPECT_TRUE(f.contentHash.has_value());
        EXPECT_EQ(f.contentHash->size(), 64u);
    }

    // Import edge plus the cross-file call, merged per (from, to, kind)
    auto fileDeps = graph->getFileDependencies(r.repository.id);
    ASSERT_TRUE(fileDeps.has_value());
    EXPECT_EQ(fileDeps.value().size(), 2u);
}

TEST_F(GraphAnalyzerTest, SecondRunWithoutChangesIsANoOp) {
    ASSERT_TRUE(analyze().has_value());
    const size_t parsedBefore = parser.calls();

    auto second = analyze();
    ASSERT_TRUE(second.has_value()) << second.error().message;
    const auto& r = second.value();
    EXPECT_FALSE(r.fullAnalysis);
    EXPECT_EQ(r.filesNew, 0u);
    EXPECT_EQ(r.filesChanged, 0u);
    EXPECT_EQ(r.filesDeleted, 0u);
    EXPECT_EQ(r.filesParsed, 0u);
    EXPECT_EQ(parser.calls(), parsedBefore);

    auto graphStats = graph->getGraphStats(r.repository.id);
    ASSERT_TRUE(graphStats.has_value());
    EXPECT_EQ(graphStats.value().symbols, 2);
    EXPECT_EQ(graphStats.value().resolvedDependencies, 1);
}

TEST_F(GraphAnalyzerTest, ChangedFileIsReparsed) {
    ASSERT_TRUE(analyze().has_value());

    ingest::ParseResult a;
    a.symbols = {parsedSymbol("main", "a.main", 1, 5), parsedSymbol("extra", "a.extra", 7, 9)};
    parser.set("src/a.ts", a);
    writeFile("project/src/a.ts", "export function main() {}\nfunction extra() {}\n");
    bump("src/a.ts");

    auto result = analyze();
    ASSERT_TRUE(result.has_value()) << result.error().message;
    const auto& r = result.value();
    EXPECT_EQ(r.filesChanged, 1u);
    EXPECT_EQ(r.filesParsed, 1u);
    EXPECT_EQ(r.cleanup.symbols, 1u);
    EXPECT_EQ(r.cleanup.dependencies, 1u);

    auto graphStats = graph->getGraphStats(r.repository.id);
    ASSERT_TRUE(graphStats.has_value());
    EXPECT_EQ(graphStats.value().symbols, 3);
    EXPECT_EQ(graphStats.value().dependencies, 0);
}

TEST_F(GraphAnalyzerTest, DeletedFileDropsItsEdges) {
    ASSERT_TRUE(analyze().has_value());
    std::filesystem::remove(root / "src/b.ts");

    auto result = analyze();
    ASSERT_TRUE(result.has_value()) << result.error().message;
    const auto& r = result.value();
    EXPECT_EQ(r.filesDeleted, 1u);
    // The call lost its target and no other symbol carries the name
    EXPECT_EQ(r.resolution.orphans.unmatched, 1u);

    auto graphStats = graph->getGraphStats(r.repository.id);
    ASSERT_TRUE(graphStats.has_value());
    EXPECT_EQ(graphStats.value().files, 1);
    EXPECT_EQ(graphStats.value().dependencies, 0);
}

TEST_F(GraphAnalyzerTest, ParseFailuresAreSkippedAndCounted) {
    writeFile("project/src/broken.ts", "export function (");
    writeFile("project/src/crashy.ts", "???");
    parser.fail("src/broken.ts");
    parser.crash("src/crashy.ts");

    auto result = analyze();
    ASSERT_TRUE(result.has_value()) << result.error().message;
    const auto& r = result.value();
    EXPECT_EQ(r.filesNew, 4u);
    EXPECT_EQ(r.filesParsed, 2u);
    EXPECT_EQ(r.parseFailures, 2u);
    ASSERT_EQ(r.errors.size(), 2u);
    EXPECT_EQ(stats.parseFailures.load(), 2u);
    EXPECT_EQ(r.resolution.resolved, 1u);

    // Failed files are not stored, so the next run retries them
    auto files = graph->getFilesByRepository(r.repository.id);
    ASSERT_TRUE(files.has_value());
    EXPECT_EQ(files.value().size(), 2u);
}

TEST_F(GraphAnalyzerTest, ForcedRunRebuildsEverything) {
    ASSERT_TRUE(analyze().has_value());

    auto forced = analyze(true);
    ASSERT_TRUE(forced.has_value()) << forced.error().message;
    const auto& r = forced.value();
    EXPECT_TRUE(r.fullAnalysis);
    EXPECT_EQ(r.filesNew, 2u);
    EXPECT_EQ(r.resolution.resolved, 1u);

    auto graphStats = graph->getGraphStats(r.repository.id);
    ASSERT_TRUE(graphStats.has_value());
    EXPECT_EQ(graphStats.value().files, 2);
    EXPECT_EQ(graphStats.value().symbols, 2);
    EXPECT_EQ(graphStats.value().dependencies, 1);
}

TEST_F(GraphAnalyzerTest, AnalysisDropsCachedTraversals) {
    config::CacheConfig cacheConfig;
    cacheConfig.ttl = 0ms;
    cache::ResultCache cache(cacheConfig);

    auto first = analyze(false, &cache);
    ASSERT_TRUE(first.has_value());
    auto helper = symbolByQualifiedName(first.value().repository.id, "b.helper");
    ASSERT_TRUE(helper);

    traverse::TraversalEngine engine(*graph, config.traversal, &cache);
    traverse::TraversalRequest request;
    request.symbolId = helper->id;
    ASSERT_TRUE(engine.traverse(request).has_value());
    ASSERT_EQ(cache.size(), 1u);

    auto second = analyze(false, &cache);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value().cacheEntriesInvalidated, 1u);
    EXPECT_EQ(cache.size(), 0u);
}
