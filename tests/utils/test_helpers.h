#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <spdlog/fmt/fmt.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <codegraph/core/types.h>
#include <codegraph/store/graph_store.h>

namespace codegraph::test {

// Base test fixture with a private scratch directory under TMPDIR
class CodegraphTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / generateTestId();
        std::filesystem::create_directories(testDir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir, ec);
    }

    std::filesystem::path writeFile(std::string_view relative, std::string_view content) {
        auto path = testDir / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.close();
        if (!file) {
            throw std::runtime_error("Failed to create test file");
        }
        return path;
    }

protected:
    std::filesystem::path testDir;

private:
    static std::string generateTestId() {
        static std::mt19937_64 rng{std::random_device{}()};
        auto now = std::chrono::system_clock::now().time_since_epoch().count();
        return fmt::format("codegraph_test_{}_{}", now, rng());
    }
};

// Fixture owning a freshly migrated SQLite graph store
class GraphStoreTest : public CodegraphTest {
protected:
    void SetUp() override {
        CodegraphTest::SetUp();
        auto opened = store::makeSqliteGraphStore((testDir / "graph.db").string());
        ASSERT_TRUE(opened.has_value()) << opened.error().message;
        graph = std::move(opened).value();
    }

    void TearDown() override {
        graph.reset();
        CodegraphTest::TearDown();
    }

    store::Repository makeRepository(const std::string& name = "repo") {
        auto repo = graph->getOrCreateRepository(name, (testDir / name).string());
        EXPECT_TRUE(repo.has_value());
        return repo.value();
    }

    store::File makeFile(RepositoryId repoId, const std::string& path) {
        store::File f;
        f.repoId = repoId;
        f.path = path;
        f.language = "typescript";
        auto stored = graph->upsertFiles({f});
        EXPECT_TRUE(stored.has_value());
        return stored.value().front();
    }

    store::Symbol makeSymbol(FileId fileId, const std::string& name,
                             std::optional<std::string> qualifiedName = std::nullopt,
                             store::SymbolKind kind = store::SymbolKind::Function,
                             int startLine = 1, int endLine = 10) {
        store::Symbol s;
        s.fileId = fileId;
        s.name = name;
        s.qualifiedName = std::move(qualifiedName);
        s.kind = kind;
        s.startLine = startLine;
        s.endLine = endLine;
        auto stored = graph->upsertSymbols({s});
        EXPECT_TRUE(stored.has_value());
        return stored.value().front();
    }

    store::Dependency makeEdge(SymbolId from, SymbolId to, int line,
                               store::DependencyKind kind = store::DependencyKind::Calls) {
        store::Dependency d;
        d.fromSymbolId = from;
        d.toSymbolId = to;
        d.kind = kind;
        d.lineNumber = line;
        auto stored = graph->upsertDependencies({d});
        EXPECT_TRUE(stored.has_value());
        return stored.value().rows.front();
    }

    store::Dependency makeUnresolvedEdge(SymbolId from, const std::string& qualifiedName, int line,
                                         store::DependencyKind kind = store::DependencyKind::Calls) {
        store::Dependency d;
        d.fromSymbolId = from;
        d.toQualifiedName = qualifiedName;
        d.kind = kind;
        d.lineNumber = line;
        auto stored = graph->upsertDependencies({d});
        EXPECT_TRUE(stored.has_value());
        return stored.value().rows.front();
    }

    std::unique_ptr<store::GraphStore> graph;
};

MATCHER_P(HasErrorCode, code, "Result has expected error code") {
    return !arg.has_value() && arg.error() == code;
}

MATCHER_P(HasValue, value, "Result has expected value") {
    return arg.has_value() && arg.value() == value;
}

// SHA-256 test vectors
struct TestVectors {
    static constexpr std::string_view EMPTY_SHA256 =
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

    static constexpr std::string_view ABC_SHA256 =
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
};

} // namespace codegraph::test
