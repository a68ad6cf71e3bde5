#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <codegraph/core/types.h>

namespace codegraph::store {

/**
 * @brief Kind of a code entity
 */
enum class SymbolKind {
    Function,
    Class,
    Interface,
    Variable,
    Constant,
    TypeAlias,
    Enum,
    Method,
    Property,
    Trait,
    Component
};

/**
 * @brief Kind of a directed edge between symbols or files
 */
enum class DependencyKind { Calls, Imports, Inherits, Implements, References, Exports };

const char* toString(SymbolKind kind);
const char* toString(DependencyKind kind);
std::optional<SymbolKind> parseSymbolKind(std::string_view s);
std::optional<DependencyKind> parseDependencyKind(std::string_view s);

/// Kinds that may own methods and properties
inline bool isContainerKind(SymbolKind kind) {
    return kind == SymbolKind::Class || kind == SymbolKind::Interface || kind == SymbolKind::Trait;
}

/// Kinds that may be owned by a container
inline bool isMemberKind(SymbolKind kind) {
    return kind == SymbolKind::Method || kind == SymbolKind::Property;
}

// Timestamps are persisted as unix epoch milliseconds
inline int64_t toEpochMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline TimePoint fromEpochMillis(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}

/**
 * @brief A tracked codebase root
 */
struct Repository {
    RepositoryId id = 0;
    std::string name;
    std::string path;
    std::optional<TimePoint> lastIndexed; ///< Set at the end of each successful analysis
};

/**
 * @brief A source file inside a repository, unique by (repoId, path)
 */
struct File {
    FileId id = 0;
    RepositoryId repoId = 0;
    std::string path; ///< Relative to the repository root, forward slashes
    std::optional<std::string> language;
    int64_t size = 0;
    std::optional<std::string> contentHash; ///< Lowercase hex SHA-256
    std::optional<TimePoint> lastModified;
    bool isGenerated = false;
    bool isTest = false;
};

/**
 * @brief A named code entity owned by exactly one file
 *
 * Physical identity is (fileId, name, kind, startLine).
 */
struct Symbol {
    SymbolId id = 0;
    FileId fileId = 0;
    std::string name;
    std::optional<std::string> qualifiedName;
    std::optional<SymbolId> parentSymbolId; ///< Index into the symbols table, never an owning link
    SymbolKind kind = SymbolKind::Function;
    int startLine = 0;
    int endLine = 0;
    bool isExported = false;
    std::optional<std::string> signature;
    std::optional<std::string> description;
};

/**
 * @brief Directed edge between two symbols
 *
 * Unique by (fromSymbolId, toSymbolId, kind, lineNumber). An edge with a
 * qualified-name target and no toSymbolId is unresolved.
 */
struct Dependency {
    DependencyId id = 0;
    SymbolId fromSymbolId = 0;
    std::optional<SymbolId> toSymbolId;
    DependencyKind kind = DependencyKind::Calls;
    int lineNumber = 0;
    std::optional<std::string> toQualifiedName;

    // Enhanced call context
    std::optional<std::string> callingObject;
    std::optional<std::string> resolvedClass;
    std::optional<std::string> qualifiedContext;
    std::optional<std::string> parameterContext;
    std::optional<std::vector<std::string>> parameterTypes;
    std::optional<std::string> callInstanceId;

    bool isResolved() const { return toSymbolId.has_value(); }
    bool isUnresolved() const { return !toSymbolId.has_value() && toQualifiedName.has_value(); }
};

/**
 * @brief Directed edge between two files, unique by (fromFileId, toFileId, kind)
 */
struct FileDependency {
    int64_t id = 0;
    FileId fromFileId = 0;
    FileId toFileId = 0;
    DependencyKind kind = DependencyKind::Imports;
    std::optional<int> lineNumber;
};

/**
 * @brief Symbol endpoint annotation used by query results
 */
struct SymbolRef {
    SymbolId id = 0;
    std::string name;
    SymbolKind kind = SymbolKind::Function;
    std::string filePath;
};

/**
 * @brief Dependency together with the symbols and files at both ends
 */
struct DependencyWithContext {
    Dependency dependency;
    std::optional<SymbolRef> from;
    std::optional<SymbolRef> to; ///< Empty while unresolved
};

/**
 * @brief Outcome of one dependency upsert batch
 */
struct DependencyUpsertResult {
    std::vector<Dependency> rows; ///< Persisted rows, ids populated
    size_t created = 0;
    size_t updated = 0;
};

/**
 * @brief Row counts removed by a file data cleanup
 */
struct FileCleanupCounts {
    size_t dependencies = 0;
    size_t fileDependencies = 0;
    size_t symbols = 0;
};

/**
 * @brief Rows removed by orphan cleanup, by rule
 */
struct OrphanCleanupCounts {
    size_t withoutTarget = 0; ///< Neither resolved nor carrying a qualified name
    size_t unmatched = 0;     ///< Qualified name matches no symbol in the repository

    size_t total() const { return withoutTarget + unmatched; }
};

struct GraphStats {
    int64_t files = 0;
    int64_t symbols = 0;
    int64_t dependencies = 0;
    int64_t resolvedDependencies = 0;
    int64_t unresolvedDependencies = 0;
    int64_t fileDependencies = 0;
};

// ===== Traversal records =====

enum class TraversalDirection {
    Callers,     ///< Follow edges backwards: who depends on the seed
    Dependencies ///< Follow edges forwards: what the seed depends on
};

const char* toString(TraversalDirection direction);

struct TraversalQuery {
    SymbolId seedSymbolId = 0;
    TraversalDirection direction = TraversalDirection::Callers;
    int maxDepth = 10;
    std::vector<DependencyKind> kinds; ///< Empty means all kinds
    size_t limit = 1000;
};

/**
 * @brief One edge reached by a transitive traversal
 */
struct TraversalEdge {
    DependencyId dependencyId = 0;
    SymbolId fromSymbolId = 0;
    std::optional<SymbolId> toSymbolId;
    DependencyKind kind = DependencyKind::Calls;
    int lineNumber = 0;
    int depth = 0;
    std::optional<std::string> toQualifiedName;
    std::optional<SymbolRef> from;
    std::optional<SymbolRef> to;
};

/**
 * @brief A raw call edge into a symbol, with its call-site context
 */
struct CallSite {
    DependencyId dependencyId = 0;
    SymbolId callerSymbolId = 0;
    std::string callerName;
    std::string filePath;
    int lineNumber = 0;
    std::optional<std::string> parameterContext;
    std::optional<std::vector<std::string>> parameterTypes;
    std::optional<std::string> callInstanceId;
};

} // namespace codegraph::store
