#pragma once

#include <optional>
#include <string>
#include <vector>
#include <codegraph/core/types.h>
#include <codegraph/store/entities.h>

namespace codegraph::ingest {

/**
 * @brief Symbol as reported by a language parser, before it has an id
 */
struct ParsedSymbol {
    std::string name;
    std::optional<std::string> qualifiedName;
    store::SymbolKind kind = store::SymbolKind::Function;
    int startLine = 0;
    int endLine = 0;
    bool isExported = false;
    std::optional<std::string> signature;
    std::optional<std::string> description;
};

/**
 * @brief Edge as reported by a parser; both ends are names, not ids
 */
struct ParsedDependency {
    std::string fromSymbol;
    std::string toSymbol;
    store::DependencyKind kind = store::DependencyKind::Calls;
    int lineNumber = 0;
    std::optional<std::string> callingObject;
    std::optional<std::string> resolvedClass;
    std::optional<std::string> qualifiedContext;
    std::optional<std::string> parameterContext;
    std::optional<std::string> parameterTypes; ///< Raw JSON array of type names
    std::optional<std::string> callInstanceId;
};

enum class ImportType { Named, Default, Namespace, SideEffect };

struct ParsedImport {
    std::string source;
    std::vector<std::string> importedNames;
    ImportType type = ImportType::Named;
    int lineNumber = 0;
    bool isDynamic = false;
};

struct ParseError {
    std::string message;
    int line = 0;
    int column = 0;
};

struct ParseResult {
    std::vector<ParsedSymbol> symbols;
    std::vector<ParsedDependency> dependencies;
    std::vector<ParsedImport> imports;
    std::vector<ParseError> errors;
};

/**
 * @brief Parser output tagged with the repository-relative path it came from
 */
struct ParsedFile {
    std::string path;
    ParseResult result;
};

/**
 * @brief Per-language parser collaborator
 *
 * Implementations must be safe to call concurrently for different files.
 */
class SourceParser {
public:
    virtual ~SourceParser() = default;

    /**
     * @param relativePath Repository-relative path, forward slashes
     * @param content Full file contents
     */
    virtual Result<ParseResult> parse(const std::string& relativePath,
                                      const std::string& content) = 0;
};

} // namespace codegraph::ingest
