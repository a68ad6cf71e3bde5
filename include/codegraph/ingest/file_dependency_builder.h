#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <codegraph/ingest/parsed_types.h>
#include <codegraph/store/entities.h>

namespace codegraph::ingest {

/**
 * @brief Derives file-level edges for one repository
 *
 * External usage (static calls, imported callees, package imports) is recorded
 * as a self-edge on the using file, since its target lives outside the
 * repository.
 */
class FileDependencyBuilder {
public:
    /**
     * @param repoFiles Every stored file of the repository, used to resolve import paths
     */
    explicit FileDependencyBuilder(const std::vector<store::File>& repoFiles);

    /**
     * @brief File edges for resolved symbol edges whose endpoints live in different files
     * @param symbols Symbols covering both ends of @p dependencies
     */
    std::vector<store::FileDependency>
    fromSymbolEdges(const std::vector<store::Dependency>& dependencies,
                    const std::vector<store::Symbol>& symbols) const;

    /**
     * @brief File edges for imports and external calls found by the parser
     */
    std::vector<store::FileDependency> fromParsedFiles(const std::vector<ParsedFile>& parsed) const;

    /**
     * @brief Map a local import of @p fromPath onto a stored file
     *
     * Tries the path as given, with each known source extension, then as a
     * directory with an index file.
     */
    std::optional<FileId> resolveImport(const std::string& fromPath,
                                        const std::string& source) const;

    /// True unless the source is relative ("./", "../"), rooted ("/") or a src alias ("src/", "@/")
    static bool isExternalImport(std::string_view source);

private:
    std::unordered_map<std::string, FileId> pathToFileId_;

    std::optional<FileId> lookup(const std::string& path) const;
};

} // namespace codegraph::ingest
