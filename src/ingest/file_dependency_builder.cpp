#include <spdlog/spdlog.h>
#include <filesystem>
#include <unordered_set>
#include <codegraph/detect/language.h>
#include <codegraph/ingest/file_dependency_builder.h>

namespace codegraph::ingest {

namespace {

bool startsWith(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

// Leading identifier of a member expression: "axios.get" -> "axios"
std::string_view headSegment(std::string_view name) {
    auto end = name.find_first_of(".(");
    return end == std::string_view::npos ? name : name.substr(0, end);
}

} // namespace

FileDependencyBuilder::FileDependencyBuilder(const std::vector<store::File>& repoFiles) {
    pathToFileId_.reserve(repoFiles.size());
    for (const auto& f : repoFiles) {
        pathToFileId_.emplace(f.path, f.id);
    }
}

bool FileDependencyBuilder::isExternalImport(std::string_view source) {
    return !startsWith(source, "./") && !startsWith(source, "../") && !startsWith(source, "/") &&
           !startsWith(source, "src/") && !startsWith(source, "@/") && source != "." &&
           source != "..";
}

std::optional<FileId> FileDependencyBuilder::lookup(const std::string& path) const {
    auto it = pathToFileId_.find(path);
    if (it == pathToFileId_.end())
        return std::nullopt;
    return it->second;
}

std::optional<FileId> FileDependencyBuilder::resolveImport(const std::string& fromPath,
                                                           const std::string& source) const {
    namespace fs = std::filesystem;

    fs::path candidate;
    if (startsWith(source, "src/")) {
        candidate = fs::path(source);
    } else if (startsWith(source, "@/")) {
        candidate = fs::path("src") / source.substr(2);
    } else if (startsWith(source, "/")) {
        candidate = fs::path(source.substr(1));
    } else {
        candidate = fs::path(fromPath).parent_path() / source;
    }

    const std::string base = candidate.lexically_normal().generic_string();
    if (base.empty() || startsWith(base, ".."))
        return std::nullopt;

    if (auto id = lookup(base))
        return id;
    for (const auto& ext : detect::importResolutionExtensions()) {
        if (auto id = lookup(base + ext))
            return id;
    }
    for (const auto& ext : detect::importResolutionExtensions()) {
        if (auto id = lookup(base + "/index" + ext))
            return id;
    }
    return std::nullopt;
}

std::vector<store::FileDependency>
FileDependencyBuilder::fromSymbolEdges(const std::vector<store::Dependency>& dependencies,
                                       const std::vector<store::Symbol>& symbols) const {
    std::unordered_map<SymbolId, FileId> symbolToFile;
    symbolToFile.reserve(symbols.size());
    for (const auto& s : symbols) {
        symbolToFile.emplace(s.id, s.fileId);
    }

    std::vector<store::FileDependency> out;
    for (const auto& dep : dependencies) {
        if (!dep.toSymbolId)
            continue;
        auto from = symbolToFile.find(dep.fromSymbolId);
        auto to = symbolToFile.find(*dep.toSymbolId);
        if (from == symbolToFile.end() || to == symbolToFile.end() || from->second == to->second)
            continue;

        store::FileDependency fd;
        fd.fromFileId = from->second;
        fd.toFileId = to->second;
        fd.kind = dep.kind;
        fd.lineNumber = dep.lineNumber;
        out.push_back(fd);
    }
    return out;
}

std::vector<store::FileDependency>
FileDependencyBuilder::fromParsedFiles(const std::vector<ParsedFile>& parsed) const {
    std::vector<store::FileDependency> out;
    size_t externalCalls = 0;
    size_t externalImports = 0;

    for (const auto& file : parsed) {
        auto fileId = lookup(file.path);
        if (!fileId) {
            spdlog::debug("No stored file for parsed path '{}'", file.path);
            continue;
        }

        std::unordered_set<std::string> importedNames;
        for (const auto& imp : file.result.imports) {
            importedNames.insert(imp.importedNames.begin(), imp.importedNames.end());

            if (isExternalImport(imp.source)) {
                store::FileDependency fd;
                fd.fromFileId = *fileId;
                fd.toFileId = *fileId;
                fd.kind = store::DependencyKind::Imports;
                fd.lineNumber = imp.lineNumber > 0 ? imp.lineNumber : 1;
                out.push_back(fd);
                ++externalImports;
                continue;
            }

            auto target = resolveImport(file.path, imp.source);
            if (target && *target != *fileId) {
                store::FileDependency fd;
                fd.fromFileId = *fileId;
                fd.toFileId = *target;
                fd.kind = store::DependencyKind::Imports;
                fd.lineNumber = imp.lineNumber > 0 ? std::optional<int>(imp.lineNumber) : std::nullopt;
                out.push_back(fd);
            }
        }

        for (const auto& dep : file.result.dependencies) {
            bool external = false;
            if (dep.kind == store::DependencyKind::Imports) {
                external = true;
            } else if (dep.kind == store::DependencyKind::Calls) {
                external = dep.toSymbol.find("::") != std::string::npos ||
                           importedNames.count(std::string(headSegment(dep.toSymbol))) > 0;
            }
            if (!external)
                continue;

            store::FileDependency fd;
            fd.fromFileId = *fileId;
            fd.toFileId = *fileId;
            fd.kind = dep.kind;
            fd.lineNumber = dep.lineNumber;
            out.push_back(fd);
            ++externalCalls;
        }
    }

    spdlog::debug("Derived {} external call and {} external import file edges", externalCalls,
                  externalImports);
    return out;
}

} // namespace codegraph::ingest
