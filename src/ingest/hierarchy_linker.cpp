#include <spdlog/spdlog.h>
#include <unordered_map>
#include <codegraph/ingest/hierarchy_linker.h>

namespace codegraph::ingest {

std::vector<std::pair<SymbolId, SymbolId>>
SymbolHierarchyLinker::computeLinks(const std::vector<store::Symbol>& symbols) {
    std::unordered_map<FileId, std::vector<const store::Symbol*>> containersByFile;
    for (const auto& s : symbols) {
        if (store::isContainerKind(s.kind)) {
            containersByFile[s.fileId].push_back(&s);
        }
    }

    std::vector<std::pair<SymbolId, SymbolId>> links;
    for (const auto& child : symbols) {
        if (!store::isMemberKind(child.kind))
            continue;
        auto it = containersByFile.find(child.fileId);
        if (it == containersByFile.end())
            continue;

        for (const store::Symbol* parent : it->second) {
            if (parent->id == child.id)
                continue;
            if (child.startLine < parent->startLine || child.endLine > parent->endLine)
                continue;
            if (child.parentSymbolId != parent->id) {
                links.emplace_back(child.id, parent->id);
            }
            break;
        }
    }
    return links;
}

Result<size_t> SymbolHierarchyLinker::linkSymbols(const std::vector<store::Symbol>& symbols) {
    const auto links = computeLinks(symbols);
    if (links.empty())
        return size_t{0};

    auto updated = store_.updateSymbolParents(links);
    if (!updated) {
        spdlog::error("Failed to store {} parent links: {}", links.size(), updated.error().message);
        return updated.error();
    }
    return updated;
}

Result<size_t> SymbolHierarchyLinker::link(RepositoryId repoId) {
    auto symbols = store_.getSymbolsByRepository(repoId);
    if (!symbols)
        return symbols.error();

    auto updated = linkSymbols(symbols.value());
    if (updated && updated.value() > 0) {
        spdlog::info("Linked {} symbols to their containers in repository {}", updated.value(),
                     repoId);
    }
    return updated;
}

} // namespace codegraph::ingest
