#include <string>
#include <unordered_map>
#include <unordered_set>
#include <codegraph/ingest/deduplication.h>

namespace codegraph::ingest {

namespace {

std::string symbolKey(const store::Symbol& s) {
    std::string key = std::to_string(s.fileId);
    key += ':';
    key += s.name;
    key += ':';
    key += store::toString(s.kind);
    key += ':';
    key += std::to_string(s.startLine);
    return key;
}

std::string dependencyKey(const store::Dependency& d) {
    std::string key = std::to_string(d.fromSymbolId);
    key += ':';
    if (d.toSymbolId) {
        key += std::to_string(*d.toSymbolId);
    } else {
        // NULL targets are distinct in the store, so the textual target joins the key
        key += "?";
        key += d.toQualifiedName.value_or("");
    }
    key += ':';
    key += store::toString(d.kind);
    key += ':';
    key += std::to_string(d.lineNumber);
    return key;
}

} // namespace

bool isMoreComplete(const store::Symbol& candidate, const store::Symbol& current) {
    auto prefer = [](bool a, bool b) -> int { return a == b ? 0 : (a ? 1 : -1); };

    const int checks[] = {
        prefer(candidate.signature.has_value(), current.signature.has_value()),
        prefer(candidate.isExported, current.isExported),
        prefer(candidate.description.has_value(), current.description.has_value()),
        prefer(candidate.qualifiedName.has_value(), current.qualifiedName.has_value()),
    };
    for (int c : checks) {
        if (c != 0)
            return c > 0;
    }
    return false;
}

std::vector<store::Symbol> deduplicateSymbols(const std::vector<store::Symbol>& symbols) {
    std::vector<store::Symbol> out;
    out.reserve(symbols.size());
    std::unordered_map<std::string, size_t> position;

    for (const auto& s : symbols) {
        auto [it, inserted] = position.try_emplace(symbolKey(s), out.size());
        if (inserted) {
            out.push_back(s);
        } else if (isMoreComplete(s, out[it->second])) {
            out[it->second] = s;
        }
    }
    return out;
}

std::vector<store::Dependency> deduplicateDependencies(const std::vector<store::Dependency>& deps) {
    std::vector<store::Dependency> out;
    out.reserve(deps.size());
    std::unordered_set<std::string> seen;
    for (const auto& d : deps) {
        if (seen.insert(dependencyKey(d)).second) {
            out.push_back(d);
        }
    }
    return out;
}

std::vector<store::FileDependency>
deduplicateFileDependencies(const std::vector<store::FileDependency>& deps) {
    std::vector<store::FileDependency> out;
    out.reserve(deps.size());
    std::unordered_set<std::string> seen;
    for (const auto& d : deps) {
        std::string key = std::to_string(d.fromFileId) + ':' + std::to_string(d.toFileId) + ':' +
                          store::toString(d.kind);
        if (seen.insert(std::move(key)).second) {
            out.push_back(d);
        }
    }
    return out;
}

} // namespace codegraph::ingest
