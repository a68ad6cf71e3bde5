#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <codegraph/ingest/edge_builder.h>

namespace codegraph::ingest {

namespace {

bool containsLine(const store::Symbol& s, int line) {
    return line >= s.startLine && line <= s.endLine;
}

int span(const store::Symbol& s) {
    return s.endLine - s.startLine;
}

bool isQualifiedReference(std::string_view name) {
    return name.find('.') != std::string_view::npos ||
           name.find("::") != std::string_view::npos ||
           name.find("->") != std::string_view::npos;
}

bool isCallableKind(store::SymbolKind kind) {
    return kind == store::SymbolKind::Method || kind == store::SymbolKind::Function ||
           kind == store::SymbolKind::Property;
}

// Innermost symbol whose range contains the line and whose kind passes the filter
template <typename Pred>
const store::Symbol* innermostContaining(const std::vector<store::Symbol>& symbols, int line,
                                         Pred accept) {
    const store::Symbol* best = nullptr;
    for (const auto& s : symbols) {
        if (!accept(s) || !containsLine(s, line))
            continue;
        if (!best || span(s) < span(*best)) {
            best = &s;
        }
    }
    return best;
}

} // namespace

std::string EdgeBuilder::extractMemberName(std::string_view name) {
    std::string last;
    size_t pos = 0;
    while (pos <= name.size()) {
        size_t dot = name.find('.', pos);
        if (dot == std::string_view::npos)
            dot = name.size();
        auto segment = name.substr(pos, dot - pos);
        if (!segment.empty() && segment.front() != '<') {
            last = std::string(segment);
        }
        pos = dot + 1;
    }
    return last;
}

Result<std::vector<std::string>> EdgeBuilder::parseParameterTypes(std::string_view payload) {
    auto parsed = nlohmann::json::parse(payload, nullptr, false);
    if (parsed.is_discarded()) {
        return Error{ErrorCode::ValidationError, "parameter types are not valid JSON"};
    }
    if (!parsed.is_array()) {
        return Error{ErrorCode::ValidationError, "parameter types must be a JSON array"};
    }
    std::vector<std::string> types;
    types.reserve(parsed.size());
    for (const auto& item : parsed) {
        if (!item.is_string()) {
            return Error{ErrorCode::ValidationError, "parameter types must be strings"};
        }
        types.push_back(item.get<std::string>());
    }
    return types;
}

const store::Symbol* EdgeBuilder::findSource(const ParsedDependency& edge,
                                             const std::vector<store::Symbol>& fileSymbols) const {
    const std::string member = extractMemberName(edge.fromSymbol);

    const store::Symbol* byName = nullptr;
    for (const auto& s : fileSymbols) {
        if (s.name != edge.fromSymbol && s.name != member)
            continue;
        if (containsLine(s, edge.lineNumber)) {
            return &s;
        }
        if (!byName) {
            byName = &s;
        }
    }
    if (byName)
        return byName;

    // Parsers report top-level code and lambdas under synthetic names
    if (auto* callable = innermostContaining(fileSymbols, edge.lineNumber,
                                             [](const store::Symbol& s) { return isCallableKind(s.kind); })) {
        return callable;
    }
    return innermostContaining(fileSymbols, edge.lineNumber,
                               [](const store::Symbol& s) { return store::isContainerKind(s.kind); });
}

const store::Symbol*
EdgeBuilder::findLocalTarget(const ParsedDependency& edge,
                             const std::vector<store::Symbol>& fileSymbols) const {
    if (edge.toSymbol.empty() || isQualifiedReference(edge.toSymbol))
        return nullptr;

    const store::Symbol* match = nullptr;
    for (const auto& s : fileSymbols) {
        if (s.name != edge.toSymbol)
            continue;
        if (match)
            return nullptr;
        match = &s;
    }
    return match;
}

std::vector<store::Dependency>
EdgeBuilder::build(const std::vector<ParsedDependency>& edges,
                   const std::vector<store::Symbol>& fileSymbols) const {
    std::vector<store::Dependency> out;
    out.reserve(edges.size());

    for (const auto& edge : edges) {
        std::optional<std::vector<std::string>> parameterTypes;
        if (edge.parameterTypes && !edge.parameterTypes->empty()) {
            auto types = parseParameterTypes(*edge.parameterTypes);
            if (!types) {
                spdlog::warn("Skipping edge {} -> {} at line {}: {}", edge.fromSymbol,
                             edge.toSymbol, edge.lineNumber, types.error().message);
                if (statistics_)
                    statistics_->validationFailures++;
                continue;
            }
            parameterTypes = std::move(types).value();
        }

        const store::Symbol* source = findSource(edge, fileSymbols);
        if (!source) {
            spdlog::debug("No source symbol for edge {} -> {} at line {}", edge.fromSymbol,
                          edge.toSymbol, edge.lineNumber);
            if (statistics_)
                statistics_->unmatchedEdges++;
            continue;
        }

        store::Dependency dep;
        dep.fromSymbolId = source->id;
        dep.kind = edge.kind;
        dep.lineNumber = edge.lineNumber;
        dep.callingObject = edge.callingObject;
        dep.resolvedClass = edge.resolvedClass;
        dep.qualifiedContext = edge.qualifiedContext;
        dep.parameterContext = edge.parameterContext;
        dep.parameterTypes = std::move(parameterTypes);
        dep.callInstanceId = edge.callInstanceId;

        if (const store::Symbol* target = findLocalTarget(edge, fileSymbols)) {
            dep.toSymbolId = target->id;
            dep.toQualifiedName = target->qualifiedName.value_or(edge.toSymbol);
        } else if (!edge.toSymbol.empty()) {
            dep.toQualifiedName = edge.toSymbol;
        }
        out.push_back(std::move(dep));
    }
    return out;
}

} // namespace codegraph::ingest
