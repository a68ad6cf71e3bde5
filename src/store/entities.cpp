#include <codegraph/store/entities.h>

namespace codegraph::store {

const char* toString(SymbolKind kind) {
    switch (kind) {
        case SymbolKind::Function: return "function";
        case SymbolKind::Class: return "class";
        case SymbolKind::Interface: return "interface";
        case SymbolKind::Variable: return "variable";
        case SymbolKind::Constant: return "constant";
        case SymbolKind::TypeAlias: return "type_alias";
        case SymbolKind::Enum: return "enum";
        case SymbolKind::Method: return "method";
        case SymbolKind::Property: return "property";
        case SymbolKind::Trait: return "trait";
        case SymbolKind::Component: return "component";
    }
    return "function";
}

const char* toString(DependencyKind kind) {
    switch (kind) {
        case DependencyKind::Calls: return "calls";
        case DependencyKind::Imports: return "imports";
        case DependencyKind::Inherits: return "inherits";
        case DependencyKind::Implements: return "implements";
        case DependencyKind::References: return "references";
        case DependencyKind::Exports: return "exports";
    }
    return "calls";
}

const char* toString(TraversalDirection direction) {
    return direction == TraversalDirection::Callers ? "callers" : "dependencies";
}

std::optional<SymbolKind> parseSymbolKind(std::string_view s) {
    if (s == "function") return SymbolKind::Function;
    if (s == "class") return SymbolKind::Class;
    if (s == "interface") return SymbolKind::Interface;
    if (s == "variable") return SymbolKind::Variable;
    if (s == "constant") return SymbolKind::Constant;
    if (s == "type_alias") return SymbolKind::TypeAlias;
    if (s == "enum") return SymbolKind::Enum;
    if (s == "method") return SymbolKind::Method;
    if (s == "property") return SymbolKind::Property;
    if (s == "trait") return SymbolKind::Trait;
    if (s == "component") return SymbolKind::Component;
    return std::nullopt;
}

std::optional<DependencyKind> parseDependencyKind(std::string_view s) {
    if (s == "calls") return DependencyKind::Calls;
    if (s == "imports") return DependencyKind::Imports;
    if (s == "inherits") return DependencyKind::Inherits;
    if (s == "implements") return DependencyKind::Implements;
    if (s == "references") return DependencyKind::References;
    if (s == "exports") return DependencyKind::Exports;
    return std::nullopt;
}

} // namespace codegraph::store
