#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <deque>
#include <unordered_map>
#include <codegraph/traverse/traversal_engine.h>

namespace codegraph::traverse {

namespace {

using nlohmann::json;
using store::TraversalEdge;

constexpr const char* kTraverseOperation = "traverse";
constexpr const char* kNoParameters = "no-parameters";

json refToJson(const std::optional<store::SymbolRef>& ref) {
    if (!ref)
        return nullptr;
    return json{{"id", ref->id},
                {"name", ref->name},
                {"kind", store::toString(ref->kind)},
                {"file_path", ref->filePath}};
}

std::optional<store::SymbolRef> refFromJson(const json& j) {
    if (j.is_null())
        return std::nullopt;
    store::SymbolRef ref;
    ref.id = j.at("id").get<SymbolId>();
    ref.name = j.at("name").get<std::string>();
    ref.kind = store::parseSymbolKind(j.at("kind").get<std::string>())
                   .value_or(store::SymbolKind::Function);
    ref.filePath = j.at("file_path").get<std::string>();
    return ref;
}

json edgeToJson(const TraversalEdge& e) {
    json j{{"dependency_id", e.dependencyId},
           {"from_symbol_id", e.fromSymbolId},
           {"kind", store::toString(e.kind)},
           {"line_number", e.lineNumber},
           {"depth", e.depth},
           {"from", refToJson(e.from)},
           {"to", refToJson(e.to)}};
    j["to_symbol_id"] = e.toSymbolId ? json(*e.toSymbolId) : json(nullptr);
    j["to_qualified_name"] = e.toQualifiedName ? json(*e.toQualifiedName) : json(nullptr);
    return j;
}

TraversalEdge edgeFromJson(const json& j) {
    TraversalEdge e;
    e.dependencyId = j.at("dependency_id").get<DependencyId>();
    e.fromSymbolId = j.at("from_symbol_id").get<SymbolId>();
    if (!j.at("to_symbol_id").is_null())
        e.toSymbolId = j.at("to_symbol_id").get<SymbolId>();
    e.kind = store::parseDependencyKind(j.at("kind").get<std::string>())
                 .value_or(store::DependencyKind::Calls);
    e.lineNumber = j.at("line_number").get<int>();
    e.depth = j.at("depth").get<int>();
    if (!j.at("to_qualified_name").is_null())
        e.toQualifiedName = j.at("to_qualified_name").get<std::string>();
    e.from = refFromJson(j.at("from"));
    e.to = refFromJson(j.at("to"));
    return e;
}

} // namespace

TraversalEngine::TraversalEngine(store::GraphStore& store, config::TraversalConfig config,
                                 cache::ResultCache* cache)
    : store_(store), config_(config), cache_(cache) {
    config_.maxDepthCap = std::max(1, config_.maxDepthCap);
}

TraversalRequest TraversalEngine::applyDefaults(const TraversalRequest& request) const {
    TraversalRequest resolved = request;
    int depth = request.maxDepth.value_or(config_.defaultMaxDepth);
    if (depth > config_.maxDepthCap) {
        spdlog::debug("Clamping traversal depth {} to {}", depth, config_.maxDepthCap);
        depth = config_.maxDepthCap;
    }
    resolved.maxDepth = depth;
    resolved.limit = request.limit.value_or(config_.defaultLimit);

    std::sort(resolved.kinds.begin(), resolved.kinds.end());
    resolved.kinds.erase(std::unique(resolved.kinds.begin(), resolved.kinds.end()),
                         resolved.kinds.end());
    return resolved;
}

cache::CacheKey TraversalEngine::cacheKey(const TraversalRequest& resolved) {
    json kinds = json::array();
    for (auto kind : resolved.kinds) {
        kinds.push_back(store::toString(kind));
    }
    json params{{"symbol_id", resolved.symbolId},
                {"direction", store::toString(resolved.direction)},
                {"max_depth", resolved.maxDepth.value_or(0)},
                {"kinds", std::move(kinds)},
                {"limit", resolved.limit.value_or(0)}};
    return cache::CacheKey::fromOperation(kTraverseOperation, params);
}

Result<TraversalResult> TraversalEngine::traverse(const TraversalRequest& request) {
    const TraversalRequest resolved = applyDefaults(request);
    if (*resolved.maxDepth < 1) {
        return Error{ErrorCode::InvalidArgument, "Traversal depth must be at least 1"};
    }

    TraversalResult result;
    result.maxDepth = *resolved.maxDepth;
    result.limit = *resolved.limit;

    const cache::CacheKey key = cacheKey(resolved);
    if (cache_) {
        if (auto cached = cache_->get(key)) {
            try {
                for (const auto& item : *cached) {
                    result.edges.push_back(edgeFromJson(item));
                }
                result.truncated = result.limit > 0 && result.edges.size() >= result.limit;
                result.fromCache = true;
                return result;
            } catch (const json::exception& e) {
                spdlog::debug("Discarding unreadable cached traversal '{}': {}", key.toString(),
                              e.what());
                cache_->invalidate(key);
                result.edges.clear();
            }
        }
    }

    store::TraversalQuery query;
    query.seedSymbolId = resolved.symbolId;
    query.direction = resolved.direction;
    query.maxDepth = *resolved.maxDepth;
    query.kinds = resolved.kinds;
    query.limit = *resolved.limit;

    auto edges = store_.queryTransitive(query, config_.queryTimeout);
    if (!edges)
        return edges.error();

    result.edges = std::move(edges).value();
    result.truncated = result.limit > 0 && result.edges.size() >= result.limit;

    if (cache_) {
        json payload = json::array();
        for (const auto& e : result.edges) {
            payload.push_back(edgeToJson(e));
        }
        cache_->set(key, std::move(payload));
        recordTouched(key, resolved.symbolId, result.edges);
    }

    spdlog::debug("Traversal from {} ({}, depth {}): {} edges", resolved.symbolId,
                  store::toString(resolved.direction), result.maxDepth, result.edges.size());
    return result;
}

Result<ParameterContextGroups> TraversalEngine::groupCallsByParameterContext(SymbolId symbolId) {
    auto target = store_.getSymbol(symbolId);
    if (!target)
        return target.error();
    if (!target.value()) {
        return Error{ErrorCode::NotFound, "Symbol not found: " + std::to_string(symbolId)};
    }

    auto sites = store_.getCallSites(symbolId, config_.queryTimeout);
    if (!sites)
        return sites.error();

    ParameterContextGroups groups;
    groups.symbolId = symbolId;
    groups.methodName = target.value()->name;
    groups.totalCalls = sites.value().size();

    std::unordered_map<std::string, size_t> index;
    for (auto& site : sites.value()) {
        const std::string context =
            site.parameterContext && !site.parameterContext->empty() ? *site.parameterContext
                                                                     : kNoParameters;
        auto [it, inserted] = index.emplace(context, groups.variations.size());
        if (inserted) {
            ParameterVariation variation;
            variation.parameterContext = context;
            variation.parameterTypes = site.parameterTypes;
            groups.variations.push_back(std::move(variation));
        }

        auto& variation = groups.variations[it->second];
        if (site.callInstanceId) {
            variation.callInstanceIds.push_back(*site.callInstanceId);
        }
        variation.lineNumbers.push_back(site.lineNumber);
        variation.callers.push_back(std::move(site));
    }
    return groups;
}

Result<std::vector<SymbolId>> TraversalEngine::shortestPath(SymbolId from, SymbolId to,
                                                            store::TraversalDirection direction,
                                                            int maxDepth) {
    if (maxDepth < 1) {
        return Error{ErrorCode::InvalidArgument, "Path depth must be at least 1"};
    }
    maxDepth = std::min(maxDepth, config_.maxDepthCap);
    if (from == to)
        return std::vector<SymbolId>{from};

    std::unordered_map<SymbolId, SymbolId> predecessor{{from, from}};
    std::vector<SymbolId> frontier{from};

    for (int depth = 0; depth < maxDepth && !frontier.empty(); ++depth) {
        std::vector<SymbolId> next;
        for (SymbolId node : frontier) {
            auto neighbors = store_.getNeighbors(node, direction, {});
            if (!neighbors)
                return neighbors.error();

            for (SymbolId neighbor : neighbors.value()) {
                if (!predecessor.emplace(neighbor, node).second)
                    continue;
                if (neighbor == to) {
                    std::deque<SymbolId> path{to};
                    for (SymbolId cur = node; cur != from; cur = predecessor.at(cur)) {
                        path.push_front(cur);
                    }
                    path.push_front(from);
                    return std::vector<SymbolId>(path.begin(), path.end());
                }
                next.push_back(neighbor);
            }
        }
        frontier = std::move(next);
    }
    return std::vector<SymbolId>{};
}

void TraversalEngine::recordTouched(const cache::CacheKey& key, SymbolId seed,
                                    const std::vector<TraversalEdge>& edges) {
    std::lock_guard<std::mutex> lock(touchedMutex_);
    touched_[seed].insert(key);
    for (const auto& e : edges) {
        touched_[e.fromSymbolId].insert(key);
        if (e.toSymbolId)
            touched_[*e.toSymbolId].insert(key);
    }
}

size_t TraversalEngine::invalidateSymbol(SymbolId symbolId) {
    if (!cache_)
        return 0;

    std::unordered_set<cache::CacheKey, cache::CacheKeyHash> keys;
    {
        std::lock_guard<std::mutex> lock(touchedMutex_);
        if (auto it = touched_.find(symbolId); it != touched_.end()) {
            keys = std::move(it->second);
            touched_.erase(it);
        }
    }

    size_t removed = 0;
    for (const auto& key : keys) {
        if (cache_->invalidate(key))
            ++removed;
    }
    // Entries cached by another engine sharing the cache are only found by seed;
    // symbol_id sorts last among the key's parameters
    removed += cache_->invalidatePattern("\"symbol_id\":" + std::to_string(symbolId) + "}");
    return removed;
}

} // namespace codegraph::traverse
