#include "sqlite_graph_store.h"

#include <spdlog/spdlog.h>
#include <codegraph/core/result_helpers.h>

namespace codegraph::store {

using namespace detail;

namespace {

// Bounds the recursive walk independently of the result limit, which is only
// applied after ordering. The query deadline is the other bound.
constexpr int64_t kMaxWalkRows = 1000000;

/**
 * Recursive walk over the edge table. Cycle detection is per path: a node is
 * skipped only when it already appears on the path that reached it, so diamonds
 * re-converge while loops terminate. Parameters are named in order of first
 * appearance: :seed, :depth, :cap, :limit.
 */
std::string buildWalkSql(TraversalDirection direction, const std::vector<DependencyKind>& kinds) {
    const std::string baseKinds = kindFilterClause(kinds, "d.dependency_type");

    std::string base;
    std::string step;
    if (direction == TraversalDirection::Callers) {
        base = "SELECT d.id, d.from_symbol_id, d.to_symbol_id, 1, "
               "',' || :seed || ',' || d.from_symbol_id || ',' "
               "FROM dependencies d WHERE d.to_symbol_id = :seed "
               "AND d.from_symbol_id <> :seed" +
               baseKinds;
        step = "SELECT d.id, d.from_symbol_id, d.to_symbol_id, w.depth + 1, "
               "w.path || d.from_symbol_id || ',' "
               "FROM dependencies d JOIN walk w ON d.to_symbol_id = w.from_id "
               "WHERE w.depth < :depth "
               "AND instr(w.path, ',' || d.from_symbol_id || ',') = 0" +
               baseKinds;
    } else {
        // Unresolved targets are reported as leaves
        base = "SELECT d.id, d.from_symbol_id, d.to_symbol_id, 1, "
               "',' || :seed || ',' || COALESCE(d.to_symbol_id, 0) || ',' "
               "FROM dependencies d WHERE d.from_symbol_id = :seed "
               "AND (d.to_symbol_id IS NULL OR d.to_symbol_id <> :seed)" +
               baseKinds;
        step = "SELECT d.id, d.from_symbol_id, d.to_symbol_id, w.depth + 1, "
               "w.path || COALESCE(d.to_symbol_id, 0) || ',' "
               "FROM dependencies d JOIN walk w ON d.from_symbol_id = w.to_id "
               "WHERE w.depth < :depth "
               "AND (d.to_symbol_id IS NULL OR instr(w.path, ',' || d.to_symbol_id || ',') = 0)" +
               baseKinds;
    }

    return "WITH RECURSIVE walk(id, from_id, to_id, depth, path) AS (" + base + " UNION ALL " +
           step +
           " LIMIT :cap), "
           "hits AS (SELECT DISTINCT id, depth FROM walk) "
           "SELECT " +
           std::string(kDependencyColumns) +
           ", h.depth, fs.id, fs.name, fs.symbol_type, ff.path, "
           "ts.id, ts.name, ts.symbol_type, tf.path "
           "FROM hits h JOIN dependencies d ON d.id = h.id "
           "LEFT JOIN symbols fs ON fs.id = d.from_symbol_id "
           "LEFT JOIN files ff ON ff.id = fs.file_id "
           "LEFT JOIN symbols ts ON ts.id = d.to_symbol_id "
           "LEFT JOIN files tf ON tf.id = ts.file_id "
           "ORDER BY h.depth ASC, d.id DESC LIMIT :limit";
}

} // namespace

Result<std::vector<TraversalEdge>> SqliteGraphStore::queryTransitive(const TraversalQuery& query,
                                                                     std::chrono::milliseconds timeout) {
    if (query.maxDepth < 1) {
        return Error{ErrorCode::InvalidArgument, "Traversal depth must be at least 1"};
    }
    if (query.limit == 0) {
        return std::vector<TraversalEdge>{};
    }

    const std::string sql = buildWalkSql(query.direction, query.kinds);
    const int64_t limit = static_cast<int64_t>(query.limit);

    return pool_->withConnection([&](Database& db) -> Result<std::vector<TraversalEdge>> {
        ScopedQueryDeadline deadline(db, timeout);
        CODEGRAPH_TRY_UNWRAP(stmt, db.prepare(sql));
        CODEGRAPH_TRY(stmt.bindAll(query.seedSymbolId, query.maxDepth, kMaxWalkRows, limit));

        std::vector<TraversalEdge> out;
        while (true) {
            auto step = stmt.step();
            if (!step) {
                if (step.error().code == ErrorCode::Timeout) {
                    spdlog::warn("Traversal from symbol {} ({}, depth {}) exceeded {} ms",
                                 query.seedSymbolId, toString(query.direction), query.maxDepth,
                                 timeout.count());
                }
                return step.error();
            }
            if (!step.value())
                break;

            const Dependency dep = readDependency(stmt);
            TraversalEdge edge;
            edge.dependencyId = dep.id;
            edge.fromSymbolId = dep.fromSymbolId;
            edge.toSymbolId = dep.toSymbolId;
            edge.kind = dep.kind;
            edge.lineNumber = dep.lineNumber;
            edge.toQualifiedName = dep.toQualifiedName;
            edge.depth = stmt.getInt(kDependencyColumnCount);
            edge.from = readSymbolRef(stmt, kDependencyColumnCount + 1);
            edge.to = readSymbolRef(stmt, kDependencyColumnCount + 5);
            out.push_back(std::move(edge));
        }
        return out;
    });
}

Result<std::vector<CallSite>> SqliteGraphStore::getCallSites(SymbolId symbolId,
                                                             std::chrono::milliseconds timeout) {
    return pool_->withConnection([&](Database& db) -> Result<std::vector<CallSite>> {
        ScopedQueryDeadline deadline(db, timeout);
        CODEGRAPH_TRY_UNWRAP(stmt, db.prepare("SELECT d.id, d.from_symbol_id, fs.name, ff.path, "
                                              "d.line_number, d.parameter_context, "
                                              "d.parameter_types, d.call_instance_id "
                                              "FROM dependencies d "
                                              "JOIN symbols fs ON fs.id = d.from_symbol_id "
                                              "JOIN files ff ON ff.id = fs.file_id "
                                              "WHERE d.to_symbol_id = ? "
                                              "AND d.dependency_type = 'calls' "
                                              "ORDER BY ff.path, d.line_number, d.id"));
        CODEGRAPH_TRY(stmt.bind(1, symbolId));
        std::vector<CallSite> out;
        while (true) {
            CODEGRAPH_TRY_UNWRAP(hasRow, stmt.step());
            if (!hasRow)
                break;
            CallSite site;
            site.dependencyId = stmt.getInt64(0);
            site.callerSymbolId = stmt.getInt64(1);
            site.callerName = stmt.getString(2);
            site.filePath = stmt.getString(3);
            site.lineNumber = stmt.getInt(4);
            site.parameterContext = stmt.getOptionalString(5);
            site.parameterTypes = decodeParameterTypes(stmt.getOptionalString(6));
            site.callInstanceId = stmt.getOptionalString(7);
            out.push_back(std::move(site));
        }
        return out;
    });
}

Result<std::vector<SymbolId>> SqliteGraphStore::getNeighbors(SymbolId symbolId,
                                                             TraversalDirection direction,
                                                             const std::vector<DependencyKind>& kinds) {
    std::string sql = direction == TraversalDirection::Dependencies
                          ? "SELECT DISTINCT d.to_symbol_id FROM dependencies d "
                            "WHERE d.from_symbol_id = ? AND d.to_symbol_id IS NOT NULL"
                          : "SELECT DISTINCT d.from_symbol_id FROM dependencies d "
                            "WHERE d.to_symbol_id = ?";
    sql += kindFilterClause(kinds, "d.dependency_type");
    sql += " ORDER BY 1";

    return pool_->withConnection([&](Database& db) -> Result<std::vector<SymbolId>> {
        CODEGRAPH_TRY_UNWRAP(stmt, db.prepare(sql));
        CODEGRAPH_TRY(stmt.bind(1, symbolId));
        std::vector<SymbolId> out;
        while (true) {
            CODEGRAPH_TRY_UNWRAP(hasRow, stmt.step());
            if (!hasRow)
                break;
            out.push_back(stmt.getInt64(0));
        }
        return out;
    });
}

} // namespace codegraph::store
