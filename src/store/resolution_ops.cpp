#include "sqlite_graph_store.h"

#include <spdlog/spdlog.h>
#include <codegraph/core/result_helpers.h>

namespace codegraph::store {

using namespace detail;

namespace {

constexpr const char* kRepoSymbols =
    "SELECT s.id FROM symbols s JOIN files f ON f.id = s.file_id WHERE f.repo_id = :repo";

// Qualified names carried by exactly one symbol of the repository
constexpr const char* kUniqueTargets =
    "SELECT s.qualified_name AS qn, MIN(s.id) AS sid FROM symbols s "
    "JOIN files f ON f.id = s.file_id "
    "WHERE f.repo_id = :repo AND s.qualified_name IS NOT NULL "
    "GROUP BY s.qualified_name HAVING COUNT(*) = 1";

Result<size_t> executeForRepo(Database& db, const std::string& sql, RepositoryId repoId,
                              std::optional<int64_t> now = std::nullopt) {
    CODEGRAPH_TRY_UNWRAP(stmt, db.prepare(sql));
    // :repo is always the first named parameter and :now the second
    CODEGRAPH_TRY(stmt.bind(1, repoId));
    if (now) {
        CODEGRAPH_TRY(stmt.bind(2, *now));
    }
    CODEGRAPH_TRY(stmt.execute());
    return static_cast<size_t>(db.changes());
}

} // namespace

Result<size_t> SqliteGraphStore::deduplicateUnresolved(RepositoryId repoId,
                                                       std::chrono::milliseconds timeout) {
    return pool_->withConnection([&](Database& db) -> Result<size_t> {
        ScopedQueryDeadline deadline(db, timeout);
        size_t deleted = 0;
        auto tx = db.transaction([&]() -> Result<void> {
            const std::string sql =
                std::string("DELETE FROM dependencies "
                            "WHERE to_symbol_id IS NULL AND to_qualified_name IS NOT NULL "
                            "AND from_symbol_id IN (") +
                kRepoSymbols +
                ") AND id NOT IN ("
                "SELECT MAX(k.id) FROM dependencies k "
                "WHERE k.to_symbol_id IS NULL AND k.to_qualified_name IS NOT NULL "
                "AND k.from_symbol_id IN (" +
                kRepoSymbols +
                ") GROUP BY k.from_symbol_id, k.to_qualified_name, k.dependency_type, "
                "k.line_number)";
            CODEGRAPH_TRY_UNWRAP(n, executeForRepo(db, sql, repoId));
            deleted = n;
            return {};
        });
        if (!tx)
            return tx.error();
        return deleted;
    });
}

Result<size_t> SqliteGraphStore::bindQualifiedNames(RepositoryId repoId,
                                                    std::chrono::milliseconds timeout) {
    return pool_->withConnection([&](Database& db) -> Result<size_t> {
        ScopedQueryDeadline deadline(db, timeout);
        size_t bound = 0;
        size_t collapsed = 0;
        auto tx = db.transaction([&]() -> Result<void> {
            // An unresolved edge whose resolved twin already exists would violate the
            // edge key once bound; the resolved row wins
            const std::string collapse =
                std::string("WITH t AS (") + kUniqueTargets +
                ") DELETE FROM dependencies WHERE id IN ("
                "SELECT u.id FROM dependencies u JOIN t ON t.qn = u.to_qualified_name "
                "JOIN dependencies r ON r.from_symbol_id = u.from_symbol_id "
                "AND r.to_symbol_id = t.sid AND r.dependency_type = u.dependency_type "
                "AND r.line_number = u.line_number "
                "WHERE u.to_symbol_id IS NULL AND u.from_symbol_id IN (" +
                kRepoSymbols + "))";
            CODEGRAPH_TRY_UNWRAP(c, executeForRepo(db, collapse, repoId));
            collapsed = c;

            const std::string bind =
                std::string("WITH t AS (") + kUniqueTargets +
                ") UPDATE dependencies SET to_symbol_id = t.sid, updated_at = :now "
                "FROM t WHERE dependencies.to_symbol_id IS NULL "
                "AND dependencies.to_qualified_name = t.qn "
                "AND dependencies.from_symbol_id IN (" +
                kRepoSymbols + ")";
            CODEGRAPH_TRY_UNWRAP(b, executeForRepo(db, bind, repoId, nowMillis()));
            bound = b;
            return {};
        });
        if (!tx)
            return tx.error();
        if (collapsed > 0) {
            spdlog::debug("Repository {}: dropped {} unresolved edges already present as resolved",
                          repoId, collapsed);
        }
        return bound;
    });
}

Result<OrphanCleanupCounts>
SqliteGraphStore::deleteOrphanDependencies(RepositoryId repoId, std::chrono::milliseconds timeout) {
    return pool_->withConnection([&](Database& db) -> Result<OrphanCleanupCounts> {
        ScopedQueryDeadline deadline(db, timeout);
        OrphanCleanupCounts counts;
        auto tx = db.transaction([&]() -> Result<void> {
            const std::string noTarget =
                std::string("DELETE FROM dependencies WHERE to_symbol_id IS NULL "
                            "AND to_qualified_name IS NULL AND from_symbol_id IN (") +
                kRepoSymbols + ")";
            CODEGRAPH_TRY_UNWRAP(a, executeForRepo(db, noTarget, repoId));
            counts.withoutTarget = a;

            // Imports may point at packages outside the repository and are kept
            const std::string unmatched =
                std::string("DELETE FROM dependencies WHERE to_symbol_id IS NULL "
                            "AND to_qualified_name IS NOT NULL "
                            "AND dependency_type <> 'imports' AND from_symbol_id IN (") +
                kRepoSymbols +
                ") AND NOT EXISTS (SELECT 1 FROM symbols s JOIN files f ON f.id = s.file_id "
                "WHERE f.repo_id = :repo AND s.qualified_name = dependencies.to_qualified_name)";
            CODEGRAPH_TRY_UNWRAP(b, executeForRepo(db, unmatched, repoId));
            counts.unmatched = b;
            return {};
        });
        if (!tx)
            return tx.error();
        return counts;
    });
}

} // namespace codegraph::store
