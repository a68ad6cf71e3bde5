#include "sqlite_graph_store.h"

#include <spdlog/spdlog.h>
#include <codegraph/core/result_helpers.h>

namespace codegraph::store {

using namespace detail;

namespace {

// Columns for the symbol at each end of an edge, appended after kDependencyColumns
constexpr const char* kEndpointColumns =
    ", fs.id, fs.name, fs.symbol_type, ff.path, ts.id, ts.name, ts.symbol_type, tf.path";
constexpr const char* kEndpointJoins =
    " FROM dependencies d "
    "JOIN symbols fs ON fs.id = d.from_symbol_id JOIN files ff ON ff.id = fs.file_id "
    "LEFT JOIN symbols ts ON ts.id = d.to_symbol_id LEFT JOIN files tf ON tf.id = ts.file_id ";

Result<std::vector<Dependency>> collectDependencies(Statement& stmt) {
    std::vector<Dependency> out;
    while (true) {
        CODEGRAPH_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            break;
        out.push_back(readDependency(stmt));
    }
    return out;
}

} // namespace

Result<DependencyUpsertResult>
SqliteGraphStore::upsertDependencies(const std::vector<Dependency>& dependencies) {
    DependencyUpsertResult result;
    if (dependencies.empty())
        return result;

    return pool_->withConnection([&](Database& db) -> Result<DependencyUpsertResult> {
        auto tx = db.transaction([&]() -> Result<void> {
            CODEGRAPH_TRY_UNWRAP(findResolved,
                                 db.prepare("SELECT id FROM dependencies WHERE from_symbol_id = ? "
                                            "AND to_symbol_id = ? AND dependency_type = ? "
                                            "AND line_number = ?"));
            CODEGRAPH_TRY_UNWRAP(
                mergeResolved,
                db.prepare("INSERT INTO dependencies (from_symbol_id, to_symbol_id, dependency_type, "
                           "line_number, to_qualified_name, calling_object, resolved_class, "
                           "qualified_context, parameter_context, parameter_types, "
                           "call_instance_id, created_at, updated_at) "
                           "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
                           "ON CONFLICT(from_symbol_id, to_symbol_id, dependency_type, line_number) "
                           "DO UPDATE SET line_number = excluded.line_number, "
                           "updated_at = excluded.updated_at, "
                           "parameter_context = excluded.parameter_context, "
                           "parameter_types = excluded.parameter_types, "
                           "call_instance_id = excluded.call_instance_id "
                           "RETURNING id"));
            // NULL targets never collide on the unique key, so unresolved rows are
            // matched explicitly to keep re-ingestion idempotent
            CODEGRAPH_TRY_UNWRAP(
                updateUnresolved,
                db.prepare("UPDATE dependencies SET updated_at = ?, parameter_context = ?, "
                           "parameter_types = ?, call_instance_id = ?, calling_object = ?, "
                           "resolved_class = ?, qualified_context = ? "
                           "WHERE from_symbol_id = ? AND to_symbol_id IS NULL "
                           "AND to_qualified_name IS ? AND dependency_type = ? "
                           "AND line_number = ? RETURNING id"));
            CODEGRAPH_TRY_UNWRAP(
                insertUnresolved,
                db.prepare("INSERT INTO dependencies (from_symbol_id, to_symbol_id, dependency_type, "
                           "line_number, to_qualified_name, calling_object, resolved_class, "
                           "qualified_context, parameter_context, parameter_types, "
                           "call_instance_id, created_at, updated_at) "
                           "VALUES (?, NULL, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) RETURNING id"));

            const int64_t now = nowMillis();
            for (const auto& dep : dependencies) {
                const char* kind = toString(dep.kind);
                auto paramTypes = encodeParameterTypes(dep.parameterTypes);
                Dependency stored = dep;

                if (dep.toSymbolId) {
                    CODEGRAPH_TRY(findResolved.reset());
                    CODEGRAPH_TRY(findResolved.bindAll(dep.fromSymbolId, *dep.toSymbolId, kind,
                                                       dep.lineNumber));
                    CODEGRAPH_TRY_UNWRAP(exists, findResolved.step());

                    CODEGRAPH_TRY(mergeResolved.reset());
                    CODEGRAPH_TRY(mergeResolved.bindAll(
                        dep.fromSymbolId, *dep.toSymbolId, kind, dep.lineNumber, dep.toQualifiedName,
                        dep.callingObject, dep.resolvedClass, dep.qualifiedContext,
                        dep.parameterContext, paramTypes, dep.callInstanceId, now, now));
                    CODEGRAPH_TRY_UNWRAP(hasRow, mergeResolved.step());
                    if (!hasRow) {
                        return Error{ErrorCode::DatabaseError, "Dependency upsert returned no row"};
                    }
                    stored.id = mergeResolved.getInt64(0);
                    if (exists)
                        ++result.updated;
                    else
                        ++result.created;
                } else {
                    CODEGRAPH_TRY(updateUnresolved.reset());
                    CODEGRAPH_TRY(updateUnresolved.bindAll(
                        now, dep.parameterContext, paramTypes, dep.callInstanceId, dep.callingObject,
                        dep.resolvedClass, dep.qualifiedContext, dep.fromSymbolId,
                        dep.toQualifiedName, kind, dep.lineNumber));
                    CODEGRAPH_TRY_UNWRAP(updatedRow, updateUnresolved.step());
                    if (updatedRow) {
                        stored.id = updateUnresolved.getInt64(0);
                        // Drain remaining rows so the statement completes
                        while (true) {
                            CODEGRAPH_TRY_UNWRAP(more, updateUnresolved.step());
                            if (!more)
                                break;
                        }
                        ++result.updated;
                    } else {
                        CODEGRAPH_TRY(insertUnresolved.reset());
                        CODEGRAPH_TRY(insertUnresolved.bindAll(
                            dep.fromSymbolId, kind, dep.lineNumber, dep.toQualifiedName,
                            dep.callingObject, dep.resolvedClass, dep.qualifiedContext,
                            dep.parameterContext, paramTypes, dep.callInstanceId, now, now));
                        CODEGRAPH_TRY_UNWRAP(inserted, insertUnresolved.step());
                        if (!inserted) {
                            return Error{ErrorCode::DatabaseError,
                                         "Dependency insert returned no row"};
                        }
                        stored.id = insertUnresolved.getInt64(0);
                        ++result.created;
                    }
                }
                result.rows.push_back(std::move(stored));
            }
            return {};
        });
        if (!tx) {
            spdlog::debug("Dependency batch of {} rolled back: {}", dependencies.size(),
                          tx.error().message);
            return tx.error();
        }
        return result;
    });
}

Result<std::vector<Dependency>>
SqliteGraphStore::findDependenciesByKeys(const std::vector<Dependency>& keys) {
    if (keys.empty())
        return std::vector<Dependency>{};
    return pool_->withConnection([&](Database& db) -> Result<std::vector<Dependency>> {
        CODEGRAPH_TRY_UNWRAP(resolved,
                             db.prepare(std::string("SELECT ") + kDependencyColumns +
                                        " FROM dependencies d WHERE d.from_symbol_id = ? "
                                        "AND d.to_symbol_id = ? AND d.dependency_type = ? "
                                        "AND d.line_number = ?"));
        CODEGRAPH_TRY_UNWRAP(unresolved,
                             db.prepare(std::string("SELECT ") + kDependencyColumns +
                                        " FROM dependencies d WHERE d.from_symbol_id = ? "
                                        "AND d.to_symbol_id IS NULL AND d.to_qualified_name IS ? "
                                        "AND d.dependency_type = ? AND d.line_number = ? "
                                        "ORDER BY d.id DESC"));
        std::vector<Dependency> out;
        for (const auto& key : keys) {
            const char* kind = toString(key.kind);
            Statement* stmt = nullptr;
            if (key.toSymbolId) {
                CODEGRAPH_TRY(resolved.reset());
                CODEGRAPH_TRY(resolved.bindAll(key.fromSymbolId, *key.toSymbolId, kind,
                                               key.lineNumber));
                stmt = &resolved;
            } else {
                CODEGRAPH_TRY(unresolved.reset());
                CODEGRAPH_TRY(unresolved.bindAll(key.fromSymbolId, key.toQualifiedName, kind,
                                                 key.lineNumber));
                stmt = &unresolved;
            }
            CODEGRAPH_TRY_UNWRAP(hasRow, stmt->step());
            if (hasRow) {
                out.push_back(readDependency(*stmt));
            }
        }
        return out;
    });
}

Result<std::vector<Dependency>> SqliteGraphStore::getDependenciesByRepository(RepositoryId repoId) {
    return pool_->withConnection([&](Database& db) -> Result<std::vector<Dependency>> {
        CODEGRAPH_TRY_UNWRAP(stmt, db.prepare(std::string("SELECT ") + kDependencyColumns +
                                              " FROM dependencies d "
                                              "JOIN symbols s ON s.id = d.from_symbol_id "
                                              "JOIN files f ON f.id = s.file_id "
                                              "WHERE f.repo_id = ? ORDER BY d.id"));
        CODEGRAPH_TRY(stmt.bind(1, repoId));
        return collectDependencies(stmt);
    });
}

Result<std::vector<DependencyWithContext>>
SqliteGraphStore::queryDependenciesWithContext(SymbolId symbolId, bool outgoing) {
    return pool_->withConnection([&](Database& db) -> Result<std::vector<DependencyWithContext>> {
        std::string sql = std::string("SELECT ") + kDependencyColumns + kEndpointColumns +
                          kEndpointJoins +
                          (outgoing ? "WHERE d.from_symbol_id = ? " : "WHERE d.to_symbol_id = ? ") +
                          "ORDER BY d.line_number, d.id";
        CODEGRAPH_TRY_UNWRAP(stmt, db.prepare(sql));
        CODEGRAPH_TRY(stmt.bind(1, symbolId));
        std::vector<DependencyWithContext> out;
        while (true) {
            CODEGRAPH_TRY_UNWRAP(hasRow, stmt.step());
            if (!hasRow)
                break;
            DependencyWithContext row;
            row.dependency = readDependency(stmt);
            row.from = readSymbolRef(stmt, kDependencyColumnCount);
            row.to = readSymbolRef(stmt, kDependencyColumnCount + 4);
            out.push_back(std::move(row));
        }
        return out;
    });
}

Result<std::vector<DependencyWithContext>> SqliteGraphStore::getDependenciesFrom(SymbolId symbolId) {
    return queryDependenciesWithContext(symbolId, true);
}

Result<std::vector<DependencyWithContext>> SqliteGraphStore::getDependenciesTo(SymbolId symbolId) {
    return queryDependenciesWithContext(symbolId, false);
}

// ===== File dependencies =====

Result<size_t>
SqliteGraphStore::upsertFileDependencies(const std::vector<FileDependency>& dependencies) {
    if (dependencies.empty())
        return size_t{0};
    return pool_->withConnection([&](Database& db) -> Result<size_t> {
        size_t written = 0;
        auto tx = db.transaction([&]() -> Result<void> {
            CODEGRAPH_TRY_UNWRAP(
                stmt, db.prepare("INSERT INTO file_dependencies (from_file_id, to_file_id, "
                                 "dependency_type, line_number, created_at) VALUES (?, ?, ?, ?, ?) "
                                 "ON CONFLICT(from_file_id, to_file_id, dependency_type) DO UPDATE SET "
                                 "line_number = COALESCE(excluded.line_number, "
                                 "file_dependencies.line_number)"));
            const int64_t now = nowMillis();
            for (const auto& dep : dependencies) {
                CODEGRAPH_TRY(stmt.reset());
                CODEGRAPH_TRY(stmt.bindAll(dep.fromFileId, dep.toFileId, toString(dep.kind),
                                           dep.lineNumber, now));
                CODEGRAPH_TRY(stmt.execute());
                written += static_cast<size_t>(db.changes());
            }
            return {};
        });
        if (!tx)
            return tx.error();
        return written;
    });
}

Result<std::vector<FileDependency>> SqliteGraphStore::getFileDependencies(RepositoryId repoId) {
    return pool_->withConnection([&](Database& db) -> Result<std::vector<FileDependency>> {
        CODEGRAPH_TRY_UNWRAP(stmt, db.prepare("SELECT fd.id, fd.from_file_id, fd.to_file_id, "
                                              "fd.dependency_type, fd.line_number "
                                              "FROM file_dependencies fd "
                                              "JOIN files f ON f.id = fd.from_file_id "
                                              "WHERE f.repo_id = ? ORDER BY fd.id"));
        CODEGRAPH_TRY(stmt.bind(1, repoId));
        std::vector<FileDependency> out;
        while (true) {
            CODEGRAPH_TRY_UNWRAP(hasRow, stmt.step());
            if (!hasRow)
                break;
            FileDependency fd;
            fd.id = stmt.getInt64(0);
            fd.fromFileId = stmt.getInt64(1);
            fd.toFileId = stmt.getInt64(2);
            fd.kind = parseDependencyKind(stmt.getString(3)).value_or(DependencyKind::Imports);
            if (!stmt.isNull(4))
                fd.lineNumber = stmt.getInt(4);
            out.push_back(fd);
        }
        return out;
    });
}

} // namespace codegraph::store
