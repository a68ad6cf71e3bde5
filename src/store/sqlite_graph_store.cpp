#include "sqlite_graph_store.h"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <spdlog/spdlog.h>
#include <sstream>
#include <codegraph/core/result_helpers.h>
#include <codegraph/store/migration.h>

namespace codegraph::store {

namespace detail {

int64_t nowMillis() {
    return toEpochMillis(std::chrono::system_clock::now());
}

std::string joinIds(const std::vector<int64_t>& ids) {
    std::ostringstream out;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0)
            out << ',';
        out << ids[i];
    }
    return out.str();
}

std::optional<std::string>
encodeParameterTypes(const std::optional<std::vector<std::string>>& types) {
    if (!types)
        return std::nullopt;
    return nlohmann::json(*types).dump();
}

std::optional<std::vector<std::string>> decodeParameterTypes(const std::optional<std::string>& json) {
    if (!json || json->empty())
        return std::nullopt;
    auto parsed = nlohmann::json::parse(*json, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        spdlog::debug("Ignoring malformed stored parameter_types '{}'", *json);
        return std::nullopt;
    }
    std::vector<std::string> out;
    for (const auto& item : parsed) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

Repository readRepository(const Statement& stmt) {
    Repository repo;
    repo.id = stmt.getInt64(0);
    repo.name = stmt.getString(1);
    repo.path = stmt.getString(2);
    if (!stmt.isNull(3)) {
        repo.lastIndexed = fromEpochMillis(stmt.getInt64(3));
    }
    return repo;
}

File readFile(const Statement& stmt, int offset) {
    File f;
    f.id = stmt.getInt64(offset + 0);
    f.repoId = stmt.getInt64(offset + 1);
    f.path = stmt.getString(offset + 2);
    f.language = stmt.getOptionalString(offset + 3);
    f.size = stmt.getInt64(offset + 4);
    f.contentHash = stmt.getOptionalString(offset + 5);
    if (!stmt.isNull(offset + 6)) {
        f.lastModified = fromEpochMillis(stmt.getInt64(offset + 6));
    }
    f.isGenerated = stmt.getInt(offset + 7) != 0;
    f.isTest = stmt.getInt(offset + 8) != 0;
    return f;
}

Symbol readSymbol(const Statement& stmt, int offset) {
    Symbol s;
    s.id = stmt.getInt64(offset + 0);
    s.fileId = stmt.getInt64(offset + 1);
    s.name = stmt.getString(offset + 2);
    s.qualifiedName = stmt.getOptionalString(offset + 3);
    s.parentSymbolId = stmt.getOptionalInt64(offset + 4);
    s.kind = parseSymbolKind(stmt.getString(offset + 5)).value_or(SymbolKind::Function);
    s.startLine = stmt.getInt(offset + 6);
    s.endLine = stmt.getInt(offset + 7);
    s.isExported = stmt.getInt(offset + 8) != 0;
    s.signature = stmt.getOptionalString(offset + 9);
    s.description = stmt.getOptionalString(offset + 10);
    return s;
}

Dependency readDependency(const Statement& stmt, int offset) {
    Dependency d;
    d.id = stmt.getInt64(offset + 0);
    d.fromSymbolId = stmt.getInt64(offset + 1);
    d.toSymbolId = stmt.getOptionalInt64(offset + 2);
    d.kind = parseDependencyKind(stmt.getString(offset + 3)).value_or(DependencyKind::Calls);
    d.lineNumber = stmt.getInt(offset + 4);
    d.toQualifiedName = stmt.getOptionalString(offset + 5);
    d.callingObject = stmt.getOptionalString(offset + 6);
    d.resolvedClass = stmt.getOptionalString(offset + 7);
    d.qualifiedContext = stmt.getOptionalString(offset + 8);
    d.parameterContext = stmt.getOptionalString(offset + 9);
    d.parameterTypes = decodeParameterTypes(stmt.getOptionalString(offset + 10));
    d.callInstanceId = stmt.getOptionalString(offset + 11);
    return d;
}

std::optional<SymbolRef> readSymbolRef(const Statement& stmt, int offset) {
    if (stmt.isNull(offset))
        return std::nullopt;
    SymbolRef ref;
    ref.id = stmt.getInt64(offset);
    ref.name = stmt.getString(offset + 1);
    ref.kind = parseSymbolKind(stmt.getString(offset + 2)).value_or(SymbolKind::Function);
    ref.filePath = stmt.getString(offset + 3);
    return ref;
}

std::string kindFilterClause(const std::vector<DependencyKind>& kinds, const char* column) {
    if (kinds.empty())
        return {};
    // Values come from the closed enum, never from user text
    std::string clause = std::string(" AND ") + column + " IN (";
    for (size_t i = 0; i < kinds.size(); ++i) {
        if (i > 0)
            clause += ",";
        clause += "'";
        clause += toString(kinds[i]);
        clause += "'";
    }
    clause += ")";
    return clause;
}

} // namespace detail

using namespace detail;

namespace {

Result<std::optional<Repository>> queryOneRepository(Database& db, const std::string& sql,
                                                     const std::string& param) {
    CODEGRAPH_TRY_UNWRAP(stmt, db.prepare(sql));
    CODEGRAPH_TRY(stmt.bind(1, param));
    CODEGRAPH_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow)
        return std::optional<Repository>{};
    return std::optional<Repository>{readRepository(stmt)};
}

Result<int64_t> countRows(Database& db, const std::string& sql, int64_t repoId) {
    CODEGRAPH_TRY_UNWRAP(stmt, db.prepare(sql));
    CODEGRAPH_TRY(stmt.bind(1, repoId));
    CODEGRAPH_TRY_UNWRAP(hasRow, stmt.step());
    int64_t count = hasRow ? stmt.getInt64(0) : 0;
    return count;
}

} // namespace

Result<std::unique_ptr<SqliteGraphStore>> SqliteGraphStore::create(const std::string& dbPath,
                                                                   const GraphStoreConfig& cfg) {
    const bool inMemory = dbPath == ":memory:";

    ConnectionPoolConfig poolCfg;
    poolCfg.minConnections = 1;
    // Every connection to ":memory:" would be a separate database
    poolCfg.maxConnections = inMemory ? 1 : std::max<size_t>(1, cfg.maxConnections);
    poolCfg.busyTimeout = cfg.busyTimeout;
    poolCfg.enableWAL = cfg.enableWAL && !inMemory;
    poolCfg.enableForeignKeys = true;

    auto pool = std::make_unique<ConnectionPool>(dbPath, poolCfg);
    auto rInit = pool->initialize();
    if (!rInit)
        return rInit.error();

    auto rMig = pool->withConnection([](Database& db) -> Result<void> {
        MigrationManager mm(db);
        CODEGRAPH_TRY(mm.initialize());
        mm.registerMigrations(GraphSchemaMigrations::getAllMigrations());
        return mm.migrate();
    });
    if (!rMig) {
        spdlog::error("Graph store migration failed for '{}': {}", dbPath, rMig.error().message);
        return rMig.error();
    }

    spdlog::debug("Opened graph store '{}' (sqlite {})", dbPath, Database::version());
    return std::unique_ptr<SqliteGraphStore>(new SqliteGraphStore(std::move(pool)));
}

Result<std::unique_ptr<GraphStore>> makeSqliteGraphStore(const std::string& dbPath,
                                                         const GraphStoreConfig& cfg) {
    auto s = SqliteGraphStore::create(dbPath, cfg);
    if (!s)
        return s.error();
    return std::unique_ptr<GraphStore>(std::move(s).value().release());
}

// ===== Repositories =====

Result<Repository> SqliteGraphStore::getOrCreateRepository(const std::string& name,
                                                           const std::string& path) {
    if (path.empty()) {
        return Error{ErrorCode::InvalidArgument, "Repository path must not be empty"};
    }
    return pool_->withConnection([&](Database& db) -> Result<Repository> {
        CODEGRAPH_TRY_UNWRAP(stmt, db.prepare(
                                       "INSERT INTO repositories (name, path, created_at) "
                                       "VALUES (?, ?, ?) "
                                       "ON CONFLICT(path) DO UPDATE SET name = excluded.name "
                                       "RETURNING id, name, path, last_indexed"));
        CODEGRAPH_TRY(stmt.bindAll(name, path, nowMillis()));
        CODEGRAPH_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow) {
            return Error{ErrorCode::DatabaseError, "Repository upsert returned no row"};
        }
        return readRepository(stmt);
    });
}

Result<std::optional<Repository>> SqliteGraphStore::getRepository(RepositoryId id) {
    return pool_->withConnection([&](Database& db) -> Result<std::optional<Repository>> {
        CODEGRAPH_TRY_UNWRAP(
            stmt, db.prepare("SELECT id, name, path, last_indexed FROM repositories WHERE id = ?"));
        CODEGRAPH_TRY(stmt.bind(1, id));
        CODEGRAPH_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            return std::optional<Repository>{};
        return std::optional<Repository>{readRepository(stmt)};
    });
}

Result<std::optional<Repository>> SqliteGraphStore::findRepositoryByPath(const std::string& path) {
    return pool_->withConnection([&](Database& db) {
        return queryOneRepository(
            db, "SELECT id, name, path, last_indexed FROM repositories WHERE path = ?", path);
    });
}

Result<std::optional<Repository>> SqliteGraphStore::findRepositoryByName(const std::string& name) {
    return pool_->withConnection([&](Database& db) {
        return queryOneRepository(db,
                                  "SELECT id, name, path, last_indexed FROM repositories "
                                  "WHERE name = ? ORDER BY id LIMIT 1",
                                  name);
    });
}

Result<void> SqliteGraphStore::updateLastIndexed(RepositoryId id, TimePoint when) {
    return pool_->withConnection([&](Database& db) -> Result<void> {
        CODEGRAPH_TRY_UNWRAP(stmt, db.prepare("UPDATE repositories SET last_indexed = ? WHERE id = ?"));
        CODEGRAPH_TRY(stmt.bindAll(toEpochMillis(when), id));
        CODEGRAPH_TRY(stmt.execute());
        if (db.changes() == 0) {
            return Error{ErrorCode::NotFound, "Repository " + std::to_string(id) + " not found"};
        }
        return {};
    });
}

Result<void> SqliteGraphStore::clearRepositoryData(RepositoryId id) {
    return pool_->withConnection([&](Database& db) -> Result<void> {
        return db.transaction([&]() -> Result<void> {
            CODEGRAPH_TRY_UNWRAP(del, db.prepare("DELETE FROM files WHERE repo_id = ?"));
            CODEGRAPH_TRY(del.bind(1, id));
            CODEGRAPH_TRY(del.execute());
            int removed = db.changes();
            CODEGRAPH_TRY_UNWRAP(reset,
                                 db.prepare("UPDATE repositories SET last_indexed = NULL WHERE id = ?"));
            CODEGRAPH_TRY(reset.bind(1, id));
            CODEGRAPH_TRY(reset.execute());
            spdlog::info("Cleared repository {} data ({} files)", id, removed);
            return {};
        });
    });
}

Result<bool> SqliteGraphStore::deleteRepository(RepositoryId id) {
    return pool_->withConnection([&](Database& db) -> Result<bool> {
        CODEGRAPH_TRY_UNWRAP(stmt, db.prepare("DELETE FROM repositories WHERE id = ?"));
        CODEGRAPH_TRY(stmt.bind(1, id));
        CODEGRAPH_TRY(stmt.execute());
        bool deleted = db.changes() > 0;
        return deleted;
    });
}

// ===== Files =====

Result<std::vector<File>> SqliteGraphStore::upsertFiles(const std::vector<File>& files) {
    if (files.empty())
        return std::vector<File>{};
    return pool_->withConnection([&](Database& db) -> Result<std::vector<File>> {
        std::vector<File> out;
        out.reserve(files.size());
        auto tx = db.transaction([&]() -> Result<void> {
            CODEGRAPH_TRY_UNWRAP(
                stmt, db.prepare("INSERT INTO files (repo_id, path, language, size, content_hash, "
                                 "last_modified, is_generated, is_test, updated_at) "
                                 "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) "
                                 "ON CONFLICT(repo_id, path) DO UPDATE SET "
                                 "language = excluded.language, size = excluded.size, "
                                 "content_hash = excluded.content_hash, "
                                 "last_modified = excluded.last_modified, "
                                 "is_generated = excluded.is_generated, is_test = excluded.is_test, "
                                 "updated_at = excluded.updated_at "
                                 "RETURNING id"));
            const int64_t now = nowMillis();
            for (const auto& f : files) {
                CODEGRAPH_TRY(stmt.reset());
                CODEGRAPH_TRY(stmt.clearBindings());
                std::optional<int64_t> mtime;
                if (f.lastModified)
                    mtime = toEpochMillis(*f.lastModified);
                CODEGRAPH_TRY(stmt.bindAll(f.repoId, f.path, f.language, f.size, f.contentHash,
                                           mtime, f.isGenerated ? 1 : 0, f.isTest ? 1 : 0, now));
                CODEGRAPH_TRY_UNWRAP(hasRow, stmt.step());
                if (!hasRow) {
                    return Error{ErrorCode::DatabaseError, "File upsert returned no row: " + f.path};
                }
                File stored = f;
                stored.id = stmt.getInt64(0);
                out.push_back(std::move(stored));
            }
            return {};
        });
        if (!tx)
            return tx.error();
        return out;
    });
}

Result<std::vector<File>> SqliteGraphStore::getFilesByRepository(RepositoryId repoId) {
    return pool_->withConnection([&](Database& db) -> Result<std::vector<File>> {
        CODEGRAPH_TRY_UNWRAP(stmt, db.prepare(std::string("SELECT ") + kFileColumns +
                                              " FROM files f WHERE f.repo_id = ? ORDER BY f.path"));
        CODEGRAPH_TRY(stmt.bind(1, repoId));
        std::vector<File> out;
        while (true) {
            CODEGRAPH_TRY_UNWRAP(hasRow, stmt.step());
            if (!hasRow)
                break;
            out.push_back(readFile(stmt));
        }
        return out;
    });
}

Result<std::optional<File>> SqliteGraphStore::findFileByPath(RepositoryId repoId,
                                                             const std::string& path) {
    return pool_->withConnection([&](Database& db) -> Result<std::optional<File>> {
        CODEGRAPH_TRY_UNWRAP(stmt, db.prepare(std::string("SELECT ") + kFileColumns +
                                              " FROM files f WHERE f.repo_id = ? AND f.path = ?"));
        CODEGRAPH_TRY(stmt.bindAll(repoId, path));
        CODEGRAPH_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            return std::optional<File>{};
        return std::optional<File>{readFile(stmt)};
    });
}

Result<size_t> SqliteGraphStore::deleteFiles(const std::vector<FileId>& fileIds) {
    if (fileIds.empty())
        return size_t{0};
    return pool_->withConnection([&](Database& db) -> Result<size_t> {
        size_t deleted = 0;
        auto tx = db.transaction([&]() -> Result<void> {
            CODEGRAPH_TRY_UNWRAP(stmt, db.prepare("DELETE FROM files WHERE id = ?"));
            for (auto id : fileIds) {
                CODEGRAPH_TRY(stmt.reset());
                CODEGRAPH_TRY(stmt.bind(1, id));
                CODEGRAPH_TRY(stmt.execute());
                deleted += static_cast<size_t>(db.changes());
            }
            return {};
        });
        if (!tx)
            return tx.error();
        spdlog::debug("Deleted {} files (symbols and edges cascaded)", deleted);
        return deleted;
    });
}

Result<FileCleanupCounts> SqliteGraphStore::cleanupFileData(const std::vector<FileId>& fileIds) {
    FileCleanupCounts counts;
    if (fileIds.empty())
        return counts;
    return pool_->withConnection([&](Database& db) -> Result<FileCleanupCounts> {
        auto tx = db.transaction([&]() -> Result<void> {
            // Outgoing edges only; incoming edges lose their target via SET NULL and
            // are rebound or orphan-cleaned by the next resolution pass
            CODEGRAPH_TRY_UNWRAP(deps, db.prepare(
                                           "DELETE FROM dependencies WHERE from_symbol_id IN "
                                           "(SELECT id FROM symbols WHERE file_id = ?)"));
            CODEGRAPH_TRY_UNWRAP(fileDeps,
                                 db.prepare("DELETE FROM file_dependencies "
                                            "WHERE from_file_id = ? OR to_file_id = ?"));
            CODEGRAPH_TRY_UNWRAP(syms, db.prepare("DELETE FROM symbols WHERE file_id = ?"));
            for (auto id : fileIds) {
                CODEGRAPH_TRY(deps.reset());
                CODEGRAPH_TRY(deps.bind(1, id));
                CODEGRAPH_TRY(deps.execute());
                counts.dependencies += static_cast<size_t>(db.changes());

                CODEGRAPH_TRY(fileDeps.reset());
                CODEGRAPH_TRY(fileDeps.bindAll(id, id));
                CODEGRAPH_TRY(fileDeps.execute());
                counts.fileDependencies += static_cast<size_t>(db.changes());

                CODEGRAPH_TRY(syms.reset());
                CODEGRAPH_TRY(syms.bind(1, id));
                CODEGRAPH_TRY(syms.execute());
                counts.symbols += static_cast<size_t>(db.changes());
            }
            return {};
        });
        if (!tx)
            return tx.error();
        return counts;
    });
}

// ===== Statistics =====

Result<GraphStats> SqliteGraphStore::getGraphStats(RepositoryId repoId) {
    return pool_->withConnection([&](Database& db) -> Result<GraphStats> {
        GraphStats stats;
        CODEGRAPH_TRY_UNWRAP(files, countRows(db, "SELECT COUNT(*) FROM files WHERE repo_id = ?",
                                              repoId));
        CODEGRAPH_TRY_UNWRAP(symbols, countRows(db,
                                                "SELECT COUNT(*) FROM symbols s "
                                                "JOIN files f ON f.id = s.file_id WHERE f.repo_id = ?",
                                                repoId));
        CODEGRAPH_TRY_UNWRAP(deps, countRows(db,
                                             "SELECT COUNT(*) FROM dependencies d "
                                             "JOIN symbols s ON s.id = d.from_symbol_id "
                                             "JOIN files f ON f.id = s.file_id WHERE f.repo_id = ?",
                                             repoId));
        CODEGRAPH_TRY_UNWRAP(resolved,
                             countRows(db,
                                       "SELECT COUNT(*) FROM dependencies d "
                                       "JOIN symbols s ON s.id = d.from_symbol_id "
                                       "JOIN files f ON f.id = s.file_id "
                                       "WHERE f.repo_id = ? AND d.to_symbol_id IS NOT NULL",
                                       repoId));
        CODEGRAPH_TRY_UNWRAP(unresolved,
                             countRows(db,
                                       "SELECT COUNT(*) FROM dependencies d "
                                       "JOIN symbols s ON s.id = d.from_symbol_id "
                                       "JOIN files f ON f.id = s.file_id "
                                       "WHERE f.repo_id = ? AND d.to_symbol_id IS NULL "
                                       "AND d.to_qualified_name IS NOT NULL",
                                       repoId));
        CODEGRAPH_TRY_UNWRAP(fileDeps, countRows(db,
                                                 "SELECT COUNT(*) FROM file_dependencies fd "
                                                 "JOIN files f ON f.id = fd.from_file_id "
                                                 "WHERE f.repo_id = ?",
                                                 repoId));
        stats.files = files;
        stats.symbols = symbols;
        stats.dependencies = deps;
        stats.resolvedDependencies = resolved;
        stats.unresolvedDependencies = unresolved;
        stats.fileDependencies = fileDeps;
        return stats;
    });
}

} // namespace codegraph::store
