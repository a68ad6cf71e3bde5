#include "sqlite_graph_store.h"

#include <spdlog/spdlog.h>
#include <codegraph/core/result_helpers.h>

namespace codegraph::store {

using namespace detail;

namespace {

Result<std::vector<Symbol>> collectSymbols(Statement& stmt) {
    std::vector<Symbol> out;
    while (true) {
        CODEGRAPH_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            break;
        out.push_back(readSymbol(stmt));
    }
    return out;
}

} // namespace

Result<std::vector<Symbol>> SqliteGraphStore::upsertSymbols(const std::vector<Symbol>& symbols) {
    if (symbols.empty())
        return std::vector<Symbol>{};
    return pool_->withConnection([&](Database& db) -> Result<std::vector<Symbol>> {
        std::vector<Symbol> out;
        out.reserve(symbols.size());
        auto tx = db.transaction([&]() -> Result<void> {
            CODEGRAPH_TRY_UNWRAP(
                stmt, db.prepare("INSERT INTO symbols (file_id, name, qualified_name, "
                                 "parent_symbol_id, symbol_type, start_line, end_line, "
                                 "is_exported, signature, description, created_at, updated_at) "
                                 "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
                                 "ON CONFLICT(file_id, name, symbol_type, start_line) DO UPDATE SET "
                                 "qualified_name = excluded.qualified_name, "
                                 "parent_symbol_id = COALESCE(excluded.parent_symbol_id, "
                                 "symbols.parent_symbol_id), "
                                 "end_line = excluded.end_line, "
                                 "is_exported = excluded.is_exported, "
                                 "signature = excluded.signature, "
                                 "description = excluded.description, "
                                 "updated_at = excluded.updated_at "
                                 "RETURNING id"));
            const int64_t now = nowMillis();
            for (const auto& s : symbols) {
                CODEGRAPH_TRY(stmt.reset());
                CODEGRAPH_TRY(stmt.clearBindings());
                CODEGRAPH_TRY(stmt.bindAll(s.fileId, s.name, s.qualifiedName, s.parentSymbolId,
                                           toString(s.kind), s.startLine, s.endLine,
                                           s.isExported ? 1 : 0, s.signature, s.description, now,
                                           now));
                CODEGRAPH_TRY_UNWRAP(hasRow, stmt.step());
                if (!hasRow) {
                    return Error{ErrorCode::DatabaseError, "Symbol upsert returned no row: " + s.name};
                }
                Symbol stored = s;
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

Result<std::optional<Symbol>> SqliteGraphStore::getSymbol(SymbolId id) {
    return pool_->withConnection([&](Database& db) -> Result<std::optional<Symbol>> {
        CODEGRAPH_TRY_UNWRAP(stmt, db.prepare(std::string("SELECT ") + kSymbolColumns +
                                              " FROM symbols s WHERE s.id = ?"));
        CODEGRAPH_TRY(stmt.bind(1, id));
        CODEGRAPH_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            return std::optional<Symbol>{};
        return std::optional<Symbol>{readSymbol(stmt)};
    });
}

Result<std::vector<Symbol>> SqliteGraphStore::getSymbolsByFile(FileId fileId) {
    return pool_->withConnection([&](Database& db) -> Result<std::vector<Symbol>> {
        CODEGRAPH_TRY_UNWRAP(stmt, db.prepare(std::string("SELECT ") + kSymbolColumns +
                                              " FROM symbols s WHERE s.file_id = ? "
                                              "ORDER BY s.start_line, s.id"));
        CODEGRAPH_TRY(stmt.bind(1, fileId));
        return collectSymbols(stmt);
    });
}

Result<std::vector<Symbol>> SqliteGraphStore::getSymbolsByRepository(RepositoryId repoId) {
    return pool_->withConnection([&](Database& db) -> Result<std::vector<Symbol>> {
        CODEGRAPH_TRY_UNWRAP(stmt, db.prepare(std::string("SELECT ") + kSymbolColumns +
                                              " FROM symbols s JOIN files f ON f.id = s.file_id "
                                              "WHERE f.repo_id = ? ORDER BY s.file_id, s.start_line"));
        CODEGRAPH_TRY(stmt.bind(1, repoId));
        return collectSymbols(stmt);
    });
}

Result<std::vector<Symbol>> SqliteGraphStore::findSymbolsByName(RepositoryId repoId,
                                                                const std::string& name) {
    return pool_->withConnection([&](Database& db) -> Result<std::vector<Symbol>> {
        CODEGRAPH_TRY_UNWRAP(stmt, db.prepare(std::string("SELECT ") + kSymbolColumns +
                                              " FROM symbols s JOIN files f ON f.id = s.file_id "
                                              "WHERE f.repo_id = ? AND s.name = ? ORDER BY s.id"));
        CODEGRAPH_TRY(stmt.bindAll(repoId, name));
        return collectSymbols(stmt);
    });
}

Result<std::vector<Symbol>>
SqliteGraphStore::findSymbolsByQualifiedName(RepositoryId repoId, const std::string& qualifiedName) {
    return pool_->withConnection([&](Database& db) -> Result<std::vector<Symbol>> {
        CODEGRAPH_TRY_UNWRAP(stmt,
                             db.prepare(std::string("SELECT ") + kSymbolColumns +
                                        " FROM symbols s JOIN files f ON f.id = s.file_id "
                                        "WHERE f.repo_id = ? AND s.qualified_name = ? ORDER BY s.id"));
        CODEGRAPH_TRY(stmt.bindAll(repoId, qualifiedName));
        return collectSymbols(stmt);
    });
}

Result<size_t>
SqliteGraphStore::updateSymbolParents(const std::vector<std::pair<SymbolId, SymbolId>>& links) {
    if (links.empty())
        return size_t{0};
    return pool_->withConnection([&](Database& db) -> Result<size_t> {
        size_t updated = 0;
        auto tx = db.transaction([&]() -> Result<void> {
            CODEGRAPH_TRY_UNWRAP(stmt, db.prepare("UPDATE symbols SET parent_symbol_id = ?, "
                                                  "updated_at = ? WHERE id = ? AND id <> ?"));
            const int64_t now = nowMillis();
            for (const auto& [child, parent] : links) {
                CODEGRAPH_TRY(stmt.reset());
                CODEGRAPH_TRY(stmt.bindAll(parent, now, child, parent));
                CODEGRAPH_TRY(stmt.execute());
                updated += static_cast<size_t>(db.changes());
            }
            return {};
        });
        if (!tx)
            return tx.error();
        spdlog::debug("Linked {} symbols to their parents", updated);
        return updated;
    });
}

} // namespace codegraph::store
