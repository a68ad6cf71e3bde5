#include <spdlog/spdlog.h>
#include <codegraph/store/migration.h>

namespace codegraph::store {

// MigrationManager implementation
MigrationManager::MigrationManager(Database& db) : db_(db) {}

Result<void> MigrationManager::initialize() {
    return createMigrationTables();
}

void MigrationManager::registerMigration(Migration migration) {
    migrations_[migration.version] = std::move(migration);
}

void MigrationManager::registerMigrations(std::vector<Migration> migrations) {
    for (auto& migration : migrations) {
        registerMigration(std::move(migration));
    }
}

Result<int> MigrationManager::getCurrentVersion() {
    auto stmtResult = db_.prepare("SELECT MAX(version) FROM migration_history WHERE success = 1");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();

    if (stepResult.value() && !stmt.isNull(0)) {
        return stmt.getInt(0);
    }

    return 0; // No migrations applied yet
}

int MigrationManager::getLatestVersion() const {
    if (migrations_.empty())
        return 0;
    return migrations_.rbegin()->first;
}

Result<bool> MigrationManager::needsMigration() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    return currentResult.value() < getLatestVersion();
}

Result<void> MigrationManager::migrate() {
    return migrateTo(getLatestVersion());
}

Result<void> MigrationManager::migrateTo(int targetVersion) {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    int currentVersion = currentResult.value();

    if (currentVersion == targetVersion) {
        spdlog::debug("Schema already at version {}", targetVersion);
        return {};
    }

    if (currentVersion > targetVersion) {
        return Error{ErrorCode::InvalidState,
                     "Database schema version " + std::to_string(currentVersion) +
                         " is newer than supported version " + std::to_string(targetVersion)};
    }

    for (const auto& [version, migration] : migrations_) {
        if (version <= currentVersion || version > targetVersion) {
            continue;
        }
        spdlog::debug("Applying migration {} '{}'", version, migration.name);

        auto start = std::chrono::steady_clock::now();
        auto result = applyMigration(migration);
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (!result) {
            auto recordResult =
                recordMigration(version, migration.name, duration, false, result.error().message);
            if (!recordResult) {
                spdlog::warn("Failed to record failed migration {}: {}", version,
                             recordResult.error().message);
            }
            return result;
        }

        auto recordResult = recordMigration(version, migration.name, duration, true);
        if (!recordResult)
            return recordResult;

        currentVersion = version;
    }

    spdlog::debug("Migration complete. Now at version {}", currentVersion);
    return {};
}

Result<std::vector<MigrationHistory>> MigrationManager::getHistory() {
    auto stmtResult = db_.prepare("SELECT version, name, applied_at, duration_ms, success, error "
                                  "FROM migration_history ORDER BY version ASC");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    std::vector<MigrationHistory> history;

    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;

        MigrationHistory entry;
        entry.version = stmt.getInt(0);
        entry.name = stmt.getString(1);
        entry.appliedAt =
            std::chrono::system_clock::time_point(std::chrono::seconds(stmt.getInt64(2)));
        entry.duration = std::chrono::milliseconds(stmt.getInt64(3));
        entry.success = stmt.getInt(4) != 0;
        entry.error = stmt.getString(5);

        history.push_back(entry);
    }

    return history;
}

Result<void> MigrationManager::applyMigration(const Migration& migration) {
    return db_.transaction([&]() -> Result<void> {
        if (migration.upFunc) {
            return migration.upFunc(db_);
        } else if (!migration.upSQL.empty()) {
            return db_.execute(migration.upSQL);
        }
        return Error{ErrorCode::InvalidData, "Migration has no up function or SQL"};
    });
}

Result<void> MigrationManager::recordMigration(int version, const std::string& name,
                                               std::chrono::milliseconds duration, bool success,
                                               const std::string& error) {
    // A failed attempt is replaced by the next successful one
    auto stmtResult = db_.prepare("INSERT OR REPLACE INTO migration_history "
                                  "(version, name, applied_at, duration_ms, success, error) "
                                  "VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto now = std::chrono::system_clock::now().time_since_epoch();
    int64_t seconds = std::chrono::duration_cast<std::chrono::seconds>(now).count();
    int64_t durationMs = duration.count();

    auto bindResult = stmt.bindAll(version, name, seconds, durationMs, success ? 1 : 0, error);
    if (!bindResult)
        return bindResult;

    return stmt.execute();
}

Result<void> MigrationManager::createMigrationTables() {
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS migration_history (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            version INTEGER NOT NULL,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL,
            duration_ms INTEGER NOT NULL,
            success INTEGER NOT NULL,
            error TEXT,
            UNIQUE(version)
        )
    )");
}

// GraphSchemaMigrations implementation
std::vector<Migration> GraphSchemaMigrations::getAllMigrations() {
    return {createCoreSchema(), createGraphIndexes(), createFileDependencies(),
            addCallContextColumns()};
}

Migration GraphSchemaMigrations::createCoreSchema() {
    Migration m;
    m.version = 1;
    m.name = "Core graph schema";
    // Timestamps are unix epoch milliseconds
    m.upSQL = R"(
        CREATE TABLE IF NOT EXISTS repositories (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL,
            path TEXT NOT NULL UNIQUE,
            last_indexed INTEGER,
            created_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS files (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            repo_id INTEGER NOT NULL REFERENCES repositories(id) ON DELETE CASCADE,
            path TEXT NOT NULL,
            language TEXT,
            size INTEGER NOT NULL DEFAULT 0,
            content_hash TEXT,
            last_modified INTEGER,
            is_generated INTEGER NOT NULL DEFAULT 0,
            is_test INTEGER NOT NULL DEFAULT 0,
            updated_at INTEGER NOT NULL,
            UNIQUE(repo_id, path)
        );

        CREATE TABLE IF NOT EXISTS symbols (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            file_id INTEGER NOT NULL REFERENCES files(id) ON DELETE CASCADE,
            name TEXT NOT NULL,
            qualified_name TEXT,
            parent_symbol_id INTEGER REFERENCES symbols(id) ON DELETE SET NULL,
            symbol_type TEXT NOT NULL,
            start_line INTEGER NOT NULL DEFAULT 0,
            end_line INTEGER NOT NULL DEFAULT 0,
            is_exported INTEGER NOT NULL DEFAULT 0,
            signature TEXT,
            description TEXT,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            UNIQUE(file_id, name, symbol_type, start_line)
        );

        CREATE TABLE IF NOT EXISTS dependencies (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            from_symbol_id INTEGER NOT NULL REFERENCES symbols(id) ON DELETE CASCADE,
            to_symbol_id INTEGER REFERENCES symbols(id) ON DELETE SET NULL,
            dependency_type TEXT NOT NULL,
            line_number INTEGER NOT NULL DEFAULT 0,
            to_qualified_name TEXT,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            UNIQUE(from_symbol_id, to_symbol_id, dependency_type, line_number)
        );
    )";
    return m;
}

Migration GraphSchemaMigrations::createGraphIndexes() {
    Migration m;
    m.version = 2;
    m.name = "Graph lookup indexes";
    m.upSQL = R"(
        CREATE INDEX IF NOT EXISTS idx_files_repo ON files(repo_id);
        CREATE INDEX IF NOT EXISTS idx_symbols_file ON symbols(file_id);
        CREATE INDEX IF NOT EXISTS idx_symbols_name ON symbols(name);
        CREATE INDEX IF NOT EXISTS idx_symbols_qualified_name ON symbols(qualified_name);
        CREATE INDEX IF NOT EXISTS idx_symbols_parent ON symbols(parent_symbol_id);
        CREATE INDEX IF NOT EXISTS idx_dependencies_from ON dependencies(from_symbol_id);
        CREATE INDEX IF NOT EXISTS idx_dependencies_to ON dependencies(to_symbol_id);
        CREATE INDEX IF NOT EXISTS idx_dependencies_unresolved
            ON dependencies(to_qualified_name) WHERE to_symbol_id IS NULL;
    )";
    return m;
}

Migration GraphSchemaMigrations::createFileDependencies() {
    Migration m;
    m.version = 3;
    m.name = "File dependencies";
    m.upSQL = R"(
        CREATE TABLE IF NOT EXISTS file_dependencies (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            from_file_id INTEGER NOT NULL REFERENCES files(id) ON DELETE CASCADE,
            to_file_id INTEGER NOT NULL REFERENCES files(id) ON DELETE CASCADE,
            dependency_type TEXT NOT NULL,
            line_number INTEGER,
            created_at INTEGER NOT NULL,
            UNIQUE(from_file_id, to_file_id, dependency_type)
        );

        CREATE INDEX IF NOT EXISTS idx_file_dependencies_from ON file_dependencies(from_file_id);
        CREATE INDEX IF NOT EXISTS idx_file_dependencies_to ON file_dependencies(to_file_id);
    )";
    return m;
}

Migration GraphSchemaMigrations::addCallContextColumns() {
    Migration m;
    m.version = 4;
    m.name = "Call context columns";
    m.upSQL = R"(
        ALTER TABLE dependencies ADD COLUMN calling_object TEXT;
        ALTER TABLE dependencies ADD COLUMN resolved_class TEXT;
        ALTER TABLE dependencies ADD COLUMN qualified_context TEXT;
        ALTER TABLE dependencies ADD COLUMN parameter_context TEXT;
        ALTER TABLE dependencies ADD COLUMN parameter_types TEXT;
        ALTER TABLE dependencies ADD COLUMN call_instance_id TEXT;

        CREATE INDEX IF NOT EXISTS idx_dependencies_parameter_context
            ON dependencies(to_symbol_id, parameter_context);
    )";
    return m;
}

} // namespace codegraph::store
