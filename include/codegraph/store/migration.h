#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <codegraph/store/database.h>

namespace codegraph::store {

/**
 * @brief Database migration definition
 */
struct Migration {
    int version;       ///< Migration version number
    std::string name;  ///< Human-readable name
    std::string upSQL; ///< SQL to apply migration

    /**
     * @brief Custom migration function (for complex migrations)
     */
    std::function<Result<void>(Database&)> upFunc;
};

/**
 * @brief Migration history entry
 */
struct MigrationHistory {
    int version;
    std::string name;
    std::chrono::system_clock::time_point appliedAt;
    std::chrono::milliseconds duration;
    bool success;
    std::string error;
};

/**
 * @brief Database migration manager
 */
class MigrationManager {
public:
    explicit MigrationManager(Database& db);

    /**
     * @brief Initialize migration system (create tables)
     */
    Result<void> initialize();

    void registerMigration(Migration migration);
    void registerMigrations(std::vector<Migration> migrations);

    /**
     * @brief Get current schema version
     */
    Result<int> getCurrentVersion();

    /**
     * @brief Get latest available version
     */
    int getLatestVersion() const;

    Result<bool> needsMigration();

    /**
     * @brief Apply all pending migrations
     */
    Result<void> migrate();

    /**
     * @brief Migrate forward to a specific version
     */
    Result<void> migrateTo(int targetVersion);

    Result<std::vector<MigrationHistory>> getHistory();

private:
    Database& db_;
    std::map<int, Migration> migrations_;

    Result<void> applyMigration(const Migration& migration);
    Result<void> recordMigration(int version, const std::string& name,
                                 std::chrono::milliseconds duration, bool success,
                                 const std::string& error = "");
    Result<void> createMigrationTables();
};

/**
 * @brief Built-in migrations for the code graph schema
 */
class GraphSchemaMigrations {
public:
    static std::vector<Migration> getAllMigrations();

private:
    // Version 1: repositories, files, symbols, dependencies
    static Migration createCoreSchema();

    // Version 2: lookup indexes for resolution and traversal
    static Migration createGraphIndexes();

    // Version 3: file-level dependency table
    static Migration createFileDependencies();

    // Version 4: enhanced call context and parameter grouping columns
    static Migration addCallContextColumns();
};

} // namespace codegraph::store
