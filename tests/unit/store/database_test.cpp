#include <gtest/gtest.h>
#include <filesystem>
#include <codegraph/store/database.h>
#include <codegraph/store/migration.h>
#include "../../utils/test_helpers.h"

using namespace codegraph;
using namespace codegraph::store;
using namespace codegraph::test;

class DatabaseTest : public CodegraphTest {
protected:
    void SetUp() override {
        CodegraphTest::SetUp();
        dbPath_ = testDir / "database_test.db";
    }

    std::filesystem::path dbPath_;
};

TEST_F(DatabaseTest, OpenClose) {
    Database db;
    ASSERT_FALSE(db.isOpen());

    auto result = db.open(dbPath_.string(), ConnectionMode::Create);
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(db.isOpen());

    db.close();
    ASSERT_FALSE(db.isOpen());
}

TEST_F(DatabaseTest, PreparedStatements) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());
    ASSERT_TRUE(db.execute("CREATE TABLE test (id INTEGER PRIMARY KEY, name TEXT, value INTEGER)")
                    .has_value());

    auto insertStmtResult = db.prepare("INSERT INTO test (name, value) VALUES (?, ?)");
    ASSERT_TRUE(insertStmtResult.has_value());
    Statement insertStmt = std::move(insertStmtResult).value();

    ASSERT_TRUE(insertStmt.bindAll("first", 42).has_value());
    ASSERT_TRUE(insertStmt.execute().has_value());
    ASSERT_TRUE(insertStmt.reset().has_value());
    ASSERT_TRUE(insertStmt.bindAll("second", std::optional<int64_t>{}).has_value());
    ASSERT_TRUE(insertStmt.execute().has_value());

    auto selectResult = db.prepare("SELECT name, value FROM test ORDER BY id");
    ASSERT_TRUE(selectResult.has_value());
    Statement select = std::move(selectResult).value();

    auto row = select.step();
    ASSERT_TRUE(row.has_value() && row.value());
    EXPECT_EQ(select.getString(0), "first");
    EXPECT_EQ(select.getInt(1), 42);

    row = select.step();
    ASSERT_TRUE(row.has_value() && row.value());
    EXPECT_EQ(select.getString(0), "second");
    EXPECT_TRUE(select.isNull(1));

    row = select.step();
    ASSERT_TRUE(row.has_value());
    EXPECT_FALSE(row.value());
}

TEST_F(DatabaseTest, TransactionRollsBackOnError) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());
    ASSERT_TRUE(db.execute("CREATE TABLE t (id INTEGER PRIMARY KEY)").has_value());

    auto tx = db.transaction([&]() -> Result<void> {
        auto r = db.execute("INSERT INTO t (id) VALUES (1)");
        if (!r)
            return r;
        return Error{ErrorCode::InvalidState, "abort"};
    });
    ASSERT_FALSE(tx.has_value());
    EXPECT_EQ(tx.error().code, ErrorCode::InvalidState);

    auto count = db.prepare("SELECT COUNT(*) FROM t");
    ASSERT_TRUE(count.has_value());
    ASSERT_TRUE(count.value().step().value());
    EXPECT_EQ(count.value().getInt(0), 0);
}

TEST_F(DatabaseTest, UniqueViolationMapsToConstraintViolation) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());
    ASSERT_TRUE(db.execute("CREATE TABLE t (k TEXT UNIQUE)").has_value());
    ASSERT_TRUE(db.execute("INSERT INTO t (k) VALUES ('a')").has_value());

    auto dup = db.execute("INSERT INTO t (k) VALUES ('a')");
    ASSERT_FALSE(dup.has_value());
    EXPECT_EQ(dup.error().code, ErrorCode::ConstraintViolation);
}

TEST_F(DatabaseTest, DeadlineInterruptsRunawayQuery) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());

    auto stmt = db.prepare("WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c) "
                           "SELECT COUNT(*) FROM c");
    ASSERT_TRUE(stmt.has_value());

    {
        ScopedQueryDeadline deadline(db, std::chrono::milliseconds(20));
        auto step = stmt.value().step();
        ASSERT_FALSE(step.has_value());
        EXPECT_EQ(step.error().code, ErrorCode::Timeout);
    }

    // The connection stays usable once the deadline is gone
    EXPECT_TRUE(db.execute("CREATE TABLE after_timeout (id INTEGER)").has_value());
}

TEST_F(DatabaseTest, MigrationsApplyOnceAndRecordHistory) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());
    ASSERT_TRUE(db.execute("PRAGMA foreign_keys = ON").has_value());

    MigrationManager manager(db);
    ASSERT_TRUE(manager.initialize().has_value());
    manager.registerMigrations(GraphSchemaMigrations::getAllMigrations());

    auto needs = manager.needsMigration();
    ASSERT_TRUE(needs.has_value());
    EXPECT_TRUE(needs.value());

    ASSERT_TRUE(manager.migrate().has_value());
    auto version = manager.getCurrentVersion();
    ASSERT_TRUE(version.has_value());
    EXPECT_EQ(version.value(), manager.getLatestVersion());

    // Running again is a no-op
    ASSERT_TRUE(manager.migrate().has_value());
    auto history = manager.getHistory();
    ASSERT_TRUE(history.has_value());
    EXPECT_EQ(static_cast<int>(history.value().size()), manager.getLatestVersion());

    for (const char* table :
         {"repositories", "files", "symbols", "dependencies", "file_dependencies"}) {
        auto exists = db.tableExists(table);
        ASSERT_TRUE(exists.has_value());
        EXPECT_TRUE(exists.value()) << table;
    }
}
