#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <type_traits>
#include <codegraph/store/database.h>

namespace codegraph::store {

/**
 * @brief Configuration for connection pool
 */
struct ConnectionPoolConfig {
    size_t minConnections = 1;                  ///< Connections opened by initialize()
    size_t maxConnections = 4;                  ///< Maximum connections allowed
    std::chrono::milliseconds busyTimeout{5000}; ///< SQLite busy timeout
    std::chrono::milliseconds acquireTimeout{30000};
    bool enableWAL = true;         ///< Enable WAL mode
    bool enableForeignKeys = true; ///< Enable foreign key constraints
};

/**
 * @brief Database connection checked out of a pool
 */
class PooledConnection {
public:
    PooledConnection(std::unique_ptr<Database> db, std::function<void(PooledConnection*)> returnFunc);
    ~PooledConnection();

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    Database* operator->() { return db_.get(); }
    Database& operator*() { return *db_; }

    [[nodiscard]] bool isValid() const { return db_ != nullptr; }

private:
    friend class ConnectionPool;

    std::unique_ptr<Database> db_;
    std::function<void(PooledConnection*)> returnFunc_;
    bool returned_ = false;
};

/**
 * @brief Thread-safe pool of SQLite connections to one database file
 *
 * Writers are serialized by SQLite itself (BEGIN IMMEDIATE plus busy timeout);
 * the pool only bounds how many connections exist at once.
 */
class ConnectionPool {
public:
    explicit ConnectionPool(const std::string& dbPath, const ConnectionPoolConfig& config = {});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;
    ConnectionPool(ConnectionPool&&) = delete;
    ConnectionPool& operator=(ConnectionPool&&) = delete;

    Result<void> initialize();
    void shutdown();

    /**
     * @brief Acquire a connection, waiting up to the configured timeout
     */
    Result<std::unique_ptr<PooledConnection>> acquire();

    /**
     * @brief Execute a function with a connection
     */
    template <typename Func>
    auto withConnection(Func&& func) -> std::invoke_result_t<Func, Database&> {
        auto connResult = acquire();
        if (!connResult) {
            return connResult.error();
        }

        auto conn = std::move(connResult).value();
        try {
            return func(**conn);
        } catch (const std::exception& e) {
            return Error{ErrorCode::DatabaseError, e.what()};
        }
    }

    struct Stats {
        size_t totalConnections;
        size_t availableConnections;
        size_t activeConnections;
        size_t timeoutCount;
    };

    [[nodiscard]] Stats getStats() const;

    [[nodiscard]] const std::string& path() const { return dbPath_; }

private:
    std::string dbPath_;
    ConnectionPoolConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::unique_ptr<Database>> available_;
    size_t totalConnections_ = 0;
    size_t activeConnections_ = 0;
    std::atomic<size_t> timeoutCount_{0};
    bool shutdown_ = false;

    Result<std::unique_ptr<Database>> createConnection();
    Result<void> configureConnection(Database& db);
    void returnConnection(PooledConnection* conn);
    std::unique_ptr<PooledConnection> wrap(std::unique_ptr<Database> db);
};

} // namespace codegraph::store
