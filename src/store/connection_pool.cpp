#include <spdlog/spdlog.h>
#include <codegraph/store/connection_pool.h>

namespace codegraph::store {

// PooledConnection implementation
PooledConnection::PooledConnection(std::unique_ptr<Database> db,
                                   std::function<void(PooledConnection*)> returnFunc)
    : db_(std::move(db)), returnFunc_(std::move(returnFunc)) {}

PooledConnection::~PooledConnection() {
    if (db_ && returnFunc_ && !returned_) {
        returnFunc_(this);
    }
}

// ConnectionPool implementation
ConnectionPool::ConnectionPool(const std::string& dbPath, const ConnectionPoolConfig& config)
    : dbPath_(dbPath), config_(config) {
    if (config_.maxConnections == 0) {
        config_.maxConnections = 1;
    }
}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

Result<void> ConnectionPool::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        return Error{ErrorCode::InvalidState, "Pool is shut down"};
    }

    for (size_t i = 0; i < config_.minConnections && totalConnections_ < config_.maxConnections;
         ++i) {
        auto connResult = createConnection();
        if (!connResult) {
            while (!available_.empty()) {
                available_.pop();
            }
            totalConnections_ = 0;
            return connResult.error();
        }
        available_.push(std::move(connResult).value());
        totalConnections_++;
    }

    spdlog::debug("Connection pool for '{}' initialized with {} connections", dbPath_,
                  totalConnections_);
    return {};
}

void ConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        return;
    }
    shutdown_ = true;
    while (!available_.empty()) {
        available_.pop();
    }
    totalConnections_ = activeConnections_;
    cv_.notify_all();
}

std::unique_ptr<PooledConnection> ConnectionPool::wrap(std::unique_ptr<Database> db) {
    return std::make_unique<PooledConnection>(
        std::move(db), [this](PooledConnection* conn) { returnConnection(conn); });
}

Result<std::unique_ptr<PooledConnection>> ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (shutdown_) {
        return Error{ErrorCode::InvalidState, "Pool is shut down"};
    }

    auto deadline = std::chrono::steady_clock::now() + config_.acquireTimeout;

    while (available_.empty()) {
        if (totalConnections_ < config_.maxConnections) {
            totalConnections_++;
            lock.unlock();
            auto connResult = createConnection();
            lock.lock();

            if (!connResult) {
                totalConnections_--;
                return connResult.error();
            }
            activeConnections_++;
            return wrap(std::move(connResult).value());
        }

        if (!cv_.wait_until(lock, deadline, [this] { return !available_.empty() || shutdown_; })) {
            timeoutCount_++;
            return Error{ErrorCode::Timeout, "Timeout acquiring database connection"};
        }
        if (shutdown_) {
            return Error{ErrorCode::InvalidState, "Pool is shut down"};
        }
    }

    auto db = std::move(available_.front());
    available_.pop();
    activeConnections_++;
    return wrap(std::move(db));
}

ConnectionPool::Stats ConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {totalConnections_, available_.size(), activeConnections_, timeoutCount_.load()};
}

Result<std::unique_ptr<Database>> ConnectionPool::createConnection() {
    auto db = std::make_unique<Database>();

    auto openResult = db->open(dbPath_, ConnectionMode::Create);
    if (!openResult) {
        return openResult.error();
    }

    auto configResult = configureConnection(*db);
    if (!configResult) {
        return configResult.error();
    }

    return db;
}

Result<void> ConnectionPool::configureConnection(Database& db) {
    auto timeoutResult = db.setBusyTimeout(config_.busyTimeout);
    if (!timeoutResult) {
        return timeoutResult.error();
    }

    if (config_.enableWAL) {
        auto walResult = db.enableWAL();
        if (!walResult) {
            spdlog::warn("WAL enable failed: {}", walResult.error().message);
        }
    }

    if (config_.enableForeignKeys) {
        auto fkResult = db.execute("PRAGMA foreign_keys = ON");
        if (!fkResult) {
            return fkResult.error();
        }
    }

    auto syncResult = db.execute("PRAGMA synchronous = NORMAL");
    if (!syncResult) {
        spdlog::warn("Setting synchronous mode failed: {}", syncResult.error().message);
    }
    return db.execute("PRAGMA temp_store = MEMORY");
}

void ConnectionPool::returnConnection(PooledConnection* conn) {
    if (!conn || !conn->db_)
        return;

    auto db = std::move(conn->db_);
    conn->returned_ = true;

    // A connection must never go back to the pool inside an open transaction
    if (db->inTransaction()) {
        auto rb = db->rollback();
        if (!rb) {
            spdlog::warn("Discarding connection after failed rollback: {}", rb.error().message);
            std::lock_guard<std::mutex> lock(mutex_);
            activeConnections_--;
            totalConnections_--;
            cv_.notify_one();
            return;
        }
    }
    db->clearDeadline();

    std::lock_guard<std::mutex> lock(mutex_);
    activeConnections_--;
    if (shutdown_) {
        totalConnections_--;
        return;
    }
    available_.push(std::move(db));
    cv_.notify_one();
}

} // namespace codegraph::store
