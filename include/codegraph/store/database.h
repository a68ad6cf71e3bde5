#pragma once

#include <sqlite3.h>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <codegraph/core/types.h>

namespace codegraph::store {

/**
 * @brief Database connection mode
 */
enum class ConnectionMode {
    ReadWrite, ///< Read-write mode (default)
    ReadOnly,  ///< Read-only mode
    Memory,    ///< In-memory database
    Create     ///< Create if not exists
};

/**
 * @brief SQLite statement wrapper with RAII
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    // Move-only
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Bind parameters to statement
     */
    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    /**
     * @brief Bind an optional value, or NULL when empty
     */
    template <typename T> Result<void> bind(int index, const std::optional<T>& value) {
        if (!value.has_value()) {
            return bind(index, nullptr);
        }
        return bind(index, *value);
    }

    /**
     * @brief Bind multiple parameters using variadic templates
     */
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        return bindHelper(1, std::forward<Args>(args)...);
    }

    /**
     * @brief Execute statement (for non-SELECT queries)
     */
    Result<void> execute();

    /**
     * @brief Step through results (for SELECT queries)
     * @return true if row available, false if done
     */
    Result<bool> step();

    /**
     * @brief Get column values
     */
    int getInt(int column) const;
    int64_t getInt64(int column) const;
    std::string getString(int column) const;
    bool isNull(int column) const;

    std::optional<int64_t> getOptionalInt64(int column) const {
        if (isNull(column))
            return std::nullopt;
        return getInt64(column);
    }

    std::optional<std::string> getOptionalString(int column) const {
        if (isNull(column))
            return std::nullopt;
        return getString(column);
    }

    /**
     * @brief Reset statement for reuse
     */
    Result<void> reset();

    /**
     * @brief Clear all bindings
     */
    Result<void> clearBindings();

private:
    sqlite3_stmt* stmt_ = nullptr;

    Error stepError(int rc, const char* action) const;

    template <typename T, typename... Rest>
    Result<void> bindHelper(int index, T&& value, Rest&&... rest) {
        auto result = bind(index, std::forward<T>(value));
        if (!result)
            return result;
        if constexpr (sizeof...(rest) > 0) {
            return bindHelper(index + 1, std::forward<Rest>(rest)...);
        }
        return {};
    }

    Result<void> bindHelper(int) { return {}; }
};

/**
 * @brief Database connection wrapper
 */
class Database {
public:
    Database() = default;
    ~Database();

    // Move-only
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Open database connection
     */
    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadWrite);

    /**
     * @brief Close database connection
     */
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    /**
     * @brief Prepare SQL statement
     */
    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Execute SQL directly (for non-SELECT queries)
     */
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();

    [[nodiscard]] bool inTransaction() const { return inTransaction_; }

    /**
     * @brief Execute within transaction
     *
     * The transaction is rolled back when @p func returns an error or throws.
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        auto beginResult = beginTransaction();
        if (!beginResult)
            return beginResult;

        try {
            auto result = func();
            if (!result) {
                auto rb = rollback();
                if (!rb) {
                    logRollbackFailure(rb.error().message);
                }
                return result;
            }
            return commit();
        } catch (...) {
            auto rb = rollback();
            if (!rb) {
                logRollbackFailure(rb.error().message);
            }
            throw;
        }
    }

    /**
     * @brief Get number of rows affected by last query
     */
    int changes() const;

    Result<bool> tableExists(const std::string& table);

    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);
    Result<void> enableWAL();

    /**
     * @brief Install a deadline after which running statements are interrupted.
     *
     * Interrupted statements report ErrorCode::Timeout.
     */
    void setDeadline(std::chrono::steady_clock::time_point deadline);
    void clearDeadline();

    static std::string version();

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
    std::optional<std::chrono::steady_clock::time_point> deadline_;

    static int progressHandler(void* self);
    static void logRollbackFailure(const std::string& message);
};

/**
 * @brief RAII guard bounding the statements run on a connection by a timeout
 */
class ScopedQueryDeadline {
public:
    ScopedQueryDeadline(Database& db, std::chrono::milliseconds timeout) : db_(db) {
        db_.setDeadline(std::chrono::steady_clock::now() + timeout);
    }
    ~ScopedQueryDeadline() { db_.clearDeadline(); }

    ScopedQueryDeadline(const ScopedQueryDeadline&) = delete;
    ScopedQueryDeadline& operator=(const ScopedQueryDeadline&) = delete;

private:
    Database& db_;
};

/**
 * @brief Map a SQLite result code to the library error taxonomy
 */
ErrorCode translateSqliteError(int rc);

} // namespace codegraph::store
