/**
 * @file access_database.hpp
 * @brief SQLite connection owner for the access engine
 *
 * This file provides the access_database class which opens the SQLite
 * database, applies schema migrations and runs multi-statement mutations
 * inside a single transaction.
 */

#pragma once

#include "migration_runner.hpp"

#include <lms/core/result.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

// Forward declaration of SQLite handle
struct sqlite3;

namespace lms::storage {

/**
 * @brief Configuration for opening the database
 */
struct database_config {
    /// Enable WAL (Write-Ahead Logging) mode; ignored for ":memory:"
    bool wal_mode = true;

    /// Cache size in megabytes
    std::size_t cache_size_mb = 16;

    /// Milliseconds to wait on a locked database before failing
    int busy_timeout_ms = 5000;
};

/**
 * @brief Owns the SQLite connection shared by the stores
 *
 * Every store operation takes the connection mutex, so statements of
 * concurrent callers never interleave on the connection. Mutations run
 * through in_transaction(): the whole read-then-act sequence commits or
 * rolls back as one unit.
 *
 * @example
 * @code
 * auto db = access_database::open("lms.db");
 * if (db.is_err()) { ... }
 *
 * auto result = db.value()->in_transaction<int64_t>([&]() -> Result<int64_t> {
 *     // several statements
 *     return id;
 * });
 * @endcode
 */
class access_database {
public:
    /**
     * @brief Open or create a database with default configuration
     *
     * @param db_path Path to the database file, or ":memory:"
     */
    [[nodiscard]] static auto open(std::string_view db_path)
        -> Result<std::shared_ptr<access_database>>;

    /**
     * @brief Open or create a database
     *
     * Applies PRAGMAs from the configuration and runs pending migrations.
     */
    [[nodiscard]] static auto open(std::string_view db_path,
                                   const database_config& config)
        -> Result<std::shared_ptr<access_database>>;

    ~access_database();

    access_database(const access_database&) = delete;
    auto operator=(const access_database&) -> access_database& = delete;
    access_database(access_database&&) = delete;
    auto operator=(access_database&&) -> access_database& = delete;

    [[nodiscard]] auto handle() const noexcept -> sqlite3* { return db_; }

    [[nodiscard]] auto path() const noexcept -> const std::string& { return path_; }

    /**
     * @brief Connection mutex; held by every store operation
     */
    [[nodiscard]] auto mutex() const noexcept -> std::recursive_mutex& {
        return mutex_;
    }

    [[nodiscard]] auto schema_version() const -> int;

    /**
     * @brief Run fn inside a transaction
     *
     * Commits when fn succeeds. On any error the transaction is rolled
     * back and fn's original error is returned. An exception thrown by fn
     * rolls the transaction back and propagates. A call made while a
     * transaction is already open joins the outer transaction.
     *
     * @tparam T Value type of the returned Result
     * @param fn Callable returning Result<T>
     */
    template <typename T, typename Fn>
    [[nodiscard]] auto in_transaction(Fn&& fn) -> Result<T>;

    // =========================================================================
    // Transaction Control
    // =========================================================================

    /**
     * @brief Begin an immediate transaction
     *
     * Prefer in_transaction() or scoped_transaction, which always close the
     * transaction they open.
     */
    [[nodiscard]] auto begin_transaction() -> VoidResult;

    [[nodiscard]] auto commit() -> VoidResult;

    [[nodiscard]] auto rollback() -> VoidResult;

    /**
     * @brief Check whether a transaction is open on the connection
     */
    [[nodiscard]] auto in_active_transaction() const -> bool;

    /**
     * @brief Execute one or more SQL statements without results
     */
    [[nodiscard]] auto execute(std::string_view sql) -> VoidResult;

private:
    /// Restores the nesting depth on every exit path of in_transaction()
    class depth_guard {
    public:
        explicit depth_guard(int& depth) noexcept : depth_(depth) { ++depth_; }
        ~depth_guard() { --depth_; }

        depth_guard(const depth_guard&) = delete;
        auto operator=(const depth_guard&) -> depth_guard& = delete;

    private:
        int& depth_;
    };

    access_database(sqlite3* db, std::string path);

    sqlite3* db_{nullptr};
    std::string path_;
    mutable std::recursive_mutex mutex_;
    int transaction_depth_{0};
    migration_runner migration_runner_;
};

/**
 * @brief RAII transaction guard
 *
 * Begins a transaction on construction. If commit() is not called before
 * destruction, including when the scope is left by an exception, the
 * transaction is rolled back.
 *
 * @example
 * @code
 * {
 *     scoped_transaction tx(db);
 *     if (!tx.is_active()) { ... }
 *     db.execute("INSERT INTO ...");
 *
 *     auto result = tx.commit();
 * } // auto-rollback if commit() not called
 * @endcode
 */
class scoped_transaction {
public:
    /**
     * @brief Construct and begin transaction
     *
     * Check is_active() for success.
     */
    explicit scoped_transaction(access_database& db);

    /**
     * @brief Destructor - rollback if not committed
     */
    ~scoped_transaction();

    scoped_transaction(const scoped_transaction&) = delete;
    auto operator=(const scoped_transaction&) -> scoped_transaction& = delete;
    scoped_transaction(scoped_transaction&&) = delete;
    auto operator=(scoped_transaction&&) -> scoped_transaction& = delete;

    /**
     * @brief Commit the transaction
     *
     * After a successful commit the destructor does nothing. A failed
     * commit leaves the transaction active, so it is still rolled back.
     */
    [[nodiscard]] auto commit() -> VoidResult;

    void rollback() noexcept;

    [[nodiscard]] auto is_active() const noexcept -> bool;

private:
    access_database& db_;
    bool committed_{false};
    bool active_{false};
};

// =============================================================================
// Template Implementation
// =============================================================================

template <typename T, typename Fn>
auto access_database::in_transaction(Fn&& fn) -> Result<T> {
    std::lock_guard lock(mutex_);

    if (transaction_depth_ > 0) {
        depth_guard nested(transaction_depth_);
        return std::forward<Fn>(fn)();
    }

    scoped_transaction tx(*this);
    if (!tx.is_active()) {
        return lms_error<T>(error_codes::database_transaction_error,
                            "Failed to begin transaction", "storage");
    }
    depth_guard outer(transaction_depth_);

    auto result = std::forward<Fn>(fn)();
    if (result.is_err()) {
        tx.rollback();
        return result;
    }

    auto commit_result = tx.commit();
    if (commit_result.is_err()) {
        return lms_error<T>(error_codes::database_transaction_error,
                            commit_result.error().message, "storage");
    }
    return result;
}

}  // namespace lms::storage
