/**
 * @file access_database.cpp
 * @brief Implementation of the SQLite connection owner
 */

#include <lms/storage/access_database.hpp>

#include <lms/compat/format.hpp>

#include <sqlite3.h>

namespace lms::storage {

using kcenon::common::make_error;
using kcenon::common::ok;

// ============================================================================
// Construction / Destruction
// ============================================================================

auto access_database::open(std::string_view db_path)
    -> Result<std::shared_ptr<access_database>> {
    return open(db_path, database_config{});
}

auto access_database::open(std::string_view db_path,
                           const database_config& config)
    -> Result<std::shared_ptr<access_database>> {
    sqlite3* db = nullptr;

    auto rc = sqlite3_open(std::string(db_path).c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string error_msg =
            db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return make_error<std::shared_ptr<access_database>>(
            error_codes::database_open_error,
            lms::compat::format("Failed to open database: {}", error_msg),
            "storage");
    }

    rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr,
                      nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);
        return make_error<std::shared_ptr<access_database>>(
            error_codes::database_open_error, "Failed to enable foreign keys",
            "storage");
    }

    if (config.wal_mode && db_path != ":memory:") {
        rc = sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr,
                          nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_close(db);
            return make_error<std::shared_ptr<access_database>>(
                error_codes::database_open_error, "Failed to enable WAL mode",
                "storage");
        }
    }

    // Negative value means KB
    auto cache_sql = lms::compat::format("PRAGMA cache_size = -{};",
                                         config.cache_size_mb * 1024);
    rc = sqlite3_exec(db, cache_sql.c_str(), nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);
        return make_error<std::shared_ptr<access_database>>(
            error_codes::database_open_error, "Failed to set cache size",
            "storage");
    }

    sqlite3_busy_timeout(db, config.busy_timeout_ms);

    auto instance = std::shared_ptr<access_database>(
        new access_database(db, std::string(db_path)));

    auto migration_result = instance->migration_runner_.run_migrations(db);
    if (migration_result.is_err()) {
        return make_error<std::shared_ptr<access_database>>(
            error_codes::database_migration_error,
            lms::compat::format("Migration failed: {}",
                                migration_result.error().message),
            "storage");
    }

    return instance;
}

access_database::access_database(sqlite3* db, std::string path)
    : db_(db), path_(std::move(path)) {}

access_database::~access_database() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Queries
// ============================================================================

auto access_database::schema_version() const -> int {
    std::lock_guard lock(mutex_);
    return migration_runner_.get_current_version(db_);
}

auto access_database::execute(std::string_view sql) -> VoidResult {
    std::lock_guard lock(mutex_);

    if (!db_) {
        return make_error<std::monostate>(error_codes::database_not_open,
                                          "Database not open", "storage");
    }

    char* errmsg = nullptr;
    auto rc = sqlite3_exec(db_, std::string(sql).c_str(), nullptr, nullptr,
                           &errmsg);
    if (rc != SQLITE_OK) {
        auto error_str = errmsg ? std::string(errmsg) : "Unknown error";
        sqlite3_free(errmsg);
        return make_error<std::monostate>(
            error_codes::database_query_error,
            lms::compat::format("SQL execution failed: {}", error_str),
            "storage");
    }

    return ok();
}

// ============================================================================
// Transaction Control
// ============================================================================

auto access_database::begin_transaction() -> VoidResult {
    return execute("BEGIN IMMEDIATE;");
}

auto access_database::commit() -> VoidResult { return execute("COMMIT;"); }

auto access_database::rollback() -> VoidResult { return execute("ROLLBACK;"); }

auto access_database::in_active_transaction() const -> bool {
    std::lock_guard lock(mutex_);
    return db_ != nullptr && sqlite3_get_autocommit(db_) == 0;
}

// ============================================================================
// scoped_transaction
// ============================================================================

scoped_transaction::scoped_transaction(access_database& db) : db_(db) {
    auto result = db_.begin_transaction();
    active_ = result.is_ok();
}

scoped_transaction::~scoped_transaction() {
    if (active_ && !committed_) {
        (void)db_.rollback();
    }
}

auto scoped_transaction::commit() -> VoidResult {
    if (!active_) {
        return make_error<std::monostate>(error_codes::database_transaction_error,
                                          "Transaction not active", "storage");
    }

    auto result = db_.commit();
    if (result.is_ok()) {
        committed_ = true;
        active_ = false;
    }
    return result;
}

void scoped_transaction::rollback() noexcept {
    if (active_ && !committed_) {
        (void)db_.rollback();
        active_ = false;
    }
}

auto scoped_transaction::is_active() const noexcept -> bool {
    return active_ && !committed_;
}

}  // namespace lms::storage
