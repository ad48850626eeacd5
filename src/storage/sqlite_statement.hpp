/**
 * @file sqlite_statement.hpp
 * @brief Prepared statement guard and column helpers shared by repositories
 *
 * Private to the storage sources; not installed.
 */

#pragma once

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace lms::storage::detail {

/**
 * @brief Owns a prepared statement and finalizes it on scope exit
 */
class statement {
public:
    statement(sqlite3* db, std::string_view sql) {
        rc_ = sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()),
                                 &stmt_, nullptr);
    }

    ~statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    statement(const statement&) = delete;
    auto operator=(const statement&) -> statement& = delete;
    statement(statement&&) = delete;
    auto operator=(statement&&) -> statement& = delete;

    [[nodiscard]] auto prepared() const noexcept -> bool {
        return rc_ == SQLITE_OK && stmt_ != nullptr;
    }

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* { return stmt_; }

    void bind(int idx, std::int64_t value) {
        sqlite3_bind_int64(stmt_, idx, value);
    }

    void bind(int idx, std::string_view value) {
        sqlite3_bind_text(stmt_, idx, value.data(),
                          static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    void bind(int idx, const std::optional<std::int64_t>& value) {
        if (value) {
            sqlite3_bind_int64(stmt_, idx, *value);
        } else {
            sqlite3_bind_null(stmt_, idx);
        }
    }

    void bind(int idx, const std::optional<std::string>& value) {
        if (value) {
            bind(idx, std::string_view{*value});
        } else {
            sqlite3_bind_null(stmt_, idx);
        }
    }

    [[nodiscard]] auto step() -> int { return sqlite3_step(stmt_); }

private:
    sqlite3_stmt* stmt_{nullptr};
    int rc_{SQLITE_ERROR};
};

/// Get text column safely (returns empty string if NULL)
[[nodiscard]] inline std::string get_text_column(sqlite3_stmt* stmt, int col) {
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

/// Get nullable text column
[[nodiscard]] inline std::optional<std::string> get_optional_text_column(
    sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return get_text_column(stmt, col);
}

/// Get int64 column with default
[[nodiscard]] inline std::int64_t get_int64_column(sqlite3_stmt* stmt, int col,
                                                   std::int64_t default_val = 0) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return default_val;
    }
    return sqlite3_column_int64(stmt, col);
}

/// Get nullable int64 column
[[nodiscard]] inline std::optional<std::int64_t> get_optional_int64_column(
    sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_int64(stmt, col);
}

/// Convert time_point to "YYYY-MM-DD HH:MM:SS" (UTC)
[[nodiscard]] inline std::string to_timestamp_string(
    std::chrono::system_clock::time_point tp) {
    if (tp == std::chrono::system_clock::time_point{}) {
        return "";
    }
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

/// Parse "YYYY-MM-DD HH:MM:SS" (UTC) to time_point
[[nodiscard]] inline std::chrono::system_clock::time_point from_timestamp_string(
    const std::string& str) {
    if (str.empty()) {
        return {};
    }
    std::tm tm{};
    if (std::sscanf(str.c_str(), "%d-%d-%d %d:%d:%d",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec) != 6) {
        return {};
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
#ifdef _WIN32
    auto time = _mkgmtime(&tm);
#else
    auto time = timegm(&tm);
#endif
    return std::chrono::system_clock::from_time_t(time);
}

}  // namespace lms::storage::detail
