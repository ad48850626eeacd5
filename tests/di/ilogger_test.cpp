/**
 * @file ilogger_test.cpp
 * @brief Unit tests for ILogger interface, implementations and injection
 */

#include <lms/di/ilogger.hpp>
#include <lms/security/course_access_resolver.hpp>
#include <lms/security/effective_role_resolver.hpp>
#include <lms/services/access_engine.hpp>
#include <lms/services/category_aggregator.hpp>
#include <lms/storage/access_database.hpp>
#include <lms/storage/category_repository.hpp>
#include <lms/storage/role_assignment_repository.hpp>
#include <lms/storage/sqlite_course_directory.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

using namespace lms;
using namespace lms::di;

// =============================================================================
// Mock Logger for Testing
// =============================================================================

namespace {

/**
 * @brief Mock logger that records all log calls for verification
 */
class MockLogger final : public ILogger {
public:
    MockLogger() = default;
    ~MockLogger() override = default;

    void trace(std::string_view message) override { record(trace_count_, message); }
    void debug(std::string_view message) override { record(debug_count_, message); }
    void info(std::string_view message) override { record(info_count_, message); }
    void warn(std::string_view message) override { record(warn_count_, message); }
    void error(std::string_view message) override { record(error_count_, message); }
    void fatal(std::string_view message) override { record(fatal_count_, message); }

    [[nodiscard]] bool is_enabled(integration::log_level level) const noexcept override {
        return level >= enabled_level_;
    }

    // Test accessors
    [[nodiscard]] size_t debug_count() const noexcept {
        return debug_count_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] size_t info_count() const noexcept {
        return info_count_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] size_t warn_count() const noexcept {
        return warn_count_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] size_t error_count() const noexcept {
        return error_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] auto messages() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        return messages_;
    }

    [[nodiscard]] bool contains(std::string_view needle) const {
        std::lock_guard lock(mutex_);
        for (const auto& message : messages_) {
            if (message.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    void set_enabled_level(integration::log_level level) noexcept {
        enabled_level_ = level;
    }

private:
    void record(std::atomic<size_t>& counter, std::string_view message) {
        counter.fetch_add(1, std::memory_order_relaxed);
        std::lock_guard lock(mutex_);
        messages_.emplace_back(message);
    }

    std::atomic<size_t> trace_count_{0};
    std::atomic<size_t> debug_count_{0};
    std::atomic<size_t> info_count_{0};
    std::atomic<size_t> warn_count_{0};
    std::atomic<size_t> error_count_{0};
    std::atomic<size_t> fatal_count_{0};

    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
    integration::log_level enabled_level_ = integration::log_level::trace;
};

}  // namespace

// =============================================================================
// NullLogger Tests
// =============================================================================

TEST_CASE("NullLogger is a no-op implementation", "[di][logger][null]") {
    NullLogger logger;

    SECTION("all log methods are safe to call") {
        logger.trace("trace message");
        logger.debug("debug message");
        logger.info("info message");
        logger.warn("warn message");
        logger.error("error message");
        logger.fatal("fatal message");
    }

    SECTION("is_enabled always returns false") {
        CHECK_FALSE(logger.is_enabled(integration::log_level::trace));
        CHECK_FALSE(logger.is_enabled(integration::log_level::info));
        CHECK_FALSE(logger.is_enabled(integration::log_level::fatal));
    }

    SECTION("formatted logging methods are safe") {
        logger.debug_fmt("value: {}", 42);
        logger.warn_fmt("values: {} {}", 1, 2);
        logger.error_fmt("error: {}", "failure");
    }
}

TEST_CASE("null_logger() returns singleton instance", "[di][logger][null]") {
    auto logger1 = null_logger();
    auto logger2 = null_logger();

    REQUIRE(logger1 != nullptr);
    CHECK(logger1.get() == logger2.get());
    CHECK_FALSE(logger1->is_enabled(integration::log_level::info));
}

// =============================================================================
// LoggerService Tests
// =============================================================================

TEST_CASE("LoggerService delegates to logger_adapter", "[di][logger][service]") {
    LoggerService service;

    SECTION("disabled while logger_adapter is not initialized") {
        REQUIRE_FALSE(integration::logger_adapter::is_initialized());
        CHECK_FALSE(service.is_enabled(integration::log_level::fatal));
    }

    SECTION("log methods are safe to call before initialization") {
        service.info("info message");
        service.warn_fmt("values: {} {}", 1, 2);
    }
}

// =============================================================================
// ILogger Formatted Logging Tests
// =============================================================================

TEST_CASE("ILogger formatted logging with MockLogger", "[di][logger][format]") {
    auto mock = std::make_shared<MockLogger>();
    ILogger* logger = mock.get();

    SECTION("info_fmt formats and logs correctly") {
        logger->info_fmt("count: {}", 100);
        CHECK(mock->info_count() == 1);
        CHECK(mock->contains("count: 100"));
    }

    SECTION("formatted logging respects is_enabled") {
        mock->set_enabled_level(integration::log_level::warn);

        logger->debug_fmt("skip: {}", 1);
        logger->info_fmt("skip: {}", 2);
        logger->warn_fmt("log: {}", 3);
        logger->error_fmt("log: {}", 4);

        CHECK(mock->debug_count() == 0);
        CHECK(mock->info_count() == 0);
        CHECK(mock->warn_count() == 1);
        CHECK(mock->error_count() == 1);
    }
}

// =============================================================================
// Component Logger Injection Tests
// =============================================================================

TEST_CASE("category_repository logger injection", "[di][logger][storage]") {
    auto opened = storage::access_database::open(":memory:");
    REQUIRE(opened.is_ok());
    auto db = opened.value();
    auto directory = std::make_shared<storage::sqlite_course_directory>(db);

    SECTION("default construction uses null_logger") {
        storage::category_repository categories(db, directory);
        CHECK(categories.create("Science").is_ok());
        CHECK(categories.create("Orphan", 999).is_err());
    }

    SECTION("failed mutation is reported as a warning") {
        auto mock = std::make_shared<MockLogger>();
        storage::category_repository categories(db, directory, {}, mock);

        auto result = categories.create("Orphan", 999);
        REQUIRE(result.is_err());
        CHECK(mock->warn_count() == 1);
        CHECK(mock->contains("Orphan"));
    }

    SECTION("role cleanup on delete is reported") {
        auto mock = std::make_shared<MockLogger>();
        auto categories = std::make_shared<storage::category_repository>(
            db, directory, storage::category_store_config{}, mock);
        storage::role_assignment_repository roles(db, directory, mock);

        REQUIRE(directory->upsert_user({7, security::global_role::user}).is_ok());
        auto drafts = categories->create("Drafts");
        REQUIRE(drafts.is_ok());
        REQUIRE(roles.assign({7, drafts.value().id, security::category_role::reviewer, 7, {}})
                    .is_ok());

        REQUIRE(categories->remove(drafts.value().id).is_ok());
        CHECK(mock->contains("Removed 1 role assignment(s)"));
    }
}

TEST_CASE("course_access_resolver logger injection", "[di][logger][security]") {
    auto opened = storage::access_database::open(":memory:");
    REQUIRE(opened.is_ok());
    auto db = opened.value();
    auto directory = std::make_shared<storage::sqlite_course_directory>(db);
    auto categories = std::make_shared<storage::category_repository>(db, directory);
    auto roles = std::make_shared<storage::role_assignment_repository>(db, directory);
    auto resolver = std::make_shared<security::effective_role_resolver>(categories, roles);

    auto mock = std::make_shared<MockLogger>();
    security::course_access_resolver access(directory, directory, directory, categories,
                                            roles, resolver, mock);

    SECTION("unknown user is noted at debug level") {
        auto decision = access.check_access(42, 10);
        REQUIRE(decision.is_ok());
        CHECK_FALSE(decision.value().has_access);
        CHECK(mock->contains("Unknown user 42"));
    }
}

TEST_CASE("access_engine logger injection", "[di][logger][engine]") {
    auto mock = std::make_shared<MockLogger>();

    auto engine = services::access_engine::open(":memory:", {}, mock);
    REQUIRE(engine.is_ok());
    CHECK(mock->contains("schema version"));

    SECTION("logger reaches the stores") {
        auto before = mock->warn_count();
        CHECK(engine.value()->categories().create("Orphan", 999).is_err());
        CHECK(mock->warn_count() == before + 1);
    }
}
