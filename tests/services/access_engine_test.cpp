/**
 * @file access_engine_test.cpp
 * @brief End-to-end tests of the wired engine over an in-memory database
 */

#include <catch2/catch_test_macros.hpp>

#include <lms/security/course_access_resolver.hpp>
#include <lms/security/effective_role_resolver.hpp>
#include <lms/services/access_engine.hpp>
#include <lms/services/category_aggregator.hpp>
#include <lms/storage/category_repository.hpp>
#include <lms/storage/migration_runner.hpp>
#include <lms/storage/role_assignment_repository.hpp>
#include <lms/storage/sqlite_course_directory.hpp>

#include <memory>

using namespace lms;
using namespace lms::services;
using namespace lms::security;

namespace {

auto open_engine(access_engine_config config = {}) -> std::unique_ptr<access_engine> {
    auto engine = access_engine::open(":memory:", config);
    REQUIRE(engine.is_ok());
    return std::move(engine.value());
}

}  // namespace

TEST_CASE("access_engine open", "[engine]") {
    SECTION("schema is migrated to the latest version") {
        auto engine = open_engine();
        storage::migration_runner runner;
        CHECK(engine->database().schema_version() == runner.get_latest_version());
    }

    SECTION("category configuration reaches the store") {
        access_engine_config config;
        config.categories.max_depth = 1;
        auto engine = open_engine(config);

        auto& categories = engine->categories();
        CHECK(categories.config().max_depth == 1u);

        auto root = categories.create("Science");
        REQUIRE(root.is_ok());
        auto child = categories.create("Physics", root.value().id);
        REQUIRE(child.is_ok());

        auto too_deep = categories.create("Quantum", child.value().id);
        REQUIRE(too_deep.is_err());
        CHECK(too_deep.error().code == error_codes::depth_limit_exceeded);
    }

    SECTION("unopenable path is reported") {
        auto engine = access_engine::open("/nonexistent-dir/lms/access.db");
        REQUIRE(engine.is_err());
        CHECK(engine.error().code == error_codes::database_open_error);
    }
}

TEST_CASE("access_engine end to end", "[engine][e2e]") {
    auto engine = open_engine();
    auto& directory = engine->directory();

    REQUIRE(directory.upsert_user({1, global_role::admin}).is_ok());
    REQUIRE(directory.upsert_user({7, global_role::user}).is_ok());
    REQUIRE(directory.upsert_user({8, global_role::user}).is_ok());

    auto science = engine->categories().create("Science").value().id;
    auto physics = engine->categories().create("Physics", science).value().id;

    REQUIRE(directory.upsert_course({100, science}).is_ok());
    REQUIRE(directory.upsert_course({101, physics}).is_ok());
    REQUIRE(directory.upsert_course({102, std::nullopt}).is_ok());

    REQUIRE(engine->roles()
                .assign({7, science, category_role::coordinator, 1, {}})
                .is_ok());
    REQUIRE(directory
                .upsert_enrollment(
                    {0, 8, 101, course_role::student, enrollment_status::active})
                .is_ok());

    SECTION("inherited role") {
        auto role = engine->role_resolver().resolve(7, physics);
        REQUIRE(role.is_ok());
        CHECK(role.value() == category_role::coordinator);
    }

    SECTION("access decisions by source") {
        auto via_category = engine->access().check_access(7, 101);
        REQUIRE(via_category.is_ok());
        CHECK(via_category.value().source == access_source::category);

        auto via_enrollment = engine->access().check_access(8, 101);
        REQUIRE(via_enrollment.is_ok());
        CHECK(via_enrollment.value().source == access_source::enrollment);

        auto via_admin = engine->access().check_access(1, 102);
        REQUIRE(via_admin.is_ok());
        CHECK(via_admin.value().source == access_source::global_admin);

        auto denied = engine->access().check_access(8, 100);
        REQUIRE(denied.is_ok());
        CHECK_FALSE(denied.value().has_access);
    }

    SECTION("accessible courses") {
        auto courses = engine->access().get_user_accessible_courses(7);
        REQUIRE(courses.is_ok());
        REQUIRE(courses.value().size() == 2);
        CHECK(courses.value()[0].course_id == 100);
        CHECK(courses.value()[1].course_id == 101);
    }

    SECTION("aggregated counts") {
        auto stats = engine->aggregator().stats(science);
        REQUIRE(stats.is_ok());
        CHECK(stats.value().direct_courses_count == 1);
        CHECK(stats.value().direct_subcategories_count == 1);
        CHECK(stats.value().total_nested_courses_count == 2);
    }

    SECTION("category holding courses cannot be deleted") {
        auto removed = engine->categories().remove(physics);
        REQUIRE(removed.is_err());
        CHECK(removed.error().code == error_codes::has_courses);
    }

    SECTION("deleting a category drops its grants") {
        auto empty = engine->categories().create("Drafts", science);
        REQUIRE(empty.is_ok());
        REQUIRE(engine->roles()
                    .assign({8, empty.value().id, category_role::reviewer, 1, {}})
                    .is_ok());

        REQUIRE(engine->categories().remove(empty.value().id).is_ok());

        auto grants = engine->roles().list_for_user(8);
        REQUIRE(grants.is_ok());
        CHECK(grants.value().empty());
    }
}
