/**
 * @file sqlite_course_directory_test.cpp
 * @brief Unit tests for the SQLite user, course and enrollment lookups
 */

#include <catch2/catch_test_macros.hpp>

#include <lms/storage/access_database.hpp>
#include <lms/storage/category_repository.hpp>
#include <lms/storage/sqlite_course_directory.hpp>

#include <memory>

using namespace lms;
using namespace lms::storage;
using namespace lms::security;

namespace {

auto open_directory() -> std::pair<std::shared_ptr<access_database>,
                                   std::shared_ptr<sqlite_course_directory>> {
    auto opened = access_database::open(":memory:");
    REQUIRE(opened.is_ok());
    auto db = opened.value();
    return {db, std::make_shared<sqlite_course_directory>(db)};
}

}  // namespace

TEST_CASE("sqlite_course_directory users", "[directory][user]") {
    auto [db, directory] = open_directory();

    SECTION("unknown user") {
        auto user = directory->find_user(1);
        REQUIRE(user.is_ok());
        CHECK_FALSE(user.value().has_value());
    }

    SECTION("stored global role round trip") {
        REQUIRE(directory->upsert_user({1, global_role::admin}).is_ok());
        REQUIRE(directory->upsert_user({2, global_role::instructor}).is_ok());

        auto admin = directory->find_user(1);
        REQUIRE(admin.is_ok());
        REQUIRE(admin.value().has_value());
        CHECK(admin.value()->is_global_admin());

        auto instructor = directory->find_user(2);
        REQUIRE(instructor.is_ok());
        REQUIRE(instructor.value().has_value());
        CHECK_FALSE(instructor.value()->is_global_admin());
    }

    SECTION("upsert replaces the role") {
        REQUIRE(directory->upsert_user({1, global_role::admin}).is_ok());
        REQUIRE(directory->upsert_user({1, global_role::user}).is_ok());

        auto user = directory->find_user(1);
        REQUIRE(user.is_ok());
        REQUIRE(user.value().has_value());
        CHECK(user.value()->role == global_role::user);
    }
}

TEST_CASE("sqlite_course_directory courses", "[directory][course]") {
    auto [db, directory] = open_directory();
    category_repository categories(db, directory);

    auto science = categories.create("Science");
    REQUIRE(science.is_ok());
    auto science_id = science.value().id;

    REQUIRE(directory->upsert_course({10, science_id}).is_ok());
    REQUIRE(directory->upsert_course({11, science_id}).is_ok());
    REQUIRE(directory->upsert_course({12, std::nullopt}).is_ok());

    SECTION("find_course") {
        auto course = directory->find_course(10);
        REQUIRE(course.is_ok());
        REQUIRE(course.value().has_value());
        CHECK(course.value()->category_id == science_id);

        auto uncategorized = directory->find_course(12);
        REQUIRE(uncategorized.is_ok());
        REQUIRE(uncategorized.value().has_value());
        CHECK_FALSE(uncategorized.value()->category_id.has_value());

        auto missing = directory->find_course(99);
        REQUIRE(missing.is_ok());
        CHECK_FALSE(missing.value().has_value());
    }

    SECTION("counts and listings by category") {
        auto count = directory->count_courses_by_category(science_id);
        REQUIRE(count.is_ok());
        CHECK(count.value() == 2);

        auto listed = directory->list_courses_by_category(science_id);
        REQUIRE(listed.is_ok());
        REQUIRE(listed.value().size() == 2);
        CHECK(listed.value()[0].id == 10);
        CHECK(listed.value()[1].id == 11);

        auto all = directory->list_all_courses();
        REQUIRE(all.is_ok());
        CHECK(all.value().size() == 3);
    }

    SECTION("course cannot point at a missing category") {
        CHECK(directory->upsert_course({13, 999}).is_err());
    }
}

TEST_CASE("sqlite_course_directory enrollments", "[directory][enrollment]") {
    auto [db, directory] = open_directory();
    REQUIRE(directory->upsert_course({10, std::nullopt}).is_ok());
    REQUIRE(directory->upsert_course({11, std::nullopt}).is_ok());

    SECTION("enrollment lookup by user and course") {
        auto stored = directory->upsert_enrollment(
            {0, 7, 10, course_role::teacher, enrollment_status::active});
        REQUIRE(stored.is_ok());
        CHECK(stored.value().id > 0);

        auto found = directory->find_enrollment(7, 10);
        REQUIRE(found.is_ok());
        REQUIRE(found.value().has_value());
        CHECK(found.value()->role == course_role::teacher);
        CHECK(found.value()->grants_access());

        auto none = directory->find_enrollment(7, 11);
        REQUIRE(none.is_ok());
        CHECK_FALSE(none.value().has_value());
    }

    SECTION("re-enrolling updates status in place") {
        auto first = directory->upsert_enrollment(
            {0, 7, 10, course_role::student, enrollment_status::active});
        REQUIRE(first.is_ok());
        auto second = directory->upsert_enrollment(
            {0, 7, 10, course_role::student, enrollment_status::dropped});
        REQUIRE(second.is_ok());
        CHECK(second.value().id == first.value().id);
        CHECK_FALSE(second.value().grants_access());
    }

    SECTION("list_enrollments_for_user includes every status") {
        REQUIRE(directory->upsert_enrollment(
                             {0, 7, 10, course_role::student, enrollment_status::active})
                    .is_ok());
        REQUIRE(directory->upsert_enrollment(
                             {0, 7, 11, course_role::ta, enrollment_status::completed})
                    .is_ok());

        auto listed = directory->list_enrollments_for_user(7);
        REQUIRE(listed.is_ok());
        REQUIRE(listed.value().size() == 2);
        CHECK(listed.value()[0].course_id == 10);
        CHECK(listed.value()[1].status == enrollment_status::completed);
    }

    SECTION("unknown role text is rejected on insert") {
        auto result = db->execute(
            "INSERT INTO enrollments (user_id, course_id, role) VALUES (7, 10, 'owner');");
        CHECK(result.is_err());

        auto found = directory->find_enrollment(7, 10);
        REQUIRE(found.is_ok());
        CHECK_FALSE(found.value().has_value());
    }

    SECTION("stored row with an unknown role grants nothing") {
        // Rows written before the constraint existed
        REQUIRE(db->execute("PRAGMA ignore_check_constraints = ON;").is_ok());
        REQUIRE(db->execute("INSERT INTO enrollments (user_id, course_id, role, status) "
                            "VALUES (7, 10, 'owner', 'active');")
                    .is_ok());
        REQUIRE(db->execute("PRAGMA ignore_check_constraints = OFF;").is_ok());

        auto found = directory->find_enrollment(7, 10);
        REQUIRE(found.is_ok());
        REQUIRE(found.value().has_value());
        CHECK(found.value()->status == enrollment_status::inactive);
        CHECK_FALSE(found.value()->grants_access());
    }
}
