/**
 * @file mock_collaborators.hpp
 * @brief In-memory user, course and enrollment lookups for unit tests
 */

#pragma once

#include <lms/core/result.hpp>
#include <lms/security/course_catalog_interface.hpp>
#include <lms/security/enrollment_lookup_interface.hpp>
#include <lms/security/user_directory_interface.hpp>

#include <atomic>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace lms::test {

/**
 * @brief Map-backed implementation of every collaborator interface
 *
 * Setting fail_lookups makes every lookup return a storage error.
 */
class MockCollaborators final : public security::course_catalog_interface,
                                public security::enrollment_lookup_interface,
                                public security::user_directory_interface {
public:
    template <typename T> using Result = lms::Result<T>;

    // Seeding
    void add_user(std::int64_t id, security::global_role role) {
        users[id] = security::user_account{id, role};
    }

    void add_course(std::int64_t id, std::optional<std::int64_t> category_id) {
        courses[id] = security::course_ref{id, category_id};
    }

    void enroll(std::int64_t user_id, std::int64_t course_id, security::course_role role,
                security::enrollment_status status = security::enrollment_status::active) {
        auto id = static_cast<std::int64_t>(enrollments.size() + 1);
        enrollments[{user_id, course_id}] =
            security::enrollment{id, user_id, course_id, role, status};
    }

    // user_directory_interface
    auto find_user(std::int64_t user_id)
        -> Result<std::optional<security::user_account>> override {
        ++user_lookups;
        if (fail_lookups) {
            return failure<std::optional<security::user_account>>();
        }
        auto it = users.find(user_id);
        if (it == users.end()) {
            return std::optional<security::user_account>{};
        }
        return std::optional<security::user_account>(it->second);
    }

    // enrollment_lookup_interface
    auto find_enrollment(std::int64_t user_id, std::int64_t course_id)
        -> Result<std::optional<security::enrollment>> override {
        ++enrollment_lookups;
        if (fail_lookups) {
            return failure<std::optional<security::enrollment>>();
        }
        auto it = enrollments.find({user_id, course_id});
        if (it == enrollments.end()) {
            return std::optional<security::enrollment>{};
        }
        return std::optional<security::enrollment>(it->second);
    }

    auto list_enrollments_for_user(std::int64_t user_id)
        -> Result<std::vector<security::enrollment>> override {
        if (fail_lookups) {
            return failure<std::vector<security::enrollment>>();
        }
        std::vector<security::enrollment> result;
        for (const auto& [key, value] : enrollments) {
            if (key.first == user_id) {
                result.push_back(value);
            }
        }
        return result;
    }

    // course_catalog_interface
    auto find_course(std::int64_t course_id)
        -> Result<std::optional<security::course_ref>> override {
        if (fail_lookups) {
            return failure<std::optional<security::course_ref>>();
        }
        auto it = courses.find(course_id);
        if (it == courses.end()) {
            return std::optional<security::course_ref>{};
        }
        return std::optional<security::course_ref>(it->second);
    }

    auto count_courses_by_category(std::int64_t category_id)
        -> Result<std::size_t> override {
        if (fail_lookups) {
            return failure<std::size_t>();
        }
        std::size_t count = 0;
        for (const auto& [id, course] : courses) {
            if (course.category_id == category_id) {
                ++count;
            }
        }
        return count;
    }

    auto list_courses_by_category(std::int64_t category_id)
        -> Result<std::vector<security::course_ref>> override {
        if (fail_lookups) {
            return failure<std::vector<security::course_ref>>();
        }
        std::vector<security::course_ref> result;
        for (const auto& [id, course] : courses) {
            if (course.category_id == category_id) {
                result.push_back(course);
            }
        }
        return result;
    }

    auto list_all_courses() -> Result<std::vector<security::course_ref>> override {
        if (fail_lookups) {
            return failure<std::vector<security::course_ref>>();
        }
        std::vector<security::course_ref> result;
        for (const auto& [id, course] : courses) {
            result.push_back(course);
        }
        return result;
    }

    std::map<std::int64_t, security::user_account> users;
    std::map<std::int64_t, security::course_ref> courses;
    std::map<std::pair<std::int64_t, std::int64_t>, security::enrollment> enrollments;

    bool fail_lookups = false;
    std::atomic<int> user_lookups{0};
    std::atomic<int> enrollment_lookups{0};

private:
    template <typename T>
    static auto failure() -> Result<T> {
        return lms_error<T>(error_codes::database_query_error,
                            "Simulated lookup failure", "mock");
    }
};

}  // namespace lms::test
