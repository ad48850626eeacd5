/**
 * @file course_ref.hpp
 * @brief Course and enrollment records owned by external collaborators
 */

#pragma once

#include "course_role.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace lms::security {

/**
 * @brief The parts of a course the engine reads
 *
 * A course without a category is reachable only through enrollment or
 * the global-admin override.
 */
struct course_ref {
    std::int64_t id{0};
    std::optional<std::int64_t> category_id;
};

/**
 * @brief Lifecycle state of an enrollment
 */
enum class enrollment_status {
    active,
    inactive,
    completed,
    dropped
};

constexpr std::string_view to_string(enrollment_status status) {
    switch (status) {
        case enrollment_status::active: return "active";
        case enrollment_status::inactive: return "inactive";
        case enrollment_status::completed: return "completed";
        case enrollment_status::dropped: return "dropped";
    }
    return "unknown";
}

inline std::optional<enrollment_status> parse_enrollment_status(std::string_view str) {
    if (str == "active") return enrollment_status::active;
    if (str == "inactive") return enrollment_status::inactive;
    if (str == "completed") return enrollment_status::completed;
    if (str == "dropped") return enrollment_status::dropped;
    return std::nullopt;
}

/**
 * @brief Direct link between a user and a course
 */
struct enrollment {
    std::int64_t id{0};
    std::int64_t user_id{0};
    std::int64_t course_id{0};
    course_role role{course_role::student};
    enrollment_status status{enrollment_status::active};

    /// Only active enrollments grant access
    [[nodiscard]] bool grants_access() const noexcept {
        return status == enrollment_status::active;
    }
};

} // namespace lms::security
