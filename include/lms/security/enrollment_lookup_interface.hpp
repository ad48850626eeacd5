/**
 * @file enrollment_lookup_interface.hpp
 * @brief Lookup of direct course enrollments
 */

#pragma once

#include "course_ref.hpp"

#include <kcenon/common/patterns/result.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace lms::security {

/**
 * @brief Abstract interface for the enrollment lookup collaborator
 */
class enrollment_lookup_interface {
public:
    template <typename T> using Result = kcenon::common::Result<T>;

    virtual ~enrollment_lookup_interface() = default;

    /**
     * @brief Find the enrollment linking a user to a course, in any status
     */
    [[nodiscard]] virtual auto find_enrollment(std::int64_t user_id,
                                               std::int64_t course_id)
        -> Result<std::optional<enrollment>> = 0;

    /**
     * @brief All enrollments of a user, in any status
     */
    [[nodiscard]] virtual auto list_enrollments_for_user(std::int64_t user_id)
        -> Result<std::vector<enrollment>> = 0;

protected:
    enrollment_lookup_interface() = default;
    enrollment_lookup_interface(const enrollment_lookup_interface&) = delete;
    enrollment_lookup_interface& operator=(const enrollment_lookup_interface&) = delete;
    enrollment_lookup_interface(enrollment_lookup_interface&&) = default;
    enrollment_lookup_interface& operator=(enrollment_lookup_interface&&) = default;
};

} // namespace lms::security
