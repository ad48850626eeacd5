/**
 * @file role_assignment_record.hpp
 * @brief Category role assignment data structure
 */

#pragma once

#include <lms/security/category_role.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace lms::storage {

/**
 * @brief A role granted to a user on one category
 *
 * (user_id, category_id) is the natural key: there is at most one
 * record per pair.
 */
struct role_assignment_record {
    /// Primary key
    std::int64_t id = 0;

    std::int64_t user_id = 0;
    std::int64_t category_id = 0;

    security::category_role role = security::category_role::reviewer;

    /// User who granted the role
    std::int64_t assigned_by = 0;

    std::chrono::system_clock::time_point assigned_at;

    std::optional<std::string> notes;
};

/**
 * @brief Input of a role grant
 */
struct role_grant {
    std::int64_t user_id = 0;
    std::int64_t category_id = 0;
    security::category_role role = security::category_role::reviewer;
    std::int64_t assigned_by = 0;
    std::optional<std::string> notes;
};

}  // namespace lms::storage
