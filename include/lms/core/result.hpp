/**
 * @file result.hpp
 * @brief Result<T> type aliases and error codes for the access engine
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for the category hierarchy and access resolution engine,
 * integrating with common_system's Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>

#include <string>
#include <string_view>

namespace lms {

/**
 * @brief Result type alias for engine operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief Engine error codes
 *
 * Error code range: -700 to -799
 */
namespace error_codes {
    constexpr int lms_base = -700;

    // Domain errors (-700 to -719)
    constexpr int invalid_argument = lms_base - 0;
    constexpr int not_found = lms_base - 1;
    constexpr int circular_reference = lms_base - 2;
    constexpr int depth_limit_exceeded = lms_base - 3;
    constexpr int has_subcategories = lms_base - 4;
    constexpr int has_courses = lms_base - 5;

    // Database errors (-780 to -799)
    constexpr int database_open_error = lms_base - 80;
    constexpr int database_query_error = lms_base - 81;
    constexpr int database_transaction_error = lms_base - 82;
    constexpr int database_migration_error = lms_base - 83;
    constexpr int database_not_open = lms_base - 84;
} // namespace error_codes

/**
 * @brief Name of the error kind for an engine error code
 *
 * The surrounding application maps these kinds onto its own transport
 * responses (bad request, not found, conflict).
 */
constexpr std::string_view error_kind_name(int code) {
    switch (code) {
        case error_codes::invalid_argument: return "InvalidArgument";
        case error_codes::not_found: return "NotFound";
        case error_codes::circular_reference: return "CircularReference";
        case error_codes::depth_limit_exceeded: return "DepthLimitExceeded";
        case error_codes::has_subcategories: return "HasSubcategories";
        case error_codes::has_courses: return "HasCourses";
        case error_codes::database_open_error:
        case error_codes::database_query_error:
        case error_codes::database_transaction_error:
        case error_codes::database_migration_error:
        case error_codes::database_not_open:
            return "StorageError";
    }
    return "Unknown";
}

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create an engine error result with module context
 * @tparam T The result value type
 * @param code Error code from lms::error_codes
 * @param message Error message
 * @param module Component that raised the error
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> lms_error(int code, const std::string& message,
                           const std::string& module = "lms") {
    return kcenon::common::make_error<T>(code, message, module);
}

/**
 * @brief Create an engine void error result
 */
inline VoidResult lms_void_error(int code, const std::string& message,
                                 const std::string& module = "lms") {
    return VoidResult(error_info{code, message, module});
}

} // namespace lms

