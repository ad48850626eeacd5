/**
 * @file course_catalog_interface.hpp
 * @brief Read-only view of the course catalog
 */

#pragma once

#include "course_ref.hpp"

#include <kcenon/common/patterns/result.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace lms::security {

/**
 * @brief Abstract interface for the course lookup collaborator
 *
 * The engine never writes course records; it only reads the category a
 * course is filed under.
 */
class course_catalog_interface {
public:
    template <typename T> using Result = kcenon::common::Result<T>;

    virtual ~course_catalog_interface() = default;

    [[nodiscard]] virtual auto find_course(std::int64_t course_id)
        -> Result<std::optional<course_ref>> = 0;

    /**
     * @brief Number of courses filed directly under a category
     */
    [[nodiscard]] virtual auto count_courses_by_category(std::int64_t category_id)
        -> Result<std::size_t> = 0;

    /**
     * @brief Courses filed directly under a category
     */
    [[nodiscard]] virtual auto list_courses_by_category(std::int64_t category_id)
        -> Result<std::vector<course_ref>> = 0;

    [[nodiscard]] virtual auto list_all_courses()
        -> Result<std::vector<course_ref>> = 0;

protected:
    course_catalog_interface() = default;
    course_catalog_interface(const course_catalog_interface&) = delete;
    course_catalog_interface& operator=(const course_catalog_interface&) = delete;
    course_catalog_interface(course_catalog_interface&&) = default;
    course_catalog_interface& operator=(course_catalog_interface&&) = default;
};

} // namespace lms::security
