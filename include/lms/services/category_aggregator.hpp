/**
 * @file category_aggregator.hpp
 * @brief Derived course and subcategory counts over the category tree
 *
 * This file provides the category_aggregator class, a read-only view
 * combining the category store with the course catalog. Nothing it
 * computes is persisted; every call recomputes from current state.
 */

#pragma once

#include <lms/core/result.hpp>
#include <lms/di/ilogger.hpp>
#include <lms/security/course_catalog_interface.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lms::storage {
class category_repository;
}  // namespace lms::storage

namespace lms::services {

/**
 * @brief Aggregate counts of one category
 */
struct category_stats {
    std::size_t direct_courses_count{0};
    std::size_t direct_subcategories_count{0};

    /// Courses filed on the category or anywhere below it
    std::size_t total_nested_courses_count{0};
};

/**
 * @brief A category of the annotated forest returned by build_tree()
 */
struct category_tree_node {
    std::int64_t id{0};
    std::string name;
    std::optional<std::int64_t> parent_id;

    std::size_t direct_courses_count{0};
    std::size_t direct_subcategories_count{0};
    std::size_t total_nested_courses_count{0};

    /// Children ordered by name
    std::vector<category_tree_node> subcategories;
};

/**
 * @brief Computes category statistics by tree traversal
 *
 * For every category C:
 * total_nested_courses_count(C) == direct_courses_count(C) +
 *     sum of total_nested_courses_count over the direct subcategories of C
 *
 * Traversals are iterative and visit every category at most once.
 */
class category_aggregator {
public:
    category_aggregator(std::shared_ptr<storage::category_repository> categories,
                        std::shared_ptr<security::course_catalog_interface> courses,
                        std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Courses filed exactly on the category
     * @return The count, or NotFound for an unknown category
     */
    [[nodiscard]] auto direct_courses_count(std::int64_t category_id)
        -> Result<std::size_t>;

    /**
     * @brief Categories whose parent is the category
     */
    [[nodiscard]] auto direct_subcategories_count(std::int64_t category_id)
        -> Result<std::size_t>;

    [[nodiscard]] auto total_nested_courses_count(std::int64_t category_id)
        -> Result<std::size_t>;

    [[nodiscard]] auto stats(std::int64_t category_id) -> Result<category_stats>;

    /**
     * @brief The whole forest annotated with counts
     *
     * Categories and courses are each read once; totals are accumulated
     * bottom-up so every node is processed a single time.
     */
    [[nodiscard]] auto build_tree() -> Result<std::vector<category_tree_node>>;

private:
    std::shared_ptr<storage::category_repository> categories_;
    std::shared_ptr<security::course_catalog_interface> courses_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace lms::services
