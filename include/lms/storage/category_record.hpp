/**
 * @file category_record.hpp
 * @brief Category node data structures
 *
 * This file provides the category_record structure persisted by the
 * category store, the partial update applied to it, and the nested
 * node used when the forest is materialized.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lms::storage {

/**
 * @brief Category record from the database
 *
 * Categories form a forest: a record with no parent_id is a root.
 */
struct category_record {
    /// Primary key
    std::int64_t id = 0;

    /// Display name (never empty)
    std::string name;

    /// Parent category, std::nullopt for roots
    std::optional<std::int64_t> parent_id;

    /// Record creation timestamp
    std::chrono::system_clock::time_point created_at;

    /// Record last update timestamp
    std::chrono::system_clock::time_point updated_at;

    [[nodiscard]] auto is_root() const noexcept -> bool {
        return !parent_id.has_value();
    }
};

/**
 * @brief Partial update of a category
 *
 * Unset fields are left untouched. Setting parent_id reparents the
 * category; move_to_root detaches it from its parent. The two are
 * mutually exclusive.
 */
struct category_update {
    std::optional<std::string> name;
    std::optional<std::int64_t> parent_id;
    bool move_to_root = false;

    [[nodiscard]] auto changes_parent() const noexcept -> bool {
        return parent_id.has_value() || move_to_root;
    }
};

/**
 * @brief A category with its subcategories materialized
 */
struct category_node {
    category_record category;
    std::vector<category_node> children;
};

/**
 * @brief Category store configuration
 */
struct category_store_config {
    /// Maximum number of ancestors a category may have; unset is unlimited
    std::optional<std::size_t> max_depth;

    /// Row limit applied to root/children listings when none is given
    std::size_t default_list_limit = 100;
};

}  // namespace lms::storage
