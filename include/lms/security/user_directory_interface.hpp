/**
 * @file user_directory_interface.hpp
 * @brief Lookup of already-identified users
 */

#pragma once

#include "user_account.hpp"

#include <kcenon/common/patterns/result.h>

#include <cstdint>
#include <optional>

namespace lms::security {

/**
 * @brief Abstract interface for the user lookup collaborator
 */
class user_directory_interface {
public:
    template <typename T> using Result = kcenon::common::Result<T>;

    virtual ~user_directory_interface() = default;

    /**
     * @brief Find a user by id
     * @return The user, std::nullopt if unknown, or a storage error
     */
    [[nodiscard]] virtual auto find_user(std::int64_t user_id)
        -> Result<std::optional<user_account>> = 0;

protected:
    user_directory_interface() = default;
    user_directory_interface(const user_directory_interface&) = delete;
    user_directory_interface& operator=(const user_directory_interface&) = delete;
    user_directory_interface(user_directory_interface&&) = default;
    user_directory_interface& operator=(user_directory_interface&&) = default;
};

} // namespace lms::security
