/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Detection is based on the __cpp_lib_format feature test macro, falling
 * back to the fmt library where the standard library lacks <format>.
 *
 * Usage:
 *   #include <lms/compat/format.hpp>
 *   auto s = lms::compat::format("category {} not found", id);
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define LMS_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define LMS_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define LMS_HAS_STD_FORMAT 1
#else
    #define LMS_HAS_STD_FORMAT 0
#endif

#if LMS_HAS_STD_FORMAT
    #include <format>
    namespace lms::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace lms::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
