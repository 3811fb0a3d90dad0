/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Provides a unified formatting interface that works across compilers and
 * standard library implementations. Detection is based on the
 * __cpp_lib_format feature test macro.
 *
 * Usage:
 *   #include <gedanon/compat/format.hpp>
 *   auto s = gedanon::compat::format("Line {}: {}", number, text);
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define GEDANON_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    // Apple Clang 15+ with libc++ may not define __cpp_lib_format
    #define GEDANON_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define GEDANON_HAS_STD_FORMAT 1
#else
    #define GEDANON_HAS_STD_FORMAT 0
#endif

#if GEDANON_HAS_STD_FORMAT
    #include <format>
    namespace gedanon::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace gedanon::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
