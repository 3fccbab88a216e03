/**
 * @file format.hpp
 * @brief std::format / fmt::format selection for the migrator
 *
 * libstdc++ only ships <format> from GCC 13 on; older toolchains fall back
 * to the fmt library, which exposes the same format-string syntax.
 *
 * Usage:
 *   #include <migrator/compat/format.hpp>
 *   auto s = migrator::compat::format("job {} is {}", id, state);
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define MIGRATOR_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define MIGRATOR_HAS_STD_FORMAT 1
#else
    #define MIGRATOR_HAS_STD_FORMAT 0
#endif

#if MIGRATOR_HAS_STD_FORMAT
    #include <format>
    namespace migrator::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace migrator::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
