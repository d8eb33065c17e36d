/**
 * @file format.hpp
 * @brief pii::compat::format, std::format where available and {fmt} otherwise
 *
 * Log messages and error details are built with this one entry point so the
 * library also builds on GCC 12 era standard libraries.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <version>

#if (defined(__cpp_lib_format) && __cpp_lib_format >= 201907L) || \
    (defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15) || \
    (defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20)
#define PII_HAS_STD_FORMAT 1
#else
#define PII_HAS_STD_FORMAT 0
#endif

#if PII_HAS_STD_FORMAT
#include <format>
#else
#include <fmt/format.h>
#endif

namespace pii::compat {

#if PII_HAS_STD_FORMAT
using std::format;
template <typename... Args>
using format_string = std::format_string<Args...>;
#else
using fmt::format;
template <typename... Args>
using format_string = fmt::format_string<Args...>;
#endif

}  // namespace pii::compat
