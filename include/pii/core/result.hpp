/**
 * @file result.hpp
 * @brief Result types for the sanitizer, on common_system's Result<T>
 *
 * Fallible operations return Result<T> or VoidResult. Errors carry one of
 * pii::error_codes, the module name "pii", and a details string holding
 * offsets and lengths only (never matched text).
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <kcenon/common/patterns/result.h>

#include <string>

namespace pii {

template <typename T>
using Result = kcenon::common::Result<T>;
using VoidResult = kcenon::common::VoidResult;
using error_info = kcenon::common::error_info;

using kcenon::common::ok;

/// Sanitizer error codes, -900 .. -949.
namespace error_codes {
    constexpr int invalid_span = -900;            ///< zero length, out of bounds, bad confidence
    constexpr int detector_unavailable = -901;    ///< recognizer failed, threw or timed out
    constexpr int unsupported_policy = -902;
    constexpr int internal_inconsistency = -903;  ///< overlapping spans reached the redactor
    constexpr int invalid_configuration = -904;
}  // namespace error_codes

inline constexpr const char* error_module = "pii";

template <typename T>
inline auto pii_error(int code, const std::string& message,
                      const std::string& details = "") -> Result<T> {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, error_module);
    }
    return kcenon::common::make_error<T>(code, message, error_module, details);
}

inline auto pii_void_error(int code, const std::string& message,
                           const std::string& details = "") -> VoidResult {
    if (details.empty()) {
        return VoidResult(error_info{code, message, error_module});
    }
    return VoidResult(error_info{code, message, error_module, details});
}

}  // namespace pii
