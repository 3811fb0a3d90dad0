/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for gedanon
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for gedanon, integrating with common_system's Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>

#include <string>

namespace gedanon {

/**
 * @brief Result type alias for gedanon operations
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
 * @brief gedanon-specific error codes
 *
 * Error code range: -700 to -749
 */
namespace error_codes {
    constexpr int gedanon_base = -700;

    // File errors (-700 to -719)
    constexpr int file_not_found = gedanon_base - 0;
    constexpr int file_read_error = gedanon_base - 1;
    constexpr int file_write_error = gedanon_base - 2;
    constexpr int output_directory_error = gedanon_base - 3;
    constexpr int not_a_regular_file = gedanon_base - 4;

    // Mapping export errors (-720 to -729)
    constexpr int mapping_write_error = gedanon_base - 20;
} // namespace error_codes

using kcenon::common::ok;

/**
 * @brief Create a gedanon error result with module context
 * @tparam T The result value type
 * @param code Error code from gedanon::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> gedanon_error(int code, const std::string& message,
                               const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "gedanon");
    }
    return kcenon::common::make_error<T>(code, message, "gedanon", details);
}

/**
 * @brief Create a gedanon void error result
 * @param code Error code from gedanon::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult gedanon_void_error(int code, const std::string& message,
                                     const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "gedanon"});
    }
    return VoidResult(error_info{code, message, "gedanon", details});
}

} // namespace gedanon

