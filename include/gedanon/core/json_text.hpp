/**
 * @file json_text.hpp
 * @brief Helpers for writing JSON text by hand
 *
 * The mapping export and the audit trail emit small, fixed-shape JSON
 * documents; these helpers cover string escaping and timestamps.
 */

#pragma once

#include <gedanon/compat/format.hpp>
#include <gedanon/compat/time.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace gedanon {

/**
 * @brief Escape a string for use inside a JSON string literal
 * @param s Input string (UTF-8 bytes are copied through)
 * @return JSON-escaped string, without surrounding quotes
 */
[[nodiscard]] inline std::string json_escape(std::string_view s) {
    static constexpr char hex_digits[] = "0123456789abcdef";

    std::string result;
    result.reserve(s.size() + 10);
    for (char c : s) {
        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    result += "\\u00";
                    result += hex_digits[(c >> 4) & 0x0F];
                    result += hex_digits[c & 0x0F];
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

/**
 * @brief Quote and escape a string as a JSON string literal
 */
[[nodiscard]] inline std::string json_quote(std::string_view s) {
    return "\"" + json_escape(s) + "\"";
}

/**
 * @brief Format a time point as ISO 8601 UTC with milliseconds
 *
 * Example: "2025-03-14T09:26:53.589Z"
 */
[[nodiscard]] inline std::string iso8601_utc(std::chrono::system_clock::time_point tp) {
    const auto seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            tp.time_since_epoch()) % 1000;

    std::tm tm_val{};
    if (compat::gmtime_safe(&seconds, &tm_val) == nullptr) {
        return {};
    }

    return compat::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                          tm_val.tm_year + 1900, tm_val.tm_mon + 1, tm_val.tm_mday,
                          tm_val.tm_hour, tm_val.tm_min, tm_val.tm_sec,
                          static_cast<int>(millis.count()));
}

} // namespace gedanon
