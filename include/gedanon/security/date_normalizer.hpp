/**
 * @file date_normalizer.hpp
 * @brief Placeholder substitution for GEDCOM date values
 *
 * Dates are replaced by a fixed placeholder that keeps the coarse shape of
 * the original value (full date, qualified year, bare year), so parsers
 * still see the same kind of date without the real one.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace gedanon::security {

/// Replacement for a full day-month-year date
inline constexpr std::string_view placeholder_full_date{"1 JAN 1900"};

/// Replacement year
inline constexpr std::string_view placeholder_year{"1900"};

/// Date qualifiers preserved in front of the placeholder year
inline constexpr std::array<std::string_view, 5> date_qualifiers{
    "ABT", "BEF", "AFT", "CAL", "EST"};

/**
 * @brief Recognized date shapes, in rule precedence order
 */
enum class date_shape : std::uint8_t {
    /// <1-2 digits> <3-letter token> <4 digits>, e.g. "4 JUL 1776"
    full_date = 0,

    /// <qualifier> <4 digits>, e.g. "ABT 1850"
    qualified_year = 1,

    /// <4 digits>, e.g. "1923"
    year = 2,

    /// Anything else; left unchanged
    unrecognized = 3
};

/**
 * @brief Convert date shape enum to string representation
 */
[[nodiscard]] constexpr auto to_string(date_shape shape) noexcept
    -> std::string_view {
    switch (shape) {
        case date_shape::full_date:
            return "full_date";
        case date_shape::qualified_year:
            return "qualified_year";
        case date_shape::year:
            return "year";
        case date_shape::unrecognized:
            return "unrecognized";
    }
    return "unknown";
}

/**
 * @brief Classify a date value by its leading shape
 *
 * Shapes are matched as prefixes of @p value; trailing text is ignored.
 * Day and month tokens are not validated ("99 ZZZ 1900" is a full date).
 *
 * @param value The DATE value
 * @return The first matching shape
 */
[[nodiscard]] auto classify_date(std::string_view value) noexcept -> date_shape;

/**
 * @brief Replace a date value with its placeholder
 *
 * - full date      → "1 JAN 1900"
 * - qualified year → "<qualifier> 1900"
 * - year           → "1900"
 * - unrecognized   → @p value unchanged
 *
 * @param value The DATE value
 * @return The placeholder date
 */
[[nodiscard]] auto normalize_date(std::string_view value) -> std::string;

} // namespace gedanon::security
