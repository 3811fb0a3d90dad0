/**
 * @file tag_policy.hpp
 * @brief Substitution policies for GEDCOM tags
 *
 * This file defines what happens to the value of each GEDCOM tag during
 * anonymization, and the report accumulated over an anonymization run.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace gedanon::security {

/// Replacement for free-text content (NOTE, TEXT, CONT, CONC)
inline constexpr std::string_view redacted_text{"[anonymized text]"};

/// Replacement for name parts, address, contact and title fields
inline constexpr std::string_view redacted_field{"[anonymized]"};

/// Placeholder prefix for personal names
inline constexpr std::string_view person_kind{"Person"};

/// Placeholder prefix for places
inline constexpr std::string_view place_kind{"Place"};

/**
 * @brief Policies applied to the value of a GEDCOM line
 */
enum class tag_policy : std::uint8_t {
    /**
     * @brief Keep the value unchanged
     *
     * Used for structural tags (INDI, FAM, BIRT, HUSB, ...) whose values
     * are record types or cross-references.
     */
    keep = 0,

    /**
     * @brief Replace with a consistent "Person N" placeholder
     */
    name_identity = 1,

    /**
     * @brief Replace with a consistent "Place N" placeholder
     *
     * Unless places are kept by configuration.
     */
    place_identity = 2,

    /**
     * @brief Normalize the date to a fixed placeholder of the same shape
     *
     * Unless dates are kept by configuration.
     */
    normalize_date = 3,

    /**
     * @brief Replace non-blank free text with "[anonymized text]"
     */
    redact_text = 4,

    /**
     * @brief Replace a non-blank field with "[anonymized]"
     */
    redact_field = 5
};

/**
 * @brief Convert tag policy enum to string representation
 * @param policy The tag policy
 * @return String name of the policy
 */
[[nodiscard]] constexpr auto to_string(tag_policy policy) noexcept
    -> std::string_view {
    switch (policy) {
        case tag_policy::keep:
            return "keep";
        case tag_policy::name_identity:
            return "name_identity";
        case tag_policy::place_identity:
            return "place_identity";
        case tag_policy::normalize_date:
            return "normalize_date";
        case tag_policy::redact_text:
            return "redact_text";
        case tag_policy::redact_field:
            return "redact_field";
    }
    return "unknown";
}

/**
 * @brief The tag → policy table
 *
 * Tags absent from the table are kept. The table does not cover the
 * level-dependent TITL rule; use policy_for() for the effective policy.
 */
[[nodiscard]] auto policy_table()
    -> const std::map<std::string, tag_policy, std::less<>>&;

/**
 * @brief Effective policy for a tag at a given level
 *
 * TITL is redacted only on level-1 lines (source titles); nested TITL
 * lines such as citation details keep their value.
 *
 * @param tag Tag token, matched case-sensitively
 * @param level Level digits as they appear in the line
 * @return The policy to apply
 */
[[nodiscard]] auto policy_for(std::string_view tag, std::string_view level)
    -> tag_policy;

} // namespace gedanon::security
