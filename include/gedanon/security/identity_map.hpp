/**
 * @file identity_map.hpp
 * @brief Consistent placeholder mapping for anonymized values
 *
 * This file provides the identity_map class which assigns each distinct
 * original value a numbered placeholder ("Person 1", "Place 2", ...) in
 * first-seen order, and keeps returning the same placeholder for repeated
 * occurrences.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gedanon::security {

/**
 * @brief Maps original values to numbered placeholders
 *
 * The mapping is injective: once a value is mapped, every later occurrence
 * of the identical value resolves to the same placeholder, and two distinct
 * values never share one. Numbering starts at 1 and follows the order in
 * which values are first seen.
 *
 * Thread Safety: This class is NOT thread-safe. Each anonymization run owns
 * its maps exclusively.
 *
 * @example
 * @code
 * identity_map names("Person");
 *
 * auto first = names.get_or_create("John /Smith/");   // "Person 1"
 * auto second = names.get_or_create("Mary /Jones/");  // "Person 2"
 * auto again = names.get_or_create("John /Smith/");   // "Person 1"
 *
 * auto original = names.get_original("Person 2");     // "Mary /Jones/"
 * @endcode
 */
class identity_map {
public:
    /**
     * @brief A single original → placeholder pair
     */
    struct entry {
        std::string original;
        std::string placeholder;
    };

    /**
     * @brief Construct an empty map
     * @param kind Placeholder prefix (e.g. "Person", "Place")
     */
    explicit identity_map(std::string kind);

    // ========================================================================
    // Mapping Operations
    // ========================================================================

    /**
     * @brief Get existing placeholder or assign the next one
     *
     * @param original The original value, compared byte for byte
     * @return The placeholder for @p original
     */
    auto get_or_create(std::string_view original) -> std::string;

    /**
     * @brief Get existing placeholder without creating a new one
     * @param original The original value to look up
     * @return The placeholder, or nullopt if @p original was never seen
     */
    [[nodiscard]] auto get_placeholder(std::string_view original) const
        -> std::optional<std::string>;

    /**
     * @brief Get original value from a placeholder (reverse lookup)
     * @param placeholder The placeholder to look up
     * @return The original value, or nullopt if not found
     */
    [[nodiscard]] auto get_original(std::string_view placeholder) const
        -> std::optional<std::string>;

    // ========================================================================
    // Query Operations
    // ========================================================================

    [[nodiscard]] auto has_mapping(std::string_view original) const -> bool;

    [[nodiscard]] auto size() const noexcept -> std::size_t;

    [[nodiscard]] auto empty() const noexcept -> bool;

    /**
     * @brief Placeholder prefix of this map
     */
    [[nodiscard]] auto kind() const noexcept -> const std::string&;

    /**
     * @brief All mappings in first-seen order
     */
    [[nodiscard]] auto entries() const noexcept -> const std::vector<entry>&;

    // ========================================================================
    // Management Operations
    // ========================================================================

    /**
     * @brief Clear all mappings and restart numbering at 1
     */
    void clear();

    /**
     * @brief Export mappings to JSON format
     *
     * The export contains original values and must be kept private.
     *
     * @return JSON object with "kind" and an ordered "mappings" array
     */
    [[nodiscard]] auto to_json() const -> std::string;

private:
    [[nodiscard]] auto make_placeholder(std::uint64_t number) const
        -> std::string;

    /// Placeholder prefix
    std::string kind_;

    /// Mappings in first-seen order
    std::vector<entry> entries_;

    /// Forward index: original -> position in entries_
    std::map<std::string, std::size_t, std::less<>> by_original_;

    /// Reverse index: placeholder -> position in entries_
    std::map<std::string, std::size_t, std::less<>> by_placeholder_;

    /// Number assigned to the next new value
    std::uint64_t next_number_{1};
};

} // namespace gedanon::security
