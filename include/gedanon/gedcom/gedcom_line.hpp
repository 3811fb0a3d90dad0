/**
 * @file gedcom_line.hpp
 * @brief Structural decomposition of GEDCOM record lines
 *
 * A GEDCOM line has the shape
 *
 *   <level> <xref>? <tag> <value>?
 *
 * e.g. "0 @I1@ INDI" or "2 DATE 4 JUL 1776". This file provides the
 * decomposer that splits a raw line into those fields, together with the
 * individual field scanners it is built from.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace gedanon::gedcom {

/// UTF-8 encoded byte-order marker
inline constexpr std::string_view utf8_bom{"\xEF\xBB\xBF"};

/// Lines at or beyond this 0-based index never produce format diagnostics
inline constexpr std::size_t diagnostic_line_limit = 5;

/// Maximum number of characters shown in a diagnostic preview
inline constexpr std::size_t diagnostic_preview_length = 50;

/**
 * @brief A line that matched the GEDCOM structural grammar
 */
struct gedcom_line {
    /// Level digits, verbatim (e.g. "0", "2")
    std::string level;

    /// Cross-reference label with its trailing whitespace (e.g. "@I1@ "),
    /// or empty when the line carries none
    std::string xref;

    /// Tag token (e.g. "NAME")
    std::string tag;

    /// Remainder of the line after the tag separator, possibly empty
    std::string value;

    [[nodiscard]] auto has_xref() const noexcept -> bool { return !xref.empty(); }

    /**
     * @brief Rebuild the line with a substituted value
     *
     * Produces `level + " " + xref + tag`, followed by `" " + value` only
     * when @p new_value is non-empty, so empty-valued tags never gain
     * trailing whitespace.
     */
    [[nodiscard]] auto assemble(std::string_view new_value) const -> std::string;

    /**
     * @brief Rebuild the line with its own value
     */
    [[nodiscard]] auto to_string() const -> std::string { return assemble(value); }
};

/**
 * @brief A line that did not match the grammar and is emitted unchanged
 */
struct passthrough_line {
    /// Original text (with any leading BOM removed)
    std::string text;
};

/**
 * @brief Outcome of decomposing a raw line
 */
using decomposed_line = std::variant<gedcom_line, passthrough_line>;

// ============================================================================
// Field scanners
// ============================================================================
//
// Each scanner decodes the start of its input as UTF-8 and returns the
// number of bytes belonging to the field, or 0 when the field is not present.
// Character classes are Unicode-aware: U+00A0 and the other space separators
// count as whitespace, and accented or non-Latin letters are word characters.

/// One or more decimal digits (ASCII or any other script's 0-9 run)
[[nodiscard]] auto scan_level(std::string_view input) noexcept -> std::size_t;

/// One or more whitespace characters
[[nodiscard]] auto scan_whitespace(std::string_view input) noexcept -> std::size_t;

/// '@', one or more non-'@' characters, '@', then at least one whitespace
/// character. The returned length includes the trailing whitespace.
[[nodiscard]] auto scan_xref(std::string_view input) noexcept -> std::size_t;

/// One or more word characters (letters, digits, underscore)
[[nodiscard]] auto scan_tag(std::string_view input) noexcept -> std::size_t;

/// Number of UTF-8 code points in @p text; each invalid byte counts as one
[[nodiscard]] auto char_count(std::string_view text) noexcept -> std::size_t;

// ============================================================================
// Decomposition
// ============================================================================

/**
 * @brief Remove a leading UTF-8 byte-order marker if present
 */
[[nodiscard]] auto strip_bom(std::string_view line) noexcept -> std::string_view;

/**
 * @brief Decompose a raw line into its structural fields
 *
 * Never fails: lines that do not match the grammar come back as a
 * passthrough_line holding the BOM-stripped text.
 *
 * @param raw_line One line without its terminator
 * @return The decomposed line or a passthrough marker
 */
[[nodiscard]] auto decompose(std::string_view raw_line) -> decomposed_line;

/**
 * @brief Check whether a line is empty or whitespace only
 */
[[nodiscard]] auto is_blank(std::string_view line) noexcept -> bool;

/**
 * @brief Trim leading and trailing whitespace
 */
[[nodiscard]] auto trim(std::string_view text) noexcept -> std::string_view;

/**
 * @brief Truncate text to at most @p max_chars UTF-8 characters
 *
 * Multi-byte sequences are never split.
 */
[[nodiscard]] auto preview(std::string_view text,
                           std::size_t max_chars = diagnostic_preview_length)
    -> std::string;

/**
 * @brief Build the operator diagnostic for a malformed line
 *
 * Only non-blank lines among the first few lines of a document are
 * reported; a malformed header usually means the file is not GEDCOM at all.
 *
 * @param line_index 0-based position of the line in the document
 * @param text The passthrough text
 * @return The diagnostic message, or nullopt if nothing should be reported
 */
[[nodiscard]] auto malformed_line_diagnostic(std::size_t line_index,
                                             std::string_view text)
    -> std::optional<std::string>;

} // namespace gedanon::gedcom
