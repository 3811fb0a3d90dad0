/**
 * @file anonymizer.hpp
 * @brief GEDCOM anonymization engine
 *
 * This file provides the anonymizer class which replaces personally
 * identifying values in GEDCOM records (names, places, dates, free text,
 * address and contact data) with deterministic placeholders while leaving
 * the structure (levels, cross-references, record types) intact.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "anonymizer_config.hpp"
#include "identity_map.hpp"
#include "tag_policy.hpp"

#include <gedanon/gedcom/gedcom_line.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace gedanon::security {

/**
 * @brief Report generated by an anonymization run
 */
struct anonymization_report {
    /// Total number of lines processed (including blank and passthrough)
    std::size_t lines_processed{0};

    /// Blank or whitespace-only lines copied through
    std::size_t blank_lines{0};

    /// Lines that did not match the GEDCOM grammar, copied through
    std::size_t lines_passed_through{0};

    /// NAME values replaced with a placeholder
    std::size_t names_replaced{0};

    /// PLAC values replaced with a placeholder
    std::size_t places_replaced{0};

    /// PLAC values kept by configuration
    std::size_t places_kept{0};

    /// DATE values normalized to a placeholder date
    std::size_t dates_normalized{0};

    /// DATE values kept, by configuration or because the format is unknown
    std::size_t dates_kept{0};

    /// Free-text values redacted
    std::size_t text_redacted{0};

    /// Name part, address, contact and title values redacted
    std::size_t fields_redacted{0};

    /// Values of other tags kept unchanged
    std::size_t values_kept{0};

    /// Operator diagnostics (malformed header lines)
    std::vector<std::string> warnings;

    /// When the run started: engine construction or the last reset()
    std::chrono::system_clock::time_point timestamp;

    /**
     * @brief Get total number of values modified
     */
    [[nodiscard]] auto total_modifications() const noexcept -> std::size_t {
        return names_replaced + places_replaced + dates_normalized +
               text_redacted + fields_redacted;
    }
};

/**
 * @brief GEDCOM anonymization engine
 *
 * An anonymizer instance represents one document-processing run: it owns
 * the name and place identity maps, so a value seen on line 10 gets the
 * same placeholder on line 5000. Lines must be fed in document order;
 * placeholder numbers follow first occurrence.
 *
 * Thread Safety: This class is NOT thread-safe. Use one instance per
 * document.
 *
 * @example
 * @code
 * anonymizer anon;
 *
 * anon.anonymize_line("0 @I1@ INDI");          // "0 @I1@ INDI"
 * anon.anonymize_line("1 NAME John /Smith/");  // "1 NAME Person 1"
 * anon.anonymize_line("2 DATE ABT 1850");      // "2 DATE ABT 1900"
 *
 * anonymizer keep_places({.keep_places = true});
 * keep_places.anonymize_line("2 PLAC Boston");  // "2 PLAC Boston"
 * @endcode
 */
class anonymizer {
public:
    // ========================================================================
    // Construction
    // ========================================================================

    /**
     * @brief Construct an engine with empty identity maps
     * @param config The run configuration
     */
    explicit anonymizer(anonymizer_config config = {});

    // ========================================================================
    // Anonymization Operations
    // ========================================================================

    /**
     * @brief Anonymize one line
     *
     * Blank lines are returned unchanged. Lines that do not match the
     * GEDCOM grammar are returned unchanged (minus any leading BOM); if such
     * a line is among the first few of the document, a warning is logged
     * and recorded in the report.
     *
     * @param raw_line The line without its terminator
     * @param line_index 0-based position of the line in the document
     * @return The replacement line
     */
    auto anonymize_line(std::string_view raw_line, std::size_t line_index = 0)
        -> std::string;

    /**
     * @brief Anonymize a whole document
     *
     * Applies anonymize_line() to every line in order. The output has
     * exactly as many lines as the input.
     *
     * @param lines Document lines without terminators
     * @return The replacement lines
     */
    auto anonymize_document(const std::vector<std::string>& lines)
        -> std::vector<std::string>;

    /**
     * @brief Apply the tag policy to an already decomposed line
     * @param line The decomposed line
     * @return The reassembled replacement line
     */
    auto anonymize(const gedcom::gedcom_line& line) -> std::string;

    // ========================================================================
    // Individual Policies
    // ========================================================================

    /**
     * @brief Resolve a personal name to its "Person N" placeholder
     */
    auto anonymize_name(std::string_view name) -> std::string;

    /**
     * @brief Resolve a place to its "Place N" placeholder
     *
     * Returns @p place unchanged when places are kept.
     */
    auto anonymize_place(std::string_view place) -> std::string;

    /**
     * @brief Normalize a date value
     *
     * Returns @p date unchanged when dates are kept.
     */
    [[nodiscard]] auto anonymize_date(std::string_view date) const -> std::string;

    /**
     * @brief Get the effective policy for a tag
     * @param tag Tag token
     * @param level Level digits of the line
     */
    [[nodiscard]] static auto get_policy(std::string_view tag,
                                         std::string_view level) -> tag_policy;

    // ========================================================================
    // State
    // ========================================================================

    [[nodiscard]] auto config() const noexcept -> const anonymizer_config&;

    /// Names seen so far (summary: unique names anonymized)
    [[nodiscard]] auto names() const noexcept -> const identity_map&;

    /// Places seen so far; stays empty when places are kept
    [[nodiscard]] auto places() const noexcept -> const identity_map&;

    [[nodiscard]] auto report() const noexcept -> const anonymization_report&;

    /**
     * @brief Forget all mappings and counters to start a new document
     */
    void reset();

private:
    void record_passthrough(std::size_t line_index, std::string_view text);

    [[nodiscard]] static auto redact(std::string_view value,
                                     std::string_view replacement)
        -> std::string;

    /// Run configuration
    anonymizer_config config_;

    /// Original name -> "Person N"
    identity_map names_;

    /// Original place -> "Place N"
    identity_map places_;

    /// Counters for the current run
    anonymization_report report_;
};

} // namespace gedanon::security
