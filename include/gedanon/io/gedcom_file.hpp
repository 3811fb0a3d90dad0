/**
 * @file gedcom_file.hpp
 * @brief GEDCOM file reading and writing
 *
 * A gedcom_file holds the lines of a GEDCOM document without their
 * terminators. Reading accepts LF, CRLF and CR line endings and drops a
 * leading UTF-8 byte-order marker; writing terminates every line with LF.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <gedanon/core/result.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace gedanon::io {

/**
 * @brief Split text into lines
 *
 * Each of "\n", "\r\n" and "\r" ends a line. A trailing terminator does not
 * start an extra empty line; a final line without terminator is kept.
 *
 * @param text The document text
 * @return Lines without terminators
 */
[[nodiscard]] auto split_lines(std::string_view text) -> std::vector<std::string>;

/**
 * @brief Check whether a path exists without throwing
 *
 * A path that is merely absent yields false. Failures other than absence,
 * such as a denied parent directory or an over-long name, are errors.
 *
 * @param path Path to check
 * @return Result containing existence, or a file_read_error error
 */
[[nodiscard]] auto path_exists(const std::filesystem::path& path) -> Result<bool>;

/**
 * @brief In-memory GEDCOM document as a sequence of lines
 *
 * @example
 * @code
 * auto result = gedcom_file::open("family.ged");
 * if (result.is_err()) {
 *     std::cerr << result.error().message << "\n";
 *     return 1;
 * }
 *
 * auto output = gedcom_file::create(anon.anonymize_document(result.value().lines()));
 * auto saved = output.save("family_anon.ged");
 * @endcode
 */
class gedcom_file {
public:
    /**
     * @brief Construct an empty document
     */
    gedcom_file() = default;

    // ========================================================================
    // Factory Methods
    // ========================================================================

    /**
     * @brief Read a GEDCOM file from disk
     * @param path Path to the file
     * @return Result containing the file, or a file_not_found,
     *         not_a_regular_file or file_read_error error
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> Result<gedcom_file>;

    /**
     * @brief Build a file from document text
     * @param text The document text, optionally starting with a UTF-8 BOM
     */
    [[nodiscard]] static auto from_text(std::string_view text) -> gedcom_file;

    /**
     * @brief Build a file from lines
     * @param lines Lines without terminators
     */
    [[nodiscard]] static auto create(std::vector<std::string> lines) -> gedcom_file;

    // ========================================================================
    // Output
    // ========================================================================

    /**
     * @brief Write the file to disk
     *
     * Missing parent directories are created. Every line is terminated by
     * "\n"; no byte-order marker is written.
     *
     * @param path Destination path (overwritten if it exists)
     * @return Success, or an output_directory_error or file_write_error error
     */
    [[nodiscard]] auto save(const std::filesystem::path& path) const -> VoidResult;

    /**
     * @brief Serialize to text with LF terminators
     */
    [[nodiscard]] auto to_text() const -> std::string;

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] auto lines() const noexcept -> const std::vector<std::string>&;

    [[nodiscard]] auto line_count() const noexcept -> std::size_t;

    /// Whether the source text started with a byte-order marker
    [[nodiscard]] auto had_bom() const noexcept -> bool;

private:
    gedcom_file(std::vector<std::string> lines, bool had_bom);

    std::vector<std::string> lines_;
    bool had_bom_{false};
};

} // namespace gedanon::io
