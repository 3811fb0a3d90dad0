/**
 * @file gedcom_file.cpp
 * @brief Implementation of GEDCOM file reading and writing
 *
 * @copyright Copyright (c) 2025
 */

#include "gedanon/io/gedcom_file.hpp"

#include <gedanon/gedcom/gedcom_line.hpp>

#include <fstream>
#include <iterator>
#include <system_error>

namespace gedanon::io {

namespace {

[[nodiscard]] auto read_file_contents(const std::filesystem::path& path)
    -> Result<std::string> {
    auto exists = path_exists(path);
    if (exists.is_err()) {
        return gedanon_error<std::string>(exists.error().code, exists.error().message);
    }
    if (!exists.value()) {
        return gedanon_error<std::string>(
            error_codes::file_not_found,
            "Input file not found: " + path.string());
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return gedanon_error<std::string>(
            error_codes::not_a_regular_file,
            "Not a regular file: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return gedanon_error<std::string>(
            error_codes::file_read_error,
            "Failed to open file for reading: " + path.string());
    }

    std::string contents{std::istreambuf_iterator<char>(file),
                         std::istreambuf_iterator<char>()};
    if (file.bad()) {
        return gedanon_error<std::string>(
            error_codes::file_read_error,
            "Failed to read file: " + path.string());
    }

    return Result<std::string>::ok(std::move(contents));
}

} // namespace

auto path_exists(const std::filesystem::path& path) -> Result<bool> {
    std::error_code ec;
    const bool exists = std::filesystem::exists(path, ec);
    if (ec) {
        return gedanon_error<bool>(
            error_codes::file_read_error,
            "Cannot access " + path.string() + ": " + ec.message());
    }
    return Result<bool>::ok(exists);
}

auto split_lines(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> lines;

    std::size_t start = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const char c = text[pos];
        if (c == '\n' || c == '\r') {
            lines.emplace_back(text.substr(start, pos - start));
            if (c == '\r' && pos + 1 < text.size() && text[pos + 1] == '\n') {
                ++pos;
            }
            start = pos + 1;
        }
        ++pos;
    }

    if (start < text.size()) {
        lines.emplace_back(text.substr(start));
    }

    return lines;
}

gedcom_file::gedcom_file(std::vector<std::string> lines, bool had_bom)
    : lines_(std::move(lines)), had_bom_(had_bom) {}

auto gedcom_file::open(const std::filesystem::path& path)
    -> Result<gedcom_file> {
    auto contents = read_file_contents(path);
    if (contents.is_err()) {
        return Result<gedcom_file>::err(contents.error());
    }

    return Result<gedcom_file>::ok(from_text(contents.value()));
}

auto gedcom_file::from_text(std::string_view text) -> gedcom_file {
    const auto body = gedcom::strip_bom(text);
    const bool had_bom = body.size() != text.size();
    return gedcom_file(split_lines(body), had_bom);
}

auto gedcom_file::create(std::vector<std::string> lines) -> gedcom_file {
    return gedcom_file(std::move(lines), false);
}

auto gedcom_file::save(const std::filesystem::path& path) const -> VoidResult {
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return gedanon_void_error(
                error_codes::output_directory_error,
                "Failed to create output directory: " + parent.string(),
                ec.message());
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return gedanon_void_error(
            error_codes::file_write_error,
            "Failed to open file for writing: " + path.string());
    }

    for (const auto& line : lines_) {
        file << line << '\n';
    }
    file.flush();

    if (!file) {
        return gedanon_void_error(
            error_codes::file_write_error,
            "Failed to write to file: " + path.string());
    }

    return ok();
}

auto gedcom_file::to_text() const -> std::string {
    std::string text;
    for (const auto& line : lines_) {
        text.append(line);
        text.push_back('\n');
    }
    return text;
}

auto gedcom_file::lines() const noexcept -> const std::vector<std::string>& {
    return lines_;
}

auto gedcom_file::line_count() const noexcept -> std::size_t {
    return lines_.size();
}

auto gedcom_file::had_bom() const noexcept -> bool {
    return had_bom_;
}

} // namespace gedanon::io
