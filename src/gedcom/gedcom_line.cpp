/**
 * @file gedcom_line.cpp
 * @brief Implementation of GEDCOM line decomposition
 *
 * @copyright Copyright (c) 2025
 */

#include "gedanon/gedcom/gedcom_line.hpp"

#include <gedanon/compat/format.hpp>

#include <initializer_list>

namespace gedanon::gedcom {

namespace {

/**
 * @brief One decoded UTF-8 code point
 *
 * Invalid or truncated sequences decode as U+FFFD with a length of one
 * byte, so scanning always advances.
 */
struct code_point {
    char32_t value;
    std::size_t length;
};

constexpr char32_t replacement_character = 0xFFFD;

constexpr auto is_utf8_continuation(char c) noexcept -> bool {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

auto decode(std::string_view input) noexcept -> code_point {
    const auto lead = static_cast<unsigned char>(input.front());
    if (lead < 0x80) {
        return {lead, 1};
    }

    std::size_t length = 0;
    char32_t value = 0;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
        value = lead & 0x1F;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        value = lead & 0x0F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        value = lead & 0x07;
    } else {
        return {replacement_character, 1};
    }

    if (input.size() < length) {
        return {replacement_character, 1};
    }
    for (std::size_t i = 1; i < length; ++i) {
        if (!is_utf8_continuation(input[i])) {
            return {replacement_character, 1};
        }
        value = (value << 6) | (static_cast<unsigned char>(input[i]) & 0x3F);
    }
    return {value, length};
}

struct code_point_range {
    char32_t first;
    char32_t last;
};

constexpr auto in_ranges(char32_t cp, std::initializer_list<code_point_range> ranges) noexcept
    -> bool {
    for (const auto& range : ranges) {
        if (cp >= range.first && cp <= range.last) {
            return true;
        }
    }
    return false;
}

// First code point of each run of ten decimal digits outside ASCII
constexpr char32_t decimal_digit_zeros[] = {
    0x0660,  0x06F0,  0x07C0,  0x0966,  0x09E6,  0x0A66,  0x0AE6,  0x0B66,
    0x0BE6,  0x0C66,  0x0CE6,  0x0D66,  0x0DE6,  0x0E50,  0x0ED0,  0x0F20,
    0x1040,  0x1090,  0x17E0,  0x1810,  0x1946,  0x19D0,  0x1A80,  0x1A90,
    0x1B50,  0x1BB0,  0x1C40,  0x1C50,  0xA620,  0xA8D0,  0xA900,  0xA9D0,
    0xA9F0,  0xAA50,  0xABF0,  0xFF10,  0x104A0, 0x11066, 0x1D7CE, 0x1D7D8,
    0x1D7E2, 0x1D7EC, 0x1D7F6, 0x1FBF0,
};

constexpr auto is_digit(char32_t cp) noexcept -> bool {
    if (cp < 0x80) {
        return cp >= '0' && cp <= '9';
    }
    for (const auto zero : decimal_digit_zeros) {
        if (cp >= zero && cp < zero + 10) {
            return true;
        }
    }
    return false;
}

constexpr auto is_space(char32_t cp) noexcept -> bool {
    return cp == ' ' || (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x1F) ||
           cp == 0x85 || cp == 0xA0 || cp == 0x1680 ||
           (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 || cp == 0x2029 ||
           cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

// Punctuation, symbol, control and combining-mark blocks. Every other
// non-ASCII code point is treated as a letter.
constexpr auto is_non_word_symbol(char32_t cp) noexcept -> bool {
    return in_ranges(cp, {
        {0x0080, 0x00A9}, {0x00AB, 0x00B1}, {0x00B4, 0x00B4}, {0x00B6, 0x00B8},
        {0x00BB, 0x00BB}, {0x00BF, 0x00BF}, {0x00D7, 0x00D7}, {0x00F7, 0x00F7},
        {0x02C2, 0x02C5}, {0x02D2, 0x02DF}, {0x0300, 0x036F}, {0x2000, 0x206F},
        {0x20A0, 0x20FF}, {0x2190, 0x245F}, {0x2500, 0x2775}, {0x3000, 0x3004},
        {0x3008, 0x3020}, {0x3030, 0x3030}, {0x303D, 0x303F}, {0xFE00, 0xFE0F},
        {0xFE30, 0xFE6F}, {0xFF01, 0xFF0F}, {0xFF1A, 0xFF20}, {0xFF3B, 0xFF40},
        {0xFF5B, 0xFF65}, {0xFFF0, 0xFFFF}, {0x1F300, 0x1FAFF},
    });
}

constexpr auto is_word(char32_t cp) noexcept -> bool {
    if (cp < 0x80) {
        return is_digit(cp) || (cp >= 'A' && cp <= 'Z') || (cp >= 'a' && cp <= 'z') ||
               cp == '_';
    }
    return is_digit(cp) || !(is_space(cp) || is_non_word_symbol(cp));
}

/// Byte length of the leading run of code points satisfying @p predicate
template <typename Predicate>
auto scan_while(std::string_view input, Predicate predicate) noexcept -> std::size_t {
    std::size_t n = 0;
    while (n < input.size()) {
        const auto cp = decode(input.substr(n));
        if (!predicate(cp.value)) {
            break;
        }
        n += cp.length;
    }
    return n;
}

} // namespace

auto gedcom_line::assemble(std::string_view new_value) const -> std::string {
    std::string out;
    out.reserve(level.size() + 1 + xref.size() + tag.size() + 1 +
                new_value.size());
    out.append(level);
    out.push_back(' ');
    out.append(xref);
    out.append(tag);
    if (!new_value.empty()) {
        out.push_back(' ');
        out.append(new_value);
    }
    return out;
}

auto scan_level(std::string_view input) noexcept -> std::size_t {
    return scan_while(input, is_digit);
}

auto scan_whitespace(std::string_view input) noexcept -> std::size_t {
    return scan_while(input, is_space);
}

auto scan_xref(std::string_view input) noexcept -> std::size_t {
    if (input.empty() || input.front() != '@') {
        return 0;
    }

    auto close = input.find('@', 1);
    if (close == std::string_view::npos || close == 1) {
        return 0;
    }

    auto trailing = scan_whitespace(input.substr(close + 1));
    if (trailing == 0) {
        return 0;
    }
    return close + 1 + trailing;
}

auto scan_tag(std::string_view input) noexcept -> std::size_t {
    return scan_while(input, is_word);
}

auto char_count(std::string_view text) noexcept -> std::size_t {
    std::size_t count = 0;
    for (std::size_t pos = 0; pos < text.size(); pos += decode(text.substr(pos)).length) {
        ++count;
    }
    return count;
}

auto strip_bom(std::string_view line) noexcept -> std::string_view {
    if (line.substr(0, utf8_bom.size()) == utf8_bom) {
        line.remove_prefix(utf8_bom.size());
    }
    return line;
}

auto decompose(std::string_view raw_line) -> decomposed_line {
    const auto line = strip_bom(raw_line);
    auto rest = line;

    auto passthrough = [&line]() -> decomposed_line {
        return passthrough_line{std::string(line)};
    };

    // <level>
    const auto level_len = scan_level(rest);
    if (level_len == 0) {
        return passthrough();
    }
    gedcom_line parsed;
    parsed.level = std::string(rest.substr(0, level_len));
    rest.remove_prefix(level_len);

    // <space>
    const auto sep_len = scan_whitespace(rest);
    if (sep_len == 0) {
        return passthrough();
    }
    rest.remove_prefix(sep_len);

    // <xref>?
    if (const auto xref_len = scan_xref(rest); xref_len > 0) {
        parsed.xref = std::string(rest.substr(0, xref_len));
        rest.remove_prefix(xref_len);
    }

    // <tag>
    const auto tag_len = scan_tag(rest);
    if (tag_len == 0) {
        return passthrough();
    }
    parsed.tag = std::string(rest.substr(0, tag_len));
    rest.remove_prefix(tag_len);

    // (<space><value>?)?
    if (!rest.empty()) {
        const auto value_sep = scan_whitespace(rest);
        if (value_sep == 0) {
            return passthrough();
        }
        rest.remove_prefix(value_sep);
        parsed.value = std::string(rest);
    }

    return parsed;
}

auto is_blank(std::string_view line) noexcept -> bool {
    return scan_whitespace(line) == line.size();
}

auto trim(std::string_view text) noexcept -> std::string_view {
    text.remove_prefix(scan_whitespace(text));
    while (!text.empty()) {
        auto start = text.size() - 1;
        while (start > 0 && text.size() - start < 4 && is_utf8_continuation(text[start])) {
            --start;
        }
        const auto last = decode(text.substr(start));
        if (start + last.length != text.size() || !is_space(last.value)) {
            break;
        }
        text.remove_suffix(last.length);
    }
    return text;
}

auto preview(std::string_view text, std::size_t max_chars) -> std::string {
    std::size_t chars = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        if (!is_utf8_continuation(text[pos])) {
            if (chars == max_chars) {
                break;
            }
            ++chars;
        }
        ++pos;
    }
    return std::string(text.substr(0, pos));
}

auto malformed_line_diagnostic(std::size_t line_index, std::string_view text)
    -> std::optional<std::string> {
    if (line_index >= diagnostic_line_limit || is_blank(text)) {
        return std::nullopt;
    }
    return compat::format("Line {} doesn't match GEDCOM format: '{}'",
                          line_index + 1, preview(text));
}

} // namespace gedanon::gedcom
