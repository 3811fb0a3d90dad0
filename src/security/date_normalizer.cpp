/**
 * @file date_normalizer.cpp
 * @brief Implementation of GEDCOM date placeholder substitution
 *
 * @copyright Copyright (c) 2025
 */

#include "gedanon/security/date_normalizer.hpp"

#include <gedanon/gedcom/gedcom_line.hpp>

#include <algorithm>

namespace gedanon::security {

using gedcom::char_count;
using gedcom::scan_level;
using gedcom::scan_tag;
using gedcom::scan_whitespace;

namespace {

// Scanners return byte lengths; the shape rules count characters.

auto digit_count(std::string_view value) noexcept -> std::size_t {
    return char_count(value.substr(0, scan_level(value)));
}

auto match_full_date(std::string_view value) noexcept -> bool {
    const auto day = scan_level(value);
    const auto day_chars = char_count(value.substr(0, day));
    if (day_chars < 1 || day_chars > 2) {
        return false;
    }
    value.remove_prefix(day);

    auto ws = scan_whitespace(value);
    if (ws == 0) {
        return false;
    }
    value.remove_prefix(ws);

    const auto month = scan_tag(value);
    if (char_count(value.substr(0, month)) != 3) {
        return false;
    }
    value.remove_prefix(month);

    ws = scan_whitespace(value);
    if (ws == 0) {
        return false;
    }
    value.remove_prefix(ws);

    return digit_count(value) >= 4;
}

auto match_qualifier(std::string_view value) noexcept -> std::string_view {
    const auto token = value.substr(0, 3);
    auto it = std::find(date_qualifiers.begin(), date_qualifiers.end(), token);
    if (it == date_qualifiers.end()) {
        return {};
    }
    return *it;
}

auto match_qualified_year(std::string_view value) noexcept -> bool {
    if (match_qualifier(value).empty()) {
        return false;
    }
    value.remove_prefix(3);

    const auto ws = scan_whitespace(value);
    if (ws == 0) {
        return false;
    }
    value.remove_prefix(ws);

    return digit_count(value) >= 4;
}

} // namespace

auto classify_date(std::string_view value) noexcept -> date_shape {
    if (match_full_date(value)) {
        return date_shape::full_date;
    }
    if (match_qualified_year(value)) {
        return date_shape::qualified_year;
    }
    if (digit_count(value) >= 4) {
        return date_shape::year;
    }
    return date_shape::unrecognized;
}

auto normalize_date(std::string_view value) -> std::string {
    switch (classify_date(value)) {
        case date_shape::full_date:
            return std::string(placeholder_full_date);
        case date_shape::qualified_year:
            return std::string(match_qualifier(value)) + " " +
                   std::string(placeholder_year);
        case date_shape::year:
            return std::string(placeholder_year);
        case date_shape::unrecognized:
            break;
    }
    return std::string(value);
}

} // namespace gedanon::security
