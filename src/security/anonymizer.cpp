/**
 * @file anonymizer.cpp
 * @brief Implementation of GEDCOM anonymization
 *
 * @copyright Copyright (c) 2025
 */

#include "gedanon/security/anonymizer.hpp"
#include "gedanon/security/date_normalizer.hpp"

#include <gedanon/integration/logger_adapter.hpp>

#include <chrono>
#include <variant>

namespace gedanon::security {

using gedanon::integration::logger_adapter;

anonymizer::anonymizer(anonymizer_config config)
    : config_{config}
    , names_{std::string(person_kind)}
    , places_{std::string(place_kind)} {
    report_.timestamp = std::chrono::system_clock::now();
}

auto anonymizer::anonymize_line(std::string_view raw_line, std::size_t line_index)
    -> std::string {
    report_.lines_processed++;

    if (gedcom::is_blank(raw_line)) {
        report_.blank_lines++;
        return std::string(raw_line);
    }

    auto decomposed = gedcom::decompose(raw_line);
    if (auto* passthrough = std::get_if<gedcom::passthrough_line>(&decomposed)) {
        record_passthrough(line_index, passthrough->text);
        return std::move(passthrough->text);
    }

    return anonymize(std::get<gedcom::gedcom_line>(decomposed));
}

auto anonymizer::anonymize_document(const std::vector<std::string>& lines)
    -> std::vector<std::string> {
    std::vector<std::string> output;
    output.reserve(lines.size());

    for (std::size_t i = 0; i < lines.size(); ++i) {
        output.push_back(anonymize_line(lines[i], i));
    }

    logger_adapter::debug(
        "Anonymized {} lines: {} modifications, {} unique names, {} unique places",
        lines.size(), report_.total_modifications(), names_.size(),
        places_.size());

    return output;
}

auto anonymizer::anonymize(const gedcom::gedcom_line& line) -> std::string {
    switch (get_policy(line.tag, line.level)) {
        case tag_policy::name_identity:
            report_.names_replaced++;
            return line.assemble(anonymize_name(line.value));

        case tag_policy::place_identity:
            if (config_.keep_places) {
                report_.places_kept++;
            } else {
                report_.places_replaced++;
            }
            return line.assemble(anonymize_place(line.value));

        case tag_policy::normalize_date: {
            auto date = anonymize_date(line.value);
            if (config_.keep_dates ||
                classify_date(line.value) == date_shape::unrecognized) {
                report_.dates_kept++;
            } else {
                report_.dates_normalized++;
            }
            return line.assemble(date);
        }

        case tag_policy::redact_text:
            if (!gedcom::trim(line.value).empty()) {
                report_.text_redacted++;
            }
            return line.assemble(redact(line.value, redacted_text));

        case tag_policy::redact_field:
            if (!gedcom::trim(line.value).empty()) {
                report_.fields_redacted++;
            }
            return line.assemble(redact(line.value, redacted_field));

        case tag_policy::keep:
            break;
    }

    report_.values_kept++;
    return line.to_string();
}

auto anonymizer::anonymize_name(std::string_view name) -> std::string {
    return names_.get_or_create(name);
}

auto anonymizer::anonymize_place(std::string_view place) -> std::string {
    if (config_.keep_places) {
        return std::string(place);
    }
    return places_.get_or_create(place);
}

auto anonymizer::anonymize_date(std::string_view date) const -> std::string {
    if (config_.keep_dates) {
        return std::string(date);
    }
    return normalize_date(date);
}

auto anonymizer::get_policy(std::string_view tag, std::string_view level)
    -> tag_policy {
    return policy_for(tag, level);
}

auto anonymizer::config() const noexcept -> const anonymizer_config& {
    return config_;
}

auto anonymizer::names() const noexcept -> const identity_map& {
    return names_;
}

auto anonymizer::places() const noexcept -> const identity_map& {
    return places_;
}

auto anonymizer::report() const noexcept -> const anonymization_report& {
    return report_;
}

void anonymizer::reset() {
    names_.clear();
    places_.clear();
    report_ = anonymization_report{};
    report_.timestamp = std::chrono::system_clock::now();
}

void anonymizer::record_passthrough(std::size_t line_index,
                                    std::string_view text) {
    report_.lines_passed_through++;

    auto diagnostic = gedcom::malformed_line_diagnostic(line_index, text);
    if (diagnostic.has_value()) {
        logger_adapter::warn("{}", diagnostic.value());
        report_.warnings.push_back(std::move(diagnostic.value()));
    }
}

auto anonymizer::redact(std::string_view value, std::string_view replacement)
    -> std::string {
    if (gedcom::trim(value).empty()) {
        return {};
    }
    return std::string(replacement);
}

} // namespace gedanon::security
