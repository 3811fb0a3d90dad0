/**
 * @file tag_policy.cpp
 * @brief Tag → policy table for GEDCOM anonymization
 *
 * @copyright Copyright (c) 2025
 */

#include "gedanon/security/tag_policy.hpp"

#include <initializer_list>

namespace gedanon::security {

namespace {

auto build_policy_table() -> std::map<std::string, tag_policy, std::less<>> {
    std::map<std::string, tag_policy, std::less<>> table;

    auto assign = [&table](std::initializer_list<const char*> tags,
                           tag_policy policy) {
        for (const auto* tag : tags) {
            table[tag] = policy;
        }
    };

    // Identities
    assign({"NAME"}, tag_policy::name_identity);
    assign({"PLAC"}, tag_policy::place_identity);
    assign({"DATE"}, tag_policy::normalize_date);

    // Free text
    assign({"NOTE", "TEXT", "CONT", "CONC"}, tag_policy::redact_text);

    // Name parts
    assign({"GIVN", "SURN", "NPFX", "NSFX", "NICK"}, tag_policy::redact_field);

    // Address components
    assign({"ADDR", "ADR1", "ADR2", "CITY", "STAE", "POST", "CTRY"},
           tag_policy::redact_field);

    // Contact information
    assign({"PHON", "EMAIL", "WWW", "FAX"}, tag_policy::redact_field);

    return table;
}

} // namespace

auto policy_table() -> const std::map<std::string, tag_policy, std::less<>>& {
    static const auto table = build_policy_table();
    return table;
}

auto policy_for(std::string_view tag, std::string_view level) -> tag_policy {
    if (tag == "TITL") {
        return level == "1" ? tag_policy::redact_field : tag_policy::keep;
    }

    const auto& table = policy_table();
    auto it = table.find(tag);
    if (it != table.end()) {
        return it->second;
    }
    return tag_policy::keep;
}

} // namespace gedanon::security
