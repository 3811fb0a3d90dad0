/**
 * @file identity_map.cpp
 * @brief Implementation of placeholder mapping for anonymization
 *
 * @copyright Copyright (c) 2025
 */

#include "gedanon/security/identity_map.hpp"

#include <gedanon/core/json_text.hpp>

#include <sstream>

namespace gedanon::security {

identity_map::identity_map(std::string kind)
    : kind_{std::move(kind)} {}

auto identity_map::get_or_create(std::string_view original) -> std::string {
    auto it = by_original_.find(original);
    if (it != by_original_.end()) {
        return entries_[it->second].placeholder;
    }

    auto placeholder = make_placeholder(next_number_++);
    const auto index = entries_.size();
    entries_.push_back({std::string(original), placeholder});
    by_original_.emplace(entries_.back().original, index);
    by_placeholder_.emplace(placeholder, index);

    return placeholder;
}

auto identity_map::get_placeholder(std::string_view original) const
    -> std::optional<std::string> {
    auto it = by_original_.find(original);
    if (it != by_original_.end()) {
        return entries_[it->second].placeholder;
    }
    return std::nullopt;
}

auto identity_map::get_original(std::string_view placeholder) const
    -> std::optional<std::string> {
    auto it = by_placeholder_.find(placeholder);
    if (it != by_placeholder_.end()) {
        return entries_[it->second].original;
    }
    return std::nullopt;
}

auto identity_map::has_mapping(std::string_view original) const -> bool {
    return by_original_.contains(original);
}

auto identity_map::size() const noexcept -> std::size_t {
    return entries_.size();
}

auto identity_map::empty() const noexcept -> bool {
    return entries_.empty();
}

auto identity_map::kind() const noexcept -> const std::string& {
    return kind_;
}

auto identity_map::entries() const noexcept -> const std::vector<entry>& {
    return entries_;
}

void identity_map::clear() {
    entries_.clear();
    by_original_.clear();
    by_placeholder_.clear();
    next_number_ = 1;
}

auto identity_map::to_json() const -> std::string {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"kind\": \"" << json_escape(kind_) << "\",\n";
    oss << "  \"mappings\": [";

    bool first = true;
    for (const auto& [original, placeholder] : entries_) {
        oss << (first ? "\n" : ",\n");
        oss << "    {\"original\": \"" << json_escape(original)
            << "\", \"placeholder\": \"" << json_escape(placeholder) << "\"}";
        first = false;
    }

    oss << (entries_.empty() ? "]\n" : "\n  ]\n");
    oss << "}";

    return oss.str();
}

auto identity_map::make_placeholder(std::uint64_t number) const -> std::string {
    return kind_ + " " + std::to_string(number);
}

} // namespace gedanon::security
