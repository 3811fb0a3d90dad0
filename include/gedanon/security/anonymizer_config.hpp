/**
 * @file anonymizer_config.hpp
 * @brief Run configuration for GEDCOM anonymization
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <string>

namespace gedanon::security {

/**
 * @brief Switches controlling which values survive anonymization
 *
 * Both switches default to false, i.e. everything is anonymized. The
 * configuration is fixed for the lifetime of an anonymizer.
 */
struct anonymizer_config {
    /// Keep DATE values byte for byte (useful for date-parsing issues)
    bool keep_dates{false};

    /// Keep PLAC values byte for byte (useful for place-parsing issues)
    bool keep_places{false};
};

/**
 * @brief Human-readable summary, e.g. "keep_dates=false, keep_places=true"
 */
[[nodiscard]] inline auto to_string(const anonymizer_config& config)
    -> std::string {
    return std::string("keep_dates=") + (config.keep_dates ? "true" : "false") +
           ", keep_places=" + (config.keep_places ? "true" : "false");
}

} // namespace gedanon::security
