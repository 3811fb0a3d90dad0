/**
 * @file logger_adapter.hpp
 * @brief Adapter for application and audit logging using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with gedanon. It supports standard leveled logging and an append-only
 * audit trail of anonymization runs.
 */

#pragma once

#include <gedanon/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gedanon::integration {

// ─────────────────────────────────────────────────────
// Types
// ─────────────────────────────────────────────────────

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Enable the audit trail file (audit.json)
    bool enable_audit_log{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{100};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{10};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Logging facade over logger_system
 *
 * Messages logged before initialize() (or after shutdown()) are dropped,
 * so library code can log unconditionally.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.enable_file = false;
 * config.enable_audit_log = false;
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Processing {} lines", lines.size());
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Initialize the logger with configuration
     *
     * Sets up console and file writers and the audit trail path.
     * Calling initialize() again while initialized has no effect.
     *
     * @param config Configuration options
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Shutdown the logger
     *
     * Flushes all pending messages and releases resources.
     */
    static void shutdown();

    /**
     * @brief Check if the logger is initialized
     */
    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(gedanon::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, gedanon::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(gedanon::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, gedanon::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(gedanon::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, gedanon::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(gedanon::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, gedanon::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(gedanon::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, gedanon::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(gedanon::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, gedanon::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     * @param level Log severity level
     * @param message The message to log
     */
    static void log(log_level level, const std::string& message);

    /**
     * @brief Check if a log level is enabled
     * @param level The level to check
     * @return true if messages at this level will be logged
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    /**
     * @brief Flush all pending log messages
     */
    static void flush();

    // ─────────────────────────────────────────────────────
    // Audit Logging
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record a completed anonymization run
     *
     * Appends one JSON line to the audit trail. Only paths and counts are
     * recorded, never original values.
     *
     * @param source Input file
     * @param destination Output file
     * @param lines Number of lines processed
     * @param unique_names Number of distinct names anonymized
     * @param unique_places Number of distinct places anonymized
     */
    static void log_anonymization_completed(const std::string& source,
                                            const std::string& destination,
                                            std::size_t lines,
                                            std::size_t unique_names,
                                            std::size_t unique_places);

    /**
     * @brief Record a failed anonymization run
     *
     * @param source Input file
     * @param destination Output file
     * @param reason Error description
     */
    static void log_anonymization_failed(const std::string& source,
                                         const std::string& destination,
                                         const std::string& reason);

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    /**
     * @brief Set the minimum log level
     * @param level New minimum log level
     */
    static void set_min_level(log_level level);

    /**
     * @brief Get the current minimum log level
     */
    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    /**
     * @brief Get the current configuration
     */
    [[nodiscard]] static auto get_config() -> const logger_config&;

    // ─────────────────────────────────────────────────────
    // Conversions
    // ─────────────────────────────────────────────────────

    /**
     * @brief Convert log level to its upper-case name
     */
    [[nodiscard]] static auto log_level_to_string(log_level level) -> std::string;

    /**
     * @brief Parse a log level name (case-insensitive)
     * @param name One of trace, debug, info, warn, error, fatal, off
     * @return The level, or nullopt for an unknown name
     */
    [[nodiscard]] static auto log_level_from_string(std::string_view name)
        -> std::optional<log_level>;

private:
    /// Audit record fields in output order
    using audit_fields = std::vector<std::pair<std::string, std::string>>;

    static void write_audit_record(std::string_view outcome,
                                   const audit_fields& fields);

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace gedanon::integration
