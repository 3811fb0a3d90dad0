/**
 * @file logger_adapter.cpp
 * @brief Implementation of the logging adapter
 */

#include <gedanon/integration/logger_adapter.hpp>

#include <gedanon/core/json_text.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <fstream>
#include <mutex>

namespace gedanon::integration {

namespace {

constexpr const char* log_file_name = "gedanon.log";
constexpr const char* audit_file_name = "audit.json";
constexpr const char* audit_event = "ANONYMIZE";

[[nodiscard]] auto to_logger_level(log_level level) -> kcenon::logger::log_level {
    switch (level) {
        case log_level::trace:
            return kcenon::logger::log_level::trace;
        case log_level::debug:
            return kcenon::logger::log_level::debug;
        case log_level::info:
            return kcenon::logger::log_level::info;
        case log_level::warn:
            return kcenon::logger::log_level::warn;
        case log_level::error:
            return kcenon::logger::log_level::error;
        case log_level::fatal:
            return kcenon::logger::log_level::fatal;
        case log_level::off:
            break;
    }
    return kcenon::logger::log_level::off;
}

[[nodiscard]] auto build_logger(const logger_config& config)
    -> std::unique_ptr<kcenon::logger::logger> {
    auto logger = std::make_unique<kcenon::logger::logger>(
        config.async_mode, config.buffer_size);
    logger->set_min_level(to_logger_level(config.min_level));

    if (config.enable_console) {
        logger->add_writer(std::make_unique<kcenon::logger::console_writer>());
    }

    if (config.enable_file) {
        const auto path = config.log_directory / log_file_name;
        logger->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
            path.string(), config.max_file_size_mb * 1024 * 1024,
            config.max_files));
    }

    return logger;
}

/**
 * @brief Append-only file of JSON records, one per line
 */
class audit_trail {
public:
    void open(std::filesystem::path path) {
        std::lock_guard lock(mutex_);
        path_ = std::move(path);
    }

    void close() {
        std::lock_guard lock(mutex_);
        path_.clear();
    }

    [[nodiscard]] auto is_open() const -> bool {
        std::lock_guard lock(mutex_);
        return !path_.empty();
    }

    [[nodiscard]] auto path() const -> std::filesystem::path {
        std::lock_guard lock(mutex_);
        return path_;
    }

    /// @return false if the record could not be written
    auto append(const std::string& record) -> bool {
        std::lock_guard lock(mutex_);
        if (path_.empty()) {
            return true;
        }

        std::ofstream file(path_, std::ios::app);
        if (!file) {
            return false;
        }
        file << record << '\n';
        file.flush();
        return static_cast<bool>(file);
    }

private:
    mutable std::mutex mutex_;
    std::filesystem::path path_;
};

}  // namespace

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    impl() = default;
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);
        if (initialized_) {
            return;
        }

        if (config.enable_file || config.enable_audit_log) {
            std::filesystem::create_directories(config.log_directory);
        }

        config_ = config;
        min_level_.store(config.min_level);
        logger_ = build_logger(config);
        logger_->start();

        if (config.enable_audit_log) {
            audit_.open(config.log_directory / audit_file_name);
        }

        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);
        if (!initialized_) {
            return;
        }

        audit_.close();
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool {
        return initialized_.load();
    }

    void log(log_level level, const std::string& message) {
        if (!initialized_ || !logger_ || !is_level_enabled(level)) {
            return;
        }
        logger_->log(to_logger_level(level), message);
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return level != log_level::off &&
               static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void flush() {
        if (logger_) {
            logger_->flush();
        }
    }

    void set_min_level(log_level level) {
        min_level_.store(level);
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
    }

    [[nodiscard]] auto get_min_level() const noexcept -> log_level {
        return min_level_.load();
    }

    [[nodiscard]] auto get_config() const -> const logger_config& { return config_; }

    void write_audit_record(std::string_view outcome, const audit_fields& fields) {
        if (!initialized_ || !audit_.is_open()) {
            return;
        }

        std::string record = "{";
        record += "\"timestamp\":" + json_quote(iso8601_utc(std::chrono::system_clock::now()));
        record += ",\"module\":\"gedanon\"";
        record += ",\"event_type\":" + json_quote(audit_event);
        record += ",\"outcome\":" + json_quote(outcome);
        for (const auto& [key, value] : fields) {
            record += "," + json_quote(key) + ":" + json_quote(value);
        }
        record += "}";

        if (!audit_.append(record)) {
            log(log_level::warn, "Cannot write audit log: " + audit_.path().string());
        }
    }

private:
    std::mutex mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> logger_;
    audit_trail audit_;
};

// =============================================================================
// Static Member Initialization
// =============================================================================

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Initialization
// =============================================================================

void logger_adapter::initialize(const logger_config& config) {
    pimpl_->initialize(config);
}

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool {
    return pimpl_->is_initialized();
}

// =============================================================================
// Standard Logging
// =============================================================================

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

// =============================================================================
// Audit Logging
// =============================================================================

void logger_adapter::log_anonymization_completed(const std::string& source,
                                                 const std::string& destination,
                                                 std::size_t lines,
                                                 std::size_t unique_names,
                                                 std::size_t unique_places) {
    info("Anonymized {} -> {}: {} lines, {} names, {} places",
         source, destination, lines, unique_names, unique_places);

    write_audit_record("success",
                       {{"source", source},
                        {"destination", destination},
                        {"lines", std::to_string(lines)},
                        {"unique_names", std::to_string(unique_names)},
                        {"unique_places", std::to_string(unique_places)}});
}

void logger_adapter::log_anonymization_failed(const std::string& source,
                                              const std::string& destination,
                                              const std::string& reason) {
    error("Anonymization of {} failed: {}", source, reason);

    write_audit_record("failure",
                       {{"source", source},
                        {"destination", destination},
                        {"reason", reason}});
}

// =============================================================================
// Configuration
// =============================================================================

void logger_adapter::set_min_level(log_level level) {
    pimpl_->set_min_level(level);
}

auto logger_adapter::get_min_level() noexcept -> log_level {
    return pimpl_->get_min_level();
}

auto logger_adapter::get_config() -> const logger_config& {
    return pimpl_->get_config();
}

// =============================================================================
// Conversions
// =============================================================================

auto logger_adapter::log_level_to_string(log_level level) -> std::string {
    switch (level) {
        case log_level::trace:
            return "TRACE";
        case log_level::debug:
            return "DEBUG";
        case log_level::info:
            return "INFO";
        case log_level::warn:
            return "WARN";
        case log_level::error:
            return "ERROR";
        case log_level::fatal:
            return "FATAL";
        case log_level::off:
            break;
    }
    return "OFF";
}

auto logger_adapter::log_level_from_string(std::string_view name)
    -> std::optional<log_level> {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return log_level::trace;
    if (lower == "debug") return log_level::debug;
    if (lower == "info") return log_level::info;
    if (lower == "warn" || lower == "warning") return log_level::warn;
    if (lower == "error") return log_level::error;
    if (lower == "fatal") return log_level::fatal;
    if (lower == "off") return log_level::off;
    return std::nullopt;
}

// =============================================================================
// Private Helpers
// =============================================================================

void logger_adapter::write_audit_record(std::string_view outcome,
                                        const audit_fields& fields) {
    pimpl_->write_audit_record(outcome, fields);
}

}  // namespace gedanon::integration
