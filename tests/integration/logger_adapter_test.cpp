/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter
 */

#include <gedanon/integration/logger_adapter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

using namespace gedanon::integration;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

/**
 * @brief Create a temporary directory for test logs
 */
auto create_temp_log_directory() -> std::filesystem::path {
    auto temp_dir = std::filesystem::temp_directory_path() / "gedanon_logger_test";
    std::filesystem::create_directories(temp_dir);
    return temp_dir;
}

/**
 * @brief Clean up temporary log directory
 */
void cleanup_temp_directory(const std::filesystem::path& path) {
    if (std::filesystem::exists(path)) {
        std::filesystem::remove_all(path);
    }
}

/**
 * @brief Read file contents as string
 */
auto read_file_contents(const std::filesystem::path& path) -> std::string {
    std::ifstream file(path);
    if (!file) {
        return "";
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

/**
 * @brief RAII wrapper for logger initialization/shutdown
 */
class logger_test_fixture {
public:
    explicit logger_test_fixture(const logger_config& config) : log_dir_(config.log_directory) {
        logger_adapter::initialize(config);
    }

    ~logger_test_fixture() {
        logger_adapter::shutdown();
        cleanup_temp_directory(log_dir_);
    }

    logger_test_fixture(const logger_test_fixture&) = delete;
    logger_test_fixture& operator=(const logger_test_fixture&) = delete;

private:
    std::filesystem::path log_dir_;
};

}  // namespace

// =============================================================================
// Initialization Tests
// =============================================================================

TEST_CASE("logger_adapter initialization and shutdown", "[logger_adapter][init]") {
    auto temp_dir = create_temp_log_directory();

    SECTION("Basic initialization") {
        logger_config config;
        config.log_directory = temp_dir;
        config.enable_console = false;
        config.enable_file = true;
        config.enable_audit_log = true;

        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("Multiple initialization calls are safe") {
        logger_config config;
        config.log_directory = temp_dir;
        config.enable_console = false;

        logger_adapter::initialize(config);
        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
    }

    SECTION("Shutdown without initialization is safe") {
        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("Logging before initialization is a no-op") {
        logger_adapter::warn("Dropped: {}", 1);
        logger_adapter::flush();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    cleanup_temp_directory(temp_dir);
}

// =============================================================================
// Standard Logging Tests
// =============================================================================

TEST_CASE("logger_adapter standard logging", "[logger_adapter][logging]") {
    auto temp_dir = create_temp_log_directory();
    logger_config config;
    config.log_directory = temp_dir;
    config.enable_console = false;
    config.enable_file = true;
    config.enable_audit_log = false;
    config.async_mode = false;
    config.min_level = log_level::trace;

    logger_test_fixture fixture(config);

    SECTION("Messages at or above the minimum level reach the log file") {
        logger_adapter::set_min_level(log_level::warn);

        logger_adapter::debug("Debug message: {}", 2);
        logger_adapter::info("Info message: {}", 3);
        logger_adapter::warn("Warn message: {}", 4);
        logger_adapter::error("Error message: {}", 5);

        logger_adapter::flush();
        logger_adapter::shutdown();

        auto content = read_file_contents(temp_dir / "gedanon.log");
        CHECK(content.find("Warn message: 4") != std::string::npos);
        CHECK(content.find("Error message: 5") != std::string::npos);
        CHECK(content.find("Info message: 3") == std::string::npos);
        CHECK(content.find("Debug message: 2") == std::string::npos);
    }

    SECTION("Log level filtering") {
        logger_adapter::set_min_level(log_level::warn);
        REQUIRE(logger_adapter::get_min_level() == log_level::warn);

        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::trace));
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::debug));
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::info));
        REQUIRE(logger_adapter::is_level_enabled(log_level::warn));
        REQUIRE(logger_adapter::is_level_enabled(log_level::error));
        REQUIRE(logger_adapter::is_level_enabled(log_level::fatal));
    }
}

// =============================================================================
// Audit Logging Tests
// =============================================================================

TEST_CASE("logger_adapter anonymization audit logging", "[logger_adapter][audit]") {
    auto temp_dir = create_temp_log_directory();
    logger_config config;
    config.log_directory = temp_dir;
    config.enable_console = false;
    config.enable_file = false;
    config.enable_audit_log = true;

    logger_test_fixture fixture(config);

    SECTION("Log anonymization completed") {
        logger_adapter::log_anonymization_completed(
            "family.ged", "family_anon.ged", 1234, 56, 7);

        logger_adapter::flush();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

        auto audit_path = temp_dir / "audit.json";
        auto content = read_file_contents(audit_path);

        REQUIRE(content.find("ANONYMIZE") != std::string::npos);
        REQUIRE(content.find("success") != std::string::npos);
        REQUIRE(content.find("family_anon.ged") != std::string::npos);
        REQUIRE(content.find("\"lines\":\"1234\"") != std::string::npos);
        REQUIRE(content.find("\"unique_names\":\"56\"") != std::string::npos);
        REQUIRE(content.find("\"unique_places\":\"7\"") != std::string::npos);
    }

    SECTION("Log anonymization failed") {
        logger_adapter::log_anonymization_failed(
            "family.ged", "out/family_anon.ged", "Failed to write \"out\"");

        logger_adapter::flush();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

        auto audit_path = temp_dir / "audit.json";
        auto content = read_file_contents(audit_path);

        REQUIRE(content.find("ANONYMIZE") != std::string::npos);
        REQUIRE(content.find("failure") != std::string::npos);
        REQUIRE(content.find("Failed to write \\\"out\\\"") != std::string::npos);
    }

    SECTION("One JSON object per event") {
        logger_adapter::log_anonymization_completed("a.ged", "b.ged", 1, 0, 0);
        logger_adapter::log_anonymization_completed("c.ged", "d.ged", 2, 0, 0);

        auto content = read_file_contents(temp_dir / "audit.json");
        std::istringstream lines(content);
        std::string line;
        int count = 0;
        while (std::getline(lines, line)) {
            REQUIRE(line.front() == '{');
            REQUIRE(line.back() == '}');
            ++count;
        }
        REQUIRE(count == 2);
    }
}

TEST_CASE("logger_adapter audit disabled", "[logger_adapter][audit]") {
    auto temp_dir = create_temp_log_directory();
    logger_config config;
    config.log_directory = temp_dir;
    config.enable_console = false;
    config.enable_file = false;
    config.enable_audit_log = false;

    logger_test_fixture fixture(config);

    logger_adapter::log_anonymization_completed("a.ged", "b.ged", 1, 0, 0);
    REQUIRE_FALSE(std::filesystem::exists(temp_dir / "audit.json"));
}

// =============================================================================
// Configuration Tests
// =============================================================================

TEST_CASE("logger_adapter configuration", "[logger_adapter][config]") {
    auto temp_dir = create_temp_log_directory();

    SECTION("Get configuration after initialization") {
        logger_config config;
        config.log_directory = temp_dir;
        config.min_level = log_level::debug;
        config.enable_console = false;
        config.enable_file = true;
        config.enable_audit_log = true;
        config.max_file_size_mb = 50;
        config.max_files = 5;

        logger_test_fixture fixture(config);

        auto& retrieved_config = logger_adapter::get_config();
        REQUIRE(retrieved_config.log_directory == temp_dir);
        REQUIRE(retrieved_config.min_level == log_level::debug);
        REQUIRE(retrieved_config.enable_console == false);
        REQUIRE(retrieved_config.enable_file == true);
        REQUIRE(retrieved_config.enable_audit_log == true);
        REQUIRE(retrieved_config.max_file_size_mb == 50);
        REQUIRE(retrieved_config.max_files == 5);
    }

    SECTION("Set and get minimum log level") {
        logger_config config;
        config.log_directory = temp_dir;
        config.enable_console = false;
        config.min_level = log_level::info;

        logger_test_fixture fixture(config);

        REQUIRE(logger_adapter::get_min_level() == log_level::info);

        logger_adapter::set_min_level(log_level::error);
        REQUIRE(logger_adapter::get_min_level() == log_level::error);
    }

    cleanup_temp_directory(temp_dir);
}

// =============================================================================
// Conversion Tests
// =============================================================================

TEST_CASE("logger_adapter level conversions", "[logger_adapter][config]") {
    SECTION("Level names") {
        REQUIRE(logger_adapter::log_level_to_string(log_level::trace) == "TRACE");
        REQUIRE(logger_adapter::log_level_to_string(log_level::warn) == "WARN");
        REQUIRE(logger_adapter::log_level_to_string(log_level::off) == "OFF");
    }

    SECTION("Parsing is case-insensitive") {
        REQUIRE(logger_adapter::log_level_from_string("debug") == log_level::debug);
        REQUIRE(logger_adapter::log_level_from_string("DEBUG") == log_level::debug);
        REQUIRE(logger_adapter::log_level_from_string("Warning") == log_level::warn);
        REQUIRE(logger_adapter::log_level_from_string("off") == log_level::off);
    }

    SECTION("Unknown names are rejected") {
        REQUIRE_FALSE(logger_adapter::log_level_from_string("verbose").has_value());
        REQUIRE_FALSE(logger_adapter::log_level_from_string("").has_value());
    }
}
