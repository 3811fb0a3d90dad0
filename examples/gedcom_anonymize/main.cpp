/**
 * @file main.cpp
 * @brief GEDCOM Anonymize - De-identification Utility
 *
 * A command-line utility that anonymizes personal information in GEDCOM
 * files while preserving the file structure, producing shareable test files
 * for reporting import problems without exposing genealogical data.
 *
 * Usage:
 *   gedcom_anonymize [options] <input> <output>
 *
 * Examples:
 *   gedcom_anonymize family.ged family_anon.ged
 *   gedcom_anonymize --keep-dates --keep-places input.ged output.ged
 */

#include "gedanon/core/result.hpp"
#include "gedanon/integration/logger_adapter.hpp"
#include "gedanon/io/gedcom_file.hpp"
#include "gedanon/security/anonymizer.hpp"
#include "gedanon/security/anonymizer_config.hpp"

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using gedanon::integration::log_level;
using gedanon::integration::logger_adapter;
using gedanon::integration::logger_config;

/**
 * @brief Command line options
 */
struct options {
    std::filesystem::path input_path;
    std::filesystem::path output_path;
    gedanon::security::anonymizer_config config;
    std::filesystem::path mapping_file;
    std::filesystem::path log_directory;
    std::optional<log_level> min_level;
    bool force{false};
    bool verbose{false};
};

/**
 * @brief Print usage information
 * @param program_name The name of the executable
 */
void print_usage(const char* program_name) {
    std::cout << "\nGEDCOM Anonymize - De-identification Utility\n\n";
    std::cout << "Usage: " << program_name << " [options] <input> <output>\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  input                   Input GEDCOM file to anonymize\n";
    std::cout << "  output                  Output path for anonymized GEDCOM file\n\n";

    std::cout << "Anonymization Options:\n";
    std::cout << "  --keep-dates            Preserve dates in the output (useful for\n"
                 "                          debugging date-related issues)\n";
    std::cout << "  --keep-places           Preserve place names in the output (useful\n"
                 "                          for debugging place-related issues)\n";
    std::cout << "  -m, --mapping-file <f>  Write the name/place mapping (JSON) to <f>\n"
                 "                          Contains original values: keep it private\n\n";

    std::cout << "Output Options:\n";
    std::cout << "  -f, --force             Overwrite output without asking\n\n";

    std::cout << "Logging Options:\n";
    std::cout << "  --log-dir <dir>         Write log and audit files to <dir>\n";
    std::cout << "  --log-level <level>     trace|debug|info|warn|error|fatal|off\n"
                 "                          (default: warn, or $GEDANON_LOG_LEVEL)\n";
    std::cout << "  -v, --verbose           Verbose output\n";
    std::cout << "  -h, --help              Show this help message\n\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " family.ged family_anon.ged\n";
    std::cout << "  " << program_name
              << " --keep-dates --keep-places input.ged output.ged\n\n";

    std::cout << "Privacy Notice:\n";
    std::cout << "  This tool provides basic anonymization for bug reporting purposes.\n";
    std::cout << "  Always review the output file before sharing to ensure no sensitive\n";
    std::cout << "  information remains.\n\n";

    std::cout << "Exit Codes:\n";
    std::cout << "  0  Success (or cancelled at the overwrite prompt)\n";
    std::cout << "  1  Invalid arguments or anonymization error\n";
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @param opts Output: parsed options
 * @return true if arguments are valid
 */
bool parse_arguments(int argc, char* argv[], options& opts) {
    if (argc < 3) {
        return false;
    }

    std::vector<std::filesystem::path> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--keep-dates") {
            opts.config.keep_dates = true;
        } else if (arg == "--keep-places") {
            opts.config.keep_places = true;
        } else if ((arg == "-m" || arg == "--mapping-file") && i + 1 < argc) {
            opts.mapping_file = argv[++i];
        } else if (arg == "-f" || arg == "--force") {
            opts.force = true;
        } else if (arg == "--log-dir" && i + 1 < argc) {
            opts.log_directory = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            auto level = logger_adapter::log_level_from_string(argv[++i]);
            if (!level) {
                std::cerr << "Error: Unknown log level '" << argv[i] << "'\n";
                return false;
            }
            opts.min_level = *level;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            return false;
        } else {
            positional.emplace_back(arg);
        }
    }

    if (positional.size() != 2) {
        std::cerr << "Error: Expected <input> and <output> paths\n";
        return false;
    }

    opts.input_path = positional[0];
    opts.output_path = positional[1];
    return true;
}

/**
 * @brief Build the logger configuration from options and environment
 */
logger_config make_logger_config(const options& opts) {
    logger_config config;
    config.enable_console = true;
    config.enable_file = !opts.log_directory.empty();
    config.enable_audit_log = !opts.log_directory.empty();
    if (!opts.log_directory.empty()) {
        config.log_directory = opts.log_directory;
    }
    config.async_mode = false;

    config.min_level = opts.verbose ? log_level::debug : log_level::warn;
    if (opts.min_level) {
        config.min_level = *opts.min_level;
    } else if (const char* env = std::getenv("GEDANON_LOG_LEVEL")) {
        if (auto level = logger_adapter::log_level_from_string(env)) {
            config.min_level = *level;
        }
    }
    return config;
}

/**
 * @brief Ask before overwriting an existing output file
 * @return true if the output may be written
 */
bool confirm_overwrite(const std::filesystem::path& output_path) {
    std::cout << "Warning: " << output_path.string()
              << " already exists. Overwrite? (y/N): " << std::flush;

    std::string response;
    if (!std::getline(std::cin, response)) {
        return false;
    }
    return response == "y" || response == "Y";
}

/**
 * @brief Save both identity maps as one JSON document
 * @return Success, or a mapping_write_error error
 */
gedanon::VoidResult save_mapping(const std::filesystem::path& path,
                                 const gedanon::security::anonymizer& anon) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return gedanon::gedanon_void_error(
            gedanon::error_codes::mapping_write_error,
            "Failed to open mapping file: " + path.string());
    }

    file << "{\n";
    file << "\"names\": " << anon.names().to_json() << ",\n";
    file << "\"places\": " << anon.places().to_json() << "\n";
    file << "}\n";

    if (!file) {
        return gedanon::gedanon_void_error(
            gedanon::error_codes::mapping_write_error,
            "Failed to write mapping file: " + path.string());
    }
    return gedanon::ok();
}

/**
 * @brief Print the detailed per-policy report
 */
void print_detailed_report(const gedanon::security::anonymization_report& report) {
    std::cout << "  Processed: " << report.lines_processed << " lines\n";
    std::cout << "    Blank:             " << report.blank_lines << "\n";
    std::cout << "    Passed through:    " << report.lines_passed_through << "\n";
    std::cout << "    Names replaced:    " << report.names_replaced << "\n";
    std::cout << "    Places replaced:   " << report.places_replaced << "\n";
    std::cout << "    Places kept:       " << report.places_kept << "\n";
    std::cout << "    Dates normalized:  " << report.dates_normalized << "\n";
    std::cout << "    Dates kept:        " << report.dates_kept << "\n";
    std::cout << "    Text redacted:     " << report.text_redacted << "\n";
    std::cout << "    Fields redacted:   " << report.fields_redacted << "\n";
    std::cout << "    Values kept:       " << report.values_kept << "\n";
}

/**
 * @brief Anonymize input into output
 * @return Process exit code
 */
int run(const options& opts) {
    using gedanon::io::gedcom_file;
    using gedanon::security::anonymizer;

    std::cout << "Reading from: " << opts.input_path.string() << "\n";

    auto source = gedcom_file::open(opts.input_path);
    if (source.is_err()) {
        std::cerr << "Error during anonymization: " << source.error().message
                  << "\n";
        logger_adapter::log_anonymization_failed(
            opts.input_path.string(), opts.output_path.string(),
            source.error().message);
        return 1;
    }

    const auto& input = source.value();
    std::cout << "Processing " << input.line_count() << " lines...\n";
    logger_adapter::debug("Configuration: {}",
                          gedanon::security::to_string(opts.config));

    anonymizer anon(opts.config);
    auto output = gedcom_file::create(anon.anonymize_document(input.lines()));

    std::cout << "Writing to: " << opts.output_path.string() << "\n";

    auto saved = output.save(opts.output_path);
    if (saved.is_err()) {
        std::cerr << "Error during anonymization: " << saved.error().message
                  << "\n";
        logger_adapter::log_anonymization_failed(
            opts.input_path.string(), opts.output_path.string(),
            saved.error().message);
        return 1;
    }

    if (!opts.mapping_file.empty()) {
        auto saved_mapping = save_mapping(opts.mapping_file, anon);
        if (saved_mapping.is_err()) {
            std::cerr << "Warning: " << saved_mapping.error().message << "\n";
            logger_adapter::warn("{}", saved_mapping.error().message);
        } else if (opts.verbose) {
            std::cout << "Saved " << anon.names().size() << " name and "
                      << anon.places().size() << " place mappings to "
                      << opts.mapping_file.string() << "\n";
        }
    }

    logger_adapter::log_anonymization_completed(
        opts.input_path.string(), opts.output_path.string(),
        output.line_count(), anon.names().size(), anon.places().size());

    std::cout << "\nAnonymization complete:\n";
    std::cout << "  - " << anon.names().size() << " unique names anonymized\n";
    std::cout << "  - " << anon.places().size() << " unique places anonymized\n";
    std::cout << "  - Output saved to: " << opts.output_path.string() << "\n";

    if (opts.verbose) {
        print_detailed_report(anon.report());
    }

    std::cout << "\nPlease review the output file before sharing!\n";
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    options opts;

    if (!parse_arguments(argc, argv, opts)) {
        print_usage(argv[0]);
        return 1;
    }

    auto input_exists = gedanon::io::path_exists(opts.input_path);
    if (input_exists.is_err()) {
        std::cerr << "Error: " << input_exists.error().message << "\n";
        return 1;
    }
    if (!input_exists.value()) {
        std::cerr << "Error: Input file not found: " << opts.input_path.string()
                  << "\n";
        return 1;
    }

    auto output_exists = gedanon::io::path_exists(opts.output_path);
    if (output_exists.is_err()) {
        std::cerr << "Error: " << output_exists.error().message << "\n";
        return 1;
    }

    if (output_exists.value() && !opts.force) {
        if (!confirm_overwrite(opts.output_path)) {
            std::cout << "Cancelled.\n";
            return 0;
        }
    }

    int rc = 1;
    try {
        logger_adapter::initialize(make_logger_config(opts));
        rc = run(opts);
    } catch (const std::exception& e) {
        std::cerr << "Error during anonymization: " << e.what() << "\n";
        rc = 1;
    }

    logger_adapter::shutdown();
    return rc;
}
