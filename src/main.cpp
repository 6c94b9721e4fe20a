/**
 * @file main.cpp
 * @brief kickqr command-line entry point
 *
 * Loads configuration (YAML file + command-line overrides), builds the
 * typed generator configuration and runs the soccer-ball QR pipeline once.
 */

#include "kickqr/core/config.hpp"
#include "kickqr/core/generator_config.hpp"
#include "kickqr/core/logger.hpp"
#include "kickqr/pipeline/qr_generator.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace {

constexpr const char* kDefaultConfigPath = "config/default.yaml";

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n\n"
              << "Soccer-ball QR code generator.\n\n"
              << "Options:\n"
              << "  --url <string>          URL for the QR code to point to\n"
              << "  --logo_path <path>      File path for the logo image\n"
              << "  --output_path <path>    File path to save the final QR code\n"
              << "  --validate              Read the saved QR code back and compare (needs ZBar)\n"
              << "  --config <path>         Configuration file (default: " << kDefaultConfigPath << ")\n"
              << "  --log_file <path>       Also write logs to a rotating file\n"
              << "  --help                  Show this help message\n"
              << "  --version               Show version information\n"
              << "\n"
              << "Any configuration key can also be overridden:\n"
              << "  --qr.module_pixel_size=40\n"
              << "  --emblem.relative_size=0.2\n"
              << "  --colors.accent=200,16,46\n"
              << std::endl;
}

void print_version() {
    std::cout << "kickqr v1.0.0\n"
              << "Build type: "
#ifdef NDEBUG
              << "Release"
#else
              << "Debug"
#endif
              << "\n"
              << "Validation backend: "
#ifdef HAS_ZBAR
              << "ZBar"
#else
              << "none"
#endif
              << std::endl;
}

}  // namespace

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    using namespace kickqr;

    // Parse command line for --help and --version first
    std::string config_path;
    std::string log_file;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        }
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--log_file" && i + 1 < argc) {
            log_file = argv[++i];
        }
    }

    // Initialize logging
    if (!Logger::init(log_file, LogLevel::INFO, LogLevel::DEBUG)) {
        std::cerr << "Failed to initialize logging" << std::endl;
        return 1;
    }

    LOG_INFO("Starting soccer ball QR code generator...");

    // Load configuration; the default file is optional, an explicit one is not
    Config config;
    if (!config_path.empty()) {
        if (!config.load(config_path)) {
            LOG_ERROR("Failed to load configuration from: {}", config_path);
            Logger::shutdown();
            return 1;
        }
    } else if (std::filesystem::exists(kDefaultConfigPath)) {
        if (!config.load(kDefaultConfigPath)) {
            LOG_ERROR("Failed to load configuration from: {}", kDefaultConfigPath);
            Logger::shutdown();
            return 1;
        }
    } else {
        LOG_INFO("No configuration file, using built-in defaults");
    }

    // Apply command-line overrides
    config.parse_args(argc, argv);

    auto generator_config = GeneratorConfig::from_config(config);
    if (!generator_config) {
        LOG_ERROR("Invalid configuration: {}", generator_config.error().describe());
        Logger::shutdown();
        return 1;
    }

    // One diagnostic sink per pipeline run
    auto run_log = Logger::create_run_sink("generator");
    auto generator = create_generator(generator_config.value(), run_log);

    auto report = generator->generate();
    if (report) {
        const auto& r = report.value();
        run_log->info("===== Generation Successful =====");
        run_log->info("Version {} ({} modules), QR {}x{}, final {}x{}, coverage {:.1f}%",
                      r.version, r.module_count, r.qr_size.width, r.qr_size.height,
                      r.final_size.width, r.final_size.height, r.coverage.coverage_percent);
        if (r.validation != ValidationOutcome::SKIPPED) {
            run_log->info("Validation: {} ({})", to_string(r.validation), r.validation_message);
        }
    } else {
        run_log->error("===== Generation Failed =====");
        run_log->error("{}", report.error().describe());
        run_log->error("QR code generation failed. Please check the log for details.");
    }

    Logger::flush();
    Logger::shutdown();
    return 0;
}
