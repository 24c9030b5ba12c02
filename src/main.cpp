/// @file main.cpp
/// @brief relay_host entry point - loads settings and runs the plugin kernel
///
/// Startup sequence:
/// - settings.toml is parsed (defaults on failure)
/// - logging is configured from its [logging] section
/// - the LifecycleController discovers, plans, instantiates and runs plugins
///   until SIGINT/SIGTERM, then shuts down within the configured deadlines

#include <relay/core/log.hpp>
#include <relay/kernel/lifecycle.hpp>
#include <relay/plugin/settings.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace fs = std::filesystem;

namespace {

constexpr const char* k_default_settings_path = "config/settings.toml";

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] [SETTINGS]\n"
              << "\n"
              << "Arguments:\n"
              << "  SETTINGS        Path to settings.toml (default: " << k_default_settings_path << ")\n"
              << "\n"
              << "Options:\n"
              << "  --help, -h      Show this help message\n"
              << "  --version, -v   Show version information\n"
              << "\n"
              << "Signals:\n"
              << "  SIGINT/SIGTERM  Graceful shutdown; a second signal aborts\n";
}

void print_version() {
    std::cout << "relay_host 0.1.0\n"
              << "relay plugin kernel\n";
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    fs::path settings_path = k_default_settings_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return relay_kernel::exit_code::Success;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return relay_kernel::exit_code::Success;
        } else if (arg[0] != '-') {
            settings_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return relay_kernel::exit_code::Failure;
        }
    }

    relay_plugin::AppSettings settings;
    std::string settings_error;

    if (fs::exists(settings_path)) {
        auto loaded = relay_plugin::AppSettings::load(settings_path);
        if (loaded) {
            settings = std::move(loaded).value();
        } else {
            settings_error = loaded.error().message();
        }
    }

    relay_core::configure_logging(settings.logging);
    auto logger = relay_core::host_logger();

    if (!settings_error.empty()) {
        logger->error("{}; continuing with default settings", settings_error);
    } else if (settings.source_path.empty()) {
        logger->warn("Settings file {} not found; using defaults", settings_path.string());
    } else {
        logger->info("Loaded settings from {}", settings.source_path.string());
    }

    int status = relay_kernel::exit_code::Failure;
    bool detached_work = false;
    {
        relay_kernel::LifecycleController controller(
            std::make_shared<relay_plugin::AppSettings>(std::move(settings)));
        status = controller.run();
        detached_work = controller.has_detached_work();
    }

    logger->info("Exiting with status {}", status);
    relay_core::flush_all_loggers();

    // Abandoned threads still use the loggers and registries
    if (detached_work) {
        logger->warn("Threads still running after shutdown; exiting immediately");
        relay_core::flush_all_loggers();
        std::_Exit(status);
    }

    relay_core::shutdown_logging();
    return status;
}
