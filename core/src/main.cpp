// ccproxy
// Supervised worker bridge with an HTTP front door

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    std::string config_path = "ccproxy.yaml";  // Default

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: ccproxy [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: ccproxy.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(config_path)) {
        // Using cerr here as logger might not be initialized/configured
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    // Before any worker is spawned: writes to a dead worker must not raise SIGPIPE
    ccproxy::runtime::SignalHandler::install();

    LOG_INFO("ccproxy starting...");
    LOG_INFO("Loading config: " << config_path);

    ccproxy::runtime::RuntimeConfig config;
    std::string error;

    if (!ccproxy::runtime::load_config(config_path, config, error)) {
        LOG_ERROR("Failed to load config: " << error);
        return 1;
    }

    ccproxy::logging::Logger::set_level(ccproxy::logging::string_to_level(config.logging.level));

    ccproxy::runtime::Runtime runtime(config);

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    LOG_INFO("Runtime Ready");
    LOG_INFO("  Worker: " << config.worker.id << " (" << config.worker.command << ")");
    LOG_INFO("  Request timeout: " << config.bridge.request_timeout_ms << "ms");
    LOG_INFO("  Log level: " << ccproxy::logging::level_to_string(ccproxy::logging::Logger::level()));

    runtime.run();
    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
