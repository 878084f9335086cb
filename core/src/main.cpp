// Pastebin Server
// Config-based service with CLI argument parsing

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv)
{
    // Parse CLI arguments
    std::string config_path = "pastebin.yaml"; // Default

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg.substr(0, 9) == "--config=")
        {
            config_path = arg.substr(9);
        }
        else if (arg == "--help" || arg == "-h")
        {
            std::cerr << "Usage: pastebin-server [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: pastebin.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n\n";
            std::cerr << "Environment:\n";
            std::cerr << "  PORT             Overrides http.port\n";
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(config_path))
    {
        // Using cerr here as logger might not be initialized/configured
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("Pastebin server starting...");
    LOG_INFO("Loading config: " + config_path);

    pastebin::runtime::ServiceConfig config;
    std::string error;

    if (!pastebin::runtime::load_config(config_path, config, error))
    {
        LOG_ERROR("Failed to load config: " + error);
        return 1;
    }

    pastebin::logging::Logger::set_level(pastebin::logging::string_to_level(config.logging.level));
    LOG_INFO("Log level: " << pastebin::logging::level_to_string(pastebin::logging::Logger::level()));

    pastebin::runtime::Runtime runtime(config);

    if (!runtime.initialize(error))
    {
        LOG_ERROR("Initialization failed: " + error);
        return 1;
    }

    // Install signal handler for graceful shutdown
    pastebin::runtime::SignalHandler::install();

    LOG_INFO("Pastebin service running on port " << config.http.port);

    // Run main loop (blocking)
    runtime.run();

    LOG_INFO("Shutdown complete");
    return 0;
}
