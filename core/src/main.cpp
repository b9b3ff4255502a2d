// helm runtime
// Mode-aware robot runtime with CLI argument parsing

#include <iostream>
#include <string>
#include <filesystem>
#include "runtime/runtime.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"
#include "logging/logger.hpp"

int main(int argc, char **argv)
{
    // Parse CLI arguments
    std::string config_path = "helm-runtime.yaml"; // Default
    std::string cli_log_level;
    bool log_to_file = false;

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
        else if (arg.substr(0, 12) == "--log-level=")
        {
            cli_log_level = arg.substr(12);
            if (!helm::logging::is_valid_level(cli_log_level))
            {
                std::cerr << "Invalid log level: " << cli_log_level << " (use debug, info, warn or error)\n";
                return 1;
            }
        }
        else if (arg == "--log-to-file")
        {
            log_to_file = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            std::cerr << "Usage: helm-runtime [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH       Path to config file (default: helm-runtime.yaml)\n";
            std::cerr << "  --log-level=LEVEL   Override logging.level (debug, info, warn, error)\n";
            std::cerr << "  --log-to-file       Also write logs to logs/<config name>.log\n";
            std::cerr << "  --help, -h          Show this help\n";
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    // Check if config exists
    if (!std::filesystem::exists(config_path))
    {
        // Using cerr here as logger might not be initialized/configured
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    if (!cli_log_level.empty())
    {
        helm::logging::Logger::set_level(helm::logging::string_to_level(cli_log_level));
    }

    LOG_INFO("helm runtime starting...");
    LOG_INFO("Loading config: " + config_path);

    // Load configuration
    helm::runtime::RuntimeConfig config;
    std::string error;

    if (!helm::runtime::load_config(config_path, config, error))
    {
        LOG_ERROR("Failed to load config: " + error);
        return 1;
    }

    // Initialize logger level and file output
    helm::logging::Logger::set_level(
        helm::logging::string_to_level(cli_log_level.empty() ? config.logging.level : cli_log_level));

    std::string log_file = config.logging.file;
    if (log_to_file)
    {
        std::error_code ec;
        std::filesystem::create_directories("logs", ec);
        log_file = "logs/" + config.modes.config_name + ".log";
    }
    if (!log_file.empty() && !helm::logging::Logger::set_file(log_file))
    {
        LOG_WARN("Cannot open log file " << log_file << ", logging to stderr only");
    }

    // Create and initialize runtime
    helm::runtime::Runtime runtime(config);

    if (!runtime.initialize(error))
    {
        LOG_ERROR("Runtime initialization failed: " + error);
        return 1;
    }

    // Install signal handler for graceful shutdown
    helm::runtime::SignalHandler::install();

    LOG_INFO("Runtime Ready");
    LOG_INFO("  Modes: " << config.modes.modes.size());
    LOG_INFO("  Current mode: " << runtime.get_cortex().mode_manager().current_mode_name());

    // Run main loop (blocking)
    bool ok = runtime.run(error);
    runtime.shutdown();

    if (!ok)
    {
        LOG_ERROR("Runtime stopped on error: " + error);
        helm::logging::Logger::close_file();
        return 1;
    }

    LOG_INFO("Shutdown complete");
    helm::logging::Logger::close_file();
    return 0;
}
