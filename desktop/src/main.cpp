#include "mesh_node.h"
#include "terminal_cli.h"
#include "logger.h"
#include "config_manager.h"
#include <atomic>
#include <filesystem>
#include <iostream>
#include <signal.h>
#include <string>
#include <vector>

namespace {
    std::atomic<TerminalCLI*> g_cli{nullptr};

    void handle_termination(int) {
        TerminalCLI* cli = g_cli.load();
        if (cli) cli->stop();
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config FILE    Path to configuration file (default: config.json)\n"
              << "  --name NAME      Display name of the local node\n"
              << "  --id ID          Explicit peer id (useful for testing)\n"
              << "  --log-level LVL  Log level: debug|info|warning|error|none\n"
              << "  --sim-peers N    Simulated neighbours on the loopback medium (default: 2)\n"
              << "  --daemon         Run without reading stdin\n"
              << "  --help           Show this help message\n"
              << "\nType 'help' after startup to see the interactive commands.\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    signal(SIGPIPE, SIG_IGN);

    // Quiet until the configured level is known
    set_log_level(LogLevel::NONE);

    std::string config_path = "config.json";
    std::string display_name;
    std::string custom_peer_id;
    std::string requested_log_level;
    int sim_peers = 2;
    bool daemon_mode = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 < argc) {
                config_path = argv[++i];
            } else {
                std::cerr << "Error: --config requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--name") {
            if (i + 1 < argc) {
                display_name = argv[++i];
            } else {
                std::cerr << "Error: --name requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--id") {
            if (i + 1 < argc) {
                custom_peer_id = argv[++i];
            } else {
                std::cerr << "Error: --id requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--log-level") {
            if (i + 1 < argc) {
                requested_log_level = argv[++i];
            } else {
                std::cerr << "Error: --log-level requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--sim-peers") {
            if (i + 1 < argc) {
                try {
                    sim_peers = std::stoi(argv[++i]);
                } catch (const std::exception& e) {
                    std::cerr << "Error: Invalid --sim-peers value: " << e.what() << std::endl;
                    return 1;
                }
                if (sim_peers < 0 || sim_peers > 16) {
                    std::cerr << "Error: --sim-peers must be between 0 and 16" << std::endl;
                    return 1;
                }
            } else {
                std::cerr << "Error: --sim-peers requires an argument" << std::endl;
                return 1;
            }
        } else if (arg == "--daemon") {
            daemon_mode = true;
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Load configuration, also looking next to the build directory
    std::vector<std::string> candidates;
    candidates.push_back(config_path);
    candidates.push_back("../config.json");
    candidates.push_back("../../config.json");
    try {
        std::filesystem::path exe_dir = std::filesystem::absolute(argv[0]).parent_path();
        candidates.push_back((exe_dir / "config.json").string());
        candidates.push_back((exe_dir / "../config.json").lexically_normal().string());
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Warning: cannot resolve executable directory: " << e.what() << std::endl;
    }

    std::string chosen_config;
    for (const auto& c : candidates) {
        if (ConfigManager::getInstance().loadConfig(c)) {
            chosen_config = c;
            break;
        }
    }
    if (chosen_config.empty()) {
        std::cerr << "Warning: no configuration file found, using defaults" << std::endl;
    }

    ConfigManager& config = ConfigManager::getInstance();
    set_log_level(log_level_from_string(requested_log_level.empty() ? config.getLogLevel() : requested_log_level));
    if (!config.isConsoleOutput()) {
        setLogCallback([](const std::string&) {});
    }
    if (config.isAsyncLogging()) {
        enable_async_logging();
    }
    if (display_name.empty()) {
        display_name = config.getDisplayName();
    }

    MeshNode node;
    std::string error;
    if (!node.start(custom_peer_id, display_name, sim_peers, &error)) {
        std::cerr << "Error: Failed to start node: " << (error.empty() ? "unknown error" : error) << std::endl;
        return 1;
    }

    TerminalCLI cli(node, std::cout, daemon_mode);
    g_cli = &cli;
    signal(SIGINT, handle_termination);
    signal(SIGTERM, handle_termination);

    cli.run();

    g_cli = nullptr;
    node.stop();
    disable_async_logging();
    return 0;
}
