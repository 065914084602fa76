/**
 * @file main.cpp
 * @brief opcuasub executable
 *
 * Starts the subscription server: a simulated open62541 node store, one
 * demonstration subscription with a loopback publisher, and the HTTP
 * diagnostics API.
 */

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <spdlog/spdlog.h>
#include "core/SubscriptionServer.h"

namespace {

constexpr const char* VERSION = "1.0.0";

struct CommandLineOptions {
    spdlog::level::level_enum logLevel = spdlog::level::info;
    bool quiet = false;
};

// Environment variables with their defaults, grouped as printed by --config
const std::vector<std::pair<std::string, std::vector<std::pair<const char*, const char*>>>> ENVIRONMENT = {
    {"Hosted server", {
        {"OPC_SERVER_PORT", "node store TCP port (4840)"},
        {"HTTP_PORT", "diagnostics HTTP port (3000)"},
        {"ALLOWED_ORIGINS", "comma-separated CORS origins (none)"}}},
    {"Subscriptions", {
        {"MIN_PUBLISHING_INTERVAL_MS", "fastest publishing interval (50)"},
        {"MAX_PUBLISHING_INTERVAL_MS", "slowest publishing interval (3600000)"},
        {"MAX_KEEPALIVE_COUNT", "keep-alive count ceiling (12000)"},
        {"MAX_LIFETIME_COUNT", "lifetime count ceiling (36000)"},
        {"MAX_SUBSCRIPTIONS_PER_SESSION", "subscriptions per engine (100)"},
        {"MAX_RETRANSMISSION_QUEUE_SIZE", "unacknowledged messages kept (10)"}}},
    {"Monitored items", {
        {"MIN_SAMPLING_INTERVAL_MS", "fastest sampling interval (50)"},
        {"MAX_SAMPLING_INTERVAL_MS", "slowest sampling interval (3600000)"},
        {"MAX_QUEUE_SIZE", "largest item queue (1000)"},
        {"MAX_MONITORED_ITEMS_PER_SUBSCRIPTION", "items per subscription (10000)"}}},
    {"Publish engine", {
        {"MAX_PUBLISH_REQUESTS_IN_QUEUE", "queued publish requests (100)"},
        {"REQUEST_TIMEOUT_CHECK_INTERVAL_MS", "housekeeping period (100)"}}},
    {"Demonstration", {
        {"PUBLISHING_INTERVAL_MS", "demo publishing interval (1000)"},
        {"SAMPLING_INTERVAL_MS", "demo sampling interval (250)"},
        {"PUBLISH_REQUEST_DEPTH", "outstanding loopback requests (3)"},
        {"SIMULATION_UPDATE_MS", "simulated value period (500)"},
        {"LOG_LEVEL", "trace, debug, info, warn, error, critical (info)"}}},
};

void printHelp(const char* program) {
    std::cout << "opcuasub " << VERSION << " - OPC UA subscription server\n\n"
              << "Usage: " << program << " [--log-level LEVEL] [--debug] [--quiet]\n"
              << "       " << program << " --config | --version | --help\n\n"
              << "  --log-level LEVEL  trace, debug, info, warn, error or critical\n"
              << "  -d, --debug        same as --log-level debug\n"
              << "  -q, --quiet        warnings and errors only, no startup line\n"
              << "  -c, --config       list the environment variables\n"
              << "  -v, --version      print the version\n"
              << "  -h, --help         print this text\n\n"
              << "Settings come from the environment; LOG_LEVEL is overridden by the flags above.\n";
}

void printEnvironment() {
    for (const auto& [group, variables] : ENVIRONMENT) {
        std::cout << group << ":\n";
        for (const auto& [name, description] : variables) {
            std::cout << "  " << std::left << std::setw(38) << name << description << "\n";
        }
        std::cout << "\n";
    }
}

std::optional<spdlog::level::level_enum> parseLevel(const std::string& text) {
    auto level = spdlog::level::from_str(text);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && text != "off") {
        return std::nullopt;
    }
    return level;
}

/**
 * @brief Parse the command line
 * @return Options to run with, or an exit code when the program should stop
 */
std::variant<CommandLineOptions, int> parseCommandLine(int argc, char* argv[]) {
    CommandLineOptions options;
    if (const char* environmentLevel = std::getenv("LOG_LEVEL")) {
        if (auto level = parseLevel(environmentLevel)) {
            options.logLevel = *level;
        }
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printHelp(argv[0]);
            return EXIT_SUCCESS;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << "opcuasub " << VERSION << "\n";
            return EXIT_SUCCESS;
        }
        if (arg == "-c" || arg == "--config") {
            printEnvironment();
            return EXIT_SUCCESS;
        }
        if (arg == "-d" || arg == "--debug") {
            options.logLevel = spdlog::level::debug;
        } else if (arg == "-q" || arg == "--quiet") {
            options.quiet = true;
            options.logLevel = spdlog::level::warn;
        } else if (arg == "--log-level" && i + 1 < argc) {
            auto level = parseLevel(argv[++i]);
            if (!level) {
                std::cerr << "Unknown log level '" << argv[i] << "'\n";
                return EXIT_FAILURE;
            }
            options.logLevel = *level;
        } else {
            std::cerr << "Invalid argument '" << arg << "', see --help\n";
            return EXIT_FAILURE;
        }
    }

    return options;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto parsed = parseCommandLine(argc, argv);
    if (const int* exitCode = std::get_if<int>(&parsed)) {
        return *exitCode;
    }
    const auto& options = std::get<CommandLineOptions>(parsed);

    spdlog::set_level(options.logLevel);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

    if (!options.quiet) {
        std::cout << "opcuasub " << VERSION << " (Ctrl+C to stop)" << std::endl;
    }

    try {
        opcuasub::SubscriptionServer server;
        if (!server.initialize()) {
            spdlog::critical("Subscription server failed to initialize, see the log above");
            std::cerr << "Initialization failed. Check the subscription limits and ports "
                         "(--config lists them)." << std::endl;
            return EXIT_FAILURE;
        }

        server.run();
        spdlog::info("Subscription server stopped");
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
