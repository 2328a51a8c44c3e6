// NearbyConnect Server - Main Entry Point
// [SERVER_AGENT] Server initialization with Redis/ScyllaDB integration

#include "service/NearbyServer.hpp"
#include "Constants.hpp"
#include <iostream>
#include <cstdlib>
#include <string>

using namespace NearbyConnect;

void printUsage(const char* programName) {
    std::cout << "NearbyConnect Server v" << Constants::VERSION << "\n"
              << "Usage: " << programName << " [options]\n"
              << "\nOptions:\n"
              << "  --redis-host <host>          Redis host (default: localhost)\n"
              << "  --redis-port <num>           Redis port (default: 6379)\n"
              << "  --scylla-host <host>         ScyllaDB host (default: localhost)\n"
              << "  --scylla-port <num>          ScyllaDB port (default: 9042)\n"
              << "  --outbox-capacity <num>      Queued events per connection (default: 256)\n"
              << "  --presence-window-min <num>  Activity window in minutes (default: 30)\n"
              << "  --retention-hours <num>      Keep locations of inactive users (default: 24)\n"
              << "  --help, -h                   Show this help\n";
}

int main(int argc, char* argv[]) {
    try {
        ServerConfig config;

        // Parse command line arguments
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--redis-host" && i + 1 < argc) {
                config.redisHost = argv[++i];
            } else if (arg == "--redis-port" && i + 1 < argc) {
                config.redisPort = static_cast<uint16_t>(std::atoi(argv[++i]));
            } else if (arg == "--scylla-host" && i + 1 < argc) {
                config.scyllaHost = argv[++i];
            } else if (arg == "--scylla-port" && i + 1 < argc) {
                config.scyllaPort = static_cast<uint16_t>(std::atoi(argv[++i]));
            } else if (arg == "--outbox-capacity" && i + 1 < argc) {
                config.outboxCapacity = static_cast<size_t>(std::atoi(argv[++i]));
            } else if (arg == "--presence-window-min" && i + 1 < argc) {
                config.presenceWindow = std::chrono::minutes(std::atoi(argv[++i]));
            } else if (arg == "--retention-hours" && i + 1 < argc) {
                config.locationRetention = std::chrono::hours(std::atoi(argv[++i]));
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }

        if (config.outboxCapacity == 0 || config.presenceWindow.count() <= 0 ||
            config.locationRetention.count() <= 0) {
            std::cerr << "Capacity, window and retention must be positive\n";
            return 1;
        }

        std::cout << R"(
    _   __                __
   / | / /__  ____ ______/ /_  __  __
  /  |/ / _ \/ __ `/ ___/ __ \/ / / /
 / /|  /  __/ /_/ / /  / /_/ / /_/ /
/_/ |_/\___/\__,_/_/  /_.___/\__, /
                            /____/
)" << "\n";

        std::cout << "Version: " << Constants::VERSION << "\n";
        std::cout << "Redis: " << config.redisHost << ":" << config.redisPort << "\n";
        std::cout << "ScyllaDB: " << config.scyllaHost << ":" << config.scyllaPort << "\n";
        std::cout << "Outbox capacity: " << config.outboxCapacity << " events\n";
        std::cout << "Presence window: " << config.presenceWindow.count() << " min\n";
        std::cout << "Location retention: " << config.locationRetention.count() << " h\n";
        std::cout << "\nInitializing server...\n\n";

        NearbyServer server;

        if (!server.initialize(config)) {
            std::cerr << "\nFailed to initialize server. Check logs for details.\n";
            return 1;
        }

        std::cout << "\n========================================\n";
        std::cout << "Server is running!\n";
        std::cout << "Press Ctrl+C to stop\n";
        std::cout << "========================================\n\n";

        // Run main loop (blocks until shutdown)
        server.run();

        std::cout << "\nServer shutdown complete.\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\nFatal error: " << e.what() << "\n";
        return 1;
    }
}
