#include "Server.hpp"
#include "ItemManager.hpp"
#include "ServerConfig.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>
#include <string>
#include <sstream>
#include <poll.h>
#include <unistd.h>

std::atomic<bool> running(true);

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        running = false;
    }
}

void printCommands() {
    std::cout << "\nAvailable commands:" << std::endl;
    std::cout << "  help          - Show this help" << std::endl;
    std::cout << "  items         - List all stored items" << std::endl;
    std::cout << "  count         - Show the number of stored items" << std::endl;
    std::cout << "  connections   - Show open connections and unsent response bytes" << std::endl;
    std::cout << "  quit          - Stop server\n" << std::endl;
}

// waits up to 100ms so the command loop can notice a shutdown
bool inputReady() {
    if (std::cin.rdbuf()->in_avail() > 0) {
        return true;
    }
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    return poll(&pfd, 1, 100) > 0;
}

int main(int argc, char* argv[]) {
    std::cout << "Catalog Service - Server" << std::endl;

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    catalog::ServerConfig config = catalog::ServerConfig::fromArgs(argc, argv);

    catalog::Server server(config);
    if (!server.start()) {
        std::cerr << "Server failed to start" << std::endl;
        return 1;
    }

    std::cout << "Serving items from " << config.dataFile << " on port " << server.getPort() << std::endl;
    printCommands();
    std::cout << "Press Ctrl+C or type 'quit' to stop.\n" << std::endl;

    // basic command IO thread
    std::thread commandThread([&]() {
        std::string line;
        while (running && server.isRunning()) {
            if (!inputReady()) {
                continue;
            }
            if (!std::getline(std::cin, line)) {
                break;
            }

            if (line.empty()) continue;

            std::istringstream iss(line);
            std::string cmd;
            iss >> cmd;

            if (cmd == "quit" || cmd == "exit") {
                running = false;
                break;
            }
            else if (cmd == "help") {
                printCommands();
            }
            else if (cmd == "items") {
                auto items = server.getItemManager().listItems();
                std::cout << "\nStored items (" << items.size() << "):" << std::endl;
                for (const auto& item : items) {
                    std::cout << "  " << catalog::formatSummary(item) << std::endl;
                }
                std::cout << std::endl;
            }
            else if (cmd == "count") {
                std::cout << server.getItemManager().count() << " item(s) stored" << std::endl;
            }
            else if (cmd == "connections") {
                std::cout << server.getConnectionCount() << " open connection(s), "
                          << server.getPendingOutputBytes() << " byte(s) waiting to be sent" << std::endl;
            }
            else {
                std::cout << "Unknown command: " << cmd << " (type 'help' for commands)" << std::endl;
            }
        }
    });

    // wait for shutdown signal
    while (running && server.isRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\nShutting down server..." << std::endl;

    // cleanup
    if (commandThread.joinable()) {
        commandThread.join();
    }

    server.stop();
    std::cout << "Server shutdown complete." << std::endl;

    return 0;
}
