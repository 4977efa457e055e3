#include "ServerConfig.hpp"
#include <cstdlib>
#include <iostream>

namespace catalog {

namespace {

// 0 lets the OS pick a free port
bool parsePort(const char* text, int& port) {
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || value < 0 || value > 65535) {
        return false;
    }
    port = static_cast<int>(value);
    return true;
}

} // namespace

ServerConfig ServerConfig::fromArgs(int argc, char* argv[]) {
    ServerConfig config;

    const char* portText = argc > 1 ? argv[1] : std::getenv("CATALOG_PORT");
    if (portText && *portText) {
        int port = 0;
        if (parsePort(portText, port)) {
            config.port = port;
        } else {
            std::cerr << "Invalid port number '" << portText << "'. Using default: "
                      << config.port << std::endl;
        }
    }

    const char* dataFile = argc > 2 ? argv[2] : std::getenv("CATALOG_DATA_FILE");
    if (dataFile && *dataFile) {
        config.dataFile = dataFile;
    }

    return config;
}

} // namespace catalog
