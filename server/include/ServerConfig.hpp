#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace catalog {

struct ServerConfig {
    int port = 8000;
    std::string dataFile = "data.json";
    std::chrono::seconds idleTimeout{30};
    size_t maxRequestBytes = 1024 * 1024;

    // catalog_server [port] [data_file]
    // CATALOG_PORT / CATALOG_DATA_FILE fill in for missing arguments
    static ServerConfig fromArgs(int argc, char* argv[]);
};

} // namespace catalog
