#pragma once

#include "ServerConfig.hpp"
#include <memory>
#include <thread>
#include <atomic>
#include <cstddef>

namespace catalog {

class ServerImpl;
class ItemManager;

class Server {
public:
    // items are kept in config.dataFile
    explicit Server(const ServerConfig& config);
    Server(const ServerConfig& config, std::shared_ptr<ItemManager> itemManager);
    ~Server();

    // binds and listens, then serves requests on a background thread
    bool start();
    void stop();
    bool isRunning() const;

    // the bound port; differs from the configured one when that was 0
    int getPort() const { return port_; }

    // console/admin api
    ItemManager& getItemManager();
    size_t getConnectionCount() const;
    // response bytes queued but not yet accepted by client sockets
    size_t getPendingOutputBytes() const;

private:
    ServerConfig config_;
    int port_;
    std::atomic<bool> running_;
    std::unique_ptr<ServerImpl> impl_;
    std::thread serverThread_;

    void run();
};

} // namespace catalog
