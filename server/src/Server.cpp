#include "Server.hpp"
#include "HttpConnection.hpp"
#include "HttpMessage.hpp"
#include "ItemManager.hpp"
#include "ItemRoutes.hpp"
#include "JsonFileItemStore.hpp"
#include <iostream>
#include <cerrno>
#include <cstring>
#include <vector>
#include <map>
#include <mutex>
#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>
#include <fcntl.h>
#include <arpa/inet.h>

namespace catalog
{

    class ServerImpl
    {
    public:
        int serverSocket = -1;
        std::map<int, std::unique_ptr<HttpConnection>> connections; // socket -> connection
        mutable std::mutex connectionsMutex;
        std::shared_ptr<ItemManager> itemManager;
        std::unique_ptr<ItemRoutes> routes;
        size_t maxRequestBytes;
        std::chrono::seconds idleTimeout;

        ServerImpl(std::shared_ptr<ItemManager> manager, const ServerConfig &config)
            : itemManager(std::move(manager)),
              maxRequestBytes(config.maxRequestBytes),
              idleTimeout(config.idleTimeout)
        {
            routes = std::make_unique<ItemRoutes>(*itemManager);
        }

        bool openListener(int port, int &boundPort);
        bool acceptClient();
        void handleClient(int clientSocket);
        bool receiveData(HttpConnection &connection, bool &peerClosed);
        void processRequests(HttpConnection &connection);
        bool flushOutbound(HttpConnection &connection);
        bool outputBackedUp(HttpConnection &connection) const;
        void rejectRequest(HttpConnection &connection, HttpStatus status, const char *detail);
        void disconnectClient(int clientSocket);
        void disconnectClientNoLock(int clientSocket);
        void closeAll();
    };

    Server::Server(const ServerConfig &config)
        : Server(config, std::make_shared<ItemManager>(std::make_shared<JsonFileItemStore>(config.dataFile)))
    {
    }

    Server::Server(const ServerConfig &config, std::shared_ptr<ItemManager> itemManager)
        : config_(config), port_(config.port), running_(false)
    {
        impl_ = std::make_unique<ServerImpl>(std::move(itemManager), config);
    }

    Server::~Server()
    {
        stop();
    }

    bool Server::start()
    {
        if (running_)
        {
            return true;
        }

        if (!impl_->openListener(config_.port, port_))
        {
            return false;
        }

        running_ = true;
        serverThread_ = std::thread(&Server::run, this);
        std::cout << "Server listening on port " << port_ << std::endl;
        return true;
    }

    void Server::stop()
    {
        if (!running_)
        {
            return;
        }

        running_ = false;

        if (serverThread_.joinable())
        {
            serverThread_.join();
        }

        impl_->closeAll();

        std::cout << "Server stopped" << std::endl;
    }

    bool Server::isRunning() const
    {
        return running_;
    }

    ItemManager &Server::getItemManager()
    {
        return *impl_->itemManager;
    }

    size_t Server::getConnectionCount() const
    {
        std::lock_guard<std::mutex> lock(impl_->connectionsMutex);
        return impl_->connections.size();
    }

    size_t Server::getPendingOutputBytes() const
    {
        std::lock_guard<std::mutex> lock(impl_->connectionsMutex);
        size_t total = 0;
        for (const auto &[socket, connection] : impl_->connections)
        {
            total += connection->getPendingOutput();
        }
        return total;
    }

    void Server::run()
    {
        while (running_)
        {
            // accept new connections
            while (impl_->acceptClient())
            {
            }

            // handle existing connections
            std::vector<int> socketsToHandle;

            {
                std::lock_guard<std::mutex> lock(impl_->connectionsMutex);
                for (auto &[socket, connection] : impl_->connections)
                {
                    socketsToHandle.push_back(socket);
                }
            }

            // handle connections outside the lock
            for (int socket : socketsToHandle)
            {
                impl_->handleClient(socket);
            }
            // avoid busy waiting
            usleep(10000); // 10ms
        }
    }

    bool ServerImpl::openListener(int port, int &boundPort)
    {
        serverSocket = socket(AF_INET, SOCK_STREAM, 0);
        if (serverSocket < 0)
        {
            std::cerr << "Failed to create socket: " << std::strerror(errno) << std::endl;
            return false;
        }

        // set the socket to reuse address
        int opt = 1;
        setsockopt(serverSocket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        // non-blocking socket
        fcntl(serverSocket, F_SETFL, O_NONBLOCK);

        sockaddr_in serverAddr{};
        serverAddr.sin_family = AF_INET;
        serverAddr.sin_addr.s_addr = INADDR_ANY;
        serverAddr.sin_port = htons(port);

        if (bind(serverSocket, (sockaddr *)&serverAddr, sizeof(serverAddr)) < 0)
        {
            std::cerr << "Failed to bind socket on port " << port << ": " << std::strerror(errno) << std::endl;
            close(serverSocket);
            serverSocket = -1;
            return false;
        }

        if (listen(serverSocket, SOMAXCONN) < 0)
        {
            std::cerr << "Failed to listen on socket: " << std::strerror(errno) << std::endl;
            close(serverSocket);
            serverSocket = -1;
            return false;
        }

        // port 0 asks the OS for a free port; report the one we got
        sockaddr_in boundAddr{};
        socklen_t boundLen = sizeof(boundAddr);
        if (getsockname(serverSocket, (sockaddr *)&boundAddr, &boundLen) == 0)
        {
            boundPort = ntohs(boundAddr.sin_port);
        }
        else
        {
            boundPort = port;
        }

        return true;
    }

    bool ServerImpl::acceptClient()
    {
        sockaddr_in clientAddr{};
        socklen_t clientLen = sizeof(clientAddr);

        int clientSocket = accept(serverSocket, (sockaddr *)&clientAddr, &clientLen);
        if (clientSocket < 0)
        {
            // EWOULDBLOCK or EAGAIN is expected for non-blocking sockets
            return false;
        }

        // set client socket to non-blocking
        fcntl(clientSocket, F_SETFL, O_NONBLOCK);

        char address[INET_ADDRSTRLEN] = "?";
        inet_ntop(AF_INET, &clientAddr.sin_addr, address, sizeof(address));
        std::string peer = std::string(address) + ":" + std::to_string(ntohs(clientAddr.sin_port));

        std::lock_guard<std::mutex> lock(connectionsMutex);
        connections[clientSocket] = std::make_unique<HttpConnection>(clientSocket, peer);
        return true;
    }

    void ServerImpl::handleClient(int clientSocket)
    {
        HttpConnection *connection = nullptr;
        {
            std::lock_guard<std::mutex> lock(connectionsMutex);
            auto it = connections.find(clientSocket);
            if (it == connections.end())
            {
                return;
            }
            connection = it->second.get();
        }

        // a client that does not read its responses gets no new ones until it catches up
        if (!connection->isClosing() && !outputBackedUp(*connection))
        {
            bool peerClosed = false;
            if (!receiveData(*connection, peerClosed))
            {
                disconnectClient(clientSocket);
                return;
            }

            processRequests(*connection);

            // answer what arrived before the peer closed its side, then hang up
            if (peerClosed)
            {
                connection->queueResponse("", true);
            }
        }

        if (!flushOutbound(*connection) || connection->readyToClose())
        {
            disconnectClient(clientSocket);
            return;
        }
        connection->publishPendingOutput();

        if (std::chrono::steady_clock::now() - connection->getLastActivity() > idleTimeout)
        {
            std::cout << "Closing idle connection " << connection->getPeer() << std::endl;
            disconnectClient(clientSocket);
        }
    }

    bool ServerImpl::receiveData(HttpConnection &connection, bool &peerClosed)
    {
        char buffer[4096];
        std::string &inbound = connection.getInbound();

        // stop reading once more than one maximal request is buffered; the parser rejects it
        while (inbound.size() <= maxRequestBytes)
        {
            ssize_t bytesRead = recv(connection.getSocket(), buffer, sizeof(buffer), 0);

            if (bytesRead > 0)
            {
                inbound.append(buffer, static_cast<size_t>(bytesRead));
                connection.updateActivity();
                continue;
            }
            if (bytesRead == 0)
            {
                peerClosed = true;
                return true;
            }
            if (errno == EINTR)
            {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                return true;
            }

            std::cerr << "Receive from " << connection.getPeer() << " failed: " << std::strerror(errno) << std::endl;
            return false;
        }
        return true;
    }

    void ServerImpl::processRequests(HttpConnection &connection)
    {
        std::string &inbound = connection.getInbound();

        while (!connection.isClosing() && !inbound.empty() && !outputBackedUp(connection))
        {
            HttpRequest request;
            size_t consumed = 0;
            ParseStatus status = HttpRequest::parse(inbound, maxRequestBytes, request, consumed);

            if (status == ParseStatus::INCOMPLETE)
            {
                return;
            }
            if (status == ParseStatus::INVALID)
            {
                rejectRequest(connection, HttpStatus::BAD_REQUEST, "Bad Request");
                return;
            }
            if (status == ParseStatus::TOO_LARGE)
            {
                rejectRequest(connection, HttpStatus::PAYLOAD_TOO_LARGE, "Request Entity Too Large");
                return;
            }

            inbound.erase(0, consumed);

            HttpResponse response = routes->handle(request);
            bool keepAlive = request.keepAlive();

            std::cout << connection.getPeer() << " \"" << request.method << " " << request.target
                      << "\" " << response.statusCode << std::endl;

            connection.queueResponse(response.serialize(keepAlive), !keepAlive);
            connection.updateActivity();
        }
    }

    bool ServerImpl::outputBackedUp(HttpConnection &connection) const
    {
        return connection.getOutbound().size() > maxRequestBytes;
    }

    void ServerImpl::rejectRequest(HttpConnection &connection, HttpStatus status, const char *detail)
    {
        HttpResponse response = HttpResponse::json(status, {{"detail", detail}});
        std::cerr << connection.getPeer() << " rejected: " << response.statusCode << " " << detail << std::endl;
        connection.getInbound().clear();
        connection.queueResponse(response.serialize(false), true);
    }

    bool ServerImpl::flushOutbound(HttpConnection &connection)
    {
        std::string &outbound = connection.getOutbound();

        while (!outbound.empty())
        {
            ssize_t bytesSent = send(connection.getSocket(), outbound.data(), outbound.size(), MSG_NOSIGNAL);
            if (bytesSent > 0)
            {
                outbound.erase(0, static_cast<size_t>(bytesSent));
                connection.updateActivity();
                continue;
            }
            if (bytesSent < 0 && errno == EINTR)
            {
                continue;
            }
            if (bytesSent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            {
                // socket buffer full, try again next tick
                return true;
            }

            std::cerr << "Send to " << connection.getPeer() << " failed: " << std::strerror(errno) << std::endl;
            return false;
        }
        return true;
    }

    void ServerImpl::disconnectClient(int clientSocket)
    {
        std::lock_guard<std::mutex> lock(connectionsMutex);
        disconnectClientNoLock(clientSocket);
    }

    void ServerImpl::disconnectClientNoLock(int clientSocket)
    {
        // assuming the caller already holds connectionsMutex
        connections.erase(clientSocket);

        shutdown(clientSocket, SHUT_RDWR);
        close(clientSocket);
    }

    void ServerImpl::closeAll()
    {
        if (serverSocket >= 0)
        {
            shutdown(serverSocket, SHUT_RDWR);
            close(serverSocket);
            serverSocket = -1;
        }

        std::lock_guard<std::mutex> lock(connectionsMutex);
        for (auto &[socket, connection] : connections)
        {
            shutdown(socket, SHUT_RDWR);
            close(socket);
        }
        connections.clear();
    }

} // namespace catalog
