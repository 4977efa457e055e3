#include "Client.hpp"
#include <iostream>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace catalog {

Client::Client() : socket_(-1), connected_(false), port_(0) {
}

Client::~Client() {
    disconnect();
}

bool Client::connect(const char* host, int port) {
    if (connected_) {
        return true;
    }

    // Create socket
    socket_ = socket(AF_INET, SOCK_STREAM, 0);
    if (socket_ < 0) {
        std::cerr << "Failed to create socket" << std::endl;
        return false;
    }

    // Setup server address
    sockaddr_in serverAddr{};
    serverAddr.sin_family = AF_INET;
    serverAddr.sin_port = htons(port);

    if (inet_pton(AF_INET, host, &serverAddr.sin_addr) <= 0) {
        std::cerr << "Invalid address: " << host << std::endl;
        close(socket_);
        socket_ = -1;
        return false;
    }

    // Connect to server
    if (::connect(socket_, (sockaddr*)&serverAddr, sizeof(serverAddr)) < 0) {
        std::cerr << "Failed to connect to " << host << ":" << port << std::endl;
        close(socket_);
        socket_ = -1;
        return false;
    }

    connected_ = true;
    host_ = host;
    port_ = port;
    receiveBuffer_.clear();
    return true;
}

void Client::disconnect() {
    if (!connected_) {
        return;
    }

    connected_ = false;

    if (socket_ >= 0) {
        shutdown(socket_, SHUT_RDWR);
        close(socket_);
        socket_ = -1;
    }
    receiveBuffer_.clear();
}

bool Client::isConnected() const {
    return connected_;
}

std::optional<HttpResponse> Client::request(const std::string& method, const std::string& target,
                                            const std::string& body) {
    if (!connected_) {
        std::cerr << "Cannot send " << method << " " << target << ": not connected" << std::endl;
        return std::nullopt;
    }

    HttpRequest req(method, target, body);
    req.setHeader("Host", host_ + ":" + std::to_string(port_));
    req.setHeader("Accept", "application/json");
    if (!body.empty()) {
        req.setHeader("Content-Type", "application/json");
    }

    if (!sendAll(req.serialize())) {
        std::cerr << "Failed to send " << method << " " << target << std::endl;
        disconnect();
        return std::nullopt;
    }

    auto response = receiveResponse();
    if (!response) {
        disconnect();
        return std::nullopt;
    }

    // the server will close after this response; reconnect for the next one
    auto connection = response->getHeader("Connection");
    if (connection && *connection == "close") {
        std::string host = host_;
        int port = port_;
        disconnect();
        connect(host.c_str(), port);
    }

    return response;
}

std::optional<HttpResponse> Client::getInfo() {
    return request("GET", "/");
}

std::optional<HttpResponse> Client::listItems() {
    return request("GET", "/items");
}

std::optional<HttpResponse> Client::getItem(int64_t id) {
    return request("GET", "/items/" + std::to_string(id));
}

std::optional<HttpResponse> Client::createItem(const nlohmann::json& item) {
    return request("POST", "/items", item.dump());
}

std::optional<HttpResponse> Client::updateItem(int64_t id, const nlohmann::json& fields) {
    return request("PUT", "/items/" + std::to_string(id), fields.dump());
}

std::optional<HttpResponse> Client::deleteItem(int64_t id) {
    return request("DELETE", "/items/" + std::to_string(id));
}

std::optional<HttpResponse> Client::deleteAllItems() {
    return request("DELETE", "/items");
}

bool Client::sendAll(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t bytesSent = send(socket_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (bytesSent < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        sent += static_cast<size_t>(bytesSent);
    }
    return true;
}

std::optional<HttpResponse> Client::receiveResponse() {
    bool closed = false;

    while (true) {
        HttpResponse response;
        size_t consumed = 0;
        ParseStatus status = HttpResponse::parse(receiveBuffer_, closed, response, consumed);

        if (status == ParseStatus::COMPLETE) {
            // keep bytes that belong to a later response
            receiveBuffer_.erase(0, consumed);
            return response;
        }
        if (status != ParseStatus::INCOMPLETE) {
            std::cerr << "Malformed response from server" << std::endl;
            return std::nullopt;
        }

        char buffer[4096];
        ssize_t bytesRead = recv(socket_, buffer, sizeof(buffer), 0);

        if (bytesRead > 0) {
            receiveBuffer_.append(buffer, static_cast<size_t>(bytesRead));
        } else if (bytesRead == 0) {
            if (closed) {
                std::cerr << "Connection to server lost" << std::endl;
                return std::nullopt;
            }
            closed = true;
        } else if (errno != EINTR) {
            std::cerr << "Receive failed: " << std::strerror(errno) << std::endl;
            return std::nullopt;
        }
    }
}

} // namespace catalog
