#pragma once

#include "HttpMessage.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace catalog {

// Blocking HTTP/1.1 client for the item service. One keep-alive connection is
// reused across requests and reopened when the server closed it.
class Client {
public:
    Client();
    ~Client();

    bool connect(const char* host, int port);
    void disconnect();
    bool isConnected() const;

    // nullopt when the request could not be sent or no valid response came back
    std::optional<HttpResponse> request(const std::string& method, const std::string& target,
                                        const std::string& body = "");

    std::optional<HttpResponse> getInfo();
    std::optional<HttpResponse> listItems();
    std::optional<HttpResponse> getItem(int64_t id);
    std::optional<HttpResponse> createItem(const nlohmann::json& item);
    std::optional<HttpResponse> updateItem(int64_t id, const nlohmann::json& fields);
    std::optional<HttpResponse> deleteItem(int64_t id);
    std::optional<HttpResponse> deleteAllItems();

private:
    int socket_;
    bool connected_;
    std::string host_;
    int port_;
    std::string receiveBuffer_;  // bytes read past the end of the last response

    bool sendAll(const std::string& data);
    std::optional<HttpResponse> receiveResponse();
};

} // namespace catalog
