#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace catalog {

enum class HttpStatus : uint16_t {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    PAYLOAD_TOO_LARGE = 413,
    UNPROCESSABLE_ENTITY = 422,
    INTERNAL_SERVER_ERROR = 500
};

const char* reasonPhrase(int statusCode);

enum class ParseStatus {
    COMPLETE,
    INCOMPLETE,   // need more bytes
    INVALID,
    TOO_LARGE
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method;
    std::string target;   // as sent, including any query string
    std::string path;     // target without the query string
    std::string version = "HTTP/1.1";
    HeaderList headers;
    std::string body;

    HttpRequest() = default;
    HttpRequest(const std::string& m, const std::string& t, const std::string& b = "");

    // header names compare case-insensitively
    std::optional<std::string> getHeader(const std::string& name) const;
    void setHeader(const std::string& name, const std::string& value);

    bool keepAlive() const;

    std::string serialize() const;

    // parses one request from the front of buffer. on COMPLETE, consumed holds
    // the number of bytes the request occupied.
    static ParseStatus parse(const std::string& buffer, size_t maxSize,
                             HttpRequest& request, size_t& consumed);
};

struct HttpResponse {
    int statusCode;
    HeaderList headers;
    std::string body;

    HttpResponse() : statusCode(200) {}
    explicit HttpResponse(HttpStatus status) : statusCode(static_cast<int>(status)) {}

    static HttpResponse json(HttpStatus status, const nlohmann::json& body);

    std::optional<std::string> getHeader(const std::string& name) const;
    void setHeader(const std::string& name, const std::string& value);

    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }

    std::string serialize(bool keepAlive) const;

    // client side. connectionClosed tells the parser that no more bytes will
    // arrive, which completes a response without Content-Length.
    static ParseStatus parse(const std::string& buffer, bool connectionClosed,
                             HttpResponse& response, size_t& consumed);
};

} // namespace catalog
