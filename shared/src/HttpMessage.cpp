#include "HttpMessage.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace catalog {

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

std::optional<std::string> findHeader(const HeaderList& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (equalsIgnoreCase(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

void replaceHeader(HeaderList& headers, const std::string& name, const std::string& value) {
    for (auto& [key, existing] : headers) {
        if (equalsIgnoreCase(key, name)) {
            existing = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

// Splits "<start line>\r\n<header>\r\n...\r\n" (terminator excluded) into the
// start line and header fields.
bool parseHead(const std::string& head, std::string& startLine, HeaderList& headers) {
    size_t lineEnd = head.find("\r\n");
    startLine = head.substr(0, lineEnd);
    if (startLine.empty()) {
        return false;
    }

    size_t pos = (lineEnd == std::string::npos) ? head.size() : lineEnd + 2;
    while (pos < head.size()) {
        size_t next = head.find("\r\n", pos);
        if (next == std::string::npos) {
            next = head.size();
        }
        std::string line = head.substr(pos, next - pos);
        pos = next + 2;

        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return false;
        }
        std::string name = line.substr(0, colon);
        if (name.find_first_of(" \t") != std::string::npos) {
            return false;
        }
        headers.emplace_back(name, trim(line.substr(colon + 1)));
    }
    return true;
}

bool parseContentLength(const std::string& value, size_t& length) {
    if (value.empty()) {
        return false;
    }
    auto result = std::from_chars(value.data(), value.data() + value.size(), length);
    return result.ec == std::errc() && result.ptr == value.data() + value.size();
}

} // namespace

const char* reasonPhrase(int statusCode) {
    switch (statusCode) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 422: return "Unprocessable Entity";
        case 500: return "Internal Server Error";
        default: return "Unknown";
    }
}

HttpRequest::HttpRequest(const std::string& m, const std::string& t, const std::string& b)
    : method(m), target(t), body(b) {
    path = target.substr(0, target.find('?'));
}

std::optional<std::string> HttpRequest::getHeader(const std::string& name) const {
    return findHeader(headers, name);
}

void HttpRequest::setHeader(const std::string& name, const std::string& value) {
    replaceHeader(headers, name, value);
}

bool HttpRequest::keepAlive() const {
    auto connection = getHeader("Connection");
    if (version == "HTTP/1.0") {
        return connection && equalsIgnoreCase(*connection, "keep-alive");
    }
    return !(connection && equalsIgnoreCase(*connection, "close"));
}

std::string HttpRequest::serialize() const {
    std::ostringstream oss;
    oss << method << " " << target << " " << version << "\r\n";
    for (const auto& [name, value] : headers) {
        if (equalsIgnoreCase(name, "Content-Length")) {
            continue;
        }
        oss << name << ": " << value << "\r\n";
    }
    if (!body.empty() || method == "POST" || method == "PUT") {
        oss << "Content-Length: " << body.size() << "\r\n";
    }
    oss << "\r\n" << body;
    return oss.str();
}

ParseStatus HttpRequest::parse(const std::string& buffer, size_t maxSize,
                               HttpRequest& request, size_t& consumed) {
    size_t headEnd = buffer.find("\r\n\r\n");
    if (headEnd == std::string::npos) {
        return buffer.size() > maxSize ? ParseStatus::TOO_LARGE : ParseStatus::INCOMPLETE;
    }

    std::string startLine;
    HttpRequest parsed;
    if (!parseHead(buffer.substr(0, headEnd), startLine, parsed.headers)) {
        return ParseStatus::INVALID;
    }

    // request line: METHOD SP request-target SP HTTP-version
    size_t firstSpace = startLine.find(' ');
    size_t secondSpace = startLine.find(' ', firstSpace == std::string::npos ? 0 : firstSpace + 1);
    if (firstSpace == std::string::npos || secondSpace == std::string::npos ||
        startLine.find(' ', secondSpace + 1) != std::string::npos) {
        return ParseStatus::INVALID;
    }
    parsed.method = startLine.substr(0, firstSpace);
    parsed.target = startLine.substr(firstSpace + 1, secondSpace - firstSpace - 1);
    parsed.version = startLine.substr(secondSpace + 1);
    if (parsed.method.empty() || parsed.target.empty() || parsed.target[0] != '/' ||
        parsed.version.rfind("HTTP/1.", 0) != 0) {
        return ParseStatus::INVALID;
    }
    parsed.path = parsed.target.substr(0, parsed.target.find('?'));

    // bodies are only delimited by Content-Length
    if (parsed.getHeader("Transfer-Encoding")) {
        return ParseStatus::INVALID;
    }

    size_t contentLength = 0;
    if (auto value = parsed.getHeader("Content-Length")) {
        if (!parseContentLength(*value, contentLength)) {
            return ParseStatus::INVALID;
        }
    }

    size_t bodyStart = headEnd + 4;
    if (contentLength > maxSize || bodyStart + contentLength > maxSize) {
        return ParseStatus::TOO_LARGE;
    }
    if (buffer.size() < bodyStart + contentLength) {
        return ParseStatus::INCOMPLETE;
    }

    parsed.body = buffer.substr(bodyStart, contentLength);
    consumed = bodyStart + contentLength;
    request = std::move(parsed);
    return ParseStatus::COMPLETE;
}

HttpResponse HttpResponse::json(HttpStatus status, const nlohmann::json& body) {
    HttpResponse response(status);
    response.setHeader("Content-Type", "application/json");
    response.body = body.dump();
    return response;
}

std::optional<std::string> HttpResponse::getHeader(const std::string& name) const {
    return findHeader(headers, name);
}

void HttpResponse::setHeader(const std::string& name, const std::string& value) {
    replaceHeader(headers, name, value);
}

std::string HttpResponse::serialize(bool keepAlive) const {
    bool noContent = statusCode == static_cast<int>(HttpStatus::NO_CONTENT);

    std::ostringstream oss;
    oss << "HTTP/1.1 " << statusCode << " " << reasonPhrase(statusCode) << "\r\n";
    for (const auto& [name, value] : headers) {
        if (equalsIgnoreCase(name, "Content-Length") || equalsIgnoreCase(name, "Connection")) {
            continue;
        }
        if (noContent && equalsIgnoreCase(name, "Content-Type")) {
            continue;
        }
        oss << name << ": " << value << "\r\n";
    }
    if (!noContent) {
        oss << "Content-Length: " << body.size() << "\r\n";
    }
    oss << "Connection: " << (keepAlive ? "keep-alive" : "close") << "\r\n";
    oss << "\r\n";
    if (!noContent) {
        oss << body;
    }
    return oss.str();
}

ParseStatus HttpResponse::parse(const std::string& buffer, bool connectionClosed,
                                HttpResponse& response, size_t& consumed) {
    size_t headEnd = buffer.find("\r\n\r\n");
    if (headEnd == std::string::npos) {
        return connectionClosed ? ParseStatus::INVALID : ParseStatus::INCOMPLETE;
    }

    std::string statusLine;
    HttpResponse parsed;
    if (!parseHead(buffer.substr(0, headEnd), statusLine, parsed.headers)) {
        return ParseStatus::INVALID;
    }

    // status line: HTTP-version SP status-code SP reason-phrase
    if (statusLine.rfind("HTTP/1.", 0) != 0) {
        return ParseStatus::INVALID;
    }
    size_t codeStart = statusLine.find(' ');
    if (codeStart == std::string::npos || statusLine.size() < codeStart + 4) {
        return ParseStatus::INVALID;
    }
    auto result = std::from_chars(statusLine.data() + codeStart + 1,
                                  statusLine.data() + codeStart + 4, parsed.statusCode);
    if (result.ec != std::errc() || result.ptr != statusLine.data() + codeStart + 4) {
        return ParseStatus::INVALID;
    }

    size_t bodyStart = headEnd + 4;
    bool noBody = parsed.statusCode == static_cast<int>(HttpStatus::NO_CONTENT) ||
                  (parsed.statusCode >= 100 && parsed.statusCode < 200);

    if (noBody) {
        consumed = bodyStart;
    } else if (auto value = parsed.getHeader("Content-Length")) {
        size_t contentLength = 0;
        if (!parseContentLength(*value, contentLength)) {
            return ParseStatus::INVALID;
        }
        if (buffer.size() < bodyStart + contentLength) {
            return connectionClosed ? ParseStatus::INVALID : ParseStatus::INCOMPLETE;
        }
        parsed.body = buffer.substr(bodyStart, contentLength);
        consumed = bodyStart + contentLength;
    } else {
        // body runs until the server closes the connection
        if (!connectionClosed) {
            return ParseStatus::INCOMPLETE;
        }
        parsed.body = buffer.substr(bodyStart);
        consumed = buffer.size();
    }

    response = std::move(parsed);
    return ParseStatus::COMPLETE;
}

} // namespace catalog
