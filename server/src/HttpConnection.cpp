#include "HttpConnection.hpp"

namespace catalog {

HttpConnection::HttpConnection(int socket, const std::string& peer)
    : socket_(socket),
      peer_(peer),
      closeAfterFlush_(false),
      pendingOutput_(0),
      lastActivity_(std::chrono::steady_clock::now()) {
}

HttpConnection::~HttpConnection() {
}

} // namespace catalog
