#pragma once

#include <string>
#include <chrono>
#include <atomic>
#include <cstddef>

namespace catalog {

// One accepted client socket with its pending input and output bytes.
class HttpConnection {
public:
    HttpConnection(int socket, const std::string& peer);
    ~HttpConnection();

    int getSocket() const { return socket_; }
    const std::string& getPeer() const { return peer_; }

    std::string& getInbound() { return inbound_; }
    std::string& getOutbound() { return outbound_; }

    void queueResponse(const std::string& data, bool closeAfter) {
        outbound_ += data;
        if (closeAfter) {
            closeAfterFlush_ = true;
        }
    }

    // no further requests are read once a response asked to close
    bool isClosing() const { return closeAfterFlush_; }
    bool readyToClose() const { return closeAfterFlush_ && outbound_.empty(); }

    void updateActivity() {
        lastActivity_ = std::chrono::steady_clock::now();
    }

    std::chrono::steady_clock::time_point getLastActivity() const {
        return lastActivity_;
    }

    // outbound size as last published by the server thread, safe to read from others
    void publishPendingOutput() { pendingOutput_ = outbound_.size(); }
    size_t getPendingOutput() const { return pendingOutput_; }

private:
    int socket_;
    std::string peer_;
    std::string inbound_;
    std::string outbound_;
    bool closeAfterFlush_;
    std::atomic<size_t> pendingOutput_;
    std::chrono::steady_clock::time_point lastActivity_;
};

} // namespace catalog
