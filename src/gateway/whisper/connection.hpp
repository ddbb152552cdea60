#pragma once

#include "byte_stream.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>

struct ConnectionOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 9000;
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds retry_backoff{2000};
    int max_attempts = 3;
};

// Owns the single persistent stream to the backend service.
// Not synchronized: callers hold the CallGate around every use.
class BackendConnection {
public:
    using Dialer = std::function<std::expected<std::unique_ptr<ByteStream>, RpcError>(
        const std::string& host, uint16_t port, std::chrono::milliseconds timeout)>;

    explicit BackendConnection(ConnectionOptions opts);
    BackendConnection(ConnectionOptions opts, Dialer dialer);
    ~BackendConnection();

    BackendConnection(const BackendConnection&) = delete;
    BackendConnection& operator=(const BackendConnection&) = delete;

    // Returns the open stream, dialing with retry and backoff if there is none
    // or the peer has dropped the current one.
    std::expected<ByteStream*, RpcError> ensure_connection();

    // Safe to call repeatedly and from any failure path.
    void close_connection();

    bool is_open() const { return stream_ != nullptr; }
    const ConnectionOptions& options() const { return opts_; }

private:
    ConnectionOptions opts_;
    Dialer dialer_;
    std::unique_ptr<ByteStream> stream_;
};
