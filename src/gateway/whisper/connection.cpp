#include "connection.hpp"
#include "platform/linux/tcp_stream.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <thread>

BackendConnection::BackendConnection(ConnectionOptions opts)
    : BackendConnection(std::move(opts), &TcpStream::dial) {}

BackendConnection::BackendConnection(ConnectionOptions opts, Dialer dialer)
    : opts_(std::move(opts)), dialer_(std::move(dialer)) {}

BackendConnection::~BackendConnection() {
    close_connection();
}

std::expected<ByteStream*, RpcError> BackendConnection::ensure_connection() {
    if (stream_) {
        if (stream_->is_alive()) return stream_.get();
        std::println(stderr, "whisper: connection to {}:{} lost, reconnecting",
                     opts_.host, opts_.port);
        close_connection();
    }

    int attempts = std::max(opts_.max_attempts, 1);
    std::string last_error;

    for (int i = 0; i < attempts; ++i) {
        auto stream = dialer_(opts_.host, opts_.port, opts_.connect_timeout);
        if (stream) {
            stream_ = std::move(*stream);
            return stream_.get();
        }

        last_error = stream.error().message;
        std::println(stderr, "whisper: connect attempt {}/{} to {}:{} failed: {}",
                     i + 1, attempts, opts_.host, opts_.port, last_error);

        if (i + 1 < attempts) {
            std::this_thread::sleep_for(opts_.retry_backoff);
        }
    }

    return std::unexpected(RpcError::connection(
        std::format("backend {}:{} unreachable after {} attempts: {}",
                    opts_.host, opts_.port, attempts, last_error)));
}

void BackendConnection::close_connection() {
    if (stream_) {
        stream_->close();
        stream_.reset();
    }
}
