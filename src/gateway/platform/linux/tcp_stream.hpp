#pragma once

#include "whisper/byte_stream.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>

// Non-blocking TCP socket driven through poll() so every operation honors its deadline.
class TcpStream : public ByteStream {
public:
    // Resolves host and tries each address until one connects within timeout.
    static std::expected<std::unique_ptr<ByteStream>, RpcError>
        dial(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);

    explicit TcpStream(int fd);
    ~TcpStream() override;

    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;

    std::expected<void, RpcError>
        write_all(std::span<const uint8_t> data, Clock::time_point deadline) override;
    std::expected<size_t, RpcError>
        read_some(std::span<uint8_t> out, Clock::time_point deadline) override;
    bool is_alive() override;
    void close() override;

private:
    // Waits for events on fd_ until deadline. Returns false on timeout.
    std::expected<bool, RpcError> wait(short events, Clock::time_point deadline);

    int fd_ = -1;
};
