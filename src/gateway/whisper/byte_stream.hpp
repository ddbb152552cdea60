#pragma once

#include "rpc_error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>

// Bidirectional blocking byte stream to the backend service.
// Every call is bounded by an absolute deadline.
class ByteStream {
public:
    using Clock = std::chrono::steady_clock;

    virtual ~ByteStream() = default;

    // Write the whole buffer or fail.
    virtual std::expected<void, RpcError>
        write_all(std::span<const uint8_t> data, Clock::time_point deadline) = 0;

    // Read up to out.size() bytes. Returns 0 when the peer closed the stream.
    virtual std::expected<size_t, RpcError>
        read_some(std::span<uint8_t> out, Clock::time_point deadline) = 0;

    // False once the peer has closed or reset the stream, or left unread bytes
    // on it between calls. Does not block.
    virtual bool is_alive() = 0;

    virtual void close() = 0;
};
