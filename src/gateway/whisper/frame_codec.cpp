#include "frame_codec.hpp"

#include <cstring>
#include <format>

namespace frame {

namespace {

// Fill out completely unless the stream ends first. Returns bytes read.
std::expected<size_t, RpcError> read_exact(ByteStream& stream, std::span<uint8_t> out,
                                           ByteStream::Clock::time_point deadline) {
    size_t got = 0;
    while (got < out.size()) {
        auto n = stream.read_some(out.subspan(got), deadline);
        if (!n) return std::unexpected(n.error());
        if (*n == 0) break;
        got += *n;
    }
    return got;
}

} // namespace

std::array<uint8_t, HEADER_SIZE> encode_length(uint64_t len) {
    std::array<uint8_t, HEADER_SIZE> header{};
    for (size_t i = 0; i < HEADER_SIZE; ++i) {
        header[i] = static_cast<uint8_t>(len >> (8 * (HEADER_SIZE - 1 - i)));
    }
    return header;
}

uint64_t decode_length(std::span<const uint8_t, HEADER_SIZE> header) {
    uint64_t len = 0;
    for (uint8_t b : header) {
        len = (len << 8) | b;
    }
    return len;
}

std::string encode(std::string_view payload) {
    auto header = encode_length(payload.size());
    std::string out;
    out.reserve(HEADER_SIZE + payload.size());
    out.append(reinterpret_cast<const char*>(header.data()), header.size());
    out.append(payload);
    return out;
}

std::expected<std::string, RpcError> decode(std::string_view buffer) {
    if (buffer.size() < HEADER_SIZE) {
        return std::unexpected(RpcError::protocol(
            std::format("truncated frame header: {} of {} bytes", buffer.size(), HEADER_SIZE)));
    }
    std::array<uint8_t, HEADER_SIZE> header;
    std::memcpy(header.data(), buffer.data(), HEADER_SIZE);
    uint64_t len = decode_length(header);

    auto body = buffer.substr(HEADER_SIZE);
    if (body.size() < len) {
        return std::unexpected(RpcError::protocol(
            std::format("truncated frame: expected {} bytes, got {}", len, body.size())));
    }
    if (body.size() > len) {
        return std::unexpected(RpcError::protocol(
            std::format("{} trailing bytes after frame", body.size() - len)));
    }
    return std::string(body);
}

std::expected<void, RpcError> write(ByteStream& stream, std::string_view payload,
                                    ByteStream::Clock::time_point deadline) {
    auto bytes = encode(payload);
    return stream.write_all(
        std::span(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()), deadline);
}

std::expected<std::string, RpcError> read(ByteStream& stream,
                                          ByteStream::Clock::time_point deadline,
                                          uint64_t max_payload) {
    std::array<uint8_t, HEADER_SIZE> header{};
    auto got = read_exact(stream, header, deadline);
    if (!got) return std::unexpected(got.error());
    if (*got == 0) {
        return std::unexpected(RpcError::io("connection closed by backend"));
    }
    if (*got < HEADER_SIZE) {
        return std::unexpected(RpcError::protocol(
            std::format("truncated frame header: {} of {} bytes", *got, HEADER_SIZE)));
    }

    uint64_t len = decode_length(header);
    if (len > max_payload) {
        return std::unexpected(RpcError::protocol(
            std::format("frame of {} bytes exceeds limit of {}", len, max_payload)));
    }

    std::string payload(static_cast<size_t>(len), '\0');
    got = read_exact(stream,
                     std::span(reinterpret_cast<uint8_t*>(payload.data()), payload.size()),
                     deadline);
    if (!got) return std::unexpected(got.error());
    if (*got < len) {
        return std::unexpected(RpcError::protocol(
            std::format("truncated frame: expected {} bytes, got {}", len, *got)));
    }
    return payload;
}

} // namespace frame
