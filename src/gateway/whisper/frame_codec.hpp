#pragma once

#include "byte_stream.hpp"

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

// Length-prefixed framing used by the backend service:
//   frame := length (8 bytes, big-endian, unsigned) || payload
namespace frame {

inline constexpr size_t HEADER_SIZE = 8;

std::array<uint8_t, HEADER_SIZE> encode_length(uint64_t len);
uint64_t decode_length(std::span<const uint8_t, HEADER_SIZE> header);

// Header followed by the payload bytes.
std::string encode(std::string_view payload);

// Decode one complete frame held in memory. Trailing bytes are an error.
std::expected<std::string, RpcError> decode(std::string_view buffer);

std::expected<void, RpcError> write(ByteStream& stream, std::string_view payload,
                                    ByteStream::Clock::time_point deadline);

// Reads exactly one frame. A stream that ends before the announced length is a
// protocol error; a length above max_payload is rejected before allocating.
std::expected<std::string, RpcError> read(ByteStream& stream,
                                          ByteStream::Clock::time_point deadline,
                                          uint64_t max_payload);

} // namespace frame
