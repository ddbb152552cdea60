#include <catch2/catch_test_macros.hpp>

#include "whisper/frame_codec.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace {

// In-memory stream that hands out at most chunk bytes per read.
class MemoryStream : public ByteStream {
public:
    explicit MemoryStream(std::string input, size_t chunk = SIZE_MAX)
        : input_(std::move(input)), chunk_(chunk) {}

    std::expected<void, RpcError>
    write_all(std::span<const uint8_t> data, Clock::time_point) override {
        written_.append(reinterpret_cast<const char*>(data.data()), data.size());
        return {};
    }

    std::expected<size_t, RpcError>
    read_some(std::span<uint8_t> out, Clock::time_point) override {
        size_t n = std::min({out.size(), chunk_, input_.size() - pos_});
        std::copy_n(input_.data() + pos_, n, reinterpret_cast<char*>(out.data()));
        pos_ += n;
        return n;
    }

    bool is_alive() override { return true; }
    void close() override {}

    const std::string& written() const { return written_; }

private:
    std::string input_;
    size_t chunk_;
    size_t pos_ = 0;
    std::string written_;
};

auto far_deadline() {
    return ByteStream::Clock::now() + std::chrono::seconds(5);
}

} // namespace

TEST_CASE("frame encoding", "[frame]") {

    SECTION("HeaderIsBigEndianLength") {
        auto out = frame::encode("hello");
        REQUIRE(out.size() == 8 + 5);
        REQUIRE(out.substr(0, 8) == std::string("\0\0\0\0\0\0\0\x05", 8));
        REQUIRE(out.substr(8) == "hello");
    }

    SECTION("LengthUsesAllEightBytes") {
        auto header = frame::encode_length(0x0102030405060708ULL);
        REQUIRE(header == std::array<uint8_t, 8>{1, 2, 3, 4, 5, 6, 7, 8});
        REQUIRE(frame::decode_length(header) == 0x0102030405060708ULL);
    }

    SECTION("EmptyPayload") {
        auto out = frame::encode("");
        REQUIRE(out == std::string(8, '\0'));
        auto back = frame::decode(out);
        REQUIRE(back.has_value());
        REQUIRE(back->empty());
    }

    SECTION("RoundTripVariousSizes") {
        for (size_t n : {size_t(1), size_t(255), size_t(256), size_t(70000)}) {
            std::string payload(n, '\0');
            for (size_t i = 0; i < n; ++i) payload[i] = static_cast<char>(i * 31);
            auto back = frame::decode(frame::encode(payload));
            REQUIRE(back.has_value());
            REQUIRE(*back == payload);
        }
    }

    SECTION("DecodeTruncatedPayload") {
        auto out = frame::encode("hello world");
        auto back = frame::decode(std::string_view(out).substr(0, out.size() - 3));
        REQUIRE_FALSE(back.has_value());
        REQUIRE(back.error().kind == RpcErrorKind::Protocol);
    }

    SECTION("DecodeTrailingBytes") {
        auto back = frame::decode(frame::encode("a") + "b");
        REQUIRE_FALSE(back.has_value());
        REQUIRE(back.error().kind == RpcErrorKind::Protocol);
    }
}

TEST_CASE("frame stream I/O", "[frame]") {

    SECTION("WriteProducesOneFrame") {
        MemoryStream stream("");
        REQUIRE(frame::write(stream, R"({"command":"list_models"})", far_deadline()).has_value());
        REQUIRE(stream.written() == frame::encode(R"({"command":"list_models"})"));
    }

    SECTION("ReadReassemblesSmallChunks") {
        MemoryStream stream(frame::encode("fragmented payload"), 3);
        auto payload = frame::read(stream, far_deadline(), 1024);
        REQUIRE(payload.has_value());
        REQUIRE(*payload == "fragmented payload");
    }

    SECTION("ReadsFramesBackToBack") {
        MemoryStream stream(frame::encode("first") + frame::encode("second"));
        REQUIRE(frame::read(stream, far_deadline(), 1024).value() == "first");
        REQUIRE(frame::read(stream, far_deadline(), 1024).value() == "second");
    }

    SECTION("ClosedBeforeHeaderIsIoError") {
        MemoryStream stream("");
        auto payload = frame::read(stream, far_deadline(), 1024);
        REQUIRE_FALSE(payload.has_value());
        REQUIRE(payload.error().kind == RpcErrorKind::Io);
    }

    SECTION("PartialHeaderIsProtocolError") {
        MemoryStream stream(std::string(5, '\0'));
        auto payload = frame::read(stream, far_deadline(), 1024);
        REQUIRE_FALSE(payload.has_value());
        REQUIRE(payload.error().kind == RpcErrorKind::Protocol);
    }

    SECTION("ShortPayloadIsProtocolError") {
        auto bytes = frame::encode("0123456789");
        MemoryStream stream(bytes.substr(0, bytes.size() - 4));
        auto payload = frame::read(stream, far_deadline(), 1024);
        REQUIRE_FALSE(payload.has_value());
        REQUIRE(payload.error().kind == RpcErrorKind::Protocol);
    }

    SECTION("OversizedFrameRejected") {
        auto header = frame::encode_length(uint64_t(1) << 40);
        MemoryStream stream(std::string(reinterpret_cast<const char*>(header.data()), header.size()));
        auto payload = frame::read(stream, far_deadline(), 1 << 20);
        REQUIRE_FALSE(payload.has_value());
        REQUIRE(payload.error().kind == RpcErrorKind::Protocol);
    }
}
