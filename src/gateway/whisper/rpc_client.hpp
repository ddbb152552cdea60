#pragma once

#include "backend.hpp"
#include "call_gate.hpp"
#include "connection.hpp"
#include "metrics.hpp"

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

struct RpcClientOptions {
    ConnectionOptions connection;
    // Applied separately to the write and the read phase of each call.
    std::chrono::milliseconds io_timeout{std::chrono::minutes(30)};
    uint64_t max_frame_bytes = uint64_t(1) << 30;
    bool verbose = false;
};

// Client for the backend transcription service. One persistent connection,
// one logical call on it at a time; safe to share between threads.
class RpcClient : public TranscriptionBackend {
public:
    explicit RpcClient(RpcClientOptions opts);
    RpcClient(RpcClientOptions opts, BackendConnection::Dialer dialer);
    ~RpcClient() override;

    RpcClient(const RpcClient&) = delete;
    RpcClient& operator=(const RpcClient&) = delete;

    // The file is read by the backend from a shared filesystem, so only the
    // canonical absolute path travels. Fails before any I/O if it does not exist.
    std::expected<TranscriptionResult, RpcError>
        transcribe_path(const std::string& path, const TranscribeParams& params,
                        std::stop_token stop = {}) override;

    std::expected<TranscriptionResult, RpcError>
        transcribe_bytes(std::span<const uint8_t> audio, const TranscribeParams& params,
                         std::stop_token stop = {}) override;

    std::expected<ModelsResult, RpcError> list_models(std::stop_token stop = {}) override;

    MetricsSnapshot metrics() const override { return metrics_.snapshot(); }

    // Waits for the call in flight, then drops the connection.
    void close();

private:
    template <typename Result, typename Decode>
    std::expected<Result, RpcError> call(std::string_view command, const nlohmann::json& request,
                                         std::stop_token stop, Decode decode);

    // Write one request frame and read its response under the gate.
    std::expected<std::string, RpcError> round_trip(const std::string& body);

    void log(const std::string& msg);

    RpcClientOptions opts_;
    CallGate gate_;
    BackendConnection connection_;
    Metrics metrics_;
};
