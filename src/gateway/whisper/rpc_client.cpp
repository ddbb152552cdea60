#include "rpc_client.hpp"
#include "frame_codec.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

RpcClient::RpcClient(RpcClientOptions opts)
    : opts_(opts), connection_(opts.connection) {}

RpcClient::RpcClient(RpcClientOptions opts, BackendConnection::Dialer dialer)
    : opts_(opts), connection_(opts.connection, std::move(dialer)) {}

RpcClient::~RpcClient() {
    close();
}

std::expected<TranscriptionResult, RpcError>
RpcClient::transcribe_path(const std::string& path, const TranscribeParams& params,
                           std::stop_token stop) {
    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    if (ec || path.empty()) {
        return std::unexpected(RpcError::invalid_argument(
            std::format("cannot resolve audio path '{}'", path)));
    }
    if (!fs::is_regular_file(absolute, ec)) {
        return std::unexpected(RpcError::invalid_argument(
            std::format("audio file does not exist: {}", absolute.string())));
    }
    auto canonical = fs::canonical(absolute, ec);
    if (ec) {
        return std::unexpected(RpcError::invalid_argument(
            std::format("cannot resolve audio path {}: {}", absolute.string(), ec.message())));
    }

    return call<TranscriptionResult>("transcribe",
                                     protocol::transcribe_path_request(canonical.string(), params),
                                     stop, protocol::decode_transcription);
}

std::expected<TranscriptionResult, RpcError>
RpcClient::transcribe_bytes(std::span<const uint8_t> audio, const TranscribeParams& params,
                            std::stop_token stop) {
    return call<TranscriptionResult>("transcribe",
                                     protocol::transcribe_bytes_request(audio, params),
                                     stop, protocol::decode_transcription);
}

std::expected<ModelsResult, RpcError> RpcClient::list_models(std::stop_token stop) {
    return call<ModelsResult>("list_models", protocol::list_models_request(), stop,
                              protocol::decode_models);
}

void RpcClient::close() {
    auto pass = gate_.enter();
    connection_.close_connection();
}

template <typename Result, typename Decode>
std::expected<Result, RpcError> RpcClient::call(std::string_view command, const json& request,
                                                std::stop_token stop, Decode decode) {
    std::string body;
    try {
        body = request.dump();
    } catch (const json::exception& e) {
        return std::unexpected(RpcError::invalid_argument(
            std::string("cannot encode request: ") + e.what()));
    }

    // Cancellation is only observed before queueing for the connection.
    if (stop.stop_requested()) {
        return std::unexpected(RpcError::cancelled());
    }

    auto start = std::chrono::steady_clock::now();

    auto payload = round_trip(body);
    std::expected<Result, RpcError> result =
        payload ? decode(*payload) : std::expected<Result, RpcError>(std::unexpect, payload.error());

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    metrics_.record(elapsed, !result.has_value());

    if (!result) {
        std::println(stderr, "whisper: {} failed after {} ms ({}): {}", command, elapsed.count(),
                     to_string(result.error().kind), result.error().message);
    } else {
        log(std::format("{} succeeded in {} ms", command, elapsed.count()));
    }
    return result;
}

std::expected<std::string, RpcError> RpcClient::round_trip(const std::string& body) {
    auto pass = gate_.enter();

    auto stream = connection_.ensure_connection();
    if (!stream) return std::unexpected(stream.error());

    auto written = frame::write(**stream, body,
                                std::chrono::steady_clock::now() + opts_.io_timeout);
    if (!written) {
        connection_.close_connection();
        return std::unexpected(written.error());
    }

    auto response = frame::read(**stream, std::chrono::steady_clock::now() + opts_.io_timeout,
                                opts_.max_frame_bytes);
    if (!response) {
        connection_.close_connection();
        return std::unexpected(response.error());
    }
    return response;
}

void RpcClient::log(const std::string& msg) {
    if (opts_.verbose) {
        std::println(stderr, "whisper: {}", msg);
    }
}
