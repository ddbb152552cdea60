#pragma once

#include "metrics.hpp"
#include "protocol.hpp"
#include "rpc_error.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <stop_token>
#include <string>

// What the HTTP layer needs from the transcription service.
class TranscriptionBackend {
public:
    virtual ~TranscriptionBackend() = default;

    virtual std::expected<TranscriptionResult, RpcError>
        transcribe_path(const std::string& path, const TranscribeParams& params,
                        std::stop_token stop = {}) = 0;

    virtual std::expected<TranscriptionResult, RpcError>
        transcribe_bytes(std::span<const uint8_t> audio, const TranscribeParams& params,
                         std::stop_token stop = {}) = 0;

    virtual std::expected<ModelsResult, RpcError> list_models(std::stop_token stop = {}) = 0;

    virtual MetricsSnapshot metrics() const = 0;
};
