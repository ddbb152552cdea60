#pragma once

#include "rpc_error.hpp"

#include <cstdint>
#include <expected>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

struct Segment {
    std::string text;
    double start = 0.0;
    double end = 0.0;
};

struct TranscriptionResult {
    std::string text;
    std::string language; // detected by the backend
    std::vector<Segment> segments;
    double processing_time = 0.0;
};

struct ModelsResult {
    std::map<std::string, std::string> available; // name -> description
    std::vector<std::string> loaded;
};

struct TranscribeParams {
    std::string model = "base";
    std::optional<std::string> language; // absent = auto-detect
    std::string task = "transcribe";     // "transcribe" or "translate"
};

void to_json(nlohmann::json& j, const Segment& s);
void from_json(const nlohmann::json& j, Segment& s);
void to_json(nlohmann::json& j, const TranscriptionResult& r);
void to_json(nlohmann::json& j, const ModelsResult& m);

// JSON payloads exchanged with the backend service.
namespace protocol {

// An empty language means "let the backend detect it".
std::optional<std::string> normalize_language(std::optional<std::string> language);

bool is_valid_task(std::string_view task);

nlohmann::json transcribe_path_request(const std::string& absolute_path,
                                       const TranscribeParams& params);
nlohmann::json transcribe_bytes_request(std::span<const uint8_t> audio,
                                        const TranscribeParams& params);
nlohmann::json list_models_request();

// Both decoders report a non-empty "error" field as RpcErrorKind::Application
// and anything undecodable as RpcErrorKind::Protocol.
std::expected<TranscriptionResult, RpcError> decode_transcription(std::string_view payload);
std::expected<ModelsResult, RpcError> decode_models(std::string_view payload);

} // namespace protocol
