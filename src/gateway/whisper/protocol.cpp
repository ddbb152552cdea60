#include "protocol.hpp"
#include "base64.hpp"

using json = nlohmann::json;

namespace {

std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    return it->get<std::string>();
}

double number_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return 0.0;
    return it->get<double>();
}

void set_common_fields(json& req, const TranscribeParams& params) {
    if (!params.model.empty()) req["model"] = params.model;
    if (auto lang = protocol::normalize_language(params.language)) req["language"] = *lang;
    if (!params.task.empty()) req["task"] = params.task;
}

// Parses the payload and splits off an embedded application error.
std::expected<json, RpcError> parse_response(std::string_view payload) {
    json j = json::parse(payload, nullptr, false);
    if (j.is_discarded()) {
        return std::unexpected(RpcError::protocol("response is not valid JSON"));
    }
    if (!j.is_object()) {
        return std::unexpected(RpcError::protocol("response is not a JSON object"));
    }
    auto it = j.find("error");
    if (it != j.end() && !it->is_null()) {
        if (!it->is_string()) {
            return std::unexpected(RpcError::protocol("response \"error\" is not a string"));
        }
        auto msg = it->get<std::string>();
        if (!msg.empty()) return std::unexpected(RpcError::application(std::move(msg)));
    }
    return j;
}

} // namespace

void to_json(json& j, const Segment& s) {
    j = json{{"text", s.text}, {"start", s.start}, {"end", s.end}};
}

void from_json(const json& j, Segment& s) {
    s.text = string_field(j, "text");
    s.start = number_field(j, "start");
    s.end = number_field(j, "end");
}

void to_json(json& j, const TranscriptionResult& r) {
    j = json{
        {"text", r.text},
        {"language", r.language},
        {"segments", r.segments},
        {"processing_time", r.processing_time},
    };
}

void to_json(json& j, const ModelsResult& m) {
    j = json{{"available_models", m.available}, {"loaded_models", m.loaded}};
}

namespace protocol {

std::optional<std::string> normalize_language(std::optional<std::string> language) {
    if (language && language->empty()) return std::nullopt;
    return language;
}

bool is_valid_task(std::string_view task) {
    return task == "transcribe" || task == "translate";
}

json transcribe_path_request(const std::string& absolute_path, const TranscribeParams& params) {
    json req = {{"command", "transcribe"}, {"audio_path", absolute_path}};
    set_common_fields(req, params);
    return req;
}

json transcribe_bytes_request(std::span<const uint8_t> audio, const TranscribeParams& params) {
    json req = {{"command", "transcribe"}, {"audio_data", base64::encode(audio)}};
    set_common_fields(req, params);
    return req;
}

json list_models_request() {
    return {{"command", "list_models"}};
}

std::expected<TranscriptionResult, RpcError> decode_transcription(std::string_view payload) {
    auto j = parse_response(payload);
    if (!j) return std::unexpected(j.error());

    try {
        TranscriptionResult r;
        r.text = string_field(*j, "text");
        r.language = string_field(*j, "language");
        r.processing_time = number_field(*j, "processing_time");
        if (auto it = j->find("segments"); it != j->end() && !it->is_null()) {
            r.segments = it->get<std::vector<Segment>>();
        }
        return r;
    } catch (const json::exception& e) {
        return std::unexpected(RpcError::protocol(
            std::string("malformed transcription response: ") + e.what()));
    }
}

std::expected<ModelsResult, RpcError> decode_models(std::string_view payload) {
    auto j = parse_response(payload);
    if (!j) return std::unexpected(j.error());

    try {
        ModelsResult m;
        if (auto it = j->find("available_models"); it != j->end() && !it->is_null()) {
            m.available = it->get<std::map<std::string, std::string>>();
        }
        if (auto it = j->find("loaded_models"); it != j->end() && !it->is_null()) {
            m.loaded = it->get<std::vector<std::string>>();
        }
        return m;
    } catch (const json::exception& e) {
        return std::unexpected(RpcError::protocol(
            std::string("malformed models response: ") + e.what()));
    }
}

} // namespace protocol
