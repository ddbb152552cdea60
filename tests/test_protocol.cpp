#include <catch2/catch_test_macros.hpp>

#include "whisper/base64.hpp"
#include "whisper/protocol.hpp"

using json = nlohmann::json;

TEST_CASE("request building", "[protocol]") {

    SECTION("PathRequest") {
        TranscribeParams params{.model = "base", .language = "en", .task = "transcribe"};
        auto req = protocol::transcribe_path_request("/srv/audio/a.wav", params);
        REQUIRE(req == json{
            {"command", "transcribe"},
            {"audio_path", "/srv/audio/a.wav"},
            {"model", "base"},
            {"language", "en"},
            {"task", "transcribe"},
        });
    }

    SECTION("EmptyLanguageOmitted") {
        TranscribeParams params{.model = "tiny", .language = "", .task = "translate"};
        auto req = protocol::transcribe_path_request("/a.wav", params);
        REQUIRE_FALSE(req.contains("language"));
        REQUIRE(req["task"] == "translate");
    }

    SECTION("AbsentLanguageOmitted") {
        auto req = protocol::transcribe_path_request("/a.wav", TranscribeParams{});
        REQUIRE_FALSE(req.contains("language"));
        REQUIRE(req["model"] == "base");
        REQUIRE(req["task"] == "transcribe");
    }

    SECTION("EmptyModelOmitted") {
        TranscribeParams params{.model = "", .language = {}, .task = "transcribe"};
        auto req = protocol::transcribe_path_request("/a.wav", params);
        REQUIRE_FALSE(req.contains("model"));
    }

    SECTION("BytesRequestCarriesBase64") {
        std::vector<uint8_t> audio = {'R', 'I', 'F', 'F'};
        auto req = protocol::transcribe_bytes_request(audio, TranscribeParams{});
        REQUIRE(req["command"] == "transcribe");
        REQUIRE(req["audio_data"] == "UklGRg==");
        REQUIRE_FALSE(req.contains("audio_path"));
    }

    SECTION("ListModels") {
        REQUIRE(protocol::list_models_request() == json{{"command", "list_models"}});
    }

    SECTION("TaskValidation") {
        REQUIRE(protocol::is_valid_task("transcribe"));
        REQUIRE(protocol::is_valid_task("translate"));
        REQUIRE_FALSE(protocol::is_valid_task(""));
        REQUIRE_FALSE(protocol::is_valid_task("Translate"));
    }
}

TEST_CASE("transcription decoding", "[protocol]") {

    SECTION("FullResponse") {
        auto r = protocol::decode_transcription(R"({
            "text": "hello world",
            "segments": [{"text": "hello world", "start": 0.0, "end": 1.2}],
            "language": "en",
            "processing_time": 0.8
        })");
        REQUIRE(r.has_value());
        REQUIRE(r->text == "hello world");
        REQUIRE(r->language == "en");
        REQUIRE(r->segments.size() == 1);
        REQUIRE(r->segments[0].text == "hello world");
        REQUIRE(r->segments[0].start == 0.0);
        REQUIRE(r->segments[0].end == 1.2);
        REQUIRE(r->processing_time == 0.8);
    }

    SECTION("UnknownFieldsIgnored") {
        auto r = protocol::decode_transcription(R"({
            "text": "x",
            "segments": [{"id": 0, "text": "x", "start": 0, "end": 1, "tokens": [50364], "avg_logprob": -0.2}],
            "duration": 1.0
        })");
        REQUIRE(r.has_value());
        REQUIRE(r->segments.size() == 1);
        REQUIRE(r->segments[0].end == 1.0);
    }

    SECTION("MissingAndNullFieldsDefault") {
        auto r = protocol::decode_transcription(R"({"text": null, "segments": null})");
        REQUIRE(r.has_value());
        REQUIRE(r->text.empty());
        REQUIRE(r->language.empty());
        REQUIRE(r->segments.empty());
        REQUIRE(r->processing_time == 0.0);
    }

    SECTION("ErrorFieldIsApplicationError") {
        auto r = protocol::decode_transcription(R"({"error": "model 'huge' not found"})");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == RpcErrorKind::Application);
        REQUIRE(r.error().message == "model 'huge' not found");
    }

    SECTION("EmptyErrorIsNotAnError") {
        auto r = protocol::decode_transcription(R"({"error": "", "text": "ok"})");
        REQUIRE(r.has_value());
        REQUIRE(r->text == "ok");
    }

    SECTION("InvalidJson") {
        auto r = protocol::decode_transcription("{\"text\": ");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == RpcErrorKind::Protocol);
    }

    SECTION("NotAnObject") {
        auto r = protocol::decode_transcription("[1, 2, 3]");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == RpcErrorKind::Protocol);
    }

    SECTION("WrongFieldType") {
        auto r = protocol::decode_transcription(R"({"text": 42})");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().kind == RpcErrorKind::Protocol);
    }
}

TEST_CASE("models decoding", "[protocol]") {

    SECTION("AvailableAndLoaded") {
        auto m = protocol::decode_models(R"({
            "available_models": {"tiny": "Tiny model", "base": "Base model"},
            "loaded_models": ["base"]
        })");
        REQUIRE(m.has_value());
        REQUIRE(m->available.size() == 2);
        REQUIRE(m->available.at("tiny") == "Tiny model");
        REQUIRE(m->loaded == std::vector<std::string>{"base"});
    }

    SECTION("ErrorField") {
        auto m = protocol::decode_models(R"({"error": "backend busy"})");
        REQUIRE_FALSE(m.has_value());
        REQUIRE(m.error().kind == RpcErrorKind::Application);
    }

    SECTION("SerializesWithWireKeys") {
        ModelsResult m{.available = {{"tiny", "Tiny"}}, .loaded = {"tiny"}};
        json j = m;
        REQUIRE(j["available_models"]["tiny"] == "Tiny");
        REQUIRE(j["loaded_models"] == json::array({"tiny"}));
    }
}

TEST_CASE("base64", "[protocol]") {

    auto bytes = [](std::string_view s) {
        return std::vector<uint8_t>(s.begin(), s.end());
    };

    SECTION("Rfc4648Vectors") {
        REQUIRE(base64::encode(bytes("")) == "");
        REQUIRE(base64::encode(bytes("f")) == "Zg==");
        REQUIRE(base64::encode(bytes("fo")) == "Zm8=");
        REQUIRE(base64::encode(bytes("foo")) == "Zm9v");
        REQUIRE(base64::encode(bytes("foobar")) == "Zm9vYmFy");
    }

    SECTION("DecodeVectors") {
        REQUIRE(base64::decode("Zg==") == bytes("f"));
        REQUIRE(base64::decode("Zm8=") == bytes("fo"));
        REQUIRE(base64::decode("Zm9vYmFy") == bytes("foobar"));
    }

    SECTION("BinaryBytes") {
        std::vector<uint8_t> all(256);
        for (size_t i = 0; i < all.size(); ++i) all[i] = static_cast<uint8_t>(i);
        REQUIRE(base64::decode(base64::encode(all)) == all);
    }

    SECTION("RejectsMalformed") {
        REQUIRE_FALSE(base64::decode("Zg=").has_value());
        REQUIRE_FALSE(base64::decode("Z$==").has_value());
        REQUIRE_FALSE(base64::decode("Zg==Zg==").has_value());
        REQUIRE_FALSE(base64::decode("Z=g=").has_value());
    }
}
