#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>
#include <string_view>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

bool parse_port(const char* value, uint16_t& out) {
    std::string_view s(value);
    unsigned port = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), port);
    if (ec != std::errc{} || ptr != s.data() + s.size() || port == 0 || port > 65535) {
        return false;
    }
    out = static_cast<uint16_t>(port);
    return true;
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("host")) cfg.backend.host = b["host"].get<std::string>();
            if (b.contains("port")) cfg.backend.port = b["port"].get<uint16_t>();
            if (b.contains("connect_timeout_ms")) cfg.backend.connect_timeout_ms = b["connect_timeout_ms"].get<uint32_t>();
            if (b.contains("io_timeout_ms")) cfg.backend.io_timeout_ms = b["io_timeout_ms"].get<uint32_t>();
            if (b.contains("retry_backoff_ms")) cfg.backend.retry_backoff_ms = b["retry_backoff_ms"].get<uint32_t>();
            if (b.contains("max_dial_attempts")) cfg.backend.max_dial_attempts = b["max_dial_attempts"].get<int>();
            if (b.contains("max_frame_bytes")) cfg.backend.max_frame_bytes = b["max_frame_bytes"].get<uint64_t>();
        }

        if (j.contains("server")) {
            auto& s = j["server"];
            if (s.contains("bind")) cfg.server.bind = s["bind"].get<std::string>();
            if (s.contains("port")) cfg.server.port = s["port"].get<uint16_t>();
            if (s.contains("max_upload_bytes")) cfg.server.max_upload_bytes = s["max_upload_bytes"].get<size_t>();
            if (s.contains("upload_mode")) cfg.server.upload_mode = s["upload_mode"].get<std::string>();
            if (s.contains("upload_dir")) cfg.server.upload_dir = s["upload_dir"].get<std::string>();
            if (s.contains("static_dir")) cfg.server.static_dir = s["static_dir"].get<std::string>();
        }

        if (j.contains("defaults")) {
            auto& d = j["defaults"];
            if (d.contains("model")) cfg.defaults.model = d["model"].get<std::string>();
            if (d.contains("task")) cfg.defaults.task = d["task"].get<std::string>();
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("enabled")) cfg.history.enabled = h["enabled"].get<bool>();
            if (h.contains("path")) cfg.history.path = h["path"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    if (cfg.server.upload_mode != "bytes" && cfg.server.upload_mode != "path") {
        std::println(stderr, "config: unknown upload_mode '{}', using 'bytes'",
                     cfg.server.upload_mode);
        cfg.server.upload_mode = "bytes";
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

void Config::apply_env() {
    if (const char* host = std::getenv("WHISPER_HOST"); host && *host) {
        backend.host = host;
    }
    if (const char* port = std::getenv("WHISPER_PORT"); port && *port) {
        if (!parse_port(port, backend.port)) {
            std::println(stderr, "config: ignoring invalid WHISPER_PORT '{}'", port);
        }
    }
    if (const char* port = std::getenv("SERVER_PORT"); port && *port) {
        if (!parse_port(port, server.port)) {
            std::println(stderr, "config: ignoring invalid SERVER_PORT '{}'", port);
        }
    }
}
