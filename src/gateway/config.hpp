#pragma once

#include <cstdint>
#include <string>

struct Config {
    struct Backend {
        std::string host = "127.0.0.1";
        uint16_t port = 9000;
        uint32_t connect_timeout_ms = 5000;
        uint32_t io_timeout_ms = 30 * 60 * 1000;
        uint32_t retry_backoff_ms = 2000;
        int max_dial_attempts = 3;
        uint64_t max_frame_bytes = uint64_t(1) << 30;
    } backend;

    struct Server {
        std::string bind = "0.0.0.0";
        uint16_t port = 8080;
        size_t max_upload_bytes = 20 << 20;
        std::string upload_mode = "bytes"; // "bytes" or "path"
        std::string upload_dir;            // empty = system temp dir
        std::string static_dir = "./static";
    } server;

    struct Defaults {
        std::string model = "base";
        std::string task = "transcribe";
    } defaults;

    struct History {
        bool enabled = true;
        std::string path; // empty = data dir
    } history;

    static Config load(const std::string& path);
    static Config load_default();

    // WHISPER_HOST, WHISPER_PORT and SERVER_PORT override the file.
    void apply_env();
};
