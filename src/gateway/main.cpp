#include "config.hpp"
#include "http/http_server.hpp"
#include "platform/daemonizer.hpp"
#include "platform/platform_paths.hpp"
#include "storage/history_db.hpp"
#include "whisper/rpc_client.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <print>
#include <pthread.h>
#include <signal.h>
#include <string>
#include <thread>

namespace fs = std::filesystem;

static std::string history_path(const Config& config) {
    if (!config.history.path.empty()) return config.history.path;
    auto dir = platform::data_dir();
    if (dir.empty()) return {};
    return (fs::path(dir) / "history.db").string();
}

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: whisper-gateway [options]");
            std::println("Options:");
            std::println("  -f, --foreground    Run in foreground (don't daemonize)");
            std::println("  -v, --verbose       Log every request");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -h, --help          Show this help");
            std::println("Environment: WHISPER_HOST, WHISPER_PORT, SERVER_PORT");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            return 1;
        }
    }

    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }
    config.apply_env();

    if (!foreground && !platform::daemonize()) {
        return 1;
    }

    // Block before any thread exists so only the signal waiter receives them.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &mask, nullptr);

    if (verbose && foreground) {
        std::println(stderr, "[whisper-gateway] Starting (backend: {}:{}, http: {}:{})",
                     config.backend.host, config.backend.port, config.server.bind,
                     config.server.port);
    }

    RpcClient client(RpcClientOptions{
        .connection = {
            .host = config.backend.host,
            .port = config.backend.port,
            .connect_timeout = std::chrono::milliseconds(config.backend.connect_timeout_ms),
            .retry_backoff = std::chrono::milliseconds(config.backend.retry_backoff_ms),
            .max_attempts = config.backend.max_dial_attempts,
        },
        .io_timeout = std::chrono::milliseconds(config.backend.io_timeout_ms),
        .max_frame_bytes = config.backend.max_frame_bytes,
        .verbose = verbose,
    });

    HistoryDb history;
    HistoryDb* history_ptr = nullptr;
    if (config.history.enabled) {
        auto path = history_path(config);
        if (!path.empty() && history.open(path)) {
            history_ptr = &history;
        } else {
            std::println(stderr, "Warning: history DB failed to open, history disabled");
        }
    }

    HttpServer server(client, history_ptr, HttpServerOptions{
        .bind = config.server.bind,
        .port = config.server.port,
        .max_upload_bytes = config.server.max_upload_bytes,
        .upload_to_path = config.server.upload_mode == "path",
        .upload_dir = config.server.upload_dir,
        .static_dir = config.server.static_dir,
        .default_model = config.defaults.model,
        .default_task = config.defaults.task,
        .verbose = verbose,
    });
    if (!server.start()) {
        std::println(stderr, "Failed to start HTTP server");
        return 1;
    }

    std::atomic<bool> signalled{false};
    std::jthread signal_waiter([&] {
        int sig = 0;
        if (sigwait(&mask, &sig) == 0 && !signalled.exchange(true)) {
            if (verbose) std::println(stderr, "[whisper-gateway] Received signal {}, shutting down", sig);
            server.stop();
        }
    });

    server.run();

    // run() can also end on its own; wake the waiter so it can be joined.
    if (!signalled.exchange(true)) {
        pthread_kill(signal_waiter.native_handle(), SIGTERM);
    }
    signal_waiter.join();

    client.close();
    return 0;
}
