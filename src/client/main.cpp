#include "gateway_client.hpp"

#include <algorithm>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [--url URL] <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  transcribe FILE [--model M] [--language L] [--task transcribe|translate]");
    std::println(stderr, "  models                            List available and loaded models");
    std::println(stderr, "  health                            Check the gateway");
    std::println(stderr, "  metrics                           Show backend call counters");
    std::println(stderr, "  history [--limit N]               Show recent transcriptions");
}

int main(int argc, char* argv[]) {
    std::string url = GatewayClient::default_url();
    std::string command;
    std::string file;
    std::string model;
    std::string language;
    std::string task;
    int limit = 10;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--url" && i + 1 < argc) {
            url = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            model = argv[++i];
        } else if (arg == "--language" && i + 1 < argc) {
            language = argv[++i];
        } else if (arg == "--task" && i + 1 < argc) {
            task = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (command.empty()) {
            command = arg;
        } else if (command == "transcribe" && file.empty()) {
            file = arg;
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    if (command.empty()) {
        usage(argv[0]);
        return 1;
    }

    GatewayClient client(url);
    std::expected<GatewayReply, std::string> reply;

    if (command == "transcribe") {
        if (file.empty()) {
            usage(argv[0]);
            return 1;
        }
        reply = client.transcribe(file, model, language, task);
    } else if (command == "models") {
        reply = client.get("/api/models");
    } else if (command == "health") {
        reply = client.get("/api/health");
    } else if (command == "metrics") {
        reply = client.get("/api/metrics");
    } else if (command == "history") {
        reply = client.get("/api/history?limit=" + std::to_string(limit));
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    if (!reply) {
        std::println(stderr, "Failed to reach gateway at {}: {}", url, reply.error());
        return 1;
    }

    const auto& body = reply->body;
    if (reply->status != 200) {
        std::println(stderr, "Error ({}): {}", reply->status, body.value("error", "unknown error"));
        return 1;
    }

    if (command == "transcribe") {
        std::println("{}", body.value("text", ""));
        std::println(stderr, "[{}] {:.1f}s", body.value("language", "?"),
                     body.value("processing_time", 0.0));
    } else if (command == "models") {
        auto loaded = body.value("loaded_models", json::array());
        auto available = body.value("available_models", json::object());
        for (auto& [name, desc] : available.items()) {
            bool is_loaded = std::find(loaded.begin(), loaded.end(), name) != loaded.end();
            std::println("{} {:<8} {}", is_loaded ? '*' : ' ', name, desc.get<std::string>());
        }
    } else if (command == "health") {
        std::println("{} (version {}, {})", body.value("status", "unknown"),
                     body.value("version", "?"), body.value("server_time", ""));
    } else if (command == "metrics") {
        std::println("Requests:        {}", body.value("requests_total", 0));
        std::println("Errors:          {}", body.value("errors_total", 0));
        std::println("Processing time: {} ms", body.value("processing_time_ms", 0));
    } else if (command == "history") {
        for (auto& entry : body.value("entries", json::array())) {
            std::println("[{}] {}", entry.value("timestamp", ""), entry.value("text", ""));
            if (!entry.value("source", "").empty()) {
                std::println("  Source: {} ({}, {})", entry["source"].get<std::string>(),
                             entry.value("model", "?"), entry.value("language", "?"));
            }
        }
    }

    return 0;
}
