#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

struct GatewayReply {
    long status = 0;
    nlohmann::json body;
};

// HTTP client for the gateway's /api endpoints.
class GatewayClient {
public:
    explicit GatewayClient(std::string base_url, long timeout_s = 30 * 60);
    ~GatewayClient();

    GatewayClient(const GatewayClient&) = delete;
    GatewayClient& operator=(const GatewayClient&) = delete;

    std::expected<GatewayReply, std::string> get(const std::string& path);

    // Empty model/language/task are not sent and the gateway defaults apply.
    std::expected<GatewayReply, std::string>
        transcribe(const std::string& file_path, const std::string& model,
                   const std::string& language, const std::string& task);

    // Default base URL: $WHISPER_GATEWAY_URL or http://localhost:8080
    static std::string default_url();

private:
    std::string base_url_;
    long timeout_s_;
};
