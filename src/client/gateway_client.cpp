#include "gateway_client.hpp"

#include <cstdlib>
#include <curl/curl.h>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// Runs a prepared handle and decodes the JSON body. Takes ownership of curl and mime.
static std::expected<GatewayReply, std::string>
perform(CURL* curl, curl_mime* mime, const std::string& url, long timeout_s) {
    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    if (mime) curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    if (mime) curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    GatewayReply reply{.status = status, .body = json::parse(response_body, nullptr, false)};
    if (reply.body.is_discarded()) {
        return std::unexpected("unexpected response: " + response_body);
    }
    return reply;
}

GatewayClient::GatewayClient(std::string base_url, long timeout_s)
    : base_url_(std::move(base_url)), timeout_s_(timeout_s) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

GatewayClient::~GatewayClient() {
    curl_global_cleanup();
}

std::expected<GatewayReply, std::string> GatewayClient::get(const std::string& path) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }
    return perform(curl, nullptr, base_url_ + path, timeout_s_);
}

std::expected<GatewayReply, std::string>
GatewayClient::transcribe(const std::string& file_path, const std::string& model,
                          const std::string& language, const std::string& task) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    if (curl_mime_filedata(part, file_path.c_str()) != CURLE_OK) {
        curl_mime_free(mime);
        curl_easy_cleanup(curl);
        return std::unexpected("cannot read " + file_path);
    }

    auto add_field = [mime](const char* name, const std::string& value) {
        if (value.empty()) return;
        curl_mimepart* p = curl_mime_addpart(mime);
        curl_mime_name(p, name);
        curl_mime_data(p, value.c_str(), CURL_ZERO_TERMINATED);
    };
    add_field("model", model);
    add_field("language", language);
    add_field("task", task);

    return perform(curl, mime, base_url_ + "/api/transcribe", timeout_s_);
}

std::string GatewayClient::default_url() {
    const char* env = std::getenv("WHISPER_GATEWAY_URL");
    if (env && *env) return env;
    return "http://localhost:8080";
}
