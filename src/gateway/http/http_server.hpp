#pragma once

#include "storage/history_db.hpp"
#include "whisper/backend.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <stop_token>
#include <string>

namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

struct HttpServerOptions {
    std::string bind = "0.0.0.0";
    uint16_t port = 8080; // 0 picks a free port
    size_t max_upload_bytes = 20 << 20;
    bool upload_to_path = false; // hand uploads to the backend as files in upload_dir
    std::string upload_dir;
    std::string static_dir = "./static";
    std::string default_model = "base";
    std::string default_task = "transcribe";
    bool verbose = false;
};

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

http::status status_for(RpcErrorKind kind);

// Blocking HTTP front end: one thread and one request per accepted connection.
class HttpServer {
public:
    // history may be null when history is disabled.
    HttpServer(TranscriptionBackend& backend, HistoryDb* history, HttpServerOptions opts);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool start();
    // Accept loop. Returns after stop() once in-flight requests have finished.
    void run();
    // Also ends sessions still waiting for a request; requests already read are answered.
    void stop();

    uint16_t port() const { return bound_port_; }

    // Route one parsed request. CORS headers are included.
    HttpResponse handle(const HttpRequest& req);

private:
    void handle_session(std::unique_ptr<tcp::socket> socket);
    void serve_request(tcp::socket& socket);
    HttpResponse route(const HttpRequest& req, std::string_view path, std::string_view query);

    HttpResponse handle_health(const HttpRequest& req);
    HttpResponse handle_models(const HttpRequest& req);
    HttpResponse handle_transcribe(const HttpRequest& req);
    HttpResponse handle_metrics(const HttpRequest& req);
    HttpResponse handle_history(const HttpRequest& req, std::string_view query);
    HttpResponse handle_static(const HttpRequest& req, std::string_view path);

    std::expected<TranscriptionResult, RpcError>
        transcribe_via_file(const std::string& data, const std::string& filename,
                            const TranscribeParams& params);

    void log(const std::string& msg);

    TranscriptionBackend& backend_;
    HistoryDb* history_;
    HttpServerOptions opts_;

    boost::asio::io_context ioc_;
    tcp::acceptor acceptor_;
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::stop_source shutdown_;

    std::mutex sessions_mutex_;
    std::condition_variable sessions_done_;
    int active_sessions_ = 0;
    std::set<int> session_fds_;
    bool stopping_ = false;
};
