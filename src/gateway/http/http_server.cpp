#include "http_server.hpp"
#include "multipart.hpp"

#include <boost/asio/ip/address.hpp>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <poll.h>
#include <print>
#include <sstream>
#include <sys/socket.h>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* VERSION = "1.0.0";
constexpr int ACCEPT_POLL_MS = 500;
constexpr int IDLE_TIMEOUT_MS = 60 * 1000;
// Room for multipart headers and small form fields around the file part.
constexpr size_t MULTIPART_OVERHEAD = 64 * 1024;

std::string_view to_sv(beast::string_view s) {
    return {s.data(), s.size()};
}

HttpResponse json_response(const HttpRequest& req, http::status status, const json& body) {
    HttpResponse res{status, req.version()};
    res.set(http::field::content_type, "application/json; charset=utf-8");
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

HttpResponse error_response(const HttpRequest& req, http::status status, const std::string& msg) {
    return json_response(req, status, {{"error", msg}});
}

void add_cors(HttpResponse& res) {
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers,
            "Content-Type, Content-Length, Accept-Encoding, Authorization");
}

std::string form_value(const std::vector<multipart::Part>& parts, std::string_view name,
                       const std::string& fallback) {
    auto* part = multipart::find(parts, name);
    if (!part || part->data.empty()) return fallback;
    return part->data;
}

std::optional<std::string> query_param(std::string_view query, std::string_view key) {
    while (!query.empty()) {
        auto amp = query.find('&');
        auto item = query.substr(0, amp);
        auto eq = item.find('=');
        if (eq != std::string_view::npos && item.substr(0, eq) == key) {
            return std::string(item.substr(eq + 1));
        }
        if (amp == std::string_view::npos) break;
        query.remove_prefix(amp + 1);
    }
    return std::nullopt;
}

const char* mime_type(const fs::path& path) {
    auto ext = path.extension().string();
    if (ext == ".html" || ext == ".htm") return "text/html; charset=utf-8";
    if (ext == ".js") return "application/javascript";
    if (ext == ".css") return "text/css";
    if (ext == ".json") return "application/json";
    if (ext == ".png") return "image/png";
    if (ext == ".svg") return "image/svg+xml";
    if (ext == ".ico") return "image/x-icon";
    return "application/octet-stream";
}

// Upload persisted for the backend to read; removed when it goes out of scope.
class TempUpload {
public:
    TempUpload(const std::string& dir, const std::string& original_name) {
        auto ext = fs::path(original_name).extension().string();
        if (ext.size() > 16) ext.clear();
        auto tmpl = (fs::path(dir) / ("whisper-upload-XXXXXX" + ext)).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        fd_ = ::mkstemps(buf.data(), static_cast<int>(ext.size()));
        if (fd_ < 0) {
            error_ = std::strerror(errno);
            return;
        }
        path_.assign(buf.data());
        // The backend reads the file as its own user.
        if (::fchmod(fd_, 0644) < 0) error_ = std::strerror(errno);
    }

    ~TempUpload() {
        if (fd_ >= 0) ::close(fd_);
        if (!path_.empty()) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    TempUpload(const TempUpload&) = delete;
    TempUpload& operator=(const TempUpload&) = delete;

    bool write(const std::string& data) {
        if (fd_ < 0 || !error_.empty()) return false;
        size_t done = 0;
        while (done < data.size()) {
            ssize_t n = ::write(fd_, data.data() + done, data.size() - done);
            if (n < 0 && errno == EINTR) continue;
            if (n < 0) {
                error_ = std::strerror(errno);
                return false;
            }
            if (n == 0) {
                error_ = "short write";
                return false;
            }
            done += static_cast<size_t>(n);
        }
        int rc = ::close(fd_);
        fd_ = -1;
        if (rc < 0) {
            error_ = std::strerror(errno);
            return false;
        }
        return true;
    }

    const std::string& path() const { return path_; }
    const std::string& error() const { return error_; }

private:
    int fd_ = -1;
    std::string path_;
    std::string error_;
};

// Waits for the first request bytes. False on timeout, error or a closed peer
// that sent nothing.
bool wait_for_request(int fd, int timeout_ms) {
    pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
    int ret;
    do {
        ret = ::poll(&pfd, 1, timeout_ms);
    } while (ret < 0 && errno == EINTR);
    return ret > 0 && (pfd.revents & POLLIN);
}

} // namespace

http::status status_for(RpcErrorKind kind) {
    switch (kind) {
        case RpcErrorKind::InvalidArgument: return http::status::bad_request;
        case RpcErrorKind::Cancelled: return http::status::service_unavailable;
        case RpcErrorKind::Connection: return http::status::service_unavailable;
        case RpcErrorKind::Timeout: return http::status::gateway_timeout;
        case RpcErrorKind::Io: return http::status::bad_gateway;
        case RpcErrorKind::Protocol: return http::status::bad_gateway;
        case RpcErrorKind::Application: return http::status::internal_server_error;
    }
    return http::status::internal_server_error;
}

HttpServer::HttpServer(TranscriptionBackend& backend, HistoryDb* history, HttpServerOptions opts)
    : backend_(backend), history_(history), opts_(std::move(opts)), acceptor_(ioc_) {}

HttpServer::~HttpServer() {
    stop();
    std::unique_lock lock(sessions_mutex_);
    sessions_done_.wait(lock, [this] { return active_sessions_ == 0; });
}

bool HttpServer::start() {
    beast::error_code ec;
    auto address = boost::asio::ip::make_address(opts_.bind, ec);
    if (ec) {
        std::println(stderr, "http: invalid bind address {}: {}", opts_.bind, ec.message());
        return false;
    }
    tcp::endpoint ep{address, opts_.port};

    acceptor_.open(ep.protocol(), ec);
    if (ec) {
        std::println(stderr, "http: open failed: {}", ec.message());
        return false;
    }
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    acceptor_.bind(ep, ec);
    if (ec) {
        std::println(stderr, "http: bind {}:{} failed: {}", opts_.bind, opts_.port, ec.message());
        acceptor_.close(ec);
        return false;
    }
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        std::println(stderr, "http: listen failed: {}", ec.message());
        acceptor_.close(ec);
        return false;
    }

    bound_port_ = acceptor_.local_endpoint(ec).port();
    running_.store(true, std::memory_order_release);
    log(std::format("listening on {}:{}", opts_.bind, bound_port_));
    return true;
}

void HttpServer::run() {
    while (running_.load(std::memory_order_acquire)) {
        // Poll so stop() is noticed without closing the acceptor under accept().
        pollfd pfd{.fd = acceptor_.native_handle(), .events = POLLIN, .revents = 0};
        int ret = ::poll(&pfd, 1, ACCEPT_POLL_MS);
        if (ret < 0 && errno != EINTR) {
            std::println(stderr, "http: poll failed: {}", std::strerror(errno));
            break;
        }
        if (ret <= 0) continue;

        beast::error_code ec;
        auto socket = std::make_unique<tcp::socket>(ioc_);
        acceptor_.accept(*socket, ec);
        if (ec) {
            std::println(stderr, "http: accept error: {}", ec.message());
            continue;
        }

        {
            std::lock_guard lock(sessions_mutex_);
            ++active_sessions_;
            int fd = socket->native_handle();
            session_fds_.insert(fd);
            if (stopping_) ::shutdown(fd, SHUT_RD);
        }
        std::thread([this, s = std::move(socket)]() mutable {
            handle_session(std::move(s));
        }).detach();
    }

    beast::error_code ec;
    acceptor_.close(ec);

    std::unique_lock lock(sessions_mutex_);
    if (active_sessions_ > 0) {
        log(std::format("waiting for {} request(s) to finish", active_sessions_));
    }
    sessions_done_.wait(lock, [this] { return active_sessions_ == 0; });
}

void HttpServer::stop() {
    running_.store(false, std::memory_order_release);
    shutdown_.request_stop();

    // Wake sessions blocked reading; responses can still be written.
    std::lock_guard lock(sessions_mutex_);
    stopping_ = true;
    for (int fd : session_fds_) ::shutdown(fd, SHUT_RD);
}

void HttpServer::handle_session(std::unique_ptr<tcp::socket> socket) {
    int fd = socket->native_handle();
    if (wait_for_request(fd, IDLE_TIMEOUT_MS)) {
        serve_request(*socket);
    } else {
        log("closing idle connection");
    }

    // The socket must be gone before the server can observe zero sessions.
    std::lock_guard lock(sessions_mutex_);
    session_fds_.erase(fd);
    socket.reset();
    --active_sessions_;
    sessions_done_.notify_all();
}

void HttpServer::serve_request(tcp::socket& socket) {
    beast::flat_buffer buffer;
    beast::error_code ec;
    http::request_parser<http::string_body> parser;
    parser.body_limit(opts_.max_upload_bytes + MULTIPART_OVERHEAD);

    http::read(socket, buffer, parser, ec);

    HttpResponse res;
    if (ec == http::error::body_limit) {
        HttpRequest req;
        res = error_response(req, http::status::payload_too_large,
                             std::format("upload exceeds {} bytes", opts_.max_upload_bytes));
        add_cors(res);
    } else if (ec) {
        log(std::format("read error: {}", ec.message()));
    } else {
        res = handle(parser.get());
    }

    if (!ec || ec == http::error::body_limit) {
        res.keep_alive(false);
        http::write(socket, res, ec);
        if (ec) log(std::format("write error: {}", ec.message()));
    }
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

HttpResponse HttpServer::handle(const HttpRequest& req) {
    auto start = std::chrono::steady_clock::now();
    std::string_view target = to_sv(req.target());
    auto qmark = target.find('?');
    std::string_view path = target.substr(0, qmark);
    std::string_view query = qmark == std::string_view::npos ? "" : target.substr(qmark + 1);

    HttpResponse res;
    try {
        res = route(req, path, query);
    } catch (const std::exception& e) {
        std::println(stderr, "http: {} {} failed: {}", to_sv(req.method_string()), path, e.what());
        res = error_response(req, http::status::internal_server_error, "internal error");
    }

    add_cors(res);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    log(std::format("{} {} -> {} ({} ms)", to_sv(req.method_string()), path,
                    res.result_int(), elapsed.count()));
    return res;
}

HttpResponse HttpServer::route(const HttpRequest& req, std::string_view path,
                               std::string_view query) {
    auto method = req.method();
    auto not_allowed = [&req] {
        return error_response(req, http::status::method_not_allowed, "method not allowed");
    };

    if (method == http::verb::options) {
        HttpResponse res{http::status::no_content, req.version()};
        res.prepare_payload();
        return res;
    } else if (path == "/api/health") {
        return method == http::verb::get ? handle_health(req) : not_allowed();
    } else if (path == "/api/models") {
        return method == http::verb::get ? handle_models(req) : not_allowed();
    } else if (path == "/api/transcribe") {
        return method == http::verb::post ? handle_transcribe(req) : not_allowed();
    } else if (path == "/api/metrics") {
        return method == http::verb::get ? handle_metrics(req) : not_allowed();
    } else if (path == "/api/history") {
        return method == http::verb::get ? handle_history(req, query) : not_allowed();
    } else if (method == http::verb::get && (path == "/" || path.starts_with("/static/"))) {
        return handle_static(req, path);
    }
    return error_response(req, http::status::not_found, "not found");
}

HttpResponse HttpServer::handle_health(const HttpRequest& req) {
    auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    return json_response(req, http::status::ok,
                         {{"status", "ok"},
                          {"server_time", std::format("{:%FT%TZ}", now)},
                          {"version", VERSION}});
}

HttpResponse HttpServer::handle_models(const HttpRequest& req) {
    auto models = backend_.list_models(shutdown_.get_token());
    if (!models) {
        return error_response(req, status_for(models.error().kind),
                              "failed to list models: " + models.error().message);
    }
    return json_response(req, http::status::ok, *models);
}

HttpResponse HttpServer::handle_transcribe(const HttpRequest& req) {
    auto boundary = multipart::boundary_from_content_type(to_sv(req[http::field::content_type]));
    if (!boundary) {
        return error_response(req, http::status::bad_request, "expected multipart/form-data");
    }

    auto parts = multipart::parse(req.body(), *boundary);
    if (!parts) {
        return error_response(req, http::status::bad_request, "malformed upload: " + parts.error());
    }

    auto* file = multipart::find(*parts, "file");
    if (!file) {
        return error_response(req, http::status::bad_request, "file not found in request");
    }
    if (file->data.size() > opts_.max_upload_bytes) {
        return error_response(req, http::status::payload_too_large,
                              std::format("upload exceeds {} bytes", opts_.max_upload_bytes));
    }

    TranscribeParams params{
        .model = form_value(*parts, "model", opts_.default_model),
        .language = protocol::normalize_language(form_value(*parts, "language", "")),
        .task = form_value(*parts, "task", opts_.default_task),
    };
    if (!protocol::is_valid_task(params.task)) {
        return error_response(req, http::status::bad_request,
                              "task must be 'transcribe' or 'translate'");
    }

    auto start = std::chrono::steady_clock::now();
    auto result = opts_.upload_to_path
        ? transcribe_via_file(file->data, file->filename, params)
        : backend_.transcribe_bytes(
              std::span(reinterpret_cast<const uint8_t*>(file->data.data()), file->data.size()),
              params, shutdown_.get_token());
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (!result) {
        return error_response(req, status_for(result.error().kind),
                              "transcription failed: " + result.error().message);
    }

    result->processing_time = elapsed;
    if (history_ && !history_->insert(*result, params, file->filename, file->data.size(), elapsed)) {
        std::println(stderr, "http: could not record transcription in history");
    }
    return json_response(req, http::status::ok, *result);
}

std::expected<TranscriptionResult, RpcError>
HttpServer::transcribe_via_file(const std::string& data, const std::string& filename,
                                const TranscribeParams& params) {
    auto dir = opts_.upload_dir.empty() ? fs::temp_directory_path().string() : opts_.upload_dir;
    TempUpload upload(dir, filename);
    if (!upload.write(data)) {
        return std::unexpected(RpcError::io(
            std::format("cannot store upload in {}: {}", dir, upload.error())));
    }
    return backend_.transcribe_path(upload.path(), params, shutdown_.get_token());
}

HttpResponse HttpServer::handle_metrics(const HttpRequest& req) {
    auto m = backend_.metrics();
    return json_response(req, http::status::ok,
                         {{"requests_total", m.requests_total},
                          {"errors_total", m.errors_total},
                          {"processing_time_ms", m.processing_time_ms}});
}

HttpResponse HttpServer::handle_history(const HttpRequest& req, std::string_view query) {
    if (!history_ || !history_->is_open()) {
        return error_response(req, http::status::service_unavailable, "history is disabled");
    }

    int limit = 10;
    if (auto value = query_param(query, "limit")) {
        auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), limit);
        if (ec != std::errc{} || ptr != value->data() + value->size() || limit <= 0) {
            return error_response(req, http::status::bad_request, "limit must be a positive integer");
        }
        limit = std::min(limit, 100);
    }

    json entries = json::array();
    for (auto& e : history_->recent(limit)) {
        entries.push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"text", e.text},
            {"language", e.language},
            {"model", e.model},
            {"task", e.task},
            {"source", e.source},
            {"audio_bytes", e.audio_bytes},
            {"processing_time", e.processing_time},
        });
    }
    return json_response(req, http::status::ok, {{"entries", entries}});
}

HttpResponse HttpServer::handle_static(const HttpRequest& req, std::string_view path) {
    std::error_code ec;
    auto root = fs::weakly_canonical(opts_.static_dir, ec);
    if (ec) return error_response(req, http::status::not_found, "not found");

    fs::path rel = path == "/" ? fs::path("index.html")
                               : fs::path(std::string(path.substr(std::string_view("/static/").size())));
    auto file = fs::weakly_canonical(root / rel, ec);
    bool inside = !ec && std::mismatch(root.begin(), root.end(), file.begin(), file.end()).first == root.end();
    if (!inside || !fs::is_regular_file(file, ec)) {
        return error_response(req, http::status::not_found, "not found");
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) return error_response(req, http::status::not_found, "not found");
    std::ostringstream contents;
    contents << in.rdbuf();

    HttpResponse res{http::status::ok, req.version()};
    res.set(http::field::content_type, mime_type(file));
    res.body() = contents.str();
    res.prepare_payload();
    return res;
}

void HttpServer::log(const std::string& msg) {
    if (opts_.verbose) {
        std::println(stderr, "http: {}", msg);
    }
}
