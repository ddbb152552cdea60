#pragma once

#include "whisper/frame_codec.hpp"

#include <arpa/inet.h>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <netinet/in.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

// Loopback stand-in for the transcription service. Speaks the framed protocol
// on 127.0.0.1 and answers every request through a handler.
class FakeBackend {
public:
    // Return nullopt to drop the connection instead of answering.
    using Handler = std::function<std::optional<std::string>(const nlohmann::json& request)>;

    explicit FakeBackend(Handler handler) : handler_(std::move(handler)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        int one = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(listen_fd_, 16);

        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        acceptor_ = std::thread([this] { accept_loop(); });
    }

    ~FakeBackend() {
        running_.store(false);
        drop_connections();
        if (acceptor_.joinable()) acceptor_.join();
        std::vector<std::thread> workers;
        {
            std::lock_guard lock(mutex_);
            workers.swap(workers_);
        }
        for (auto& w : workers) w.join();
        ::close(listen_fd_);
    }

    FakeBackend(const FakeBackend&) = delete;
    FakeBackend& operator=(const FakeBackend&) = delete;

    uint16_t port() const { return port_; }
    int connections() const { return connections_.load(); }
    int requests() const { return requests_.load(); }
    bool overlap_detected() const { return overlap_.load(); }

    std::vector<nlohmann::json> received() {
        std::lock_guard lock(mutex_);
        return received_;
    }

    // Simulates the service closing every open connection.
    void drop_connections() {
        std::lock_guard lock(mutex_);
        for (int fd : client_fds_) ::shutdown(fd, SHUT_RDWR);
    }

    // Blocks until every connection has been closed on this side.
    bool wait_for_disconnects(std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            {
                std::lock_guard lock(mutex_);
                if (client_fds_.empty()) return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return false;
    }

    // A port on which nothing listens.
    static uint16_t unused_port() {
        int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        socklen_t len = sizeof(addr);
        ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
        ::close(fd);
        return ntohs(addr.sin_port);
    }

private:
    void accept_loop() {
        while (running_.load()) {
            pollfd pfd{.fd = listen_fd_, .events = POLLIN, .revents = 0};
            if (::poll(&pfd, 1, 20) <= 0) continue;

            int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (fd < 0) continue;
            connections_.fetch_add(1);

            std::lock_guard lock(mutex_);
            client_fds_.push_back(fd);
            workers_.emplace_back([this, fd] { serve(fd); });
        }
    }

    bool read_exact(int fd, void* buf, size_t len) {
        auto* p = static_cast<uint8_t*>(buf);
        size_t got = 0;
        while (got < len) {
            ssize_t n = ::recv(fd, p + got, len - got, 0);
            if (n <= 0) return false;
            got += static_cast<size_t>(n);
        }
        return true;
    }

    void serve(int fd) {
        while (running_.load()) {
            std::array<uint8_t, frame::HEADER_SIZE> header{};
            if (!read_exact(fd, header.data(), header.size())) break;
            std::string payload(frame::decode_length(header), '\0');
            if (!read_exact(fd, payload.data(), payload.size())) break;

            auto request = nlohmann::json::parse(payload, nullptr, false);
            requests_.fetch_add(1);
            {
                std::lock_guard lock(mutex_);
                received_.push_back(request);
            }

            auto reply = handler_(request);

            // A client that pipelines would already have its next request queued here.
            char c;
            if (::recv(fd, &c, 1, MSG_PEEK | MSG_DONTWAIT) > 0) overlap_.store(true);

            if (!reply) break;
            auto out = frame::encode(*reply);
            if (::send(fd, out.data(), out.size(), MSG_NOSIGNAL) != static_cast<ssize_t>(out.size())) {
                break;
            }
        }

        std::lock_guard lock(mutex_);
        std::erase(client_fds_, fd);
        ::close(fd);
    }

    Handler handler_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> running_{true};
    std::atomic<int> connections_{0};
    std::atomic<int> requests_{0};
    std::atomic<bool> overlap_{false};

    std::mutex mutex_;
    std::vector<int> client_fds_;
    std::vector<nlohmann::json> received_;
    std::vector<std::thread> workers_;
    std::thread acceptor_;
};
