#include "platform/linux/tcp_stream.hpp"

#include <cerrno>
#include <cstring>
#include <format>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

int remaining_ms(ByteStream::Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - ByteStream::Clock::now());
    if (left.count() <= 0) return 0;
    if (left.count() > INT32_MAX) return INT32_MAX;
    return static_cast<int>(left.count());
}

void configure_socket(int fd) {
    int nodelay = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

    int keepalive = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));
}

} // namespace

std::expected<std::unique_ptr<ByteStream>, RpcError>
TcpStream::dial(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* res = nullptr;
    auto port_str = std::to_string(port);
    int err = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (err != 0 || res == nullptr) {
        return std::unexpected(RpcError::connection(
            std::format("cannot resolve {}: {}", host, ::gai_strerror(err))));
    }

    auto deadline = Clock::now() + timeout;
    bool timed_out = false;
    std::string last_error = "no usable address";

    for (addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
        int fd = ::socket(rp->ai_family, rp->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                          rp->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }

        if (::connect(fd, rp->ai_addr, rp->ai_addrlen) < 0) {
            if (errno != EINPROGRESS) {
                last_error = std::strerror(errno);
                ::close(fd);
                continue;
            }

            pollfd pfd{.fd = fd, .events = POLLOUT, .revents = 0};
            int ret;
            do {
                ret = ::poll(&pfd, 1, remaining_ms(deadline));
            } while (ret < 0 && errno == EINTR);

            if (ret == 0) {
                timed_out = true;
                last_error = "connect timed out";
                ::close(fd);
                continue;
            }
            if (ret < 0) {
                last_error = std::strerror(errno);
                ::close(fd);
                continue;
            }

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
            if (so_error != 0) {
                last_error = std::strerror(so_error);
                ::close(fd);
                continue;
            }
        }

        ::freeaddrinfo(res);
        configure_socket(fd);
        return std::make_unique<TcpStream>(fd);
    }

    ::freeaddrinfo(res);
    auto msg = std::format("connect to {}:{} failed: {}", host, port, last_error);
    if (timed_out) return std::unexpected(RpcError::timeout(std::move(msg)));
    return std::unexpected(RpcError::connection(std::move(msg)));
}

TcpStream::TcpStream(int fd) : fd_(fd) {}

TcpStream::~TcpStream() {
    close();
}

std::expected<bool, RpcError> TcpStream::wait(short events, Clock::time_point deadline) {
    pollfd pfd{.fd = fd_, .events = events, .revents = 0};
    while (true) {
        int ret = ::poll(&pfd, 1, remaining_ms(deadline));
        if (ret > 0) return true;
        if (ret == 0) return false;
        if (errno != EINTR) {
            return std::unexpected(RpcError::io(std::format("poll: {}", std::strerror(errno))));
        }
    }
}

std::expected<void, RpcError>
TcpStream::write_all(std::span<const uint8_t> data, Clock::time_point deadline) {
    if (fd_ < 0) return std::unexpected(RpcError::io("stream is closed"));

    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            auto ready = wait(POLLOUT, deadline);
            if (!ready) return std::unexpected(ready.error());
            if (!*ready) {
                return std::unexpected(RpcError::timeout(
                    std::format("write timed out after {} of {} bytes", sent, data.size())));
            }
            continue;
        }
        return std::unexpected(RpcError::io(std::format("send: {}", std::strerror(errno))));
    }
    return {};
}

std::expected<size_t, RpcError>
TcpStream::read_some(std::span<uint8_t> out, Clock::time_point deadline) {
    if (fd_ < 0) return std::unexpected(RpcError::io("stream is closed"));
    if (out.empty()) return 0;

    while (true) {
        ssize_t n = ::recv(fd_, out.data(), out.size(), 0);
        if (n >= 0) return static_cast<size_t>(n);
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            auto ready = wait(POLLIN, deadline);
            if (!ready) return std::unexpected(ready.error());
            if (!*ready) return std::unexpected(RpcError::timeout("read timed out"));
            continue;
        }
        return std::unexpected(RpcError::io(std::format("recv: {}", std::strerror(errno))));
    }
}

bool TcpStream::is_alive() {
    if (fd_ < 0) return false;

    pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
    int ret;
    do {
        ret = ::poll(&pfd, 1, 0);
    } while (ret < 0 && errno == EINTR);
    if (ret == 0) return true;
    if (ret < 0 || (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))) return false;

    // Readable between calls: either EOF or bytes nobody asked for.
    char c;
    ssize_t n = ::recv(fd_, &c, 1, MSG_PEEK | MSG_DONTWAIT);
    return n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK);
}

void TcpStream::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}
