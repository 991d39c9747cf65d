#include "socket_wrapper.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <format>
#include <limits>

namespace segread {

class Socket::Impl {
public:
    int fd = -1;
    std::optional<Deadline> deadline;

    ~Impl() { if (fd >= 0) ::close(fd); }

    // -1 means wait forever
    int remaining_ms() const {
        if (!deadline) return -1;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) return 0;
        return static_cast<int>(std::min<int64_t>(left.count(), std::numeric_limits<int>::max()));
    }

    std::expected<void, SocketErrorInfo> wait_for(short events) {
        while (true) {
            int timeout = remaining_ms();
            if (timeout == 0) {
                return std::unexpected(SocketErrorInfo{SocketError::TimeoutError, "Deadline exceeded"});
            }
            pollfd pfd{fd, events, 0};
            int rc = ::poll(&pfd, 1, timeout);
            if (rc > 0) return {};
            if (rc == 0) {
                return std::unexpected(SocketErrorInfo{SocketError::TimeoutError, "Deadline exceeded"});
            }
            if (errno != EINTR) {
                return std::unexpected(SocketErrorInfo{SocketError::ReadError,
                    std::format("poll failed: {}", strerror(errno))});
            }
        }
    }
};

Socket::Socket() : pImpl_(std::make_unique<Impl>()) {}
Socket::~Socket() = default;
Socket::Socket(Socket&&) noexcept = default;
Socket& Socket::operator=(Socket&&) noexcept = default;

void Socket::set_deadline(std::optional<Deadline> deadline) {
    pImpl_->deadline = deadline;
}

bool Socket::is_open() const {
    return pImpl_->fd >= 0;
}

void Socket::close() {
    if (pImpl_->fd >= 0) {
        ::close(pImpl_->fd);
        pImpl_->fd = -1;
    }
}

int Socket::fd() const {
    return pImpl_->fd;
}

std::expected<void, SocketErrorInfo> Socket::wait_readable() {
    return pImpl_->wait_for(POLLIN);
}

std::expected<void, SocketErrorInfo> Socket::wait_writable() {
    return pImpl_->wait_for(POLLOUT);
}

std::expected<void, SocketErrorInfo> Socket::connect(const std::string& host, uint16_t port) {
    close();

    addrinfo hints{}, *result = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    if (getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &result) != 0) {
        return std::unexpected(SocketErrorInfo{SocketError::DNSError,
            std::format("Failed to resolve host: {}", host)});
    }

    std::string last_error = "no addresses";
    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = strerror(errno);
            continue;
        }
        pImpl_->fd = fd;

        int flag = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            freeaddrinfo(result);
            return {};
        }
        if (errno == EINPROGRESS) {
            auto ready = wait_writable();
            if (!ready) {
                freeaddrinfo(result);
                close();
                if (ready.error().error == SocketError::TimeoutError) {
                    return std::unexpected(SocketErrorInfo{SocketError::TimeoutError,
                        std::format("Connection to {}:{} timed out", host, port)});
                }
                return std::unexpected(ready.error());
            }
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
            if (so_error == 0) {
                freeaddrinfo(result);
                return {};
            }
            last_error = strerror(so_error);
        } else {
            last_error = strerror(errno);
        }
        close();
    }

    freeaddrinfo(result);
    return std::unexpected(SocketErrorInfo{SocketError::ConnectionFailed,
        std::format("Connection failed to {}:{}: {}", host, port, last_error)});
}

std::expected<size_t, SocketErrorInfo> Socket::write(std::span<const char> data) {
    if (pImpl_->fd < 0) {
        return std::unexpected(SocketErrorInfo{SocketError::WriteError, "Socket not connected"});
    }

    while (true) {
        ssize_t sent = ::send(pImpl_->fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (sent >= 0) return static_cast<size_t>(sent);
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            auto ready = wait_writable();
            if (!ready) return std::unexpected(ready.error());
            continue;
        }
        return std::unexpected(SocketErrorInfo{SocketError::WriteError,
            std::format("Write failed: {}", strerror(errno))});
    }
}

std::expected<size_t, SocketErrorInfo> Socket::read(std::span<char> buffer) {
    if (pImpl_->fd < 0) {
        return std::unexpected(SocketErrorInfo{SocketError::ReadError, "Socket not connected"});
    }

    while (true) {
        ssize_t received = ::recv(pImpl_->fd, buffer.data(), buffer.size(), 0);
        if (received >= 0) return static_cast<size_t>(received);
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            auto ready = wait_readable();
            if (!ready) return std::unexpected(ready.error());
            continue;
        }
        return std::unexpected(SocketErrorInfo{SocketError::ReadError,
            std::format("Read failed: {}", strerror(errno))});
    }
}

std::expected<void, SocketErrorInfo> write_all(ISocket& socket, std::span<const char> data) {
    while (!data.empty()) {
        auto sent = socket.write(data);
        if (!sent) return std::unexpected(sent.error());
        if (*sent == 0) return std::unexpected(SocketErrorInfo{SocketError::Closed, "Connection closed during write"});
        data = data.subspan(*sent);
    }
    return {};
}

std::expected<void, SocketErrorInfo> read_exact(ISocket& socket, std::span<char> buffer) {
    while (!buffer.empty()) {
        auto received = socket.read(buffer);
        if (!received) return std::unexpected(received.error());
        if (*received == 0) return std::unexpected(SocketErrorInfo{SocketError::Closed, "Connection closed by peer"});
        buffer = buffer.subspan(*received);
    }
    return {};
}

} // namespace segread
