#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace segread {

enum class SocketError { ConnectionFailed, ReadError, WriteError, TimeoutError, DNSError, Closed };

struct SocketErrorInfo {
    SocketError error;
    std::string message;
};

using Deadline = std::chrono::steady_clock::time_point;

class ISocket {
public:
    virtual ~ISocket() = default;
    virtual std::expected<void, SocketErrorInfo> connect(const std::string& host, uint16_t port) = 0;
    virtual std::expected<size_t, SocketErrorInfo> write(std::span<const char> data) = 0;
    // Returns 0 when the peer closed the connection
    virtual std::expected<size_t, SocketErrorInfo> read(std::span<char> buffer) = 0;
    // Every blocking call after this fails with TimeoutError once the deadline passes
    virtual void set_deadline(std::optional<Deadline> deadline) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

std::expected<void, SocketErrorInfo> write_all(ISocket& socket, std::span<const char> data);
std::expected<void, SocketErrorInfo> read_exact(ISocket& socket, std::span<char> buffer);

class Socket : public ISocket {
public:
    Socket();
    ~Socket() override;

    Socket(Socket&&) noexcept;
    Socket& operator=(Socket&&) noexcept;

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    std::expected<void, SocketErrorInfo> connect(const std::string& host, uint16_t port) override;
    std::expected<size_t, SocketErrorInfo> write(std::span<const char> data) override;
    std::expected<size_t, SocketErrorInfo> read(std::span<char> buffer) override;

    void set_deadline(std::optional<Deadline> deadline) override;
    void close() override;
    bool is_open() const override;
    int fd() const;

    // Blocks until the descriptor is ready or the deadline passes
    std::expected<void, SocketErrorInfo> wait_readable();
    std::expected<void, SocketErrorInfo> wait_writable();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace segread
