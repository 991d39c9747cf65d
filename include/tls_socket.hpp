#pragma once

#include "socket_wrapper.hpp"
#include <filesystem>
#include <openssl/ssl.h>
#include <openssl/err.h>

namespace segread {

class TlsSocket : public ISocket {
public:
    // An empty trust store uses the system's default CA locations
    explicit TlsSocket(std::filesystem::path trust_store = {});
    ~TlsSocket() override;

    TlsSocket(TlsSocket&&) noexcept;
    TlsSocket& operator=(TlsSocket&&) noexcept;

    TlsSocket(const TlsSocket&) = delete;
    TlsSocket& operator=(const TlsSocket&) = delete;

    std::expected<void, SocketErrorInfo> connect(const std::string& host, uint16_t port) override;
    std::expected<size_t, SocketErrorInfo> write(std::span<const char> data) override;
    std::expected<size_t, SocketErrorInfo> read(std::span<char> buffer) override;

    void set_deadline(std::optional<Deadline> deadline) override;
    void close() override;
    bool is_open() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace segread
