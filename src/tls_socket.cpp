#include "tls_socket.hpp"
#include <arpa/inet.h>
#include <openssl/x509v3.h>
#include <format>

namespace segread {

namespace {

std::string last_ssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

bool is_ip_literal(const std::string& host) {
    unsigned char addr[sizeof(in6_addr)];
    return inet_pton(AF_INET, host.c_str(), addr) == 1 || inet_pton(AF_INET6, host.c_str(), addr) == 1;
}

} // namespace

class TlsSocket::Impl {
public:
    Socket socket;
    SSL_CTX* ctx = nullptr;
    SSL* ssl = nullptr;
    std::filesystem::path trust_store;

    explicit Impl(std::filesystem::path trust) : trust_store(std::move(trust)) {
        ctx = SSL_CTX_new(TLS_client_method());
        if (ctx) {
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
        }
    }

    ~Impl() {
        if (ssl) SSL_free(ssl);
        if (ctx) SSL_CTX_free(ctx);
    }

    // Drives a non-blocking SSL call until it completes or the deadline passes
    template<typename Op>
    std::expected<int, SocketErrorInfo> drive(Op op, SocketError kind, const char* what) {
        while (true) {
            int rc = op();
            if (rc > 0) return rc;
            int err = SSL_get_error(ssl, rc);
            if (err == SSL_ERROR_WANT_READ) {
                auto ready = socket.wait_readable();
                if (!ready) return std::unexpected(ready.error());
            } else if (err == SSL_ERROR_WANT_WRITE) {
                auto ready = socket.wait_writable();
                if (!ready) return std::unexpected(ready.error());
            } else if (err == SSL_ERROR_ZERO_RETURN) {
                return 0;
            } else {
                return std::unexpected(SocketErrorInfo{kind, std::format("{}: {}", what, last_ssl_error())});
            }
        }
    }
};

TlsSocket::TlsSocket(std::filesystem::path trust_store)
    : pImpl_(std::make_unique<Impl>(std::move(trust_store))) {}
TlsSocket::~TlsSocket() = default;
TlsSocket::TlsSocket(TlsSocket&&) noexcept = default;
TlsSocket& TlsSocket::operator=(TlsSocket&&) noexcept = default;

void TlsSocket::set_deadline(std::optional<Deadline> deadline) {
    pImpl_->socket.set_deadline(deadline);
}

bool TlsSocket::is_open() const {
    return pImpl_->ssl != nullptr && pImpl_->socket.is_open();
}

void TlsSocket::close() {
    if (pImpl_->ssl) {
        SSL_shutdown(pImpl_->ssl);
        SSL_free(pImpl_->ssl);
        pImpl_->ssl = nullptr;
    }
    pImpl_->socket.close();
}

std::expected<void, SocketErrorInfo> TlsSocket::connect(const std::string& host, uint16_t port) {
    if (!pImpl_->ctx) {
        return std::unexpected(SocketErrorInfo{SocketError::ConnectionFailed, "Failed to create TLS context"});
    }
    int loaded = pImpl_->trust_store.empty()
        ? SSL_CTX_set_default_verify_paths(pImpl_->ctx)
        : SSL_CTX_load_verify_locations(pImpl_->ctx, pImpl_->trust_store.c_str(), nullptr);
    if (loaded != 1) {
        return std::unexpected(SocketErrorInfo{SocketError::ConnectionFailed,
            std::format("Failed to load trust store {}: {}", pImpl_->trust_store.string(), last_ssl_error())});
    }

    close();
    auto conn = pImpl_->socket.connect(host, port);
    if (!conn) return conn;

    pImpl_->ssl = SSL_new(pImpl_->ctx);
    if (!pImpl_->ssl) {
        pImpl_->socket.close();
        return std::unexpected(SocketErrorInfo{SocketError::ConnectionFailed,
            std::format("Failed to create TLS session: {}", last_ssl_error())});
    }
    SSL_set_fd(pImpl_->ssl, pImpl_->socket.fd());
    // IP literals are matched against the certificate's IP SANs and carry no SNI
    if (is_ip_literal(host)) {
        X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(pImpl_->ssl), host.c_str());
    } else {
        SSL_set_tlsext_host_name(pImpl_->ssl, host.c_str());
        SSL_set1_host(pImpl_->ssl, host.c_str());
    }

    SSL* ssl = pImpl_->ssl;
    auto handshake = pImpl_->drive([ssl] { return SSL_connect(ssl); },
                                   SocketError::ConnectionFailed, "TLS handshake failed");
    if (!handshake || *handshake == 0) {
        close();
        if (!handshake) return std::unexpected(handshake.error());
        return std::unexpected(SocketErrorInfo{SocketError::ConnectionFailed, "TLS handshake closed by peer"});
    }
    return {};
}

std::expected<size_t, SocketErrorInfo> TlsSocket::write(std::span<const char> data) {
    if (!pImpl_->ssl) {
        return std::unexpected(SocketErrorInfo{SocketError::WriteError, "TLS not connected"});
    }
    SSL* ssl = pImpl_->ssl;
    auto sent = pImpl_->drive([ssl, data] { return SSL_write(ssl, data.data(), static_cast<int>(data.size())); },
                              SocketError::WriteError, "TLS write failed");
    if (!sent) return std::unexpected(sent.error());
    return static_cast<size_t>(*sent);
}

std::expected<size_t, SocketErrorInfo> TlsSocket::read(std::span<char> buffer) {
    if (!pImpl_->ssl) {
        return std::unexpected(SocketErrorInfo{SocketError::ReadError, "TLS not connected"});
    }
    SSL* ssl = pImpl_->ssl;
    auto received = pImpl_->drive([ssl, buffer] { return SSL_read(ssl, buffer.data(), static_cast<int>(buffer.size())); },
                                  SocketError::ReadError, "TLS read failed");
    if (!received) return std::unexpected(received.error());
    return static_cast<size_t>(*received);
}

} // namespace segread
