#pragma once

#include "respool/net/TcpConnection.hpp"
#include "respool/pool/PoolConfig.hpp"

#include <openssl/ssl.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace respool {

/**
 * Client-side SSL_CTX configured for TLS 1.2+.
 * Peer certificates are verified against the system CA store unless
 * verification is disabled (self-signed test servers).
 */
class TlsClientContext {
public:
    explicit TlsClientContext(bool verify_peer = true);
    ~TlsClientContext();

    TlsClientContext(const TlsClientContext&) = delete;
    TlsClientContext& operator=(const TlsClientContext&) = delete;

    SSL_CTX* native() const noexcept { return ctx_; }
    bool verifiesPeer() const noexcept { return verify_peer_; }

private:
    SSL_CTX* ctx_ = nullptr;
    bool verify_peer_;
};

/**
 * A TLS session over an owned TcpConnection.
 * The handshake happens in connect(); shutdown() sends close_notify and
 * closes the socket. Failures throw std::runtime_error with the OpenSSL
 * error queue text.
 *
 * Records go out through send(MSG_NOSIGNAL), so writing to a session the
 * server already dropped throws instead of raising SIGPIPE.
 */
class TlsConnection {
public:
    TlsConnection(TcpConnection tcp, SSL* ssl) noexcept;
    ~TlsConnection();

    TlsConnection(const TlsConnection&) = delete;
    TlsConnection& operator=(const TlsConnection&) = delete;

    static std::unique_ptr<TlsConnection> connect(std::shared_ptr<TlsClientContext> ctx,
                                                  const std::string& host, uint16_t port);

    static PoolConfig<TlsConnection>::Factory factory(std::shared_ptr<TlsClientContext> ctx,
                                                      std::string host, uint16_t port);
    static PoolConfig<TlsConnection>::Closer closer();

    void write(std::string_view data);

    // @return bytes read; 0 once the peer has closed the session
    size_t read(char* buf, size_t len);

    // Idempotent
    void shutdown();

    bool isOpen() const noexcept { return ssl_ != nullptr; }

private:
    TcpConnection tcp_;
    SSL* ssl_;
};

} // namespace respool
