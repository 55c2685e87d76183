#include "respool/net/TlsConnection.hpp"
#include "respool/logger/Logger.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>

#include <sys/socket.h>

#include <cerrno>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace respool {

namespace {

std::string drainOpenSSLErrors() {
    std::string out;
    unsigned long code;
    char buf[256];
    while ((code = ERR_get_error()) != 0) {
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty()) {
            out += "; ";
        }
        out += buf;
    }
    return out.empty() ? std::string("no OpenSSL error reported") : out;
}

[[noreturn]] void throwTlsError(const std::string& what) {
    throw std::runtime_error(what + ": " + drainOpenSSLErrors());
}

// Socket BIO that sends with MSG_NOSIGNAL. OpenSSL's stock socket BIO uses
// write(), which raises SIGPIPE once the peer has closed the connection.
int fdOf(BIO* bio) {
    return static_cast<int>(reinterpret_cast<intptr_t>(BIO_get_data(bio)));
}

bool isRetryable(int err) {
    return err == EAGAIN || err == EWOULDBLOCK || err == EINTR;
}

int noSignalWrite(BIO* bio, const char* data, int len) {
    BIO_clear_retry_flags(bio);
    ssize_t n = ::send(fdOf(bio), data, static_cast<size_t>(len), MSG_NOSIGNAL);
    if (n < 0 && isRetryable(errno)) {
        BIO_set_retry_write(bio);
    }
    return static_cast<int>(n);
}

int noSignalRead(BIO* bio, char* buf, int len) {
    BIO_clear_retry_flags(bio);
    ssize_t n = ::recv(fdOf(bio), buf, static_cast<size_t>(len), 0);
    if (n < 0 && isRetryable(errno)) {
        BIO_set_retry_read(bio);
    }
    return static_cast<int>(n);
}

int noSignalPuts(BIO* bio, const char* str) {
    return noSignalWrite(bio, str, static_cast<int>(std::char_traits<char>::length(str)));
}

long noSignalCtrl(BIO* bio, int cmd, long, void* ptr) {
    switch (cmd) {
        case BIO_C_GET_FD:
            if (ptr) {
                *static_cast<int*>(ptr) = fdOf(bio);
            }
            return fdOf(bio);
        case BIO_CTRL_FLUSH:
            return 1;
        default:
            return 0;
    }
}

int noSignalCreate(BIO* bio) {
    BIO_set_init(bio, 1);
    return 1;
}

// The fd belongs to the TcpConnection, so destroy leaves it open
int noSignalDestroy(BIO* bio) {
    if (!bio) {
        return 0;
    }
    BIO_set_data(bio, nullptr);
    return 1;
}

BIO_METHOD* createNoSignalMethod() {
    BIO_METHOD* method =
        BIO_meth_new(BIO_get_new_index() | BIO_TYPE_SOURCE_SINK | BIO_TYPE_DESCRIPTOR, "respool socket");
    if (!method || BIO_meth_set_write(method, noSignalWrite) != 1 ||
        BIO_meth_set_read(method, noSignalRead) != 1 || BIO_meth_set_puts(method, noSignalPuts) != 1 ||
        BIO_meth_set_ctrl(method, noSignalCtrl) != 1 || BIO_meth_set_create(method, noSignalCreate) != 1 ||
        BIO_meth_set_destroy(method, noSignalDestroy) != 1) {
        BIO_meth_free(method);
        return nullptr;
    }
    return method;
}

BIO* newNoSignalBio(int fd) {
    // Shared by every connection for the life of the process
    static BIO_METHOD* method = createNoSignalMethod();
    if (!method) {
        throwTlsError("TlsConnection: failed to create socket BIO method");
    }
    BIO* bio = BIO_new(method);
    if (!bio) {
        throwTlsError("TlsConnection: BIO_new failed");
    }
    BIO_set_data(bio, reinterpret_cast<void*>(static_cast<intptr_t>(fd)));
    return bio;
}

} // namespace

TlsClientContext::TlsClientContext(bool verify_peer) : verify_peer_(verify_peer) {
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);

    ctx_ = SSL_CTX_new(TLS_client_method());
    if (!ctx_) {
        throwTlsError("TlsClientContext: failed to create SSL context");
    }

    if (SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION) != 1) {
        SSL_CTX_free(ctx_);
        ctx_ = nullptr;
        throwTlsError("TlsClientContext: failed to require TLS 1.2");
    }
    SSL_CTX_set_mode(ctx_, SSL_MODE_AUTO_RETRY);

    if (verify_peer_) {
        if (SSL_CTX_set_default_verify_paths(ctx_) != 1) {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
            throwTlsError("TlsClientContext: failed to load default CA paths");
        }
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
    } else {
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
        Logger::getInstance().logMessage("TlsClientContext: peer verification disabled");
    }
}

TlsClientContext::~TlsClientContext() {
    if (ctx_) {
        SSL_CTX_free(ctx_);
    }
}

TlsConnection::TlsConnection(TcpConnection tcp, SSL* ssl) noexcept
    : tcp_(std::move(tcp)), ssl_(ssl) {}

TlsConnection::~TlsConnection() {
    if (ssl_) {
        SSL_free(ssl_);
    }
}

std::unique_ptr<TlsConnection> TlsConnection::connect(std::shared_ptr<TlsClientContext> ctx,
                                                      const std::string& host, uint16_t port) {
    TcpConnection tcp = TcpConnection::dial(host, port);

    SSL* ssl = SSL_new(ctx->native());
    if (!ssl) {
        throwTlsError("TlsConnection: SSL_new failed");
    }
    // Owns ssl until the handshake succeeds
    std::unique_ptr<SSL, decltype(&SSL_free)> guard(ssl, &SSL_free);

    BIO* bio = newNoSignalBio(tcp.fd());
    // ssl takes ownership of the single reference
    SSL_set_bio(ssl, bio, bio);
    if (SSL_set_tlsext_host_name(ssl, host.c_str()) != 1) {
        throwTlsError("TlsConnection: failed to set SNI host name");
    }
    if (ctx->verifiesPeer()) {
        if (SSL_set1_host(ssl, host.c_str()) != 1) {
            throwTlsError("TlsConnection: SSL_set1_host failed");
        }
    }

    if (SSL_connect(ssl) != 1) {
        std::string reason = "TlsConnection: handshake with " + host + ":" + std::to_string(port) + " failed";
        long verify = SSL_get_verify_result(ssl);
        if (verify != X509_V_OK) {
            reason += " (";
            reason += X509_verify_cert_error_string(verify);
            reason += ")";
        }
        throwTlsError(reason);
    }

    return std::make_unique<TlsConnection>(std::move(tcp), guard.release());
}

PoolConfig<TlsConnection>::Factory TlsConnection::factory(std::shared_ptr<TlsClientContext> ctx,
                                                          std::string host, uint16_t port) {
    return [ctx = std::move(ctx), host = std::move(host), port]() -> std::shared_ptr<TlsConnection> {
        return TlsConnection::connect(ctx, host, port);
    };
}

PoolConfig<TlsConnection>::Closer TlsConnection::closer() {
    return [](const std::shared_ptr<TlsConnection>& conn) { conn->shutdown(); };
}

void TlsConnection::write(std::string_view data) {
    if (!ssl_) {
        throw std::runtime_error("TlsConnection: write on closed connection");
    }
    size_t written = 0;
    while (written < data.size()) {
        size_t n = 0;
        if (SSL_write_ex(ssl_, data.data() + written, data.size() - written, &n) != 1) {
            throwTlsError("TlsConnection: write failed");
        }
        written += n;
    }
}

size_t TlsConnection::read(char* buf, size_t len) {
    if (!ssl_) {
        throw std::runtime_error("TlsConnection: read on closed connection");
    }
    size_t n = 0;
    if (SSL_read_ex(ssl_, buf, len, &n) == 1) {
        return n;
    }
    int err = SSL_get_error(ssl_, 0);
    if (err == SSL_ERROR_ZERO_RETURN) {
        return 0;
    }
    throwTlsError("TlsConnection: read failed");
}

void TlsConnection::shutdown() {
    if (!ssl_) {
        return;
    }
    // close_notify is best effort; the peer may already be gone
    if (SSL_shutdown(ssl_) < 0) {
        ERR_clear_error();
    }
    SSL_free(ssl_);
    ssl_ = nullptr;
    tcp_.close();
}

} // namespace respool
