#include <gtest/gtest.h>
#include "respool/net/TlsConnection.hpp"
#include "respool/pool/ResourcePool.hpp"
#include <arpa/inet.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <netinet/in.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace respool;
using namespace std::chrono_literals;

namespace {

using KeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using CertPtr = std::unique_ptr<X509, decltype(&X509_free)>;

KeyPtr generateKey() {
    EVP_PKEY* key = nullptr;
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
    if (ctx && EVP_PKEY_keygen_init(ctx) == 1 && EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, 2048) == 1) {
        if (EVP_PKEY_keygen(ctx, &key) != 1) {
            key = nullptr;
        }
    }
    EVP_PKEY_CTX_free(ctx);
    return KeyPtr(key, &EVP_PKEY_free);
}

// Self-signed CN=localhost certificate valid for one hour
CertPtr selfSign(EVP_PKEY* key) {
    CertPtr cert(X509_new(), &X509_free);
    if (!cert) {
        return cert;
    }
    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 3600);
    X509_NAME* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
    if (X509_set_issuer_name(cert.get(), name) != 1 || X509_set_pubkey(cert.get(), key) != 1 ||
        X509_sign(cert.get(), key, EVP_sha256()) <= 0) {
        cert.reset();
    }
    return cert;
}

} // namespace

TEST(TlsClientContextTest, CreatesContextWithoutVerification) {
    TlsClientContext ctx(false);
    ASSERT_NE(ctx.native(), nullptr);
    EXPECT_FALSE(ctx.verifiesPeer());
    EXPECT_EQ(SSL_CTX_get_min_proto_version(ctx.native()), TLS1_2_VERSION);
}

// Loopback TLS echo server on an ephemeral port; one thread per accepted connection.
// With drop_after_handshake_ set, the server sends close_notify and closes the
// socket right after the handshake instead of echoing.
class TlsConnectionPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        key_ = generateKey();
        ASSERT_NE(key_, nullptr);
        cert_ = selfSign(key_.get());
        ASSERT_NE(cert_, nullptr);

        server_ctx_ = SSL_CTX_new(TLS_server_method());
        ASSERT_NE(server_ctx_, nullptr);
        ASSERT_EQ(SSL_CTX_use_certificate(server_ctx_, cert_.get()), 1);
        ASSERT_EQ(SSL_CTX_use_PrivateKey(server_ctx_, key_.get()), 1);

        listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
        ASSERT_GE(listen_fd_, 0);

        int one = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        ASSERT_EQ(bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
        ASSERT_EQ(listen(listen_fd_, 64), 0);

        socklen_t len = sizeof(addr);
        ASSERT_EQ(getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len), 0);
        port_ = ntohs(addr.sin_port);

        client_ctx_ = std::make_shared<TlsClientContext>(false);
        accept_thread_ = std::thread([this]() { acceptLoop(); });
    }

    void TearDown() override {
        stopping_ = true;
        if (listen_fd_ >= 0) {
            shutdown(listen_fd_, SHUT_RDWR);
        }
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        if (listen_fd_ >= 0) {
            close(listen_fd_);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto& t : session_threads_) {
                if (t.joinable()) {
                    t.join();
                }
            }
        }
        if (server_ctx_) {
            SSL_CTX_free(server_ctx_);
        }
    }

    void acceptLoop() {
        while (!stopping_) {
            int client = accept(listen_fd_, nullptr, nullptr);
            if (client < 0) {
                return;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            session_threads_.emplace_back([this, client]() { serve(client); });
        }
    }

    void serve(int client) {
        SSL* ssl = SSL_new(server_ctx_);
        if (!ssl || SSL_set_fd(ssl, client) != 1 || SSL_accept(ssl) != 1) {
            SSL_free(ssl);
            close(client);
            return;
        }
        handshakes_++;

        if (drop_after_handshake_) {
            SSL_shutdown(ssl);
            SSL_free(ssl);
            close(client);
            dropped_++;
            return;
        }

        char buf[512];
        while (true) {
            size_t n = 0;
            if (SSL_read_ex(ssl, buf, sizeof(buf), &n) != 1) {
                if (SSL_get_error(ssl, 0) == SSL_ERROR_ZERO_RETURN) {
                    close_notifies_++;
                }
                break;
            }
            size_t written = 0;
            if (SSL_write_ex(ssl, buf, n, &written) != 1) {
                break;
            }
        }
        SSL_free(ssl);
        close(client);
        peer_closed_++;
    }

    PoolConfig<TlsConnection> makeConfig(int max_cap) {
        PoolConfig<TlsConnection> config;
        config.maxCap = max_cap;
        config.factory = TlsConnection::factory(client_ctx_, "127.0.0.1", port_);
        config.closer = TlsConnection::closer();
        return config;
    }

    std::string roundTrip(TlsConnection& conn, const std::string& msg) {
        conn.write(msg);
        std::string reply;
        char buf[512];
        while (reply.size() < msg.size()) {
            size_t n = conn.read(buf, sizeof(buf));
            if (n == 0) {
                break;
            }
            reply.append(buf, n);
        }
        return reply;
    }

    bool waitFor(const std::atomic<int>& counter, int expected) {
        for (int i = 0; i < 200 && counter.load() < expected; ++i) {
            std::this_thread::sleep_for(5ms);
        }
        return counter.load() >= expected;
    }

    KeyPtr key_{nullptr, &EVP_PKEY_free};
    CertPtr cert_{nullptr, &X509_free};
    SSL_CTX* server_ctx_ = nullptr;
    std::shared_ptr<TlsClientContext> client_ctx_;

    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> stopping_{false};
    std::atomic<bool> drop_after_handshake_{false};
    std::atomic<int> handshakes_{0};
    std::atomic<int> dropped_{0};
    std::atomic<int> close_notifies_{0};
    std::atomic<int> peer_closed_{0};
    std::thread accept_thread_;
    std::mutex mutex_;
    std::vector<std::thread> session_threads_;
};

TEST_F(TlsConnectionPoolTest, PooledSessionRoundTripsAndIsReused) {
    ResourcePool<TlsConnection> pool(makeConfig(2));

    auto conn = pool.acquire();
    ASSERT_TRUE(conn->isOpen());
    TlsConnection* first = conn.get();
    EXPECT_EQ(roundTrip(*conn, "ping"), "ping");
    pool.release(std::move(conn));

    auto again = pool.acquire();
    EXPECT_EQ(again.get(), first);
    EXPECT_EQ(roundTrip(*again, "pong"), "pong");
    pool.release(std::move(again));

    EXPECT_EQ(handshakes_.load(), 1);
    EXPECT_EQ(pool.stats().hits, 1u);
    EXPECT_EQ(pool.stats().misses, 1u);
}

TEST_F(TlsConnectionPoolTest, ShutdownSendsCloseNotifyAndClosesSockets) {
    ResourcePool<TlsConnection> pool(makeConfig(4));

    std::vector<std::shared_ptr<TlsConnection>> conns;
    for (int i = 0; i < 2; ++i) {
        conns.push_back(pool.acquire());
        ASSERT_EQ(roundTrip(*conns.back(), "hello"), "hello");
    }
    for (auto& conn : conns) {
        pool.release(conn);
    }

    pool.shutdown();

    for (auto& conn : conns) {
        EXPECT_FALSE(conn->isOpen());
    }
    EXPECT_TRUE(waitFor(close_notifies_, 2));
    EXPECT_TRUE(waitFor(peer_closed_, 2));
}

// A session the server dropped while idle must fail with an exception, not SIGPIPE
TEST_F(TlsConnectionPoolTest, WriteToSessionDroppedWhileIdleThrows) {
    drop_after_handshake_ = true;
    ResourcePool<TlsConnection> pool(makeConfig(2));

    pool.release(pool.acquire());
    ASSERT_TRUE(waitFor(dropped_, 1));

    auto reused = pool.acquire();
    EXPECT_EQ(pool.stats().hits, 1u);

    // The first write can still land in the socket buffer; the reset shows up on a later one
    bool threw = false;
    for (int i = 0; i < 50 && !threw; ++i) {
        try {
            reused->write("HEAD / HTTP/1.1\r\nHost: localhost\r\n\r\n");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        if (!threw) {
            std::this_thread::sleep_for(10ms);
        }
    }
    EXPECT_TRUE(threw);

    auto held = reused;
    EXPECT_NO_THROW(pool.close(std::move(reused)));
    EXPECT_FALSE(held->isOpen());
}

TEST_F(TlsConnectionPoolTest, ReadReturnsZeroAfterServerCloseNotify) {
    drop_after_handshake_ = true;
    auto conn = TlsConnection::connect(client_ctx_, "127.0.0.1", port_);

    char buf[64];
    EXPECT_EQ(conn->read(buf, sizeof(buf)), 0u);

    conn->shutdown();
    EXPECT_FALSE(conn->isOpen());
    EXPECT_NO_THROW(conn->shutdown());
}

TEST_F(TlsConnectionPoolTest, FactoryErrorReachesCaller) {
    // Bind then close to get a port that refuses connections
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len), 0);
    uint16_t dead_port = ntohs(addr.sin_port);
    close(fd);

    PoolConfig<TlsConnection> config;
    config.factory = TlsConnection::factory(client_ctx_, "127.0.0.1", dead_port);
    config.closer = TlsConnection::closer();
    ResourcePool<TlsConnection> pool(std::move(config));

    EXPECT_THROW((void)pool.acquire(), std::system_error);
    EXPECT_EQ(pool.stats().misses, 0u);
}
