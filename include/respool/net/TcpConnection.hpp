#pragma once

#include "respool/pool/PoolConfig.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace respool {

// Parses a decimal TCP port; throws std::invalid_argument unless it is 1-65535
uint16_t parsePort(const std::string& text);

/**
 * Owns one connected TCP socket. Closed on destruction if still open.
 * Errors are reported as std::system_error carrying errno.
 */
class TcpConnection {
public:
    explicit TcpConnection(int fd) noexcept : fd_(fd) {}
    ~TcpConnection();

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;
    TcpConnection(TcpConnection&& other) noexcept;
    TcpConnection& operator=(TcpConnection&& other) noexcept;

    /**
     * Resolve `host` and connect to the first address that accepts.
     * @throws std::runtime_error if resolution fails
     * @throws std::system_error if no address could be connected
     */
    static TcpConnection dial(const std::string& host, uint16_t port);

    // PoolConfig callables dialing host:port and closing the socket
    static PoolConfig<TcpConnection>::Factory factory(std::string host, uint16_t port);
    static PoolConfig<TcpConnection>::Closer closer();

    int fd() const noexcept { return fd_; }
    bool isOpen() const noexcept { return fd_ >= 0; }

    // Blocks until every byte is written
    void sendAll(std::string_view data);

    // @return bytes read; 0 on orderly shutdown by the peer
    size_t receiveSome(char* buf, size_t len);

    // Idempotent
    void close();

    // Hand the descriptor to another owner
    int release() noexcept;

private:
    int fd_ = -1;
};

} // namespace respool
