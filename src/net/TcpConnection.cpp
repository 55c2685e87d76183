#include "respool/net/TcpConnection.hpp"
#include "respool/Config.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

namespace respool {

uint16_t parsePort(const std::string& text) {
    size_t consumed = 0;
    long port = 0;
    try {
        port = std::stol(text, &consumed);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("port out of range (1-65535): " + text);
    }
    if (consumed != text.size()) {
        throw std::invalid_argument("port is not a number: " + text);
    }
    if (port < 1 || port > 65535) {
        throw std::invalid_argument("port out of range (1-65535): " + text);
    }
    return static_cast<uint16_t>(port);
}

TcpConnection::~TcpConnection() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

TcpConnection::TcpConnection(TcpConnection&& other) noexcept : fd_(other.release()) {}

TcpConnection& TcpConnection::operator=(TcpConnection&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = other.release();
    }
    return *this;
}

TcpConnection TcpConnection::dial(const std::string& host, uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    const std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
    if (rc != 0) {
        throw std::runtime_error("TcpConnection: cannot resolve " + host + ": " + gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> guard(result, &freeaddrinfo);

    int last_errno = 0;
    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_errno = errno;
            continue;
        }
        if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            // Latency hint only; a failure here leaves a usable socket
            int one = 1;
            (void)setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
            RESPOOL_DEBUG_LOG("TcpConnection: connected fd=" << fd << " to " << host << ":" << port);
            return TcpConnection(fd);
        }
        last_errno = errno;
        ::close(fd);
    }

    throw std::system_error(last_errno, std::system_category(),
                            "TcpConnection: connect to " + host + ":" + service + " failed");
}

PoolConfig<TcpConnection>::Factory TcpConnection::factory(std::string host, uint16_t port) {
    return [host = std::move(host), port]() {
        return std::make_shared<TcpConnection>(TcpConnection::dial(host, port));
    };
}

PoolConfig<TcpConnection>::Closer TcpConnection::closer() {
    return [](const std::shared_ptr<TcpConnection>& conn) { conn->close(); };
}

void TcpConnection::sendAll(std::string_view data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::system_category(), "TcpConnection: send failed");
        }
        sent += static_cast<size_t>(n);
    }
}

size_t TcpConnection::receiveSome(char* buf, size_t len) {
    while (true) {
        ssize_t n = ::recv(fd_, buf, len, 0);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno != EINTR) {
            throw std::system_error(errno, std::system_category(), "TcpConnection: recv failed");
        }
    }
}

void TcpConnection::close() {
    int fd = release();
    if (fd < 0) {
        return;
    }
    if (::close(fd) < 0 && errno != EINTR) {
        throw std::system_error(errno, std::system_category(), "TcpConnection: close failed");
    }
}

int TcpConnection::release() noexcept {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

} // namespace respool
