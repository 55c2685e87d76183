/**
 * TLS client connection pool example
 *
 * Several worker threads issue "HEAD /" requests to one HTTPS host,
 * borrowing TLS connections from a shared ResourcePool instead of
 * performing a fresh TCP + TLS handshake for every request.
 *
 * Usage: ./tls_client_pool [host] [port] [threads] [requests_per_thread] [log_file]
 *
 * Host and port fall back to RESPOOL_HOST / RESPOOL_PORT, then example.com:443.
 * Set RESPOOL_INSECURE=1 to skip certificate verification (self-signed servers).
 */

#include "respool/logger/ConsoleLogger.hpp"
#include "respool/logger/FileLogger.hpp"
#include "respool/net/TlsConnection.hpp"
#include "respool/pool/ResourcePool.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace respool;

namespace {

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

// Reads until the end of the response headers
std::string headRequest(TlsConnection& conn, const std::string& host) {
    conn.write("HEAD / HTTP/1.1\r\nHost: " + host + "\r\nConnection: keep-alive\r\n\r\n");

    std::string response;
    char buf[1024];
    while (response.find("\r\n\r\n") == std::string::npos) {
        size_t n = conn.read(buf, sizeof(buf));
        if (n == 0) {
            throw std::runtime_error("server closed connection mid-response");
        }
        response.append(buf, n);
    }
    return response.substr(0, response.find("\r\n"));
}

} // namespace

int main(int argc, char** argv) {
    static std::unique_ptr<Logger> logger;
    try {
        std::string host = argc > 1 ? argv[1] : envOr("RESPOOL_HOST", "example.com");
        uint16_t port = parsePort(argc > 2 ? argv[2] : envOr("RESPOOL_PORT", "443"));
        int num_threads = argc > 3 ? std::stoi(argv[3]) : 4;
        int requests_per_thread = argc > 4 ? std::stoi(argv[4]) : 5;
        std::string log_file = argc > 5 ? argv[5] : "";
        bool insecure = envOr("RESPOOL_INSECURE", "0") == "1";

        if (!log_file.empty()) {
            logger = std::make_unique<FileLogger>(log_file, true);
        } else {
            logger = std::make_unique<ConsoleLogger>();
        }
        Logger::setGlobalLogger(logger.get());

        auto ctx = std::make_shared<TlsClientContext>(!insecure);

        PoolConfig<TlsConnection> config;
        config.maxCap = num_threads;
        config.factory = TlsConnection::factory(ctx, host, port);
        config.closer = TlsConnection::closer();
        config.idleTimeout = std::chrono::seconds(30);
        ResourcePool<TlsConnection> pool(std::move(config));

        std::atomic<int> failures{0};
        std::vector<std::thread> workers;
        for (int t = 0; t < num_threads; ++t) {
            workers.emplace_back([&, t]() {
                for (int i = 0; i < requests_per_thread; ++i) {
                    std::shared_ptr<TlsConnection> conn;
                    try {
                        conn = pool.acquire();
                        std::string status = headRequest(*conn, host);
                        Logger::getInstance().logMessage("worker " + std::to_string(t) + ": " + status);
                        pool.release(std::move(conn));
                    } catch (...) {
                        failures++;
                        Logger::getInstance().logCurrentError("worker " + std::to_string(t) + ": request failed");
                        // A connection that failed mid-request is not reusable
                        if (conn) {
                            try {
                                pool.close(std::move(conn));
                            } catch (...) {
                                Logger::getInstance().logCurrentError("worker " + std::to_string(t) + ": close failed");
                            }
                        }
                    }
                }
            });
        }
        for (auto& w : workers) {
            w.join();
        }

        pool.logStats();
        pool.shutdown();

        std::cout << "Completed with " << failures.load() << " failed request(s)\n";
        Logger::setGlobalLogger(nullptr);
        return failures.load() == 0 ? 0 : 1;
    } catch (...) {
        Logger::getInstance().logCurrentError("tls_client_pool failed");
        Logger::setGlobalLogger(nullptr);
        return 1;
    }
}
