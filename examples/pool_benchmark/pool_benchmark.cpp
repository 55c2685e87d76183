/**
 * Pool throughput benchmark
 *
 * Drives ResourcePool from several threads with a dummy connection whose
 * creation is free, so the numbers measure the pool's own overhead.
 *
 * Usage: ./pool_benchmark [threads] [ops_per_thread]
 *
 * Modes:
 *   acquire+release - connections go back to the pool (steady-state reuse)
 *   acquire+close   - every connection is destroyed after use, no closer
 */

#include "respool/logger/ConsoleLogger.hpp"
#include "respool/pool/ResourcePool.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace respool;

namespace {

struct DummyConnection {
    int id = 0;
};

enum class Mode { AcquireRelease, AcquireClose };

double runBenchmark(Mode mode, int pool_size, int num_threads, int ops_per_thread) {
    PoolConfig<DummyConnection> config;
    config.maxCap = pool_size;
    config.factory = []() { return std::make_shared<DummyConnection>(); };
    if (mode == Mode::AcquireRelease) {
        config.closer = [](const std::shared_ptr<DummyConnection>&) {};
    }
    config.idleTimeout = std::chrono::seconds(15);

    ResourcePool<DummyConnection> pool(std::move(config));

    auto start = std::chrono::steady_clock::now();

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&pool, mode, ops_per_thread]() {
            for (int i = 0; i < ops_per_thread; ++i) {
                auto conn = pool.acquire();
                if (mode == Mode::AcquireRelease) {
                    pool.release(std::move(conn));
                } else {
                    pool.close(std::move(conn));
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);

    pool.logStats();

    double total_ops = static_cast<double>(num_threads) * ops_per_thread;
    return total_ops * 1000000.0 / static_cast<double>(elapsed.count() > 0 ? elapsed.count() : 1);
}

} // namespace

int main(int argc, char** argv) {
    ConsoleLogger console_logger;
    Logger::setGlobalLogger(&console_logger);

    try {
        int num_threads = argc > 1 ? std::stoi(argv[1]) : static_cast<int>(std::thread::hardware_concurrency());
        int ops_per_thread = argc > 2 ? std::stoi(argv[2]) : 100000;
        if (num_threads <= 0) {
            num_threads = 1;
        }

        std::cout << "Threads: " << num_threads << ", ops/thread: " << ops_per_thread << "\n";

        const int pool_sizes[] = {10, 100, 1000};
        for (Mode mode : {Mode::AcquireRelease, Mode::AcquireClose}) {
            const char* name = mode == Mode::AcquireRelease ? "acquire+release" : "acquire+close";
            for (int size : pool_sizes) {
                double ops = runBenchmark(mode, size, num_threads, ops_per_thread);
                std::cout << std::left << std::setw(16) << name
                          << " cap=" << std::setw(5) << size
                          << std::fixed << std::setprecision(0) << ops << " ops/sec\n";
            }
        }
    } catch (...) {
        Logger::getInstance().logCurrentError("pool_benchmark failed");
        Logger::setGlobalLogger(nullptr);
        return 1;
    }

    Logger::setGlobalLogger(nullptr);
    return 0;
}
