#pragma once

#include "respool/Config.hpp"
#include "respool/logger/Logger.hpp"
#include "respool/pool/PoolConfig.hpp"
#include "respool/pool/PoolErrors.hpp"
#include "respool/pool/PoolStats.hpp"
#include "respool/pool/Pooler.hpp"
#include "respool/ring_buffer/BoundedRingBuffer.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

namespace respool {

/**
 * ResourcePool - caches expensive resources (typically connections) for reuse.
 *
 * Idle resources sit in a lock-free BoundedRingBuffer of maxCap entries.
 * acquire() pops the oldest idle entry, discarding any that outlived
 * idleTimeout, and falls back to the factory when none is left.
 * release() pushes the resource back, or closes it when the buffer is
 * full or the pool has been shut down.
 *
 * Synchronization:
 * - mutex_ guards only the buffer pointer (swapped out by shutdown)
 * - steady-state push/pop go through the buffer's own atomics
 * - factory and closer run on the calling thread, outside any lock
 *
 * Usage:
 *   PoolConfig<Conn> cfg;
 *   cfg.maxCap = 16;
 *   cfg.factory = [] { return std::make_shared<Conn>(dial()); };
 *   cfg.closer = [](const std::shared_ptr<Conn>& c) { c->close(); };
 *   ResourcePool<Conn> pool(std::move(cfg));
 *
 *   auto conn = pool.acquire();
 *   conn->send(...);
 *   pool.release(std::move(conn));
 */
template <typename T>
class ResourcePool : public Pooler<T> {
  public:
    using Resource = typename Pooler<T>::Resource;
    using Clock = std::chrono::steady_clock;

    explicit ResourcePool(PoolConfig<T> config)
        : factory_(std::move(config.factory)),
          closer_(std::move(config.closer)),
          idle_timeout_(config.idleTimeout) {
        if (!factory_) {
            throw std::invalid_argument("ResourcePool: factory is required");
        }

        int max_cap = config.maxCap > 0 ? config.maxCap : kDefaultMaxCap;
        if (config.initialCap < 0 || config.initialCap > max_cap) {
            throw std::invalid_argument("ResourcePool: invalid capacity settings (initialCap " +
                                        std::to_string(config.initialCap) + ", maxCap " +
                                        std::to_string(max_cap) + ")");
        }

        idle_ = std::make_shared<IdleBuffer>(static_cast<size_t>(max_cap));

        if (config.initialCap > 0) {
            prefill(static_cast<size_t>(config.initialCap));
        }
    }

    ~ResourcePool() override {
        try {
            shutdown();
        } catch (...) {
            Logger::getInstance().logCurrentError("ResourcePool: shutdown during destruction failed");
        }
    }

    ResourcePool(const ResourcePool&) = delete;
    ResourcePool& operator=(const ResourcePool&) = delete;

    Resource acquire() override {
        auto idle = idleBuffer();
        if (!idle) {
            throw ClosedError();
        }

        IdleEntry entry;
        while (idle->tryDequeue(entry)) {
            if (isStale(entry)) {
                evict(std::move(entry.resource));
                continue;
            }
            hits_.fetch_add(1, std::memory_order_relaxed);
            RESPOOL_DEBUG_LOG("ResourcePool: hit, idle=" << idle->size());
            return std::move(entry.resource);
        }

        // Empty because shutdown drained it
        if (idle->isClosed()) {
            throw ClosedError();
        }

        Resource resource = factory_();
        if (!resource) {
            throw NilResourceError("ResourcePool: factory produced a nil resource");
        }
        misses_.fetch_add(1, std::memory_order_relaxed);
        RESPOOL_DEBUG_LOG("ResourcePool: miss, created new resource");
        return resource;
    }

    void release(Resource resource) override {
        if (!resource) {
            throw NilResourceError();
        }

        auto idle = idleBuffer();
        if (!idle) {
            close(std::move(resource));
            return;
        }

        // tryEnqueue leaves the entry intact when it fails
        IdleEntry entry{std::move(resource), Clock::now()};
        if (!idle->tryEnqueue(std::move(entry))) {
            if (!idle->isClosed()) {
                overflow_closes_.fetch_add(1, std::memory_order_relaxed);
            }
            RESPOOL_DEBUG_LOG("ResourcePool: idle buffer full or closed, closing resource");
            close(std::move(entry.resource));
        }
    }

    void close(Resource resource) override {
        if (!resource) {
            throw NilResourceError();
        }
        if (closer_) {
            closer_(resource);
        }
    }

    void shutdown() override {
        std::shared_ptr<IdleBuffer> idle;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            idle = std::move(idle_);
            idle_.reset();
        }
        if (!idle) {
            return;
        }

        std::exception_ptr first_error;
        size_t failures = 0;
        size_t drained = idle->drain([&](IdleEntry& entry) {
            try {
                close(std::move(entry.resource));
            } catch (...) {
                ++failures;
                Logger::getInstance().logCurrentError("ResourcePool: failed to close idle resource on shutdown");
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }
        });

        if (drained > 0 || failures > 0) {
            Logger::getInstance().logMessage("ResourcePool: shutdown closed " + std::to_string(drained) +
                                             " idle resources (" + std::to_string(failures) + " failed)");
        }

        if (first_error) {
            std::rethrow_exception(first_error);
        }
    }

    size_t size() const override {
        auto idle = idleBuffer();
        return idle ? idle->size() : 0;
    }

    PoolStats stats() const override {
        PoolStats s;
        s.hits = hits_.load(std::memory_order_relaxed);
        s.misses = misses_.load(std::memory_order_relaxed);
        s.totalIdle = size();
        s.staleEvictions = stale_evictions_.load(std::memory_order_relaxed);
        s.evictionCloseFailures = eviction_close_failures_.load(std::memory_order_relaxed);
        s.overflowCloses = overflow_closes_.load(std::memory_order_relaxed);
        return s;
    }

    void logStats() const { respool::logStats(Logger::getInstance(), stats()); }

    bool isClosed() const { return idleBuffer() == nullptr; }

  private:
    struct IdleEntry {
        Resource resource;
        Clock::time_point enteredIdleAt{};
    };
    using IdleBuffer = BoundedRingBuffer<IdleEntry>;

    std::shared_ptr<IdleBuffer> idleBuffer() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return idle_;
    }

    bool isStale(const IdleEntry& entry) const {
        if (idle_timeout_ <= Clock::duration::zero()) {
            return false;
        }
        return Clock::now() - entry.enteredIdleAt > idle_timeout_;
    }

    // Closer failures here are logged and counted, never thrown to acquire()'s caller.
    void evict(Resource resource) {
        stale_evictions_.fetch_add(1, std::memory_order_relaxed);
        try {
            close(std::move(resource));
        } catch (...) {
            eviction_close_failures_.fetch_add(1, std::memory_order_relaxed);
            Logger::getInstance().logCurrentError("ResourcePool: failed to close stale idle resource");
        }
    }

    void prefill(size_t count) {
        for (size_t i = 0; i < count; ++i) {
            Resource resource;
            try {
                resource = factory_();
                if (!resource) {
                    throw NilResourceError("ResourcePool: factory produced a nil resource");
                }
            } catch (...) {
                abandonPrefill();
                std::throw_with_nested(PoolError("factory is not able to fill the pool"));
            }
            // count <= capacity and nobody else can see the pool yet, so this holds
            IdleEntry entry{std::move(resource), Clock::now()};
            if (!idle_->tryEnqueue(std::move(entry))) {
                close(std::move(entry.resource));
            }
        }
    }

    // Close what prefill created so far; the factory error is what propagates.
    void abandonPrefill() {
        idle_->drain([this](IdleEntry& entry) {
            try {
                close(std::move(entry.resource));
            } catch (...) {
                Logger::getInstance().logCurrentError("ResourcePool: failed to close resource while abandoning prefill");
            }
        });
        idle_.reset();
    }

    const typename PoolConfig<T>::Factory factory_;
    const typename PoolConfig<T>::Closer closer_;
    const Clock::duration idle_timeout_;

    mutable std::mutex mutex_;
    std::shared_ptr<IdleBuffer> idle_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> stale_evictions_{0};
    std::atomic<uint64_t> eviction_close_failures_{0};
    std::atomic<uint64_t> overflow_closes_{0};
};

} // namespace respool
