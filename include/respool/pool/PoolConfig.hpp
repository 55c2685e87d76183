#pragma once

#include "respool/Config.hpp"

#include <chrono>
#include <functional>
#include <memory>

namespace respool {

/**
 * Construction-time settings for ResourcePool<T>.
 *
 * factory  - required; creates a resource or throws.
 * closer   - optional; releases a resource or throws. Empty means
 *            discarded resources are simply dropped.
 * maxCap   - idle buffer capacity; values <= 0 select kDefaultMaxCap.
 * initialCap - resources created up front and parked idle. Off by default.
 * idleTimeout - idle entries older than this are closed instead of
 *            handed out; zero or negative disables the check.
 */
template <typename T>
struct PoolConfig {
    using Resource = std::shared_ptr<T>;
    using Factory = std::function<Resource()>;
    using Closer = std::function<void(const Resource&)>;

    int maxCap = kDefaultMaxCap;
    int initialCap = 0;
    Factory factory;
    Closer closer;
    std::chrono::steady_clock::duration idleTimeout{0};
};

} // namespace respool
