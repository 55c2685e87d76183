#pragma once

#include "respool/pool/PoolStats.hpp"

#include <cstddef>
#include <memory>

namespace respool {

/**
 * Caller-facing pool interface. Pools are owned by whoever creates them
 * and handed to users by reference; there is no process-wide instance.
 */
template <typename T>
class Pooler {
  public:
    using Resource = std::shared_ptr<T>;

    virtual ~Pooler() = default;

    // Reuse a fresh idle resource or create a new one
    virtual Resource acquire() = 0;

    // Park a resource for reuse, closing it if it cannot be kept
    virtual void release(Resource resource) = 0;

    // Destroy a resource through the configured closer
    virtual void close(Resource resource) = 0;

    // Close every idle resource and refuse further acquires
    virtual void shutdown() = 0;

    virtual size_t size() const = 0;
    virtual PoolStats stats() const = 0;
};

} // namespace respool
