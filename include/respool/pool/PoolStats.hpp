#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace respool {

class Logger;

// Point-in-time counters. Best effort: not synchronized with the idle buffer.
struct PoolStats {
    uint64_t hits = 0;                  // acquire served from the idle buffer
    uint64_t misses = 0;                // acquire served by the factory
    size_t totalIdle = 0;               // idle buffer length when sampled
    uint64_t staleEvictions = 0;        // idle entries closed for exceeding idleTimeout
    uint64_t evictionCloseFailures = 0; // closer failures suppressed during eviction
    uint64_t overflowCloses = 0;        // releases closed because the buffer was full
};

std::string formatStats(const PoolStats& stats);

// Writes the two-line summary through `logger`
void logStats(Logger& logger, const PoolStats& stats);

} // namespace respool
