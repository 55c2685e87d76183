#pragma once

// Debug configuration
// Set to 1 to trace every acquire/release decision, 0 for production builds
#ifndef RESPOOL_DEBUG
#define RESPOOL_DEBUG 0
#endif

// Stream-style trace macro - compiles to nothing when RESPOOL_DEBUG is 0
#if RESPOOL_DEBUG
#include "respool/logger/Logger.hpp"
#include <sstream>
#define RESPOOL_DEBUG_LOG(msg) \
    do { \
        std::ostringstream oss; \
        oss << msg; \
        respool::Logger::getInstance().logMessage(oss.str()); \
    } while(0)
#else
#define RESPOOL_DEBUG_LOG(msg) ((void)0)
#endif

namespace respool {

// Capacity used when PoolConfig::maxCap is not positive
constexpr int kDefaultMaxCap = 10;

} // namespace respool
