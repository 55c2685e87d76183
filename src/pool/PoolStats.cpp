#include "respool/pool/PoolStats.hpp"
#include "respool/logger/Logger.hpp"

#include <sstream>

namespace respool {

std::string formatStats(const PoolStats& stats) {
    std::ostringstream oss;
    oss << "Hits: " << stats.hits
        << "\tMisses: " << stats.misses
        << "\tStaleEvictions: " << stats.staleEvictions
        << "\tEvictionCloseFailures: " << stats.evictionCloseFailures
        << "\tOverflowCloses: " << stats.overflowCloses;
    return oss.str();
}

void logStats(Logger& logger, const PoolStats& stats) {
    logger.logMessage("TotalIdle: " + std::to_string(stats.totalIdle));
    logger.logMessage(formatStats(stats));
}

} // namespace respool
