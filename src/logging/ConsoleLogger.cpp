#include "respool/logger/ConsoleLogger.hpp"

#include <iostream>

namespace respool {

void ConsoleLogger::logMessage(std::string_view msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "[respool] " << msg << std::endl;
}

void ConsoleLogger::logError(std::string_view msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << "[respool] " << msg << std::endl;
}

} // namespace respool
