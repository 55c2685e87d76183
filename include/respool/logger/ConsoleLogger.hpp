#pragma once

#include "respool/logger/Logger.hpp"

#include <mutex>

namespace respool {

// Writes messages to stdout and errors to stderr, one line per call
class ConsoleLogger : public Logger {
  public:
    void logMessage(std::string_view msg) override;
    void logError(std::string_view msg) override;

  private:
    std::mutex mutex_;
};

} // namespace respool
