#pragma once

#include "respool/logger/Logger.hpp"
#include <fstream>
#include <mutex>
#include <string>

namespace respool {

/**
 * File logger that appends timestamped lines to a file.
 * Pool operations log from arbitrary caller threads, so writes are
 * serialized with an internal mutex.
 */
class FileLogger : public Logger {
  public:
    /**
     * Create a file logger.
     * @param filepath Path to log file (will be created/appended to)
     * @param auto_flush If true, flush after each log message
     */
    explicit FileLogger(const std::string& filepath, bool auto_flush = true);
    ~FileLogger();

    void logMessage(std::string_view msg) override;
    void logError(std::string_view msg) override;

    void flush();

    // Reopen the log file (for log rotation via SIGHUP)
    void reopen();

  private:
    void writeLine(std::string_view level, std::string_view msg);

    std::mutex mutex_;
    std::ofstream file_;
    bool auto_flush_;
    std::string filepath_;
};

} // namespace respool
