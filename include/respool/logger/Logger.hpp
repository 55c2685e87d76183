#pragma once
#include <string>
#include <string_view>

namespace respool {

class Logger {
public:
    virtual ~Logger() = default;
    virtual void logMessage(std::string_view msg) = 0;
    virtual void logError(std::string_view msg) = 0;

    /**
     * Log the in-flight exception prefixed with a context message.
     * Must be called from within a catch block; nested exceptions
     * (std::throw_with_nested) are unwound and appended in order.
     */
    void logCurrentError(std::string_view context_msg);

    static void setGlobalLogger(Logger* ptr);
    static Logger& getInstance();
};

} // namespace respool
