#include "respool/logger/Logger.hpp"
#include "respool/logger/ConsoleLogger.hpp"

#include <atomic>
#include <exception>
#include <string>

namespace {
    std::atomic<respool::Logger*> logger{nullptr};

    void appendException(std::string& out, const std::exception& e) {
        out += ": ";
        out += e.what();
        try {
            std::rethrow_if_nested(e);
        } catch (const std::exception& nested) {
            appendException(out, nested);
        } catch (...) {
            out += ": unknown nested exception type";
        }
    }
}

namespace respool {

void Logger::logCurrentError(std::string_view context_msg) {
    auto eptr = std::current_exception();
    std::string full_message(context_msg);

    if (eptr) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            appendException(full_message, e);
        } catch (...) {
            full_message += ": unknown exception type";
        }
    } else {
        full_message += ": no current exception";
    }

    logError(full_message);
}

void Logger::setGlobalLogger(Logger* ptr) {
    logger.store(ptr, std::memory_order_release);
}

Logger& Logger::getInstance() {
    auto* ptr = logger.load(std::memory_order_acquire);
    if (!ptr) {
        // Leaked on purpose so it outlives pools destroyed during static teardown
        static respool::ConsoleLogger* fallback_logger = new respool::ConsoleLogger();
        return *fallback_logger;
    }
    return *ptr;
}

} // namespace respool
