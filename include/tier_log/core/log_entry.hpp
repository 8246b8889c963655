#ifndef TIER_LOG_ENTRY_HPP
#define TIER_LOG_ENTRY_HPP

#include "log_level.hpp"
#include <string>
#include <chrono>

namespace tierlog {
    struct LogEntry {
        LogLevel level;
        std::string loggerName;
        std::string message;
        std::chrono::system_clock::time_point timestamp;
    };
} // namespace tierlog

#endif // TIER_LOG_ENTRY_HPP
