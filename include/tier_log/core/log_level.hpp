#ifndef TIER_LOG_LEVEL_HPP
#define TIER_LOG_LEVEL_HPP

#include <string>
#include <cctype>

namespace tierlog {
    enum class LogLevel {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR,
        FATAL
    };

    inline const char *getLevelString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default: return "UNKNOWN";
        }
    }

    /// Case-insensitive, whitespace-tolerant level lookup.
    /// Unknown strings map to INFO; configuration typos never throw.
    inline LogLevel parseLevel(const std::string &value) {
        size_t start = 0;
        while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) ++start;
        size_t end = value.size();
        while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;

        std::string upper;
        upper.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            upper += static_cast<char>(std::toupper(static_cast<unsigned char>(value[i])));
        }

        if (upper == "TRACE") return LogLevel::TRACE;
        if (upper == "DEBUG") return LogLevel::DEBUG;
        if (upper == "INFO")  return LogLevel::INFO;
        if (upper == "WARN")  return LogLevel::WARN;
        if (upper == "ERROR") return LogLevel::ERROR;
        if (upper == "FATAL") return LogLevel::FATAL;
        return LogLevel::INFO;
    }
} // namespace tierlog

#endif // TIER_LOG_LEVEL_HPP
