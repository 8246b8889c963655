#ifndef TIER_LOG_SCAN_PERIOD_HPP
#define TIER_LOG_SCAN_PERIOD_HPP

#include "../core/log_common.hpp"
#include <chrono>
#include <string>
#include <sstream>
#include <cstdlib>
#include <cmath>

namespace tierlog {

    static constexpr long long kDefaultScanPeriodMs = 60000;
    static constexpr long long kMinScanPeriodMs = 1000;

    inline std::chrono::milliseconds clampScanPeriod(std::chrono::milliseconds period) {
        if (period.count() < kMinScanPeriodMs) {
            return std::chrono::milliseconds(kMinScanPeriodMs);
        }
        return period;
    }

    /// Parses "<number> <unit>", e.g. "30 seconds" or "1.5 h".
    /// Malformed input yields the 60 s default; every result is floored
    /// at one second.
    inline std::chrono::milliseconds parseScanPeriod(const std::string &value) {
        std::istringstream iss(value);
        std::string numberPart;
        std::string unitPart;
        std::string extra;
        if (!(iss >> numberPart >> unitPart) || (iss >> extra)) {
            return std::chrono::milliseconds(kDefaultScanPeriodMs);
        }

        const char *begin = numberPart.c_str();
        char *end = nullptr;
        double number = std::strtod(begin, &end);
        if (end == begin || *end != '\0' || !std::isfinite(number)) {
            return std::chrono::milliseconds(kDefaultScanPeriodMs);
        }

        std::string unit = detail::toLower(unitPart);
        double factor;
        if (unit == "millisecond" || unit == "milliseconds" || unit == "ms") {
            factor = 1.0;
        } else if (unit == "second" || unit == "seconds" || unit == "s") {
            factor = 1000.0;
        } else if (unit == "minute" || unit == "minutes" || unit == "m") {
            factor = 60.0 * 1000.0;
        } else if (unit == "hour" || unit == "hours" || unit == "h") {
            factor = 60.0 * 60.0 * 1000.0;
        } else if (unit == "day" || unit == "days" || unit == "d") {
            factor = 24.0 * 60.0 * 60.0 * 1000.0;
        } else {
            return std::chrono::milliseconds(kDefaultScanPeriodMs);
        }

        double ms = number * factor;
        // Anything beyond ~290 years cannot be represented in steady_clock nanoseconds.
        if (ms > 9.0e12) {
            return std::chrono::milliseconds(kDefaultScanPeriodMs);
        }
        return clampScanPeriod(std::chrono::milliseconds(static_cast<long long>(ms)));
    }

} // namespace tierlog

#endif // TIER_LOG_SCAN_PERIOD_HPP
