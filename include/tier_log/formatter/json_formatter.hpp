#ifndef TIER_LOG_JSON_FORMATTER_HPP
#define TIER_LOG_JSON_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "../core/log_common.hpp"
#include <nlohmann/json.hpp>

namespace tierlog {
    /// One JSON object per entry: timestamp, level, logger, message.
    class JsonFormatter : public IFormatter {
    public:
        std::string format(const LogEntry &entry) const override {
            nlohmann::ordered_json j;
            j["timestamp"] = formatTimestamp(entry.timestamp);
            j["level"] = getLevelString(entry.level);
            if (!entry.loggerName.empty()) {
                j["logger"] = entry.loggerName;
            }
            j["message"] = entry.message;
            return j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
        }
    };
} // namespace tierlog

#endif // TIER_LOG_JSON_FORMATTER_HPP
