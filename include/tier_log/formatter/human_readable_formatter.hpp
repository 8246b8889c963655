#ifndef TIER_LOG_HUMAN_READABLE_FORMATTER_HPP
#define TIER_LOG_HUMAN_READABLE_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "../core/log_common.hpp"
#include "../core/name_formatter.hpp"
#include <cstring>
#include <sstream>
#include <iomanip>

namespace tierlog {
    /// "2025-01-31 12:00:00.000 [INFO]  [         App.Database.Connection] : message"
    ///
    /// The logger name is abbreviated Logback-style and right-aligned in a
    /// column of nameWidth characters.  A width of 0 prints the name as is.
    /// Entries without a logger name omit the name column.
    class HumanReadableFormatter : public IFormatter {
    public:
        static constexpr size_t kDefaultNameWidth = 40;

        explicit HumanReadableFormatter(size_t nameWidth = kDefaultNameWidth)
            : m_nameWidth(nameWidth) {}

        std::string format(const LogEntry &entry) const override {
            std::ostringstream oss;
            const char *levelStr = getLevelString(entry.level);
            oss << formatTimestamp(entry.timestamp) << " "
                << "[" << levelStr << "]";
            for (size_t pad = std::strlen(levelStr); pad < 6; ++pad) {
                oss << ' ';
            }

            if (!entry.loggerName.empty()) {
                oss << "[";
                if (m_nameWidth > 0) {
                    oss << std::setw(static_cast<int>(m_nameWidth))
                        << abbreviateLoggerName(entry.loggerName, m_nameWidth);
                } else {
                    oss << entry.loggerName;
                }
                oss << "] ";
            }

            oss << ": " << entry.message;
            return oss.str();
        }

        size_t nameWidth() const { return m_nameWidth; }

    private:
        size_t m_nameWidth;
    };
} // namespace tierlog

#endif // TIER_LOG_HUMAN_READABLE_FORMATTER_HPP
