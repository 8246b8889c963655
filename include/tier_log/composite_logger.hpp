#ifndef TIER_LOG_COMPOSITE_LOGGER_HPP
#define TIER_LOG_COMPOSITE_LOGGER_HPP

#include "logger.hpp"
#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tierlog {

    /// Broadcasts every accepted message to a list of member loggers.
    ///
    /// Unlike a chain, the composite is the only filtering point: members
    /// are set to TRACE when added and are delivered to without their own
    /// level check, so whatever passes the composite's level reaches every
    /// member even after a LoggerFactory resets a member's level.  Members
    /// are called outside the lock in the order they were added.
    class CompositeLogger : public Logger {
    public:
        explicit CompositeLogger(const std::string &name = "",
                                 LogLevel minLevel = LogLevel::INFO)
            : Logger(name, minLevel) {}

        /// @return false if the logger is null, this composite, or already a member
        bool addLogger(const std::shared_ptr<Logger> &logger) {
            if (!logger || logger.get() == this) {
                return false;
            }
            {
                std::lock_guard<std::mutex> lock(m_membersMutex);
                if (std::find(m_members.begin(), m_members.end(), logger) != m_members.end()) {
                    return false;
                }
                m_members.push_back(logger);
            }
            logger->setLevel(LogLevel::TRACE);
            return true;
        }

        bool removeLogger(const std::shared_ptr<Logger> &logger) {
            std::lock_guard<std::mutex> lock(m_membersMutex);
            auto it = std::find(m_members.begin(), m_members.end(), logger);
            if (it == m_members.end()) {
                return false;
            }
            m_members.erase(it);
            return true;
        }

        void clearLoggers() {
            std::lock_guard<std::mutex> lock(m_membersMutex);
            m_members.clear();
        }

        size_t loggerCount() const {
            std::lock_guard<std::mutex> lock(m_membersMutex);
            return m_members.size();
        }

    protected:
        void emit(LogLevel level, const std::string &message) override {
            std::vector<std::shared_ptr<Logger> > members;
            {
                std::lock_guard<std::mutex> lock(m_membersMutex);
                members = m_members;
            }
            for (size_t i = 0; i < members.size(); ++i) {
                members[i]->dispatch(level, message, false);
            }
        }

    private:
        mutable std::mutex m_membersMutex;
        std::vector<std::shared_ptr<Logger> > m_members;
    };

} // namespace tierlog

#endif // TIER_LOG_COMPOSITE_LOGGER_HPP
