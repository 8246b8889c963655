#ifndef TIER_LOG_LOGGER_HPP
#define TIER_LOG_LOGGER_HPP

#include "core/log_common.hpp"
#include "core/log_entry.hpp"
#include "core/log_level.hpp"
#include "core/exception_info.hpp"
#include "core/message_format.hpp"
#include "core/name_formatter.hpp"
#include "sink/sink_interface.hpp"
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace tierlog {

    /// A named logging destination that can be linked to a successor.
    ///
    /// Every call runs the reload hook, renders through emit() when the
    /// level passes this node's threshold, and then forwards the same call
    /// to the next node whether or not this node rendered it.  Each node in
    /// a chain therefore filters on its own level:
    /// @code
    ///   auto console = std::make_shared<Logger>("app", LogLevel::DEBUG,
    ///                                           detail::make_unique<ConsoleSink>());
    ///   auto file = std::make_shared<Logger>("app", LogLevel::WARN,
    ///                                        detail::make_unique<FileSink>("app.log"));
    ///   console->addToChain(file);
    ///   console->info("Started");   // console only
    ///   console->error("Failed");   // console and file
    /// @endcode
    ///
    /// Thread safety: level and next link are guarded by a per-node mutex.
    /// Chain walks hold one node's mutex at a time, so a walk racing with a
    /// structural change may see the chain before or after that change.
    /// No lock is held while emit() runs.
    class Logger {
    public:
        typedef std::function<void()> ReloadHook;

        explicit Logger(const std::string &name = "",
                        LogLevel minLevel = LogLevel::INFO,
                        std::unique_ptr<ISink> sink = nullptr)
            : m_name(name)
            , m_minLevel(minLevel)
            , m_sink(std::move(sink)) {}

        virtual ~Logger() = default;

        Logger(const Logger &) = delete;
        Logger &operator=(const Logger &) = delete;

        // ------------------------------------------------------------------
        //  Logging
        // ------------------------------------------------------------------

        void trace(const std::string &message) { log(LogLevel::TRACE, message); }

        template<typename T, typename... Args>
        void trace(const std::string &messageTemplate, const T &first, const Args &... rest) {
            log(LogLevel::TRACE, detail::formatMessage(messageTemplate, first, rest...));
        }

        void trace(const std::exception &ex, const std::string &message) {
            log(LogLevel::TRACE, detail::formatExceptionMessage(message, ex));
        }

        template<typename T, typename... Args>
        void trace(const std::exception &ex, const std::string &messageTemplate,
                   const T &first, const Args &... rest) {
            log(LogLevel::TRACE, detail::formatExceptionMessage(
                detail::formatMessage(messageTemplate, first, rest...), ex));
        }

        void debug(const std::string &message) { log(LogLevel::DEBUG, message); }

        template<typename T, typename... Args>
        void debug(const std::string &messageTemplate, const T &first, const Args &... rest) {
            log(LogLevel::DEBUG, detail::formatMessage(messageTemplate, first, rest...));
        }

        void debug(const std::exception &ex, const std::string &message) {
            log(LogLevel::DEBUG, detail::formatExceptionMessage(message, ex));
        }

        template<typename T, typename... Args>
        void debug(const std::exception &ex, const std::string &messageTemplate,
                   const T &first, const Args &... rest) {
            log(LogLevel::DEBUG, detail::formatExceptionMessage(
                detail::formatMessage(messageTemplate, first, rest...), ex));
        }

        void info(const std::string &message) { log(LogLevel::INFO, message); }

        template<typename T, typename... Args>
        void info(const std::string &messageTemplate, const T &first, const Args &... rest) {
            log(LogLevel::INFO, detail::formatMessage(messageTemplate, first, rest...));
        }

        void info(const std::exception &ex, const std::string &message) {
            log(LogLevel::INFO, detail::formatExceptionMessage(message, ex));
        }

        template<typename T, typename... Args>
        void info(const std::exception &ex, const std::string &messageTemplate,
                  const T &first, const Args &... rest) {
            log(LogLevel::INFO, detail::formatExceptionMessage(
                detail::formatMessage(messageTemplate, first, rest...), ex));
        }

        void warn(const std::string &message) { log(LogLevel::WARN, message); }

        template<typename T, typename... Args>
        void warn(const std::string &messageTemplate, const T &first, const Args &... rest) {
            log(LogLevel::WARN, detail::formatMessage(messageTemplate, first, rest...));
        }

        void warn(const std::exception &ex, const std::string &message) {
            log(LogLevel::WARN, detail::formatExceptionMessage(message, ex));
        }

        template<typename T, typename... Args>
        void warn(const std::exception &ex, const std::string &messageTemplate,
                  const T &first, const Args &... rest) {
            log(LogLevel::WARN, detail::formatExceptionMessage(
                detail::formatMessage(messageTemplate, first, rest...), ex));
        }

        void error(const std::string &message) { log(LogLevel::ERROR, message); }

        template<typename T, typename... Args>
        void error(const std::string &messageTemplate, const T &first, const Args &... rest) {
            log(LogLevel::ERROR, detail::formatMessage(messageTemplate, first, rest...));
        }

        void error(const std::exception &ex, const std::string &message) {
            log(LogLevel::ERROR, detail::formatExceptionMessage(message, ex));
        }

        template<typename T, typename... Args>
        void error(const std::exception &ex, const std::string &messageTemplate,
                   const T &first, const Args &... rest) {
            log(LogLevel::ERROR, detail::formatExceptionMessage(
                detail::formatMessage(messageTemplate, first, rest...), ex));
        }

        void fatal(const std::string &message) { log(LogLevel::FATAL, message); }

        template<typename T, typename... Args>
        void fatal(const std::string &messageTemplate, const T &first, const Args &... rest) {
            log(LogLevel::FATAL, detail::formatMessage(messageTemplate, first, rest...));
        }

        void fatal(const std::exception &ex, const std::string &message) {
            log(LogLevel::FATAL, detail::formatExceptionMessage(message, ex));
        }

        template<typename T, typename... Args>
        void fatal(const std::exception &ex, const std::string &messageTemplate,
                   const T &first, const Args &... rest) {
            log(LogLevel::FATAL, detail::formatExceptionMessage(
                detail::formatMessage(messageTemplate, first, rest...), ex));
        }

        /// Every call shape ends up here with the final text.
        void log(LogLevel level, const std::string &message) {
            dispatch(level, message, true);
        }

        /// Runs the reload hook, if any, without logging anything.  The
        /// TIER_* macros call this before their level gate so that a
        /// disabled call still notices a changed configuration file.
        void checkReload() {
            std::shared_ptr<ReloadHook> hook;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                hook = m_reloadHook;
            }
            if (hook && *hook) {
                (*hook)();
            }
        }

        void flush() {
            if (m_sink) {
                m_sink->flush();
            }
            std::shared_ptr<Logger> nextLogger = next();
            if (nextLogger) {
                nextLogger->flush();
            }
        }

        // ------------------------------------------------------------------
        //  Level checks
        // ------------------------------------------------------------------

        bool isEnabled(LogLevel level) const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return level >= m_minLevel;
        }

        bool isTraceEnabled() const { return isEnabled(LogLevel::TRACE); }
        bool isDebugEnabled() const { return isEnabled(LogLevel::DEBUG); }
        bool isInfoEnabled() const { return isEnabled(LogLevel::INFO); }
        bool isWarnEnabled() const { return isEnabled(LogLevel::WARN); }
        bool isErrorEnabled() const { return isEnabled(LogLevel::ERROR); }
        bool isFatalEnabled() const { return isEnabled(LogLevel::FATAL); }

        /// True if this node or any node after it would render the level.
        bool isEnabledInChain(LogLevel level) const {
            if (isEnabled(level)) return true;
            std::shared_ptr<Logger> current = next();
            while (current) {
                if (current->isEnabled(level)) return true;
                current = current->next();
            }
            return false;
        }

        // ------------------------------------------------------------------
        //  Configuration
        // ------------------------------------------------------------------

        void setLevel(LogLevel level) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_minLevel = level;
        }

        LogLevel getLevel() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_minLevel;
        }

        const std::string &name() const { return m_name; }

        std::string abbreviatedName(size_t width = 40) const {
            return abbreviateLoggerName(m_name, width);
        }

        ISink *sink() const { return m_sink.get(); }

        /// Called at the start of every log() before the level check.
        /// LoggerFactory installs its configuration reload check here.
        void setReloadHook(ReloadHook hook) {
            std::shared_ptr<ReloadHook> shared;
            if (hook) {
                shared = std::make_shared<ReloadHook>(std::move(hook));
            }
            std::lock_guard<std::mutex> lock(m_mutex);
            m_reloadHook = std::move(shared);
        }

        // ------------------------------------------------------------------
        //  Chain
        // ------------------------------------------------------------------

        std::shared_ptr<Logger> next() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_next;
        }

        /// Raw link replacement without cycle checks; prefer addToChain().
        void setNext(std::shared_ptr<Logger> logger) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_next = std::move(logger);
        }

        /// Append a logger at the end of this chain.
        ///
        /// Adding a logger that is already in the chain (or this node) is a
        /// no-op.  So is adding a logger whose own chain runs into this one,
        /// since linking it would close a cycle.
        /// @return the logger passed in, or null if it was null
        std::shared_ptr<Logger> addToChain(const std::shared_ptr<Logger> &logger) {
            if (!logger) {
                return nullptr;
            }

            std::unordered_set<const Logger *> members;
            members.insert(this);
            Logger *tail = this;
            std::shared_ptr<Logger> hold;
            while (true) {
                std::shared_ptr<Logger> nextLogger = tail->next();
                if (!nextLogger) break;
                members.insert(nextLogger.get());
                hold = std::move(nextLogger);
                tail = hold.get();
            }

            if (members.count(logger.get()) > 0) {
                return logger;
            }

            std::shared_ptr<Logger> current = logger->next();
            while (current) {
                if (members.count(current.get()) > 0) {
                    return logger;
                }
                current = current->next();
            }

            tail->setNext(logger);
            return logger;
        }

        /// Unlink a logger: its successor takes its place and its own next
        /// link is cleared.
        /// @return false if the logger is null, this node, or not in the chain
        bool removeFromChain(const std::shared_ptr<Logger> &logger) {
            if (!logger || logger.get() == this) {
                return false;
            }

            Logger *current = this;
            std::shared_ptr<Logger> hold;
            while (true) {
                std::shared_ptr<Logger> nextLogger = current->next();
                if (!nextLogger) {
                    return false;
                }
                if (nextLogger == logger) {
                    current->setNext(logger->next());
                    logger->setNext(nullptr);
                    return true;
                }
                hold = std::move(nextLogger);
                current = hold.get();
            }
        }

        /// Nodes reachable from here, this one included.
        size_t chainCount() const {
            size_t count = 1;
            std::shared_ptr<Logger> current = next();
            while (current) {
                ++count;
                current = current->next();
            }
            return count;
        }

        /// Detach this node's successor.  Downstream links are left as they are.
        void clearChain() {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_next.reset();
        }

    protected:
        /// Render one accepted message.  The default builds a LogEntry and
        /// writes it to the sink; nodes without a sink drop it.
        virtual void emit(LogLevel level, const std::string &message) {
            if (!m_sink) {
                return;
            }
            LogEntry entry;
            entry.level = level;
            entry.loggerName = m_name;
            entry.message = message;
            entry.timestamp = std::chrono::system_clock::now();
            m_sink->write(entry);
        }

    private:
        friend class CompositeLogger;

        // CompositeLogger delivers with applyLevel == false: its own level is
        // the only filter for members, whatever their level is reset to later.
        // Nodes after this one still filter on their own level.
        void dispatch(LogLevel level, const std::string &message, bool applyLevel) {
            checkReload();

            bool enabled;
            std::shared_ptr<Logger> next;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                enabled = !applyLevel || level >= m_minLevel;
                next = m_next;
            }

            if (enabled) {
                emit(level, message);
            }

            if (next) {
                next->log(level, message);
            }
        }

        const std::string m_name;
        mutable std::mutex m_mutex;
        LogLevel m_minLevel;
        std::shared_ptr<Logger> m_next;
        std::shared_ptr<ReloadHook> m_reloadHook;
        std::unique_ptr<ISink> m_sink;
    };

} // namespace tierlog

#endif // TIER_LOG_LOGGER_HPP
