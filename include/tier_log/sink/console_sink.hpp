#ifndef TIER_LOG_CONSOLE_SINK_HPP
#define TIER_LOG_CONSOLE_SINK_HPP

#include "sink_interface.hpp"
#include "../core/log_common.hpp"
#include "../formatter/human_readable_formatter.hpp"
#include "../transport/stdout_transport.hpp"
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <unistd.h>

namespace tierlog {
    enum class ConsoleStream { StdOut, StdErr };

    /// Human-readable console output with the [LEVEL] tag coloured by
    /// severity.
    ///
    /// Colour is off when requested, when the stream is not a TTY, or when
    /// NO_COLOR or TIER_LOG_NO_COLOR is set.
    class ConsoleSink : public BaseSink {
    public:
        explicit ConsoleSink(bool useColors = true, ConsoleStream stream = ConsoleStream::StdOut) {
            setFormatter(detail::make_unique<HumanReadableFormatter>());
            if (stream == ConsoleStream::StdOut) {
                setTransport(detail::make_unique<StdoutTransport>());
            } else {
                setTransport(detail::make_unique<StderrTransport>());
            }
            m_colorEnabled.store(useColors && detectColorSupport(stream), std::memory_order_relaxed);
        }

        void setColor(bool enabled) { m_colorEnabled.store(enabled, std::memory_order_relaxed); }

        bool isColorEnabled() const { return m_colorEnabled.load(std::memory_order_relaxed); }

        void write(const LogEntry &entry) override {
            IFormatter *fmt = formatter();
            ITransport *tp = transport();
            if (fmt && tp) {
                std::string formatted = fmt->format(entry);
                if (m_colorEnabled.load(std::memory_order_relaxed)) {
                    formatted = colorize(formatted, entry.level);
                }
                tp->write(formatted);
            }
        }

        /// Wrap the first "[LEVEL]" tag in ANSI colour codes; text without
        /// the tag is returned unchanged.
        static std::string colorize(const std::string &text, LogLevel level) {
            std::string tag = "[";
            tag += getLevelString(level);
            tag += "]";

            size_t pos = text.find(tag);
            if (pos == std::string::npos) return text;

            std::string result;
            result.reserve(text.size() + 16);
            result.append(text, 0, pos);
            result += getColorCode(level);
            result += tag;
            result += "\033[0m";
            result.append(text, pos + tag.size(), std::string::npos);
            return result;
        }

        static const char *getColorCode(LogLevel level) {
            switch (level) {
                case LogLevel::TRACE: return "\033[2m";      // dim
                case LogLevel::DEBUG: return "\033[36m";     // cyan
                case LogLevel::INFO:  return "\033[32m";     // green
                case LogLevel::WARN:  return "\033[33m";     // yellow
                case LogLevel::ERROR: return "\033[31m";     // red
                case LogLevel::FATAL: return "\033[1;41m";   // bold on red
                default: return "";
            }
        }

    private:
        std::atomic<bool> m_colorEnabled;

        static bool detectColorSupport(ConsoleStream stream) {
            if (std::getenv("NO_COLOR") != nullptr) return false;

            const char *noColor = std::getenv("TIER_LOG_NO_COLOR");
            if (noColor && noColor[0] != '\0') return false;

            FILE *fp = (stream == ConsoleStream::StdOut) ? stdout : stderr;
            return isatty(fileno(fp)) != 0;
        }
    };
} // namespace tierlog

#endif // TIER_LOG_CONSOLE_SINK_HPP
