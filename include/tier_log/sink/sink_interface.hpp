#ifndef TIER_LOG_SINK_INTERFACE_HPP
#define TIER_LOG_SINK_INTERFACE_HPP

#include "../core/log_entry.hpp"
#include "../formatter/formatter_interface.hpp"
#include "../transport/transport_interface.hpp"
#include <memory>

namespace tierlog {
    /// A backend that renders entries the owning Logger has already
    /// accepted.  Sinks do no level filtering of their own.
    ///
    /// Formatter and transport are meant to be set up before the sink is
    /// handed to a logger.
    class ISink {
    public:
        virtual ~ISink() = default;

        virtual void write(const LogEntry &entry) = 0;

        virtual void flush() {}

        void setFormatter(std::unique_ptr<IFormatter> formatter) {
            m_formatter = std::move(formatter);
        }

        void setTransport(std::unique_ptr<ITransport> transport) {
            m_transport = std::move(transport);
        }

        IFormatter *formatter() const { return m_formatter.get(); }
        ITransport *transport() const { return m_transport.get(); }

    protected:
        std::unique_ptr<IFormatter> m_formatter;
        std::unique_ptr<ITransport> m_transport;
    };

    /// Format with the formatter, hand the line to the transport.
    class BaseSink : public ISink {
    public:
        void write(const LogEntry &entry) override {
            if (m_formatter && m_transport) {
                m_transport->write(m_formatter->format(entry));
            }
        }

        void flush() override {
            if (m_transport) {
                m_transport->flush();
            }
        }
    };
} // namespace tierlog

#endif // TIER_LOG_SINK_INTERFACE_HPP
