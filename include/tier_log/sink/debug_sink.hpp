#ifndef TIER_LOG_DEBUG_SINK_HPP
#define TIER_LOG_DEBUG_SINK_HPP

#include "sink_interface.hpp"
#include "../core/log_common.hpp"
#include "../formatter/human_readable_formatter.hpp"
#include "../transport/stdout_transport.hpp"

namespace tierlog {
    /// Plain, uncoloured lines on stderr, the channel debuggers and IDE
    /// consoles capture.  Keeps stdout free for program output.
    class DebugSink : public BaseSink {
    public:
        DebugSink() {
            setFormatter(detail::make_unique<HumanReadableFormatter>());
            setTransport(detail::make_unique<StderrTransport>());
        }
    };
} // namespace tierlog

#endif // TIER_LOG_DEBUG_SINK_HPP
