#ifndef TIER_LOG_NULL_SINK_HPP
#define TIER_LOG_NULL_SINK_HPP

#include "sink_interface.hpp"

namespace tierlog {
    /// Discards everything.
    class NullSink : public ISink {
    public:
        void write(const LogEntry &) override {}
    };
} // namespace tierlog

#endif // TIER_LOG_NULL_SINK_HPP
