#ifndef TIER_LOG_FORMATTER_INTERFACE_HPP
#define TIER_LOG_FORMATTER_INTERFACE_HPP

#include "../core/log_entry.hpp"
#include <string>

namespace tierlog {

    /// Turns an accepted entry into the text a transport writes.
    ///
    /// A sink calls format() from whatever thread is logging, possibly from
    /// several threads at once, so implementations keep no mutable state.
    /// The result carries no trailing newline; transports add line breaks.
    class IFormatter {
    public:
        virtual ~IFormatter() = default;
        virtual std::string format(const LogEntry &entry) const = 0;
    };

} // namespace tierlog

#endif // TIER_LOG_FORMATTER_INTERFACE_HPP
