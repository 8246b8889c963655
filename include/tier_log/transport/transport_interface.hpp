#ifndef TIER_LOG_TRANSPORT_INTERFACE_HPP
#define TIER_LOG_TRANSPORT_INTERFACE_HPP

#include <string>

namespace tierlog {

    class ITransport {
    public:
        virtual ~ITransport() = default;
        virtual void write(const std::string& formattedEntry) = 0;
        virtual void flush() {}
    };

} // namespace tierlog

#endif // TIER_LOG_TRANSPORT_INTERFACE_HPP
