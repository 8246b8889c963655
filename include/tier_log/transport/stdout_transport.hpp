#ifndef TIER_LOG_STDOUT_TRANSPORT_HPP
#define TIER_LOG_STDOUT_TRANSPORT_HPP

#include "transport_interface.hpp"
#include <iostream>
#include <mutex>
#include <ostream>

namespace tierlog {

    /// Writes one line per entry to a process-wide standard stream.
    ///
    /// The stream is looked up on every write, so redirecting std::cout's
    /// buffer after construction is honoured.  Every transport bound to the
    /// same stream serializes on one mutex and whole lines never interleave.
    template<std::ostream &(*Stream)()>
    class StandardStreamTransport : public ITransport {
    public:
        void write(const std::string &formattedEntry) override {
            std::lock_guard<std::mutex> lock(streamMutex());
            Stream() << formattedEntry << '\n' << std::flush;
        }

        void flush() override {
            std::lock_guard<std::mutex> lock(streamMutex());
            Stream().flush();
        }

    private:
        static std::mutex &streamMutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }
    };

    namespace detail {
        inline std::ostream &standardOut() { return std::cout; }
        inline std::ostream &standardError() { return std::cerr; }
    } // namespace detail

    typedef StandardStreamTransport<&detail::standardOut> StdoutTransport;
    typedef StandardStreamTransport<&detail::standardError> StderrTransport;

} // namespace tierlog

#endif // TIER_LOG_STDOUT_TRANSPORT_HPP
