#ifndef TIER_LOG_CLOCK_HPP
#define TIER_LOG_CLOCK_HPP

#include <chrono>

namespace tierlog {

    /// Monotonic time source used by the configuration reload check.
    class IClock {
    public:
        virtual ~IClock() = default;
        virtual std::chrono::steady_clock::time_point now() const = 0;
    };

    class SteadyClock : public IClock {
    public:
        std::chrono::steady_clock::time_point now() const override {
            return std::chrono::steady_clock::now();
        }
    };

} // namespace tierlog

#endif // TIER_LOG_CLOCK_HPP
