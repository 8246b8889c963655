// global_facade.cpp
//
// Process-wide access through tierlog::Log and the TIER_G* macros.
//
// Compile: g++ -std=c++11 -I include examples/global_facade.cpp -o global_facade -pthread

#include "tier_log.hpp"
#include <iostream>
#include <stdexcept>

namespace {

void connect() {
    auto log = tierlog::Log::getLogger("App.Database");
    log->debug("Connecting to {host}:{port}", "db.local", 5432);
    TIER_DEBUG(log, "Pool size {n}", 8);
}

} // namespace

int main() {
    try {
        tierlog::Log::info("Too early");
    } catch (const std::logic_error &e) {
        std::cout << "expected: " << e.what() << std::endl;
    }

    // Picks up logging-debug.properties (or logging.properties in release
    // builds) next to the process when there is one.
    tierlog::Log::configure()
        .defaultConfig()
        .level("App.Database", tierlog::LogLevel::DEBUG)
        .build();

    tierlog::Log::info("Started with {count} workers", 4);
    connect();
    TIER_GWARN("Disk usage at {pct}%", 91);

    try {
        throw std::runtime_error("socket closed");
    } catch (const std::exception &ex) {
        tierlog::Log::error(ex, "Lost connection");
    }

    tierlog::Log::shutdown();
    return 0;
}
