// basic_usage.cpp
//
// Named loggers from a factory, the four call shapes, and per-logger levels.
//
// Compile: g++ -std=c++11 -I include examples/basic_usage.cpp -o basic_usage -pthread

#include "tier_log.hpp"
#include <stdexcept>

int main() {
    auto factory = tierlog::LoggerFactory::create();
    factory->setDefaultLevel(tierlog::LogLevel::DEBUG);

    auto log = factory->getLogger("App.Orders.Checkout");

    log->trace("Not shown, the default level is DEBUG");
    log->debug("Cart has {count} items", 3);
    log->info("User {username} checked out from {ip}", "alice", "192.168.1.1");
    log->warn("Plain messages are not formatted: {literal}");

    try {
        throw std::runtime_error("card declined");
    } catch (const std::exception &ex) {
        log->error(ex, "Payment failed");
        log->error(ex, "Payment {id} failed", 1042);
    }

    // Same logger, case-insensitive lookup
    factory->getLogger("app.orders.checkout")->fatal("Shutting down");

    // Raise one logger's level at runtime
    factory->setLoggerLevel("App.Orders.*", tierlog::LogLevel::ERROR);
    log->info("Not shown any more");
    log->error("Still shown");

    log->flush();
    return 0;
}
