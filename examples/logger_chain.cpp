// logger_chain.cpp
//
// One log call fanned out along a chain.  Every node applies its own
// level, so the console can show everything while the file keeps errors only.
//
// Compile: g++ -std=c++11 -I include examples/logger_chain.cpp -o logger_chain -pthread

#include "tier_log.hpp"

int main() {
    auto console = std::make_shared<tierlog::Logger>(
        "App", tierlog::LogLevel::TRACE,
        tierlog::detail::make_unique<tierlog::ConsoleSink>());

    auto errorsFile = std::make_shared<tierlog::Logger>(
        "App", tierlog::LogLevel::ERROR,
        tierlog::detail::make_unique<tierlog::FileSink>("logger_chain.errors.log"));

    auto debugOutput = std::make_shared<tierlog::Logger>(
        "App", tierlog::LogLevel::WARN,
        tierlog::detail::make_unique<tierlog::DebugSink>());

    console->addToChain(errorsFile);
    console->addToChain(debugOutput);

    // Adding an existing member again changes nothing
    console->addToChain(errorsFile);

    console->debug("Console only");
    console->warn("Console and debug output");
    console->error("Everywhere: {code}", 500);

    // Gate expensive arguments on the whole chain
    TIER_TRACE(console, "Cache state {state}", "warm");

    console->removeFromChain(debugOutput);
    console->error("Console and file, {count} nodes", console->chainCount());

    console->flush();
    return 0;
}
