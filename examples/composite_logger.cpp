// composite_logger.cpp
//
// A CompositeLogger filters once and broadcasts to all members.
//
// Compile: g++ -std=c++11 -I include examples/composite_logger.cpp -o composite_logger -pthread

#include "tier_log.hpp"
#include <iostream>

int main() {
    auto audit = std::make_shared<tierlog::CompositeLogger>("Audit", tierlog::LogLevel::INFO);

    auto console = std::make_shared<tierlog::Logger>(
        "Audit", tierlog::LogLevel::ERROR,
        tierlog::detail::make_unique<tierlog::ConsoleSink>(false));

    auto jsonFile = tierlog::detail::make_unique<tierlog::FileSink>("composite_logger.jsonl");
    jsonFile->setFormatter(tierlog::detail::make_unique<tierlog::JsonFormatter>());
    auto file = std::make_shared<tierlog::Logger>("Audit", tierlog::LogLevel::FATAL, std::move(jsonFile));

    audit->addLogger(console);
    audit->addLogger(file);

    // Members were opened up to TRACE when added
    std::cout << "console level: " << tierlog::getLevelString(console->getLevel()) << std::endl;

    audit->debug("Filtered by the composite");
    audit->info("User {user} changed role to {role}", "bob", "admin");

    audit->removeLogger(file);
    audit->warn("Console only, {count} member left", audit->loggerCount());

    audit->flush();
    file->flush();
    return 0;
}
