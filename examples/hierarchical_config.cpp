// hierarchical_config.cpp
//
// Exact rules, wildcard rules and the root level from a properties file.
//
// Compile: g++ -std=c++11 -I include examples/hierarchical_config.cpp -o hierarchical_config -pthread

#include "tier_log.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>

int main() {
    const char *path = "hierarchical_config.properties";
    {
        std::ofstream out(path);
        out << "# Root applies when nothing else matches\n"
            << "root=WARN\n"
            << "\n"
            << "app.database.connection=TRACE\n"
            << "app.database.*=DEBUG\n"
            << "app.*=INFO\n"
            << "! network noise\n"
            << "net.*=ERROR\n";
    }

    auto factory = tierlog::LoggerFactory::create();
    try {
        factory->loadConfig(path);
    } catch (const tierlog::ConfigError &e) {
        std::cerr << "Cannot load " << e.path() << ": " << e.what() << std::endl;
        return 1;
    }

    const char *names[] = {
        "App.Database.Connection",
        "App.Database.Pool",
        "App.UI.MainForm",
        "Net.Http",
        "Metrics"
    };
    for (const char *name : names) {
        auto log = factory->getLogger(name);
        std::cout << name << " -> " << tierlog::getLevelString(log->getLevel()) << std::endl;
        log->debug("debug from {name}", name);
        log->warn("warn from {name}", name);
    }

    std::remove(path);
    return 0;
}
