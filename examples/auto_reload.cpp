// auto_reload.cpp
//
// With scan=true the factory re-reads the properties file once the scan
// period has passed and it changed on disk.  The check piggybacks on log
// calls, there is no watcher thread.
//
// Compile: g++ -std=c++11 -I include examples/auto_reload.cpp -o auto_reload -pthread

#include "tier_log.hpp"
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <thread>

namespace {

void writeConfig(const char *path, const char *level) {
    std::ofstream out(path, std::ios::trunc);
    out << "scan=true\n"
        << "scan.period=1 second\n"
        << "app.worker=" << level << "\n";
}

} // namespace

int main() {
    const char *path = "auto_reload.properties";
    writeConfig(path, "WARN");

    auto factory = tierlog::LoggerFactory::configure()
        .configFile(path)
        .writeTo<tierlog::ConsoleSink>()
        .build();
    auto worker = factory->getLogger("App.Worker");

    worker->info("Hidden, level is WARN");

    writeConfig(path, "DEBUG");
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    // This call notices the change and applies it before its own level check
    worker->info("Shown after the reload");
    std::cout << "level now " << tierlog::getLevelString(worker->getLevel()) << std::endl;

    // Loading explicitly bypasses the scan period
    writeConfig(path, "ERROR");
    factory->loadConfig(path);
    worker->warn("Hidden again");

    std::remove(path);
    return 0;
}
