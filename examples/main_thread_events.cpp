// main_thread_events.cpp
//
// Worker threads log through an EventSink; the main loop drains the queue
// and runs the handlers on its own thread, the way a UI would.
//
// Compile: g++ -std=c++11 -I include examples/main_thread_events.cpp -o main_thread_events -pthread

#include "tier_log.hpp"
#include <atomic>
#include <iostream>
#include <thread>
#include <vector>

int main() {
    auto queue = std::make_shared<tierlog::EventQueue>();

    auto sink = tierlog::detail::make_unique<tierlog::EventSink>(queue);
    sink->setHandler(tierlog::LogLevel::ERROR, [](const tierlog::LogEntry &entry) {
        std::cout << "[status bar] " << entry.message << std::endl;
    });
    sink->setMessageHandler([](const tierlog::LogEntry &entry) {
        std::cout << "[log view] " << entry.loggerName << ": " << entry.message << std::endl;
    });

    auto ui = std::make_shared<tierlog::Logger>("App.UI", tierlog::LogLevel::DEBUG, std::move(sink));

    std::atomic<int> running(3);
    std::vector<std::thread> workers;
    for (int t = 0; t < 3; ++t) {
        workers.emplace_back([ui, &running, t]() {
            for (int i = 0; i < 3; ++i) {
                ui->info("worker {id} step {step}", t, i);
            }
            if (t == 2) {
                ui->error("worker {id} lost its connection", t);
            }
            running.fetch_sub(1);
        });
    }

    // Main loop
    while (running.load() > 0) {
        if (queue->waitForEvents(std::chrono::milliseconds(50))) {
            queue->dispatchPending();
        }
    }

    for (auto &worker : workers) {
        worker.join();
    }
    queue->dispatchPending();
    return 0;
}
