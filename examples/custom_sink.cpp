// custom_sink.cpp
//
// Demonstrates how to create a custom sink by extending tierlog::ISink
// and how to give every factory logger its own instance.
//
// A sink only sees entries its logger already accepted.  Use the built-in
// formatter via formatter()->format(entry), or format in write() yourself.
//
// Compile: g++ -std=c++11 -I include examples/custom_sink.cpp -o custom_sink -pthread

#include "tier_log.hpp"
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// ---------------------------------------------------------------
// Example 1: Prefix every line
// ---------------------------------------------------------------
class PrefixedConsoleSink : public tierlog::ISink {
public:
    explicit PrefixedConsoleSink(const std::string &prefix) : m_prefix(prefix) {
        setFormatter(tierlog::detail::make_unique<tierlog::HumanReadableFormatter>(0));
    }

    void write(const tierlog::LogEntry &entry) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::cout << m_prefix << " " << formatter()->format(entry) << std::endl;
    }

private:
    std::string m_prefix;
    std::mutex m_mutex;
};

// ---------------------------------------------------------------
// Example 2: Collect lines in memory, shared by all loggers
// ---------------------------------------------------------------
class MemorySink : public tierlog::ISink {
public:
    struct Buffer {
        std::mutex mutex;
        std::vector<std::string> lines;
    };

    explicit MemorySink(std::shared_ptr<Buffer> buffer) : m_buffer(std::move(buffer)) {
        setFormatter(tierlog::detail::make_unique<tierlog::JsonFormatter>());
    }

    void write(const tierlog::LogEntry &entry) override {
        std::string formatted = formatter()->format(entry);
        std::lock_guard<std::mutex> lock(m_buffer->mutex);
        m_buffer->lines.push_back(formatted);
    }

private:
    std::shared_ptr<Buffer> m_buffer;
};

// ---------------------------------------------------------------
// Example 3: Count entries per logger name, no formatting at all
// ---------------------------------------------------------------
class CountingSink : public tierlog::ISink {
public:
    void write(const tierlog::LogEntry &entry) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_counts[entry.loggerName];
    }

    std::map<std::string, int> counts() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_counts;
    }

private:
    mutable std::mutex m_mutex;
    std::map<std::string, int> m_counts;
};

int main() {
    // Example 1
    tierlog::Logger prefixed("App.Prefixed", tierlog::LogLevel::INFO,
                             tierlog::detail::make_unique<PrefixedConsoleSink>(">>"));
    prefixed.info("Hello from a custom sink");

    // Example 2, wired through the factory
    auto buffer = std::make_shared<MemorySink::Buffer>();
    auto factory = tierlog::LoggerFactory::configure()
        .defaultLevel(tierlog::LogLevel::DEBUG)
        .sinkFactory([buffer](const std::string &) -> std::unique_ptr<tierlog::ISink> {
            return tierlog::detail::make_unique<MemorySink>(buffer);
        })
        .build();

    factory->getLogger("App.Orders")->info("Order {id} created", 7);
    factory->getLogger("App.Billing")->debug("Invoice {id} drafted", 7);

    {
        std::lock_guard<std::mutex> lock(buffer->mutex);
        for (const auto &line : buffer->lines) {
            std::cout << line << std::endl;
        }
    }

    // Example 3, chained after the prefixed logger
    auto head = std::make_shared<tierlog::Logger>(
        "App.Counted", tierlog::LogLevel::INFO,
        tierlog::detail::make_unique<PrefixedConsoleSink>("--"));
    auto counter = std::make_shared<tierlog::Logger>(
        "App.Counted", tierlog::LogLevel::TRACE,
        tierlog::detail::make_unique<CountingSink>());
    head->addToChain(counter);

    head->debug("counted only");
    head->info("printed and counted");

    auto *counting = dynamic_cast<CountingSink *>(counter->sink());
    for (const auto &kv : counting->counts()) {
        std::cout << kv.first << ": " << kv.second << std::endl;
    }
    return 0;
}
