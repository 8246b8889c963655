#include <benchmark/benchmark.h>
#include <stdexcept>
#include <string>
#include "tier_log.hpp"

namespace {

tierlog::LogEntry sampleEntry() {
    tierlog::LogEntry entry;
    entry.level = tierlog::LogLevel::INFO;
    entry.loggerName = "App.Database.Repository.Orders";
    entry.message = "Order 42 shipped to warehouse 7";
    entry.timestamp = std::chrono::system_clock::now();
    return entry;
}

} // namespace

// ---------------------------------------------------------------------------
// BM_FormatMessage_Simple
// Single placeholder: "Hello {name}"
// ---------------------------------------------------------------------------
static void BM_FormatMessage_Simple(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(tierlog::detail::formatMessage("Hello {name}", "World"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_FormatMessage_Simple);

// ---------------------------------------------------------------------------
// BM_FormatMessage_Multi
// Mixed argument types and escaped braces.
// ---------------------------------------------------------------------------
static void BM_FormatMessage_Multi(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(tierlog::detail::formatMessage(
            "{method} {path} {status} in {elapsed}ms {{cached={hit}}}",
            "GET", "/api/users", 200, 12.34, true));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_FormatMessage_Multi);

// ---------------------------------------------------------------------------
// BM_FormatException
// Exception suffix including type demangling.
// ---------------------------------------------------------------------------
static void BM_FormatException(benchmark::State& state) {
    std::runtime_error ex("connection reset");

    for (auto _ : state) {
        benchmark::DoNotOptimize(tierlog::detail::formatExceptionMessage("request failed", ex));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_FormatException);

// ---------------------------------------------------------------------------
// BM_AbbreviateName
// Long dotted name squeezed into the default column.
// ---------------------------------------------------------------------------
static void BM_AbbreviateName(benchmark::State& state) {
    std::string name = "Company.Product.Subsystem.Database.Repository.OrderRepository";

    for (auto _ : state) {
        benchmark::DoNotOptimize(tierlog::abbreviateLoggerName(name, 30));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_AbbreviateName);

// ---------------------------------------------------------------------------
// BM_HumanReadableFormatter
// ---------------------------------------------------------------------------
static void BM_HumanReadableFormatter(benchmark::State& state) {
    tierlog::HumanReadableFormatter formatter;
    tierlog::LogEntry entry = sampleEntry();

    for (auto _ : state) {
        benchmark::DoNotOptimize(formatter.format(entry));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_HumanReadableFormatter);

// ---------------------------------------------------------------------------
// BM_JsonFormatter
// ---------------------------------------------------------------------------
static void BM_JsonFormatter(benchmark::State& state) {
    tierlog::JsonFormatter formatter;
    tierlog::LogEntry entry = sampleEntry();

    for (auto _ : state) {
        benchmark::DoNotOptimize(formatter.format(entry));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_JsonFormatter);
