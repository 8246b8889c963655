#include <benchmark/benchmark.h>
#include <vector>
#include "tier_log.hpp"

namespace {

std::shared_ptr<tierlog::Logger> makeChain(int length, tierlog::LogLevel level) {
    auto head = std::make_shared<tierlog::Logger>(
        "head", level, tierlog::detail::make_unique<tierlog::NullSink>());
    for (int i = 1; i < length; ++i) {
        head->addToChain(std::make_shared<tierlog::Logger>(
            "node", level, tierlog::detail::make_unique<tierlog::NullSink>()));
    }
    return head;
}

} // namespace

// ---------------------------------------------------------------------------
// BM_Chain_Accepted
// Every node renders the entry.
// ---------------------------------------------------------------------------
static void BM_Chain_Accepted(benchmark::State& state) {
    auto head = makeChain(static_cast<int>(state.range(0)), tierlog::LogLevel::TRACE);

    for (auto _ : state) {
        head->info("Order {id} shipped", 42);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Chain_Accepted)->Arg(1)->Arg(4)->Arg(16);

// ---------------------------------------------------------------------------
// BM_Chain_Filtered
// Every node rejects the level; the message is still formatted once.
// ---------------------------------------------------------------------------
static void BM_Chain_Filtered(benchmark::State& state) {
    auto head = makeChain(static_cast<int>(state.range(0)), tierlog::LogLevel::FATAL);

    for (auto _ : state) {
        head->debug("Order {id} shipped", 42);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Chain_Filtered)->Arg(1)->Arg(4)->Arg(16);

// ---------------------------------------------------------------------------
// BM_Chain_MacroFiltered
// Macro gate walks the chain and skips formatting.
// ---------------------------------------------------------------------------
static void BM_Chain_MacroFiltered(benchmark::State& state) {
    auto head = makeChain(static_cast<int>(state.range(0)), tierlog::LogLevel::FATAL);

    for (auto _ : state) {
        TIER_DEBUG(head, "Order {id} shipped", 42);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Chain_MacroFiltered)->Arg(1)->Arg(4)->Arg(16);

// ---------------------------------------------------------------------------
// BM_Factory_LoggerWithReloadHook
// Factory logger: reload gate plus level check.
// ---------------------------------------------------------------------------
static void BM_Factory_LoggerWithReloadHook(benchmark::State& state) {
    auto factory = tierlog::LoggerFactory::configure()
        .configText("scan=true\nscan.period=1 minute\napp.*=INFO\n")
        .writeTo<tierlog::NullSink>()
        .build();
    auto logger = factory->getLogger("App.Orders");

    for (auto _ : state) {
        logger->info("Order {id} shipped", 42);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Factory_LoggerWithReloadHook);

// ---------------------------------------------------------------------------
// BM_Factory_GetLogger
// Cache hit on a case-insensitive name.
// ---------------------------------------------------------------------------
static void BM_Factory_GetLogger(benchmark::State& state) {
    auto factory = tierlog::LoggerFactory::create();
    factory->useNullSink();
    factory->getLogger("App.Orders");

    for (auto _ : state) {
        benchmark::DoNotOptimize(factory->getLogger("app.orders"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Factory_GetLogger);
