#include <benchmark/benchmark.h>
#include <sstream>
#include "tier_log.hpp"

namespace {

std::string makeRules(int count) {
    std::ostringstream oss;
    oss << "root=WARN\n";
    for (int i = 0; i < count; ++i) {
        oss << "app.module" << i << ".repository=DEBUG\n";
        oss << "app.module" << i << ".*=INFO\n";
    }
    oss << "app.*=ERROR\n";
    return oss.str();
}

} // namespace

// ---------------------------------------------------------------------------
// BM_Resolve_Exact
// Name with an exact rule.
// ---------------------------------------------------------------------------
static void BM_Resolve_Exact(benchmark::State& state) {
    tierlog::LevelConfig config;
    config.loadFromText(makeRules(static_cast<int>(state.range(0))));

    for (auto _ : state) {
        benchmark::DoNotOptimize(config.getLevelForLogger("App.Module0.Repository"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Resolve_Exact)->Arg(4)->Arg(64);

// ---------------------------------------------------------------------------
// BM_Resolve_Wildcard
// Falls through to the least specific wildcard.
// ---------------------------------------------------------------------------
static void BM_Resolve_Wildcard(benchmark::State& state) {
    tierlog::LevelConfig config;
    config.loadFromText(makeRules(static_cast<int>(state.range(0))));

    for (auto _ : state) {
        benchmark::DoNotOptimize(config.getLevelForLogger("App.Unlisted.Service"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Resolve_Wildcard)->Arg(4)->Arg(64);

// ---------------------------------------------------------------------------
// BM_Resolve_Root
// No rule matches.
// ---------------------------------------------------------------------------
static void BM_Resolve_Root(benchmark::State& state) {
    tierlog::LevelConfig config;
    config.loadFromText(makeRules(static_cast<int>(state.range(0))));

    for (auto _ : state) {
        benchmark::DoNotOptimize(config.getLevelForLogger("Net.Http.Client"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Resolve_Root)->Arg(4)->Arg(64);

// ---------------------------------------------------------------------------
// BM_ReloadCheck_WithinPeriod
// Gate run at the start of every log call.
// ---------------------------------------------------------------------------
static void BM_ReloadCheck_WithinPeriod(benchmark::State& state) {
    tierlog::LevelConfig config;
    config.loadFromText("scan=true\nscan.period=1 hour\n");

    for (auto _ : state) {
        config.checkAndReloadIfNeeded();
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ReloadCheck_WithinPeriod);

// ---------------------------------------------------------------------------
// BM_Parse
// Full properties parse.
// ---------------------------------------------------------------------------
static void BM_Parse(benchmark::State& state) {
    std::string content = makeRules(static_cast<int>(state.range(0)));

    for (auto _ : state) {
        tierlog::LevelConfig config;
        config.loadFromText(content);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Parse)->Arg(4)->Arg(64);
