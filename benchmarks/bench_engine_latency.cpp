/**
 * @file bench_engine_latency.cpp
 * @brief Engine entry points under the lock, listeners and account updates included
 */

#include <benchmark/benchmark.h>

#include <lobsim/engine/matching_engine.hpp>
#include <lobsim/metrics/latency.hpp>
#include <lobsim/common/types.hpp>
#include <lobsim/common/time.hpp>

#include <cmath>
#include <memory>
#include <random>
#include <string>

using namespace lobsim;

namespace {

Price quote(double mid, int ticks) {
    return Price{std::round((mid + 0.01 * ticks) * 100.0) / 100.0};
}

void report(benchmark::State& state, const LatencyStats& stats) {
    state.counters["p50_us"] = stats.p50_ns * 1e-3;
    state.counters["p99_us"] = stats.p99_ns * 1e-3;
    state.counters["max_us"] = ns_to_us(stats.max_ns);
}

} // namespace

// ============================================================================
// Submit
// ============================================================================

// Limits scattered one dollar either side of 100; roughly half cross on arrival
static void BM_SubmitLimit(benchmark::State& state) {
    EngineConfig config;
    config.max_orders = 1 << 20;
    auto engine = std::make_unique<MatchingEngine>(config);
    LatencyHistogram histogram;

    std::mt19937_64 rng(12345);
    std::uniform_int_distribution<int> ticks(-100, 100);
    std::uniform_int_distribution<std::int64_t> size(1, 20);
    const std::string owners[] = {"maker", "trader-a", "trader-b", "trader-c"};

    std::size_t n = 0;
    for (auto _ : state) {
        const Side side = (n % 2 == 0) ? Side::Buy : Side::Sell;
        const Timestamp start = now_ns();
        benchmark::DoNotOptimize(engine->submit_limit(side, quote(100.0, ticks(rng)), Qty{size(rng)}, owners[n % 4]));
        histogram.record(elapsed_ns(start));
        ++n;

        if (engine->order_count() > (1u << 19)) {
            state.PauseTiming();
            engine = std::make_unique<MatchingEngine>(config);
            state.ResumeTiming();
        }
    }

    report(state, histogram.summarize());
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_SubmitLimit);

// One fill listener per participant, as the simulation registers them
static void BM_SubmitWithListeners(benchmark::State& state) {
    const auto listener_count = static_cast<int>(state.range(0));
    MatchingEngine engine;
    std::int64_t seen = 0;
    for (int i = 0; i < listener_count; ++i) {
        engine.add_fill_listener([&seen](const Fill& fill) { seen += fill.qty.get(); });
    }

    for (auto _ : state) {
        (void)engine.submit_limit(Side::Sell, Price{100.0}, Qty{10}, "maker");
        benchmark::DoNotOptimize(engine.submit_limit(Side::Buy, Price{100.0}, Qty{10}, "taker"));
    }

    benchmark::DoNotOptimize(seen);
    state.SetItemsProcessed(state.iterations() * 2);
}

BENCHMARK(BM_SubmitWithListeners)->Arg(0)->Arg(4)->Arg(16);

// ============================================================================
// Cancel
// ============================================================================

static void BM_SubmitThenCancel(benchmark::State& state) {
    MatchingEngine engine;
    for (int i = 1; i <= 100; ++i) {
        (void)engine.submit_limit(Side::Buy, quote(99.0, -i), Qty{100}, "maker");
        (void)engine.submit_limit(Side::Sell, quote(101.0, i), Qty{100}, "maker");
    }

    for (auto _ : state) {
        const auto placed = engine.submit_limit(Side::Buy, Price{99.50}, Qty{10}, "bench");
        benchmark::DoNotOptimize(engine.cancel(*placed.order_id));
    }

    report(state, engine.stats().get_latency_stats());
    state.SetItemsProcessed(state.iterations() * 2);
}

BENCHMARK(BM_SubmitThenCancel);

// ============================================================================
// Market Orders
// ============================================================================

static void BM_MarketAgainstRefill(benchmark::State& state) {
    MatchingEngine engine;

    for (auto _ : state) {
        state.PauseTiming();
        (void)engine.submit_limit(Side::Sell, Price{100.0}, Qty{10}, "maker");
        state.ResumeTiming();

        benchmark::DoNotOptimize(engine.submit_market(Side::Buy, Qty{10}, "taker"));
    }

    state.counters["trades"] = static_cast<double>(engine.trade_count());
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_MarketAgainstRefill);

// ============================================================================
// Contention
// ============================================================================

// Writers submitting while every thread also reads the mid
static void BM_ContendedSubmit(benchmark::State& state) {
    static std::unique_ptr<MatchingEngine> engine;
    if (state.thread_index() == 0) {
        engine = std::make_unique<MatchingEngine>();
    }

    std::mt19937_64 rng(99 + static_cast<std::uint64_t>(state.thread_index()));
    std::uniform_int_distribution<int> ticks(-50, 50);
    const std::string owner = "thread-" + std::to_string(state.thread_index());

    for (auto _ : state) {
        const Side side = (rng() & 1) ? Side::Sell : Side::Buy;
        benchmark::DoNotOptimize(engine->submit_limit(side, quote(100.0, ticks(rng)), Qty{5}, owner));
        benchmark::DoNotOptimize(engine->get_mid_price());
    }

    if (state.thread_index() == 0) {
        state.counters["trades"] = static_cast<double>(engine->trade_count());
        state.counters["resting"] = static_cast<double>(engine->order_count());
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_ContendedSubmit)->Threads(1)->Threads(2)->Threads(4);

BENCHMARK_MAIN();
