/**
 * @file bench_order_book.cpp
 * @brief Order book benchmarks driven by the order flow the simulated participants send
 */

#include <benchmark/benchmark.h>

#include <lobsim/lob/order_book.hpp>
#include <lobsim/lob/order.hpp>
#include <lobsim/common/types.hpp>

#include <cmath>
#include <random>
#include <vector>

using namespace lobsim;

namespace {

constexpr double MID = 100.0;

double to_cents(double price) {
    return std::round(price * 100.0) / 100.0;
}

/**
 * @brief Book pre-loaded with passive two-sided interest around MID
 */
struct SeededBook {
    OrderBook book;
    std::uint64_t next_id{1};

    explicit SeededBook(std::uint32_t capacity, int levels_per_side, std::int64_t qty = 50)
        : book(capacity) {
        seed(levels_per_side, qty);
    }

    void seed(int levels_per_side, std::int64_t qty) {
        for (int i = 1; i <= levels_per_side; ++i) {
            book.add_limit(OrderId{next_id++}, ParticipantId{9}, Side::Buy, Price{to_cents(MID - 0.5 - 0.01 * i)}, Qty{qty});
            book.add_limit(OrderId{next_id++}, ParticipantId{9}, Side::Sell, Price{to_cents(MID + 0.5 + 0.01 * i)}, Qty{qty});
        }
    }

    OrderId id() { return OrderId{next_id++}; }
};

} // namespace

// ============================================================================
// Market Maker Requote
// ============================================================================

// One tick of the market maker: pull every quote, then ladder new ones
static void BM_MarketMakerRequote(benchmark::State& state) {
    const auto levels = static_cast<int>(state.range(0));
    SeededBook seeded(100000, 200);
    std::mt19937_64 rng(7);
    std::uniform_int_distribution<std::int64_t> size_dist(5, 15);
    std::uniform_real_distribution<double> drift(-0.05, 0.05);

    std::vector<OrderId> quotes;
    double mid = MID;

    for (auto _ : state) {
        for (OrderId id : quotes) {
            benchmark::DoNotOptimize(seeded.book.cancel(id));
        }
        quotes.clear();

        mid += drift(rng);
        const double step = 1.0 / levels;
        for (int i = 0; i < levels; ++i) {
            const double offset = 0.5 + i * step;
            OrderId bid = seeded.id();
            OrderId ask = seeded.id();
            seeded.book.add_limit(bid, ParticipantId{0}, Side::Buy, Price{to_cents(mid - offset)}, Qty{size_dist(rng)});
            seeded.book.add_limit(ask, ParticipantId{0}, Side::Sell, Price{to_cents(mid + offset)}, Qty{size_dist(rng)});
            quotes.push_back(bid);
            quotes.push_back(ask);
        }
    }

    state.SetItemsProcessed(state.iterations() * levels * 4);  // Cancels plus quotes
}

BENCHMARK(BM_MarketMakerRequote)->Arg(3)->Arg(10);

// ============================================================================
// Random Trader Flow
// ============================================================================

// Market orders at the given percentage, otherwise limits inside the spread band
static void BM_RandomTraderFlow(benchmark::State& state) {
    const double market_share = static_cast<double>(state.range(0)) / 100.0;
    SeededBook seeded(1000000, 500, 200);
    std::mt19937_64 rng(11);
    std::bernoulli_distribution is_market(market_share);
    std::bernoulli_distribution is_buy(0.5);
    std::gamma_distribution<double> shape_a(2.0, 1.0);
    std::gamma_distribution<double> shape_b(5.0, 1.0);
    std::uniform_int_distribution<std::int64_t> size_dist(1, 30);

    for (auto _ : state) {
        const Side side = is_buy(rng) ? Side::Buy : Side::Sell;
        const Qty qty{size_dist(rng)};

        if (is_market(rng)) {
            benchmark::DoNotOptimize(seeded.book.add_market(seeded.id(), ParticipantId{1}, side, qty));
        } else {
            // Beta(2,5) offset of up to 30 bps
            const double x = shape_a(rng);
            const double y = shape_b(rng);
            const double offset = x / (x + y) * 30.0 / 10'000.0 * MID;
            const double price = side == Side::Buy ? MID - offset : MID + offset;
            benchmark::DoNotOptimize(
                seeded.book.add_limit(seeded.id(), ParticipantId{1}, side, Price{to_cents(price)}, qty));
        }

        if (seeded.book.order_count() > 900000) {
            state.PauseTiming();
            seeded.book.clear();
            seeded.seed(500, 200);
            state.ResumeTiming();
        }
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_RandomTraderFlow)->Arg(0)->Arg(30)->Arg(60);

// ============================================================================
// Cancel Inside a Deep Queue
// ============================================================================

// Unlink from the middle of one crowded level, then rejoin at the back
static void BM_CancelDeepQueue(benchmark::State& state) {
    const auto depth = static_cast<std::uint64_t>(state.range(0));
    OrderBook book(static_cast<std::uint32_t>(depth + 1));

    std::uint64_t next_id = 1;
    std::vector<OrderId> queue;
    for (std::uint64_t i = 0; i < depth; ++i) {
        OrderId id{next_id++};
        book.add_limit(id, ParticipantId{0}, Side::Buy, Price{99.5}, Qty{10});
        queue.push_back(id);
    }

    std::size_t pos = depth / 2;
    for (auto _ : state) {
        benchmark::DoNotOptimize(book.cancel(queue[pos]));
        queue[pos] = OrderId{next_id++};
        benchmark::DoNotOptimize(book.add_limit(queue[pos], ParticipantId{0}, Side::Buy, Price{99.5}, Qty{10}));
        pos = (pos + 7) % depth;
    }

    state.SetItemsProcessed(state.iterations() * 2);
}

BENCHMARK(BM_CancelDeepQueue)->Arg(16)->Arg(4096);

// ============================================================================
// Crossing Limit
// ============================================================================

// Limit that lands through the touch: rests, matches, leaves nothing behind
static void BM_CrossingLimit(benchmark::State& state) {
    SeededBook seeded(100000, 100);

    for (auto _ : state) {
        benchmark::DoNotOptimize(
            seeded.book.add_limit(seeded.id(), ParticipantId{1}, Side::Buy, Price{to_cents(MID + 0.51)}, Qty{10}));
        seeded.book.add_limit(seeded.id(), ParticipantId{9}, Side::Sell, Price{to_cents(MID + 0.51)}, Qty{10});
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_CrossingLimit);

// Same flow with no free slot: the incoming limit must fill without resting
static void BM_CrossingLimitFullStore(benchmark::State& state) {
    OrderBook book(2);
    std::uint64_t next_id = 1;
    book.add_limit(OrderId{next_id++}, ParticipantId{9}, Side::Buy, Price{99.0}, Qty{1});
    book.add_limit(OrderId{next_id++}, ParticipantId{9}, Side::Sell, Price{101.0}, Qty{1'000'000'000});

    for (auto _ : state) {
        benchmark::DoNotOptimize(
            book.add_limit(OrderId{next_id++}, ParticipantId{1}, Side::Buy, Price{101.0}, Qty{10}));
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_CrossingLimitFullStore);

// ============================================================================
// Market Sweep
// ============================================================================

static void BM_MarketSweep(benchmark::State& state) {
    const auto levels = static_cast<int>(state.range(0));
    OrderBook book(100000);
    std::uint64_t next_id = 1;

    for (auto _ : state) {
        state.PauseTiming();
        for (int i = 0; i < levels; ++i) {
            book.add_limit(OrderId{next_id++}, ParticipantId{0}, Side::Sell, Price{MID + 0.01 * i}, Qty{10});
        }
        state.ResumeTiming();

        benchmark::DoNotOptimize(book.add_market(OrderId{next_id++}, ParticipantId{1}, Side::Buy, Qty{10 * levels}));
    }

    state.SetItemsProcessed(state.iterations() * levels);
}

BENCHMARK(BM_MarketSweep)->Arg(1)->Arg(10)->Arg(100);

// ============================================================================
// Market Data
// ============================================================================

// What each participant reads before acting, and what the CLI prints
static void BM_TopOfBookAndDepth(benchmark::State& state) {
    const auto max_levels = static_cast<std::size_t>(state.range(0));
    SeededBook seeded(100000, 2000);

    for (auto _ : state) {
        benchmark::DoNotOptimize(seeded.book.mid_price());
        benchmark::DoNotOptimize(seeded.book.depth(max_levels));
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_TopOfBookAndDepth)->Arg(10)->Arg(0);

BENCHMARK_MAIN();
