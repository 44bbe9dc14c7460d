#pragma once
/**
 * @file stats.hpp
 * @brief Counters the engine keeps about its own traffic
 *
 * Only the engine writes, always under its write lock. Any thread may read
 * the atomics without taking that lock.
 */

#include <lobsim/common/time.hpp>
#include <lobsim/common/macros.hpp>
#include <lobsim/metrics/latency.hpp>

#include <atomic>
#include <cstdint>
#include <initializer_list>

namespace lobsim {

struct EngineStats {
    using Counter = std::atomic<std::uint64_t>;

    LOBSIM_CACHE_ALIGNED Counter trade_count{0};
    Counter volume{0};
    Counter filled_qty{0};  // Both sides of every trade

    LOBSIM_CACHE_ALIGNED Counter orders_received{0};
    Counter orders_accepted{0};
    Counter orders_rejected{0};   // Empty opposite side, or no slot to rest in
    Counter orders_invalid{0};
    Counter orders_cancelled{0};
    Counter cancels_not_found{0};

    /// Wall time spent inside submit and cancel
    LatencyHistogram latency_histogram;

    EngineStats() = default;
    EngineStats(const EngineStats&) = delete;
    EngineStats& operator=(const EngineStats&) = delete;

    void record_latency(Duration latency_ns) { latency_histogram.record(latency_ns); }

    [[nodiscard]] LatencyStats get_latency_stats() const { return latency_histogram.summarize(); }

    void reset() {
        for (Counter* counter : {&trade_count, &volume, &filled_qty, &orders_received, &orders_accepted,
                                 &orders_rejected, &orders_invalid, &orders_cancelled, &cancels_not_found}) {
            counter->store(0, std::memory_order_relaxed);
        }
        latency_histogram.clear();
    }

    /// Counters followed by the latency summary, on stdout
    void print_summary() const;
};

} // namespace lobsim
