/**
 * @file latency.cpp
 * @brief Text reports for the latency histogram and the engine counters
 */

#include <lobsim/metrics/latency.hpp>
#include <lobsim/metrics/stats.hpp>

#include <iomanip>
#include <iostream>
#include <utility>

namespace lobsim {

namespace {

void print_row(const char* label, double micros) {
    std::cout << "  " << std::left << std::setw(8) << label << std::right << std::setw(12)
              << micros << " us\n";
}

} // namespace

void LatencyStats::print() const {
    std::cout << "\n--- Latency (" << count << " samples) ---\n";
    if (count == 0) {
        return;
    }

    const auto flags = std::cout.flags();
    std::cout << std::fixed << std::setprecision(3);
    print_row("mean", mean_ns * 1e-3);
    print_row("min", ns_to_us(min_ns));
    print_row("p50", p50_ns * 1e-3);
    print_row("p90", p90_ns * 1e-3);
    print_row("p99", p99_ns * 1e-3);
    print_row("p99.9", p999_ns * 1e-3);
    print_row("max", ns_to_us(max_ns));
    std::cout.flags(flags);
}

void EngineStats::print_summary() const {
    const std::pair<const char*, const Counter*> rows[] = {
        {"trades", &trade_count},
        {"volume", &volume},
        {"filled qty", &filled_qty},
        {"received", &orders_received},
        {"accepted", &orders_accepted},
        {"rejected", &orders_rejected},
        {"invalid", &orders_invalid},
        {"cancelled", &orders_cancelled},
        {"cancel miss", &cancels_not_found},
    };

    std::cout << "\n--- Engine ---\n";
    for (const auto& [label, counter] : rows) {
        std::cout << "  " << std::left << std::setw(12) << label << std::right
                  << counter->load(std::memory_order_relaxed) << "\n";
    }

    get_latency_stats().print();
}

} // namespace lobsim
