#pragma once
/**
 * @file latency.hpp
 * @brief Fixed-memory latency histogram for engine operations
 */

#include <lobsim/common/time.hpp>

#include <algorithm>
#include <array>
#include <bit>
#include <cstdint>
#include <limits>
#include <mutex>

namespace lobsim {

/**
 * @brief Percentile summary of recorded latencies
 */
struct LatencyStats {
    double mean_ns{0.0};
    double p50_ns{0.0};
    double p90_ns{0.0};
    double p99_ns{0.0};
    double p999_ns{0.0};
    Duration min_ns{0};
    Duration max_ns{0};
    std::size_t count{0};

    void print() const;
};

/**
 * @brief Log-linear latency histogram
 *
 * Values below SUB_BUCKETS ns are counted exactly. Above that, every
 * power-of-two range is split into SUB_BUCKETS equal buckets, so a reported
 * percentile is within 1/SUB_BUCKETS of the true sample. Memory does not grow
 * with the number of samples, so a simulation can record every submit.
 *
 * Thread Safety: record() and summarize() lock an internal mutex.
 */
class LatencyHistogram {
public:
    static constexpr unsigned SUB_BUCKET_BITS = 4;
    static constexpr std::size_t SUB_BUCKETS = std::size_t{1} << SUB_BUCKET_BITS;
    static constexpr std::size_t BUCKETS = SUB_BUCKETS + (64 - SUB_BUCKET_BITS) * SUB_BUCKETS;

private:
    std::array<std::uint64_t, BUCKETS> counts_{};
    std::uint64_t total_{0};
    std::uint64_t sum_{0};
    std::uint64_t min_{std::numeric_limits<std::uint64_t>::max()};
    std::uint64_t max_{0};

    mutable std::mutex mutex_;

public:
    void record(Duration latency_ns) {
        const auto value = static_cast<std::uint64_t>(std::max<Duration>(latency_ns, 0));

        std::lock_guard lock(mutex_);
        ++counts_[bucket_of(value)];
        ++total_;
        sum_ += value;
        min_ = std::min(min_, value);
        max_ = std::max(max_, value);
    }

    [[nodiscard]] LatencyStats summarize() const {
        std::lock_guard lock(mutex_);

        LatencyStats stats;
        if (total_ == 0) {
            return stats;
        }

        stats.count = static_cast<std::size_t>(total_);
        stats.min_ns = static_cast<Duration>(min_);
        stats.max_ns = static_cast<Duration>(max_);
        stats.mean_ns = static_cast<double>(sum_) / static_cast<double>(total_);
        stats.p50_ns = percentile(50.0);
        stats.p90_ns = percentile(90.0);
        stats.p99_ns = percentile(99.0);
        stats.p999_ns = percentile(99.9);
        return stats;
    }

    [[nodiscard]] std::size_t count() const {
        std::lock_guard lock(mutex_);
        return static_cast<std::size_t>(total_);
    }

    void clear() {
        std::lock_guard lock(mutex_);
        counts_.fill(0);
        total_ = 0;
        sum_ = 0;
        min_ = std::numeric_limits<std::uint64_t>::max();
        max_ = 0;
    }

    [[nodiscard]] static constexpr std::size_t bucket_of(std::uint64_t value) noexcept {
        if (value < SUB_BUCKETS) {
            return static_cast<std::size_t>(value);
        }
        const auto shift = static_cast<unsigned>(std::bit_width(value)) - 1 - SUB_BUCKET_BITS;
        const auto sub = static_cast<std::size_t>(value >> shift) - SUB_BUCKETS;
        return SUB_BUCKETS + shift * SUB_BUCKETS + sub;
    }

    /// Midpoint of the values that land in `bucket`
    [[nodiscard]] static constexpr std::uint64_t bucket_value(std::size_t bucket) noexcept {
        if (bucket < SUB_BUCKETS) {
            return bucket;
        }
        const std::size_t shift = (bucket - SUB_BUCKETS) / SUB_BUCKETS;
        const std::size_t sub = (bucket - SUB_BUCKETS) % SUB_BUCKETS;
        const std::uint64_t low = static_cast<std::uint64_t>(SUB_BUCKETS + sub) << shift;
        return low + ((std::uint64_t{1} << shift) - 1) / 2;
    }

private:
    // Caller holds mutex_ and total_ > 0
    [[nodiscard]] double percentile(double p) const noexcept {
        const auto rank = std::max<std::uint64_t>(
            1, static_cast<std::uint64_t>(p / 100.0 * static_cast<double>(total_) + 0.5));

        std::uint64_t seen = 0;
        for (std::size_t b = 0; b < BUCKETS; ++b) {
            seen += counts_[b];
            if (seen >= rank) {
                return static_cast<double>(std::clamp(bucket_value(b), min_, max_));
            }
        }
        return static_cast<double>(max_);
    }
};

} // namespace lobsim
