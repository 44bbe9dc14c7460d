#pragma once
/**
 * @file time.hpp
 * @brief Nanosecond clock readings used for order timestamps and latency
 */

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace lobsim {

/// steady_clock nanoseconds since an unspecified epoch
using Timestamp = std::uint64_t;

/// Signed nanoseconds
using Duration = std::int64_t;

[[nodiscard]] inline Timestamp now_ns() noexcept {
    const auto since_epoch = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count());
}

[[nodiscard]] inline Duration elapsed_ns(Timestamp since) noexcept {
    return static_cast<Duration>(now_ns() - since);
}

[[nodiscard]] constexpr double ns_to_us(Duration ns) noexcept { return static_cast<double>(ns) * 1e-3; }
[[nodiscard]] constexpr double ns_to_ms(Duration ns) noexcept { return static_cast<double>(ns) * 1e-6; }

/**
 * @brief Admission clock for one book
 *
 * Each reading is greater than the one before, even if steady_clock has not
 * ticked in between, so the later of two orders is always decidable.
 *
 * Thread Safety: NOT thread-safe. Called under the engine's write lock.
 */
class SequencedClock {
private:
    Timestamp last_{0};

public:
    [[nodiscard]] Timestamp next() noexcept {
        last_ = std::max(now_ns(), last_ + 1);
        return last_;
    }

    [[nodiscard]] Timestamp last() const noexcept { return last_; }
};

} // namespace lobsim
