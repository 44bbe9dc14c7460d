#pragma once
/**
 * @file validation.hpp
 * @brief Admission checks for incoming orders
 *
 * Rejects malformed input at the boundary so the book never stores a
 * non-finite price or a non-positive quantity. Price sign is the caller's
 * business unless require_positive_price is set.
 */

#include <lobsim/common/types.hpp>
#include <lobsim/common/macros.hpp>

#include <cmath>
#include <cstdint>

namespace lobsim {

/**
 * @brief Limits applied to every submission
 */
struct OrderLimits {
    Qty max_order_qty{Qty{constants::DEFAULT_MAX_ORDER_QTY}};  // Max quantity per order
    bool require_positive_price{false};                         // Opt-in: reject limit price <= 0

    OrderLimits() = default;
};

/**
 * @brief Why a submission was not accepted (Passed when it was)
 */
enum class ValidationResult : std::uint8_t {
    Passed = 0,
    InvalidQty = 1,
    InvalidPrice = 2,
    NoLiquidity = 3,
    CapacityExceeded = 4
};

[[nodiscard]] constexpr const char* to_string(ValidationResult r) noexcept {
    switch (r) {
        case ValidationResult::Passed:           return "Passed";
        case ValidationResult::InvalidQty:       return "InvalidQty";
        case ValidationResult::InvalidPrice:     return "InvalidPrice";
        case ValidationResult::NoLiquidity:      return "NoLiquidity";
        case ValidationResult::CapacityExceeded: return "CapacityExceeded";
    }
    return "Unknown";
}

/**
 * @brief Stateless pre-admission validator
 */
class OrderValidator {
private:
    OrderLimits limits_;

public:
    explicit OrderValidator(OrderLimits limits = {})
        : limits_(limits) {
    }

    /**
     * @brief Check quantity and (for limits) price
     *
     * Market order prices are ignored entirely.
     */
    [[nodiscard]] ValidationResult check(OrderKind kind, Price price, Qty qty) const noexcept {
        if LOBSIM_UNLIKELY(qty.get() <= 0 || qty > limits_.max_order_qty) {
            return ValidationResult::InvalidQty;
        }

        if (kind == OrderKind::Limit) {
            if LOBSIM_UNLIKELY(!std::isfinite(price.get())) {
                return ValidationResult::InvalidPrice;
            }
            if LOBSIM_UNLIKELY(limits_.require_positive_price && price.get() <= 0.0) {
                return ValidationResult::InvalidPrice;
            }
        }

        return ValidationResult::Passed;
    }
};

} // namespace lobsim
