#pragma once
/**
 * @file types.hpp
 * @brief Vocabulary types shared by the book, the engine and the simulation
 *
 * Price, Qty, OrderId and ParticipantId are distinct wrapper types so an id
 * can never be passed where a quantity is expected.
 */

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>

namespace lobsim {

// ============================================================================
// Tagged Numeric Wrapper
// ============================================================================

/**
 * @brief Numeric value tagged with the quantity it measures
 * @tparam T Representation
 * @tparam Tag Empty struct naming the quantity
 *
 * Only same-tag arithmetic is defined; get() is the explicit way out.
 */
template<typename T, typename Tag>
struct StrongType {
    T value{};

    constexpr StrongType() noexcept = default;
    constexpr explicit StrongType(T v) noexcept : value(v) {}

    [[nodiscard]] constexpr T get() const noexcept { return value; }

    constexpr auto operator<=>(const StrongType&) const noexcept = default;
    constexpr bool operator==(const StrongType&) const noexcept = default;

    friend constexpr StrongType operator-(StrongType lhs, StrongType rhs) noexcept {
        return StrongType{lhs.value - rhs.value};
    }

    constexpr StrongType& operator+=(StrongType rhs) noexcept {
        value += rhs.value;
        return *this;
    }

    constexpr StrongType& operator-=(StrongType rhs) noexcept {
        value -= rhs.value;
        return *this;
    }
};

struct PriceTag {};
struct QtyTag {};
struct OrderIdTag {};
struct ParticipantIdTag {};

/// Currency units; callers quote to the cent
using Price = StrongType<double, PriceTag>;

/// Signed so positions and fill arithmetic share one type
using Qty = StrongType<std::int64_t, QtyTag>;

/// Handed out by the engine, strictly increasing from FIRST_ORDER_ID
using OrderId = StrongType<std::uint64_t, OrderIdTag>;

/// Interned owner name
using ParticipantId = StrongType<std::uint32_t, ParticipantIdTag>;

namespace constants {

inline constexpr OrderId INVALID_ORDER_ID{std::numeric_limits<std::uint64_t>::max()};
inline constexpr ParticipantId INVALID_PARTICIPANT_ID{std::numeric_limits<std::uint32_t>::max()};

inline constexpr std::uint64_t FIRST_ORDER_ID = 1;

/// What last_price() reports until the first trade prints
inline constexpr double DEFAULT_REFERENCE_PRICE = 100.0;

/// Resting orders the book can hold at once
inline constexpr std::size_t DEFAULT_MAX_ORDERS = 1'000'000;

inline constexpr std::int64_t DEFAULT_MAX_ORDER_QTY = 1'000'000;

} // namespace constants

// ============================================================================
// Enumerations
// ============================================================================

enum class Side : std::uint8_t { Buy, Sell };

[[nodiscard]] constexpr const char* to_string(Side side) noexcept {
    return side == Side::Buy ? "Buy" : "Sell";
}

enum class OrderKind : std::uint8_t { Limit, Market };

[[nodiscard]] constexpr const char* to_string(OrderKind kind) noexcept {
    return kind == OrderKind::Market ? "Market" : "Limit";
}

/**
 * @brief Outcome of one submit or cancel
 *
 * Invalid means validation refused the request before the book saw it;
 * Rejected means the book could not take it (empty opposite side for a
 * market order, no free slot for a limit that has to rest).
 */
enum class OrderResult : std::uint8_t {
    Accepted,
    PartiallyFilled,
    FullyFilled,
    Cancelled,
    Rejected,
    NotFound,
    Invalid
};

[[nodiscard]] constexpr const char* to_string(OrderResult result) noexcept {
    switch (result) {
        case OrderResult::Accepted:        return "Accepted";
        case OrderResult::PartiallyFilled: return "PartiallyFilled";
        case OrderResult::FullyFilled:     return "FullyFilled";
        case OrderResult::Cancelled:       return "Cancelled";
        case OrderResult::Rejected:        return "Rejected";
        case OrderResult::NotFound:        return "NotFound";
        case OrderResult::Invalid:         return "Invalid";
    }
    return "?";
}

/**
 * @brief Where an order is in its life
 *
 * A limit goes Pending, Resting, then Filled or Cancelled. A market order
 * goes straight from Pending to Filled or Rejected.
 */
enum class OrderState : std::uint8_t {
    Pending,
    Resting,
    Filled,
    Cancelled,
    Rejected
};

[[nodiscard]] constexpr const char* to_string(OrderState state) noexcept {
    switch (state) {
        case OrderState::Pending:   return "Pending";
        case OrderState::Resting:   return "Resting";
        case OrderState::Filled:    return "Filled";
        case OrderState::Cancelled: return "Cancelled";
        case OrderState::Rejected:  return "Rejected";
    }
    return "?";
}

[[nodiscard]] constexpr bool is_terminal(OrderState state) noexcept {
    return state != OrderState::Pending && state != OrderState::Resting;
}

} // namespace lobsim

template<typename T, typename Tag>
struct std::hash<lobsim::StrongType<T, Tag>> {
    std::size_t operator()(const lobsim::StrongType<T, Tag>& v) const noexcept {
        return std::hash<T>{}(v.get());
    }
};
