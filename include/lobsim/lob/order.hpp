#pragma once
/**
 * @file order.hpp
 * @brief Order, trade and fill records for the limit order book
 *
 * Resting orders carry the slot links of their price level's queue, so a
 * cancel can unlink any order in O(1).
 */

#include <lobsim/common/types.hpp>
#include <lobsim/common/time.hpp>

#include <cstdint>
#include <limits>

namespace lobsim {

/// Position of a resting order inside the OrderStore
using OrderSlot = std::uint32_t;

/// No slot: end of a level queue, or a full store
inline constexpr OrderSlot NO_SLOT = std::numeric_limits<OrderSlot>::max();

/**
 * @brief A limit order while it rests, or an incoming order while it matches
 *
 * qty_original is what the owner asked for; qty_remaining drops with each
 * fill. A stored order always has qty_remaining > 0.
 */
struct Order {
    OrderId order_id{constants::INVALID_ORDER_ID};
    ParticipantId participant{constants::INVALID_PARTICIPANT_ID};
    Side side{Side::Buy};
    OrderKind kind{OrderKind::Limit};
    Price price{0.0};
    Qty qty_remaining{0};
    Qty qty_original{0};
    Timestamp timestamp{0};

    OrderSlot queue_prev{NO_SLOT};
    OrderSlot queue_next{NO_SLOT};

    Order() = default;

    Order(OrderId id, ParticipantId owner, Side order_side, Price limit, Qty qty, Timestamp admitted)
        : order_id(id), participant(owner), side(order_side), price(limit),
          qty_remaining(qty), qty_original(qty), timestamp(admitted) {}

    [[nodiscard]] bool is_filled() const noexcept { return qty_remaining <= Qty{0}; }
    [[nodiscard]] Qty qty_filled() const noexcept { return qty_original - qty_remaining; }
};

/**
 * @brief One execution between a buy order and a sell order
 *
 * Prices at the passive quote: the resting order's price against a market
 * order, the ask's price when two limits cross. aggressor_side is the side
 * of whichever order was admitted later.
 */
struct Trade {
    Timestamp timestamp{0};
    Price price{0.0};
    Qty qty{0};
    Side aggressor_side{Side::Buy};

    OrderId buy_order_id{constants::INVALID_ORDER_ID};
    OrderId sell_order_id{constants::INVALID_ORDER_ID};
    ParticipantId buyer{constants::INVALID_PARTICIPANT_ID};
    ParticipantId seller{constants::INVALID_PARTICIPANT_ID};
};

/// One side of a Trade, addressed to the owner of that order
struct Fill {
    OrderId order_id{constants::INVALID_ORDER_ID};
    ParticipantId participant{constants::INVALID_PARTICIPANT_ID};
    Side side{Side::Buy};
    OrderKind kind{OrderKind::Limit};
    Price price{0.0};
    Qty qty{0};
    Qty qty_remaining{0};
    Timestamp timestamp{0};

    [[nodiscard]] bool completes_order() const noexcept { return qty_remaining <= Qty{0}; }
};

/// What the book did with one add or cancel
struct OrderResponse {
    OrderResult result{OrderResult::Rejected};
    OrderId order_id{constants::INVALID_ORDER_ID};
    Qty qty_filled{0};
    Qty qty_remaining{0};
    std::size_t trade_count{0};

    [[nodiscard]] bool success() const noexcept {
        switch (result) {
            case OrderResult::Rejected:
            case OrderResult::NotFound:
            case OrderResult::Invalid:
                return false;
            default:
                return true;
        }
    }
};

} // namespace lobsim
