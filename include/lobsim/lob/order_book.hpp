#pragma once
/**
 * @file order_book.hpp
 * @brief Limit order book with price-time priority and continuous matching
 *
 * Price levels live in ordered maps keyed by price (best price at begin()).
 * Resting orders live in an OrderStore; each level queues them by arrival.
 */

#include <lobsim/common/types.hpp>
#include <lobsim/common/time.hpp>
#include <lobsim/common/macros.hpp>
#include <lobsim/common/concepts.hpp>
#include <lobsim/lob/order.hpp>
#include <lobsim/lob/order_store.hpp>

#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lobsim {

/// Open quantity and order count at one price
struct LevelView {
    Price price{0.0};
    Qty qty{0};
    std::uint32_t order_count{0};
};

/// Both sides, best price first on each
struct BookSnapshot {
    std::vector<LevelView> bids;
    std::vector<LevelView> asks;

    [[nodiscard]] bool empty() const noexcept { return bids.empty() && asks.empty(); }
};

/**
 * @brief Single-instrument book: price priority, then arrival order
 *
 * A limit order is stored and queued at its price first; the book then
 * trades best bid against best ask until they no longer cross. A market
 * order never rests and walks the opposite side from the best price.
 *
 * The store has a fixed number of slots. When it is full, a limit order the
 * opposite side can fill completely still trades; one that would have to
 * rest is rejected.
 *
 * Thread Safety: none. MatchingEngine serializes every call.
 */
class OrderBook {
public:
    using TradeCallback = std::function<void(const Trade&)>;
    using FillCallback = std::function<void(const Fill&)>;

private:
    using BidLevels = std::map<Price, LevelQueue, std::greater<Price>>;
    using AskLevels = std::map<Price, LevelQueue, std::less<Price>>;

    BidLevels bids_;
    AskLevels asks_;
    OrderStore store_;
    std::unordered_map<std::uint64_t, OrderSlot> order_map_;  // Resting orders only
    SequencedClock clock_;

    TradeCallback trade_callback_;
    FillCallback fill_callback_;

    std::uint64_t total_trades_{0};
    std::uint64_t total_volume_{0};
    std::optional<Price> last_trade_price_;

public:
    /**
     * @param max_orders Slots in the store, i.e. the most orders that can rest at once
     * @param load_factor Of the id index
     */
    explicit OrderBook(
        std::uint32_t max_orders = static_cast<std::uint32_t>(constants::DEFAULT_MAX_ORDERS),
        float load_factor = 0.5f
    );

    OrderBook(const OrderBook&) = delete;
    OrderBook& operator=(const OrderBook&) = delete;

    template<TradeHandler<Trade> F>
    void set_trade_callback(F&& callback) {
        trade_callback_ = std::forward<F>(callback);
    }

    /// Called twice per trade, maker leg first
    template<FillHandler<Fill> F>
    void set_fill_callback(F&& callback) {
        fill_callback_ = std::forward<F>(callback);
    }

    // ========================================================================
    // Mutations
    // ========================================================================

    /**
     * @brief Admit a limit order and trade until the book is uncrossed
     *
     * Arguments are assumed valid (qty > 0, finite price, unused id).
     * @return Fill totals for this order only
     */
    OrderResponse add_limit(
        OrderId order_id,
        ParticipantId participant,
        Side side,
        Price price,
        Qty qty
    );

    /**
     * @brief Trade against the opposite side until filled or out of liquidity
     *
     * Rejected with no effect when the opposite side is empty. An unfilled
     * remainder is discarded.
     */
    OrderResponse add_market(
        OrderId order_id,
        ParticipantId participant,
        Side side,
        Qty qty
    );

    /// NotFound unless the id is resting right now
    OrderResponse cancel(OrderId order_id);

    // ========================================================================
    // Market Data
    // ========================================================================

    [[nodiscard]] std::optional<Price> best_bid() const;
    [[nodiscard]] std::optional<Price> best_ask() const;

    // Both need a bid and an ask
    [[nodiscard]] std::optional<double> mid_price() const;
    [[nodiscard]] std::optional<double> spread() const;

    [[nodiscard]] Qty best_bid_qty() const;
    [[nodiscard]] Qty best_ask_qty() const;

    /// @param max_levels Per side; 0 means every level
    [[nodiscard]] BookSnapshot depth(std::size_t max_levels = 0) const;

    [[nodiscard]] std::size_t order_count() const;
    [[nodiscard]] std::size_t bid_levels() const;
    [[nodiscard]] std::size_t ask_levels() const;
    [[nodiscard]] std::uint64_t trade_count() const;
    [[nodiscard]] std::uint64_t total_volume() const;
    [[nodiscard]] std::optional<Price> last_trade_price() const;

    [[nodiscard]] bool has_order(OrderId order_id) const;

    /// nullptr unless resting; the pointer is invalidated by the next mutation
    [[nodiscard]] const Order* find_order(OrderId order_id) const;

    /// Best bid >= best ask. Never true between public calls.
    [[nodiscard]] bool is_crossed() const;

    /// Drops every order and resets the trade counters
    void clear();

private:
    /// Trades top of book against top of book; bumps trade_count per trade
    void match_crossed(std::size_t& trade_count);

    /**
     * @brief Fill an order that never rests by walking one side from the best level
     *
     * A limit taker stops at the first level that no longer crosses its
     * price; a market taker only stops when the side runs dry.
     * @return Quantity left unfilled
     */
    template<typename Levels>
    Qty sweep(Levels& levels, const Order& taker, std::size_t& trade_count);

    /**
     * @brief Unlink a filled order, drop it from the index and free its slot
     */
    template<typename Levels>
    void retire(Levels& levels, typename Levels::iterator level_it, OrderSlot slot);

    /**
     * @brief Remove a resting order from its level (cancel path)
     */
    void remove_resting(OrderSlot slot);

    void record_trade(const Trade& trade);
    void emit_fill(const Fill& fill);
};

} // namespace lobsim
