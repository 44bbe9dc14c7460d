#pragma once
/**
 * @file matching_engine.hpp
 * @brief Matching engine: order admission, book ownership and trade history
 *
 * Owns OrderBook, Accounts, EngineStats and the append-only trade log.
 * Every entry point is synchronous; the whole engine state is one unit of
 * mutual exclusion.
 */

#include <lobsim/common/types.hpp>
#include <lobsim/common/time.hpp>
#include <lobsim/common/macros.hpp>
#include <lobsim/lob/order.hpp>
#include <lobsim/lob/order_book.hpp>
#include <lobsim/engine/accounts.hpp>
#include <lobsim/engine/validation.hpp>
#include <lobsim/metrics/stats.hpp>
#include <lobsim/logging/async_logger.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lobsim {

/**
 * @brief Configuration for the matching engine
 */
struct EngineConfig {
    // Order book configuration
    std::uint32_t max_orders{static_cast<std::uint32_t>(constants::DEFAULT_MAX_ORDERS)};

    // Reported by get_mid_price() until the first trade prints
    double default_reference_price{constants::DEFAULT_REFERENCE_PRICE};

    // Admission checks
    OrderLimits limits;

    // Logging
    bool log_fills{false};  // One Debug line per fill leg

    EngineConfig() = default;
};

/**
 * @brief Outcome of a submission
 *
 * `accepted` is false for invalid input, for a market order that found no
 * opposing liquidity, and when the order pool is exhausted. `order_id` is
 * set exactly when `accepted` is true.
 */
struct SubmitResult {
    bool accepted{false};
    std::optional<OrderId> order_id;
    OrderKind kind{OrderKind::Limit};
    OrderResult result{OrderResult::Rejected};
    ValidationResult reason{ValidationResult::Passed};
    Qty qty_filled{0};
    Qty qty_remaining{0};
    std::size_t trade_count{0};

    /**
     * @brief Lifecycle state of the order right after submission
     */
    [[nodiscard]] OrderState state() const noexcept {
        if (!accepted) {
            return OrderState::Rejected;
        }
        if (kind == OrderKind::Market || result == OrderResult::FullyFilled) {
            return OrderState::Filled;
        }
        return OrderState::Resting;
    }
};

/**
 * @brief Single-instrument matching engine
 *
 * Thread Safety:
 * - submit()/cancel() hold an exclusive lock for the full admit-and-match
 *   sequence, so the book is never observed crossed
 * - Queries hold a shared lock and may run concurrently with each other
 * - Fill listeners run after the lock is released, on the submitting thread,
 *   and may call back into the engine, including add_fill_listener()
 */
class MatchingEngine {
public:
    /// Callback for per-order fill notifications
    using FillCallback = std::function<void(const Fill&)>;

private:
    EngineConfig config_;
    OrderBook book_;
    OrderValidator validator_;
    Accounts accounts_;
    EngineStats stats_;
    AsyncLogger* logger_;

    std::vector<Trade> trade_log_;
    std::vector<Fill> pending_fills_;
    std::vector<FillCallback> fill_listeners_;

    // Owner name interning: name <-> dense id
    std::unordered_map<std::string, ParticipantId> participant_ids_;
    std::vector<std::string> participant_names_;

    std::uint64_t next_order_id_{constants::FIRST_ORDER_ID};

    mutable std::shared_mutex mutex_;

public:
    /**
     * @brief Construct matching engine
     * @param config Engine configuration
     * @param logger Optional async logger (not owned)
     */
    explicit MatchingEngine(EngineConfig config = {}, AsyncLogger* logger = nullptr);

    ~MatchingEngine() = default;

    MatchingEngine(const MatchingEngine&) = delete;
    MatchingEngine& operator=(const MatchingEngine&) = delete;

    // ========================================================================
    // Order Entry
    // ========================================================================

    /**
     * @brief Submit a new order
     *
     * LIMIT orders rest and then match continuously while the book is
     * crossed. MARKET orders execute against the opposite side at the
     * resting prices; they are rejected when that side is empty and any
     * unfilled remainder is dropped.
     *
     * @param side Buy or Sell
     * @param kind Limit or Market
     * @param price Limit price (ignored for market orders)
     * @param qty Quantity (> 0)
     * @param owner Opaque participant name
     */
    SubmitResult submit(Side side, OrderKind kind, Price price, Qty qty, std::string_view owner);

    SubmitResult submit_limit(Side side, Price price, Qty qty, std::string_view owner) {
        return submit(side, OrderKind::Limit, price, qty, owner);
    }

    SubmitResult submit_market(Side side, Qty qty, std::string_view owner) {
        return submit(side, OrderKind::Market, Price{0.0}, qty, owner);
    }

    /**
     * @brief Cancel a resting order
     * @return false if the id is unknown, already filled or already cancelled
     */
    bool cancel(OrderId order_id);

    /**
     * @brief Register a fill listener
     */
    void add_fill_listener(FillCallback callback);

    // ========================================================================
    // Market Data
    // ========================================================================

    /**
     * @brief Aggregated depth per side
     * @param max_levels Levels per side (0 = all)
     */
    [[nodiscard]] BookSnapshot get_book(std::size_t max_levels = 0) const;

    /**
     * @brief Reference price for strategies
     *
     * Mid of best bid and ask when both sides have orders, else the last
     * trade price, else the configured default.
     */
    [[nodiscard]] double get_mid_price() const;

    [[nodiscard]] std::optional<Price> best_bid() const;
    [[nodiscard]] std::optional<Price> best_ask() const;
    [[nodiscard]] std::optional<double> spread() const;
    [[nodiscard]] std::optional<double> last_trade_price() const;

    /**
     * @brief Copy of the trade log, oldest first
     */
    [[nodiscard]] std::vector<Trade> trade_log() const;

    /**
     * @brief The most recent trades, oldest first
     */
    [[nodiscard]] std::vector<Trade> recent_trades(std::size_t count) const;

    [[nodiscard]] std::size_t trade_count() const;

    // ========================================================================
    // Order Queries
    // ========================================================================

    [[nodiscard]] bool has_order(OrderId order_id) const;

    /**
     * @brief Copy of a resting order, or nullopt once it is filled or cancelled
     */
    [[nodiscard]] std::optional<Order> find_order(OrderId order_id) const;

    [[nodiscard]] std::size_t order_count() const;

    // ========================================================================
    // Participants
    // ========================================================================

    [[nodiscard]] std::optional<ParticipantId> participant_id(std::string_view owner) const;
    [[nodiscard]] std::string participant_name(ParticipantId participant) const;

    [[nodiscard]] std::int64_t position(std::string_view owner) const;
    [[nodiscard]] double cash(std::string_view owner) const;
    [[nodiscard]] std::vector<Account> accounts() const;

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] const EngineStats& stats() const noexcept { return stats_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    /**
     * @brief Map an owner name to its id, creating one on first use
     */
    ParticipantId intern(std::string_view owner);

    void on_trade(const Trade& trade);
    void on_fill(const Fill& fill);

    /**
     * @brief Deliver fills to a snapshot of the listeners (caller must NOT hold mutex_)
     *
     * Listeners added during dispatch see fills from the next mutation on.
     */
    void dispatch(const std::vector<Fill>& fills, const std::vector<FillCallback>& listeners);
};

} // namespace lobsim
