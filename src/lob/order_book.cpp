/**
 * @file order_book.cpp
 * @brief Implementation of the price-time priority limit order book
 */

#include <lobsim/lob/order_book.hpp>
#include <lobsim/common/macros.hpp>

#include <algorithm>

namespace lobsim {

namespace {

Fill make_fill(const Order& order, Price price, Qty qty, Timestamp ts) {
    Fill fill;
    fill.order_id = order.order_id;
    fill.participant = order.participant;
    fill.side = order.side;
    fill.kind = order.kind;
    fill.price = price;
    fill.qty = qty;
    fill.qty_remaining = order.qty_remaining;
    fill.timestamp = ts;
    return fill;
}

template<typename Levels>
void collect_depth(const Levels& levels, std::size_t max_levels, std::vector<LevelView>& out) {
    out.reserve(max_levels == 0 ? levels.size() : std::min(max_levels, levels.size()));
    for (const auto& [price, level] : levels) {
        if (max_levels != 0 && out.size() >= max_levels) {
            break;
        }
        LOBSIM_ASSERT(!level.empty());
        out.push_back(LevelView{price, level.open_qty, level.order_count});
    }
}

/// Opposite-side quantity a limit order at `limit` could take right now
template<typename Levels>
Qty crossable_qty(const Levels& levels, Side taker_side, Price limit, Qty wanted) {
    Qty total{0};
    for (const auto& [price, level] : levels) {
        const bool crosses = (taker_side == Side::Buy) ? price <= limit : price >= limit;
        if (!crosses || total >= wanted) {
            break;
        }
        total += level.open_qty;
    }
    return total;
}

Trade make_trade(const Order& buy, const Order& sell, Price price, Qty qty, Side aggressor, Timestamp ts) {
    Trade trade;
    trade.timestamp = ts;
    trade.price = price;
    trade.qty = qty;
    trade.aggressor_side = aggressor;
    trade.buy_order_id = buy.order_id;
    trade.sell_order_id = sell.order_id;
    trade.buyer = buy.participant;
    trade.seller = sell.participant;
    return trade;
}

/// Fill totals for an order that asked for `qty` and has `remaining` left
void settle(OrderResponse& response, Qty qty, Qty remaining, std::size_t trades) {
    response.trade_count = trades;
    response.qty_remaining = remaining;
    response.qty_filled = qty - remaining;
    if (remaining <= Qty{0}) {
        response.result = OrderResult::FullyFilled;
    } else {
        response.result = (response.qty_filled > Qty{0}) ? OrderResult::PartiallyFilled : OrderResult::Accepted;
    }
}

} // namespace

OrderBook::OrderBook(std::uint32_t max_orders, float load_factor)
    : store_(max_orders) {
    order_map_.max_load_factor(load_factor);
    order_map_.reserve(std::min<std::size_t>(max_orders, 1u << 16));
}

// ============================================================================
// Mutations
// ============================================================================

OrderResponse OrderBook::add_limit(OrderId order_id, ParticipantId participant, Side side, Price price, Qty qty) {
    OrderResponse response;
    response.order_id = order_id;
    response.qty_remaining = qty;

    if LOBSIM_UNLIKELY(order_map_.contains(order_id.get())) {
        response.result = OrderResult::Rejected;
        return response;
    }

    const Order order(order_id, participant, side, price, qty, clock_.next());
    std::size_t trades = 0;

    if LOBSIM_UNLIKELY(store_.full()) {
        // Nowhere to rest: only an order the book fills outright gets through
        const Qty available = (side == Side::Buy)
            ? crossable_qty(asks_, side, price, qty)
            : crossable_qty(bids_, side, price, qty);
        if (available < qty) {
            response.result = OrderResult::Rejected;
            return response;
        }

        const Qty remaining = (side == Side::Buy) ? sweep(asks_, order, trades) : sweep(bids_, order, trades);
        LOBSIM_ASSERT(remaining == Qty{0});
        settle(response, qty, remaining, trades);
        return response;
    }

    OrderSlot slot = store_.insert(order);
    order_map_.emplace(order_id.get(), slot);

    // Rest first; a cross is resolved by the matching loop below
    if (side == Side::Buy) {
        bids_[price].enqueue(store_, slot);
    } else {
        asks_[price].enqueue(store_, slot);
    }

    match_crossed(trades);

    // Gone from the index means it filled completely
    const auto still_resting = order_map_.find(order_id.get());
    settle(response, qty, still_resting == order_map_.end() ? Qty{0} : store_[still_resting->second].qty_remaining,
           trades);
    return response;
}

OrderResponse OrderBook::add_market(OrderId order_id, ParticipantId participant, Side side, Qty qty) {
    OrderResponse response;
    response.order_id = order_id;
    response.qty_remaining = qty;

    if ((side == Side::Buy) ? asks_.empty() : bids_.empty()) {
        response.result = OrderResult::Rejected;
        return response;
    }

    Order order(order_id, participant, side, Price{0.0}, qty, clock_.next());
    order.kind = OrderKind::Market;

    std::size_t trades = 0;
    const Qty remaining = (side == Side::Buy) ? sweep(asks_, order, trades) : sweep(bids_, order, trades);
    settle(response, qty, remaining, trades);
    return response;
}

OrderResponse OrderBook::cancel(OrderId order_id) {
    OrderResponse response;
    response.order_id = order_id;

    auto it = order_map_.find(order_id.get());
    if LOBSIM_UNLIKELY(it == order_map_.end()) {
        response.result = OrderResult::NotFound;
        return response;
    }

    OrderSlot slot = it->second;
    response.qty_remaining = store_[slot].qty_remaining;

    order_map_.erase(it);
    remove_resting(slot);

    response.result = OrderResult::Cancelled;
    return response;
}

// ============================================================================
// Market Data
// ============================================================================

std::optional<Price> OrderBook::best_bid() const {
    return bids_.empty() ? std::nullopt : std::optional<Price>(bids_.begin()->first);
}

std::optional<Price> OrderBook::best_ask() const {
    return asks_.empty() ? std::nullopt : std::optional<Price>(asks_.begin()->first);
}

std::optional<double> OrderBook::mid_price() const {
    if (bids_.empty() || asks_.empty()) {
        return std::nullopt;
    }
    return 0.5 * (bids_.begin()->first.get() + asks_.begin()->first.get());
}

std::optional<double> OrderBook::spread() const {
    if (bids_.empty() || asks_.empty()) {
        return std::nullopt;
    }
    return asks_.begin()->first.get() - bids_.begin()->first.get();
}

Qty OrderBook::best_bid_qty() const { return bids_.empty() ? Qty{0} : bids_.begin()->second.open_qty; }
Qty OrderBook::best_ask_qty() const { return asks_.empty() ? Qty{0} : asks_.begin()->second.open_qty; }

BookSnapshot OrderBook::depth(std::size_t max_levels) const {
    BookSnapshot snapshot;
    collect_depth(bids_, max_levels, snapshot.bids);
    collect_depth(asks_, max_levels, snapshot.asks);
    return snapshot;
}

std::size_t OrderBook::order_count() const { return store_.size(); }
std::size_t OrderBook::bid_levels() const { return bids_.size(); }
std::size_t OrderBook::ask_levels() const { return asks_.size(); }
std::uint64_t OrderBook::trade_count() const { return total_trades_; }
std::uint64_t OrderBook::total_volume() const { return total_volume_; }
std::optional<Price> OrderBook::last_trade_price() const { return last_trade_price_; }

bool OrderBook::has_order(OrderId order_id) const {
    return order_map_.contains(order_id.get());
}

const Order* OrderBook::find_order(OrderId order_id) const {
    const auto it = order_map_.find(order_id.get());
    return it == order_map_.end() ? nullptr : &store_[it->second];
}

bool OrderBook::is_crossed() const {
    return !bids_.empty() && !asks_.empty() && bids_.begin()->first >= asks_.begin()->first;
}

void OrderBook::clear() {
    store_.clear();
    order_map_.clear();
    bids_.clear();
    asks_.clear();
    total_trades_ = 0;
    total_volume_ = 0;
    last_trade_price_.reset();
}

// ============================================================================
// Matching
// ============================================================================

void OrderBook::match_crossed(std::size_t& trade_count) {
    while (!bids_.empty() && !asks_.empty()) {
        auto bid_level_it = bids_.begin();
        auto ask_level_it = asks_.begin();

        if (bid_level_it->first < ask_level_it->first) {
            break;
        }

        LevelQueue& bid_level = bid_level_it->second;
        LevelQueue& ask_level = ask_level_it->second;
        const OrderSlot bid_slot = bid_level.head;
        const OrderSlot ask_slot = ask_level.head;
        Order& bid = store_[bid_slot];
        Order& ask = store_[ask_slot];

        const Qty fill_qty{std::min(bid.qty_remaining.get(), ask.qty_remaining.get())};

        // Both orders rest; the later arrival completed the cross
        const Side aggressor = (bid.timestamp > ask.timestamp) ? Side::Buy : Side::Sell;
        const Trade trade = make_trade(bid, ask, ask.price, fill_qty, aggressor, clock_.next());

        bid.qty_remaining -= fill_qty;
        ask.qty_remaining -= fill_qty;
        bid_level.on_fill(fill_qty);
        ask_level.on_fill(fill_qty);

        record_trade(trade);
        ++trade_count;

        emit_fill(make_fill(bid, trade.price, fill_qty, trade.timestamp));
        emit_fill(make_fill(ask, trade.price, fill_qty, trade.timestamp));

        if (bid.is_filled()) {
            retire(bids_, bid_level_it, bid_slot);
        }
        if (ask.is_filled()) {
            retire(asks_, ask_level_it, ask_slot);
        }
    }

    LOBSIM_ASSERT(!is_crossed());
}

template<typename Levels>
Qty OrderBook::sweep(Levels& levels, const Order& taker, std::size_t& trade_count) {
    const bool taker_buys = (taker.side == Side::Buy);
    const bool bounded = (taker.kind == OrderKind::Limit);
    Qty remaining = taker.qty_remaining;

    while (remaining.get() > 0 && !levels.empty()) {
        auto level_it = levels.begin();
        if (bounded && (taker_buys ? level_it->first > taker.price : level_it->first < taker.price)) {
            break;
        }

        LevelQueue& level = level_it->second;
        const OrderSlot maker_slot = level.head;
        Order& maker = store_[maker_slot];

        const Qty fill_qty{std::min(remaining.get(), maker.qty_remaining.get())};

        // A cross trades at the ask; a limit seller is the ask here
        const Price price = (bounded && !taker_buys) ? taker.price : maker.price;
        const Trade trade = taker_buys
            ? make_trade(taker, maker, price, fill_qty, taker.side, clock_.next())
            : make_trade(maker, taker, price, fill_qty, taker.side, clock_.next());

        maker.qty_remaining -= fill_qty;
        level.on_fill(fill_qty);
        remaining -= fill_qty;

        record_trade(trade);
        ++trade_count;

        Fill taker_fill = make_fill(taker, trade.price, fill_qty, trade.timestamp);
        taker_fill.qty_remaining = remaining;

        emit_fill(make_fill(maker, trade.price, fill_qty, trade.timestamp));
        emit_fill(taker_fill);

        if (maker.is_filled()) {
            retire(levels, level_it, maker_slot);
        }
    }

    return remaining;
}

template<typename Levels>
void OrderBook::retire(Levels& levels, typename Levels::iterator level_it, OrderSlot slot) {
    LOBSIM_ASSERT(store_[slot].is_filled());

    order_map_.erase(store_[slot].order_id.get());
    level_it->second.unlink(store_, slot);
    store_.erase(slot);

    if (level_it->second.empty()) {
        levels.erase(level_it);
    }
}

void OrderBook::remove_resting(OrderSlot slot) {
    const Order& order = store_[slot];

    auto take_out = [this, slot, price = order.price](auto& levels) {
        auto it = levels.find(price);
        LOBSIM_ASSERT(it != levels.end());
        if (it == levels.end()) {
            return;
        }
        it->second.unlink(store_, slot);
        if (it->second.empty()) {
            levels.erase(it);
        }
    };

    if (order.side == Side::Buy) {
        take_out(bids_);
    } else {
        take_out(asks_);
    }

    store_.erase(slot);
}

void OrderBook::record_trade(const Trade& trade) {
    ++total_trades_;
    total_volume_ += static_cast<std::uint64_t>(trade.qty.get());
    last_trade_price_ = trade.price;

    if (trade_callback_) {
        trade_callback_(trade);
    }
}

void OrderBook::emit_fill(const Fill& fill) {
    if (fill_callback_) {
        fill_callback_(fill);
    }
}

} // namespace lobsim
