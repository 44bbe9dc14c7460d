/**
 * @file test_order_book.cpp
 * @brief Unit tests for the limit order book
 */

#include <gtest/gtest.h>

#include <lobsim/lob/order_book.hpp>
#include <lobsim/lob/order.hpp>
#include <lobsim/common/types.hpp>

#include <cstdint>
#include <vector>

using namespace lobsim;

class OrderBookTest : public ::testing::Test {
protected:
    OrderBook book{10000};
    std::vector<Trade> trades;
    std::vector<Fill> fills;

    void SetUp() override {
        book.set_trade_callback([this](const Trade& t) { trades.push_back(t); });
        book.set_fill_callback([this](const Fill& f) { fills.push_back(f); });
    }

    OrderResponse bid(std::uint64_t id, double price, std::int64_t qty, std::uint32_t owner = 0) {
        return book.add_limit(OrderId{id}, ParticipantId{owner}, Side::Buy, Price{price}, Qty{qty});
    }

    OrderResponse ask(std::uint64_t id, double price, std::int64_t qty, std::uint32_t owner = 0) {
        return book.add_limit(OrderId{id}, ParticipantId{owner}, Side::Sell, Price{price}, Qty{qty});
    }

    OrderResponse market(std::uint64_t id, Side side, std::int64_t qty, std::uint32_t owner) {
        return book.add_market(OrderId{id}, ParticipantId{owner}, side, Qty{qty});
    }
};

// ============================================================================
// Resting
// ============================================================================

TEST_F(OrderBookTest, EmptyBookHasNoPrices) {
    EXPECT_EQ(book.order_count(), 0);
    EXPECT_EQ(book.bid_levels(), 0);
    EXPECT_EQ(book.ask_levels(), 0);
    EXPECT_FALSE(book.best_bid().has_value());
    EXPECT_FALSE(book.best_ask().has_value());
    EXPECT_FALSE(book.spread().has_value());
    EXPECT_FALSE(book.mid_price().has_value());
    EXPECT_TRUE(book.depth().empty());
}

TEST_F(OrderBookTest, BidRests) {
    auto response = bid(1, 100.0, 10);

    EXPECT_EQ(response.result, OrderResult::Accepted);
    EXPECT_EQ(response.qty_filled.get(), 0);
    EXPECT_EQ(response.qty_remaining.get(), 10);

    EXPECT_EQ(book.order_count(), 1);
    EXPECT_EQ(book.bid_levels(), 1);
    ASSERT_TRUE(book.best_bid().has_value());
    EXPECT_DOUBLE_EQ(book.best_bid()->get(), 100.0);
    EXPECT_EQ(book.best_bid_qty().get(), 10);
}

TEST_F(OrderBookTest, AskRests) {
    auto response = ask(1, 100.0, 10);

    EXPECT_EQ(response.result, OrderResult::Accepted);
    EXPECT_EQ(book.order_count(), 1);
    EXPECT_EQ(book.ask_levels(), 1);
    ASSERT_TRUE(book.best_ask().has_value());
    EXPECT_DOUBLE_EQ(book.best_ask()->get(), 100.0);
}

TEST_F(OrderBookTest, DuplicateOrderIdRejected) {
    bid(1, 100.0, 10);

    auto response = bid(1, 101.0, 20);

    EXPECT_EQ(response.result, OrderResult::Rejected);
    EXPECT_EQ(book.order_count(), 1);
    EXPECT_DOUBLE_EQ(book.best_bid()->get(), 100.0);
}

TEST_F(OrderBookTest, FullStoreRejectsOrderThatWouldRest) {
    OrderBook small{2};
    small.add_limit(OrderId{1}, ParticipantId{0}, Side::Buy, Price{99.0}, Qty{10});
    small.add_limit(OrderId{2}, ParticipantId{0}, Side::Buy, Price{98.0}, Qty{10});

    auto response = small.add_limit(OrderId{3}, ParticipantId{0}, Side::Buy, Price{97.0}, Qty{10});

    EXPECT_EQ(response.result, OrderResult::Rejected);
    EXPECT_EQ(small.order_count(), 2);
    EXPECT_FALSE(small.has_order(OrderId{3}));

    // A freed slot is reusable
    small.cancel(OrderId{1});
    auto retry = small.add_limit(OrderId{4}, ParticipantId{0}, Side::Buy, Price{97.0}, Qty{10});
    EXPECT_EQ(retry.result, OrderResult::Accepted);
}

TEST_F(OrderBookTest, FullStoreStillFillsMarketableLimit) {
    OrderBook small{2};
    std::vector<Trade> small_trades;
    std::vector<Fill> small_fills;
    small.set_trade_callback([&small_trades](const Trade& trade) { small_trades.push_back(trade); });
    small.set_fill_callback([&small_fills](const Fill& fill) { small_fills.push_back(fill); });

    small.add_limit(OrderId{1}, ParticipantId{0}, Side::Sell, Price{100.0}, Qty{5});
    small.add_limit(OrderId{2}, ParticipantId{0}, Side::Sell, Price{101.0}, Qty{5});

    // Sweeps both asks at their own prices without ever resting
    auto buy = small.add_limit(OrderId{3}, ParticipantId{1}, Side::Buy, Price{101.0}, Qty{8});
    EXPECT_EQ(buy.result, OrderResult::FullyFilled);
    EXPECT_EQ(buy.qty_filled.get(), 8);
    EXPECT_EQ(buy.trade_count, 2);
    ASSERT_EQ(small_trades.size(), 2);
    EXPECT_DOUBLE_EQ(small_trades[0].price.get(), 100.0);
    EXPECT_DOUBLE_EQ(small_trades[1].price.get(), 101.0);
    EXPECT_EQ(small_trades[1].aggressor_side, Side::Buy);
    EXPECT_EQ(small_fills.size(), 4);
    EXPECT_FALSE(small.has_order(OrderId{3}));
    EXPECT_EQ(small.best_ask_qty().get(), 2);
    EXPECT_FALSE(small.best_bid().has_value());
}

TEST_F(OrderBookTest, FullStoreSellCrossTradesAtItsOwnPrice) {
    OrderBook small{1};
    std::vector<Trade> small_trades;
    small.set_trade_callback([&small_trades](const Trade& trade) { small_trades.push_back(trade); });

    small.add_limit(OrderId{1}, ParticipantId{0}, Side::Buy, Price{100.0}, Qty{5});

    // The incoming sell is the ask, so the cross prints at 99
    auto sell = small.add_limit(OrderId{2}, ParticipantId{1}, Side::Sell, Price{99.0}, Qty{5});
    EXPECT_EQ(sell.result, OrderResult::FullyFilled);
    ASSERT_EQ(small_trades.size(), 1);
    EXPECT_DOUBLE_EQ(small_trades[0].price.get(), 99.0);
    EXPECT_EQ(small_trades[0].aggressor_side, Side::Sell);
    EXPECT_EQ(small.order_count(), 0);
}

TEST_F(OrderBookTest, FullStoreRejectsPartiallyMarketableLimit) {
    OrderBook small{1};
    small.add_limit(OrderId{1}, ParticipantId{0}, Side::Sell, Price{100.0}, Qty{5});

    // Only 5 of 6 could trade and the rest has nowhere to rest
    auto buy = small.add_limit(OrderId{2}, ParticipantId{1}, Side::Buy, Price{100.0}, Qty{6});
    EXPECT_EQ(buy.result, OrderResult::Rejected);
    EXPECT_EQ(small.trade_count(), 0);
    EXPECT_EQ(small.best_ask_qty().get(), 5);
}

// ============================================================================
// Levels and Depth
// ============================================================================

TEST_F(OrderBookTest, HighestBidIsBest) {
    bid(1, 100.0, 10);
    bid(2, 99.0, 20);
    bid(3, 101.0, 30);

    EXPECT_EQ(book.bid_levels(), 3);
    EXPECT_DOUBLE_EQ(book.best_bid()->get(), 101.0);
    EXPECT_EQ(book.best_bid_qty().get(), 30);
}

TEST_F(OrderBookTest, LowestAskIsBest) {
    ask(1, 100.0, 10);
    ask(2, 101.0, 20);
    ask(3, 99.0, 30);

    EXPECT_EQ(book.ask_levels(), 3);
    EXPECT_DOUBLE_EQ(book.best_ask()->get(), 99.0);
    EXPECT_EQ(book.best_ask_qty().get(), 30);
}

TEST_F(OrderBookTest, SamePriceSharesOneLevel) {
    bid(1, 100.0, 10);
    bid(2, 100.0, 20, 1);
    bid(3, 100.0, 30, 2);

    EXPECT_EQ(book.bid_levels(), 1);
    EXPECT_EQ(book.order_count(), 3);
    EXPECT_EQ(book.best_bid_qty().get(), 60);
}

TEST_F(OrderBookTest, DepthOrdersBestFirst) {
    bid(1, 99.0, 10);
    bid(2, 98.0, 20);
    bid(3, 99.0, 5, 1);
    ask(4, 102.0, 7);
    ask(5, 101.0, 8);

    BookSnapshot snapshot = book.depth();

    ASSERT_EQ(snapshot.bids.size(), 2);
    EXPECT_DOUBLE_EQ(snapshot.bids[0].price.get(), 99.0);
    EXPECT_EQ(snapshot.bids[0].qty.get(), 15);
    EXPECT_EQ(snapshot.bids[0].order_count, 2);
    EXPECT_DOUBLE_EQ(snapshot.bids[1].price.get(), 98.0);

    ASSERT_EQ(snapshot.asks.size(), 2);
    EXPECT_DOUBLE_EQ(snapshot.asks[0].price.get(), 101.0);
    EXPECT_EQ(snapshot.asks[0].qty.get(), 8);
    EXPECT_DOUBLE_EQ(snapshot.asks[1].price.get(), 102.0);

    BookSnapshot top = book.depth(1);
    EXPECT_EQ(top.bids.size(), 1);
    EXPECT_EQ(top.asks.size(), 1);
}

// ============================================================================
// Matching
// ============================================================================

TEST_F(OrderBookTest, EqualCrossEmptiesBook) {
    ask(1, 100.0, 10);

    auto response = bid(2, 100.0, 10, 1);

    EXPECT_EQ(response.result, OrderResult::FullyFilled);
    EXPECT_EQ(response.qty_filled.get(), 10);
    EXPECT_EQ(response.trade_count, 1);

    ASSERT_EQ(trades.size(), 1);
    EXPECT_EQ(trades[0].qty.get(), 10);
    EXPECT_DOUBLE_EQ(trades[0].price.get(), 100.0);
    EXPECT_EQ(trades[0].sell_order_id.get(), 1);
    EXPECT_EQ(trades[0].buy_order_id.get(), 2);
    EXPECT_EQ(trades[0].aggressor_side, Side::Buy);

    EXPECT_EQ(book.order_count(), 0);
    EXPECT_EQ(book.bid_levels(), 0);
    EXPECT_EQ(book.ask_levels(), 0);
}

TEST_F(OrderBookTest, CrossTradesAtAskPrice) {
    bid(1, 100.0, 10);

    auto response = ask(2, 99.0, 5, 1);

    EXPECT_EQ(response.result, OrderResult::FullyFilled);
    ASSERT_EQ(trades.size(), 1);
    EXPECT_DOUBLE_EQ(trades[0].price.get(), 99.0);
    EXPECT_EQ(trades[0].qty.get(), 5);
    EXPECT_EQ(trades[0].aggressor_side, Side::Sell);
    EXPECT_EQ(trades[0].buyer, ParticipantId{0});
    EXPECT_EQ(trades[0].seller, ParticipantId{1});

    EXPECT_DOUBLE_EQ(book.best_bid()->get(), 100.0);
    EXPECT_EQ(book.best_bid_qty().get(), 5);
    EXPECT_FALSE(book.best_ask().has_value());
}

TEST_F(OrderBookTest, LargerBuyRestsRemainder) {
    ask(1, 100.0, 10);

    auto response = bid(2, 100.0, 15, 1);

    EXPECT_EQ(response.result, OrderResult::PartiallyFilled);
    EXPECT_EQ(response.qty_filled.get(), 10);
    EXPECT_EQ(response.qty_remaining.get(), 5);

    EXPECT_EQ(book.order_count(), 1);  // Remainder rests
    EXPECT_DOUBLE_EQ(book.best_bid()->get(), 100.0);
    EXPECT_EQ(book.best_bid_qty().get(), 5);

    const Order* rest = book.find_order(OrderId{2});
    ASSERT_NE(rest, nullptr);
    EXPECT_EQ(rest->qty_filled().get(), 10);
    EXPECT_EQ(rest->qty_original.get(), 15);
}

TEST_F(OrderBookTest, CrossWalksSeveralAskLevels) {
    ask(1, 100.0, 10);
    ask(2, 101.0, 10);
    ask(3, 102.0, 10);

    // Walks three levels, leaving 5 at the last
    auto response = bid(4, 102.0, 25, 1);

    EXPECT_EQ(response.result, OrderResult::FullyFilled);
    EXPECT_EQ(response.qty_filled.get(), 25);
    ASSERT_EQ(trades.size(), 3);
    EXPECT_DOUBLE_EQ(trades[0].price.get(), 100.0);
    EXPECT_DOUBLE_EQ(trades[1].price.get(), 101.0);
    EXPECT_DOUBLE_EQ(trades[2].price.get(), 102.0);

    EXPECT_EQ(book.ask_levels(), 1);
    EXPECT_DOUBLE_EQ(book.best_ask()->get(), 102.0);
    EXPECT_EQ(book.best_ask_qty().get(), 5);
}

TEST_F(OrderBookTest, EarlierOrderAtPriceTradesFirst) {
    ask(1, 100.0, 10);
    ask(2, 100.0, 10, 1);

    // Same price: the earlier order trades first
    bid(3, 100.0, 10, 2);

    ASSERT_EQ(trades.size(), 1);
    EXPECT_EQ(trades[0].sell_order_id.get(), 1);

    EXPECT_TRUE(book.has_order(OrderId{2}));
    EXPECT_FALSE(book.has_order(OrderId{1}));
}

TEST_F(OrderBookTest, NoMatchWhenPricesDoNotCross) {
    ask(1, 100.0, 10);

    auto response = bid(2, 99.0, 10, 1);

    EXPECT_EQ(response.result, OrderResult::Accepted);
    EXPECT_EQ(trades.size(), 0);
    EXPECT_EQ(book.order_count(), 2);
    EXPECT_FALSE(book.is_crossed());
}

TEST_F(OrderBookTest, CrossEmitsTwoFills) {
    ask(1, 100.0, 10);
    bid(2, 100.0, 4, 1);

    ASSERT_EQ(fills.size(), 2);

    // Bid leg first, then ask leg
    EXPECT_EQ(fills[0].order_id.get(), 2);
    EXPECT_EQ(fills[0].side, Side::Buy);
    EXPECT_EQ(fills[0].qty.get(), 4);
    EXPECT_TRUE(fills[0].completes_order());

    EXPECT_EQ(fills[1].order_id.get(), 1);
    EXPECT_EQ(fills[1].side, Side::Sell);
    EXPECT_EQ(fills[1].qty_remaining.get(), 6);
    EXPECT_FALSE(fills[1].completes_order());
}

// ============================================================================
// Market Orders
// ============================================================================

TEST_F(OrderBookTest, MarketBuyWalksAsks) {
    ask(1, 100.0, 10);
    ask(2, 101.0, 10);

    auto response = market(3, Side::Buy, 15, 1);

    EXPECT_EQ(response.result, OrderResult::FullyFilled);
    EXPECT_EQ(response.qty_filled.get(), 15);
    ASSERT_EQ(trades.size(), 2);
    EXPECT_DOUBLE_EQ(trades[0].price.get(), 100.0);
    EXPECT_DOUBLE_EQ(trades[1].price.get(), 101.0);
    EXPECT_EQ(trades[1].qty.get(), 5);
    EXPECT_EQ(trades[0].aggressor_side, Side::Buy);
}

TEST_F(OrderBookTest, MarketRemainderIsDiscarded) {
    ask(1, 100.0, 10);

    auto response = market(2, Side::Buy, 20, 1);

    EXPECT_EQ(response.result, OrderResult::PartiallyFilled);
    EXPECT_EQ(response.qty_filled.get(), 10);
    EXPECT_EQ(response.qty_remaining.get(), 10);
    EXPECT_EQ(book.order_count(), 0);
    EXPECT_FALSE(book.has_order(OrderId{2}));
}

TEST_F(OrderBookTest, MarketOrderRejectedOnEmptySide) {
    bid(1, 100.0, 10);

    auto response = market(2, Side::Buy, 5, 1);

    EXPECT_EQ(response.result, OrderResult::Rejected);
    EXPECT_EQ(trades.size(), 0);
    EXPECT_EQ(fills.size(), 0);
    EXPECT_EQ(book.order_count(), 1);
}

TEST_F(OrderBookTest, MarketSellFillsTakerAndMaker) {
    bid(1, 100.0, 10);

    market(2, Side::Sell, 4, 1);

    ASSERT_EQ(fills.size(), 2);
    EXPECT_EQ(fills[0].order_id.get(), 1);
    EXPECT_EQ(fills[0].kind, OrderKind::Limit);
    EXPECT_EQ(fills[1].order_id.get(), 2);
    EXPECT_EQ(fills[1].kind, OrderKind::Market);
    EXPECT_EQ(fills[1].side, Side::Sell);
    EXPECT_TRUE(fills[1].completes_order());

    ASSERT_EQ(trades.size(), 1);
    EXPECT_EQ(trades[0].aggressor_side, Side::Sell);
    EXPECT_EQ(trades[0].buy_order_id.get(), 1);
    EXPECT_EQ(trades[0].sell_order_id.get(), 2);
    EXPECT_EQ(book.best_bid_qty().get(), 6);
}

// ============================================================================
// Cancel
// ============================================================================

TEST_F(OrderBookTest, CancelRemovesLevel) {
    bid(1, 100.0, 10);

    auto response = book.cancel(OrderId{1});

    EXPECT_EQ(response.result, OrderResult::Cancelled);
    EXPECT_EQ(response.qty_remaining.get(), 10);
    EXPECT_EQ(book.order_count(), 0);
    EXPECT_EQ(book.bid_levels(), 0);
    EXPECT_FALSE(book.has_order(OrderId{1}));
}

TEST_F(OrderBookTest, CancelUnknownId) {
    auto response = book.cancel(OrderId{999});

    EXPECT_EQ(response.result, OrderResult::NotFound);
}

TEST_F(OrderBookTest, CancelMiddleOfQueueKeepsOrder) {
    ask(1, 100.0, 10);
    ask(2, 100.0, 10, 1);
    ask(3, 100.0, 10, 2);

    book.cancel(OrderId{2});
    EXPECT_EQ(book.best_ask_qty().get(), 20);

    market(4, Side::Buy, 20, 3);

    ASSERT_EQ(trades.size(), 2);
    EXPECT_EQ(trades[0].sell_order_id.get(), 1);
    EXPECT_EQ(trades[1].sell_order_id.get(), 3);
    EXPECT_EQ(book.order_count(), 0);
}

TEST_F(OrderBookTest, CancelledAskCannotTrade) {
    ask(1, 100.0, 10);
    book.cancel(OrderId{1});

    auto response = bid(2, 100.0, 10, 1);

    EXPECT_EQ(response.result, OrderResult::Accepted);
    EXPECT_EQ(trades.size(), 0);
}

TEST_F(OrderBookTest, CancelFilledOrderNotFound) {
    ask(1, 100.0, 10);
    bid(2, 100.0, 10, 1);

    EXPECT_EQ(book.cancel(OrderId{1}).result, OrderResult::NotFound);
    EXPECT_EQ(book.cancel(OrderId{2}).result, OrderResult::NotFound);
}

// ============================================================================
// Market Data
// ============================================================================

TEST_F(OrderBookTest, SpreadIsAskMinusBid) {
    bid(1, 99.0, 10);
    ask(2, 101.0, 10);

    auto spread = book.spread();
    ASSERT_TRUE(spread.has_value());
    EXPECT_DOUBLE_EQ(*spread, 2.0);
}

TEST_F(OrderBookTest, MidIsAverageOfTouch) {
    bid(1, 99.0, 10);
    ask(2, 101.0, 10);

    auto mid = book.mid_price();
    ASSERT_TRUE(mid.has_value());
    EXPECT_DOUBLE_EQ(*mid, 100.0);
}

TEST_F(OrderBookTest, CountsTradesAndVolume) {
    ask(1, 100.0, 10);
    ask(2, 101.0, 10);
    market(3, Side::Buy, 12, 1);

    EXPECT_EQ(book.trade_count(), 2);
    EXPECT_EQ(book.total_volume(), 12);
    ASSERT_TRUE(book.last_trade_price().has_value());
    EXPECT_DOUBLE_EQ(book.last_trade_price()->get(), 101.0);
}

TEST_F(OrderBookTest, ClearDropsOrdersAndCounters) {
    bid(1, 100.0, 10);
    ask(2, 101.0, 10);

    book.clear();

    EXPECT_EQ(book.order_count(), 0);
    EXPECT_EQ(book.bid_levels(), 0);
    EXPECT_EQ(book.ask_levels(), 0);
    EXPECT_EQ(book.trade_count(), 0);
    EXPECT_FALSE(book.has_order(OrderId{1}));
}
