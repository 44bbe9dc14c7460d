/**
 * @file market_maker.cpp
 * @brief Implementation of the market making strategy
 */

#include <lobsim/sim/market_maker.hpp>
#include <lobsim/engine/matching_engine.hpp>

#include <cmath>
#include <cstdlib>
#include <numeric>
#include <vector>

namespace lobsim::sim {

namespace {

double round_to_cents(double price) {
    return std::round(price * 100.0) / 100.0;
}

} // namespace

MarketMaker::MarketMaker(std::string name, MarketMakerConfig config)
    : Participant(std::move(name))
    , config_(config)
    , rng_(config.seed) {
}

void MarketMaker::act(MatchingEngine& engine, double /*now_s*/) {
    cancel_all_orders(engine);

    double mid = engine.get_mid_price();
    update_price_history(mid);

    double spread = calculate_spread(calculate_volatility());
    place_quotes(engine, mid, spread);

    last_mid_ = mid;
}

void MarketMaker::on_fill(const Fill& fill) {
    if (fill.side == Side::Buy) {
        inventory_ += fill.qty.get();
    } else {
        inventory_ -= fill.qty.get();
    }
    Participant::on_fill(fill);
}

double MarketMaker::calculate_volatility() const {
    if (price_history_.size() < 2) {
        return 0.0;
    }

    const auto n = static_cast<double>(price_history_.size());
    double mean = std::accumulate(price_history_.begin(), price_history_.end(), 0.0) / n;

    double sq_sum = 0.0;
    for (double p : price_history_) {
        sq_sum += (p - mean) * (p - mean);
    }
    return std::sqrt(sq_sum / n);
}

double MarketMaker::calculate_spread(double volatility) const {
    double vol_component = config_.volatility_sensitivity * volatility;

    double inv_factor = config_.inventory_limit > 0
        ? static_cast<double>(std::llabs(inventory_)) / static_cast<double>(config_.inventory_limit)
        : 0.0;
    double inv_component = inv_factor * config_.inventory_risk_factor * config_.base_spread;

    return config_.base_spread + vol_component + inv_component;
}

void MarketMaker::cancel_all_orders(MatchingEngine& engine) {
    // Ids that already filled simply report false
    std::vector<OrderId> ids(active_orders_.begin(), active_orders_.end());
    for (OrderId id : ids) {
        [[maybe_unused]] bool cancelled = engine.cancel(id);
    }
    active_orders_.clear();
}

void MarketMaker::update_price_history(double mid) {
    price_history_.push_back(mid);
    while (price_history_.size() > config_.volatility_window) {
        price_history_.pop_front();
    }
}

void MarketMaker::place_quotes(MatchingEngine& engine, double mid, double spread) {
    if (config_.num_levels == 0) {
        return;
    }

    std::uniform_int_distribution<std::int64_t> size_dist(config_.min_size, config_.max_size);
    const double half_spread = spread / 2.0;
    const double step = spread / static_cast<double>(config_.num_levels);
    const double skew = config_.inventory_limit > 0
        ? static_cast<double>(std::llabs(inventory_)) / static_cast<double>(config_.inventory_limit) * 0.1
        : 0.0;

    for (std::size_t level = 0; level < config_.num_levels; ++level) {
        double offset = half_spread + static_cast<double>(level) * step;

        double bid_price = round_to_cents(mid - offset);
        double ask_price = round_to_cents(mid + offset);
        Qty size{size_dist(rng_)};

        // Lean away from the side that would grow the inventory
        if (inventory_ > 0) {
            bid_price -= skew;
        } else if (inventory_ < 0) {
            ask_price += skew;
        }

        SubmitResult bid = engine.submit_limit(Side::Buy, Price{bid_price}, size, name_);
        if (bid.state() == OrderState::Resting) {
            track(*bid.order_id);
        }

        SubmitResult ask = engine.submit_limit(Side::Sell, Price{ask_price}, size, name_);
        if (ask.state() == OrderState::Resting) {
            track(*ask.order_id);
        }
    }
}

} // namespace lobsim::sim
