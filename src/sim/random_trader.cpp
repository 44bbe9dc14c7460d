/**
 * @file random_trader.cpp
 * @brief Implementation of the noise trader
 */

#include <lobsim/sim/random_trader.hpp>
#include <lobsim/engine/matching_engine.hpp>

#include <algorithm>
#include <cmath>

namespace lobsim::sim {

namespace {

/// Shape of the power-law size distribution
constexpr double SIZE_ALPHA = 2.5;

} // namespace

RandomTrader::RandomTrader(std::string name, RandomTraderConfig config)
    : Participant(std::move(name))
    , config_(config)
    , rng_(config.seed) {
}

void RandomTrader::act(MatchingEngine& engine, double now_s) {
    if (!should_trade(now_s)) {
        return;
    }

    double mid = engine.get_mid_price();

    std::bernoulli_distribution coin(0.5);
    Side side = coin(rng_) ? Side::Buy : Side::Sell;
    Qty size{generate_order_size()};

    std::uniform_real_distribution<double> unit_dist(0.0, 1.0);
    bool is_market = unit_dist(rng_) < config_.market_order_probability;

    if (is_market) {
        // May be rejected on an empty side; nothing to track either way
        [[maybe_unused]] SubmitResult result = engine.submit_market(side, size, name_);
    } else {
        Price price{generate_limit_price(mid, side)};
        SubmitResult result = engine.submit_limit(side, price, size, name_);
        if (result.state() == OrderState::Resting) {
            track(*result.order_id);
        }
    }

    ++orders_sent_;
    last_trade_time_ = now_s;
}

std::int64_t RandomTrader::generate_order_size() {
    std::uniform_real_distribution<double> unit_dist(0.0, 1.0);
    double draw = std::pow(unit_dist(rng_), 1.0 / SIZE_ALPHA);
    auto size = static_cast<std::int64_t>(draw * static_cast<double>(config_.max_order_size));
    return std::max<std::int64_t>(1, size);
}

bool RandomTrader::should_trade(double now_s) {
    if (config_.mean_time_between_trades <= 0.0) {
        return true;
    }
    double elapsed = now_s - last_trade_time_;
    double probability = 1.0 - std::exp(-elapsed / config_.mean_time_between_trades);

    std::uniform_real_distribution<double> unit_dist(0.0, 1.0);
    return unit_dist(rng_) < probability;
}

double RandomTrader::generate_limit_price(double mid, Side side) {
    // Buys skew toward small deviations below mid, sells toward larger above
    double deviation_bps = (side == Side::Buy)
        ? sample_beta(2.0, 5.0) * config_.price_range_bps
        : sample_beta(5.0, 2.0) * config_.price_range_bps;

    double adjustment = (deviation_bps / 10'000.0) * mid;
    double price = (side == Side::Buy) ? mid - adjustment : mid + adjustment;

    return std::round(price * 100.0) / 100.0;
}

double RandomTrader::sample_beta(double a, double b) {
    std::gamma_distribution<double> x_dist(a, 1.0);
    std::gamma_distribution<double> y_dist(b, 1.0);
    double x = x_dist(rng_);
    double y = y_dist(rng_);
    return x / (x + y);
}

} // namespace lobsim::sim
