#pragma once
/**
 * @file random_trader.hpp
 * @brief Noise trader placing randomly sized market and limit orders
 *
 * Trades on a Poisson clock with deterministic seeding.
 */

#include <lobsim/common/types.hpp>
#include <lobsim/sim/participant.hpp>

#include <cstdint>
#include <random>
#include <string>

namespace lobsim::sim {

/**
 * @brief Configuration for synthetic order generation
 */
struct RandomTraderConfig {
    double mean_time_between_trades{5.0};  // Seconds
    double market_order_probability{0.3};
    std::int64_t max_order_size{50};
    double price_range_bps{20.0};          // Max limit distance from mid
    std::uint64_t seed{12345};

    RandomTraderConfig() = default;
};

/**
 * @brief Noise trader
 *
 * Sizes follow a power law (many small, few large). Limit prices are drawn
 * from a beta distribution so buys cluster just under the mid and sells
 * just over it.
 */
class RandomTrader : public Participant {
private:
    RandomTraderConfig config_;
    std::mt19937_64 rng_;
    double last_trade_time_{0.0};
    std::uint64_t orders_sent_{0};

public:
    RandomTrader(std::string name, RandomTraderConfig config = {});

    void act(MatchingEngine& engine, double now_s) override;

    /**
     * @brief Draw max(1, floor(U^(1/2.5) * max_order_size))
     */
    [[nodiscard]] std::int64_t generate_order_size();

    /**
     * @brief Poisson arrival: P(trade) = 1 - exp(-elapsed / mean)
     */
    [[nodiscard]] bool should_trade(double now_s);

    /**
     * @brief Limit price within price_range_bps of mid, rounded to cents
     */
    [[nodiscard]] double generate_limit_price(double mid, Side side);

    [[nodiscard]] std::uint64_t orders_sent() const noexcept { return orders_sent_; }
    [[nodiscard]] const RandomTraderConfig& config() const noexcept { return config_; }

private:
    double sample_beta(double a, double b);
};

} // namespace lobsim::sim
