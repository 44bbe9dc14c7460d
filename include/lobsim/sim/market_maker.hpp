#pragma once
/**
 * @file market_maker.hpp
 * @brief Layered two-sided quoting strategy with volatility and inventory skew
 */

#include <lobsim/common/types.hpp>
#include <lobsim/sim/participant.hpp>

#include <cstdint>
#include <deque>
#include <random>
#include <string>

namespace lobsim::sim {

/**
 * @brief Configuration for the market maker
 */
struct MarketMakerConfig {
    double base_spread{1.0};               // Minimum spread around mid (price units)
    std::int64_t inventory_limit{100};     // Inventory at which skew is strongest
    std::size_t num_levels{3};             // Bid/ask pairs per side
    std::int64_t min_size{5};
    std::int64_t max_size{15};
    std::size_t volatility_window{10};     // Mid prices kept for volatility
    double inventory_risk_factor{0.05};
    double volatility_sensitivity{0.5};
    std::uint64_t seed{12345};

    MarketMakerConfig() = default;
};

/**
 * @brief Re-quotes every tick: cancel everything, then ladder new quotes
 *
 * spread = base + sensitivity * vol + |inventory| / limit * risk * base,
 * level i sits at mid -+ (spread / 2 + i * spread / num_levels).
 */
class MarketMaker : public Participant {
private:
    MarketMakerConfig config_;
    std::mt19937_64 rng_;

    std::int64_t inventory_{0};
    std::deque<double> price_history_;
    double last_mid_{0.0};

public:
    MarketMaker(std::string name, MarketMakerConfig config = {});

    void act(MatchingEngine& engine, double now_s) override;
    void on_fill(const Fill& fill) override;

    /**
     * @brief Population standard deviation of the mid window (0 with < 2 samples)
     */
    [[nodiscard]] double calculate_volatility() const;

    /**
     * @brief Quoted spread for the given volatility and current inventory
     */
    [[nodiscard]] double calculate_spread(double volatility) const;

    [[nodiscard]] std::int64_t inventory() const noexcept { return inventory_; }
    [[nodiscard]] double last_mid() const noexcept { return last_mid_; }
    [[nodiscard]] const MarketMakerConfig& config() const noexcept { return config_; }

private:
    void cancel_all_orders(MatchingEngine& engine);
    void update_price_history(double mid);
    void place_quotes(MatchingEngine& engine, double mid, double spread);
};

} // namespace lobsim::sim
