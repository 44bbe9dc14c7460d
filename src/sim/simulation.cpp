/**
 * @file simulation.cpp
 * @brief Implementation of the simulation driver
 */

#include <lobsim/sim/simulation.hpp>
#include <lobsim/sim/market_maker.hpp>
#include <lobsim/sim/random_trader.hpp>

#include <stdexcept>
#include <utility>

namespace lobsim::sim {

Simulation::Simulation(SimulationConfig config, AsyncLogger* logger)
    : config_(std::move(config))
    , engine_(config_.engine, logger) {

    engine_.add_fill_listener([this](const Fill& fill) {
        route_fill(fill);
    });
}

Participant& Simulation::add_participant(std::unique_ptr<Participant> participant) {
    if (!participant) {
        throw std::invalid_argument("Simulation: null participant");
    }
    const std::string& name = participant->name();
    if (by_name_.contains(name)) {
        throw std::invalid_argument("Simulation: duplicate participant name: " + name);
    }

    Participant* raw = participant.get();
    by_name_.emplace(name, raw);
    participants_.push_back(std::move(participant));
    return *raw;
}

void Simulation::add_default_roster() {
    const std::uint64_t base = config_.seed;

    MarketMakerConfig mm;
    mm.seed = base;
    add_participant(std::make_unique<MarketMaker>("MM1", mm));

    RandomTraderConfig aggressive;
    aggressive.mean_time_between_trades = 3.0;
    aggressive.market_order_probability = 0.4;
    aggressive.max_order_size = 30;
    aggressive.price_range_bps = 30.0;
    aggressive.seed = base + 1;
    add_participant(std::make_unique<RandomTrader>("AggressiveTrader", aggressive));

    RandomTraderConfig passive;
    passive.mean_time_between_trades = 8.0;
    passive.market_order_probability = 0.2;
    passive.max_order_size = 20;
    passive.price_range_bps = 15.0;
    passive.seed = base + 2;
    add_participant(std::make_unique<RandomTrader>("PassiveTrader", passive));

    RandomTraderConfig small;
    small.mean_time_between_trades = 2.0;
    small.market_order_probability = 0.8;
    small.max_order_size = 10;
    small.price_range_bps = 10.0;
    small.seed = base + 3;
    add_participant(std::make_unique<RandomTrader>("SmallTrader", small));
}

void Simulation::step() {
    now_s_ += config_.tick_interval_s;
    ++ticks_;

    for (auto& participant : participants_) {
        participant->act(engine_, now_s_);
    }
}

void Simulation::run(std::uint64_t ticks) {
    for (std::uint64_t i = 0; i < ticks; ++i) {
        step();
    }
}

Participant* Simulation::find_participant(const std::string& name) const {
    auto it = by_name_.find(name);
    return it == by_name_.end() ? nullptr : it->second;
}

void Simulation::route_fill(const Fill& fill) {
    // Orders submitted by outside callers have no registered owner
    if (Participant* owner = find_participant(engine_.participant_name(fill.participant))) {
        owner->on_fill(fill);
    }
}

} // namespace lobsim::sim
