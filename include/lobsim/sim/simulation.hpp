#pragma once
/**
 * @file simulation.hpp
 * @brief Tick-driven simulation loop owning an engine and its participants
 */

#include <lobsim/engine/matching_engine.hpp>
#include <lobsim/logging/async_logger.hpp>
#include <lobsim/sim/participant.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace lobsim::sim {

/**
 * @brief Configuration for a simulation run
 */
struct SimulationConfig {
    std::uint64_t seed{12345};
    double tick_interval_s{1.0};   // Simulated seconds per step
    EngineConfig engine;

    SimulationConfig() = default;
};

/**
 * @brief Simulation driver
 *
 * Each step() advances simulated time by one tick and lets every
 * participant act once, in registration order. Fills are routed back to the
 * participant that owns the order.
 */
class Simulation {
private:
    SimulationConfig config_;
    MatchingEngine engine_;
    std::vector<std::unique_ptr<Participant>> participants_;
    std::unordered_map<std::string, Participant*> by_name_;

    double now_s_{0.0};
    std::uint64_t ticks_{0};

public:
    explicit Simulation(SimulationConfig config = {}, AsyncLogger* logger = nullptr);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    /**
     * @brief Register a participant
     * @throws std::invalid_argument on a duplicate name
     */
    Participant& add_participant(std::unique_ptr<Participant> participant);

    /**
     * @brief One market maker and three noise traders of different temperament
     *
     * Seeds are derived from the simulation seed so runs are reproducible.
     */
    void add_default_roster();

    void step();
    void run(std::uint64_t ticks);

    [[nodiscard]] MatchingEngine& engine() noexcept { return engine_; }
    [[nodiscard]] const MatchingEngine& engine() const noexcept { return engine_; }

    [[nodiscard]] const std::vector<std::unique_ptr<Participant>>& participants() const noexcept {
        return participants_;
    }

    [[nodiscard]] Participant* find_participant(const std::string& name) const;

    [[nodiscard]] double now() const noexcept { return now_s_; }
    [[nodiscard]] std::uint64_t ticks() const noexcept { return ticks_; }
    [[nodiscard]] const SimulationConfig& config() const noexcept { return config_; }

private:
    void route_fill(const Fill& fill);
};

} // namespace lobsim::sim
