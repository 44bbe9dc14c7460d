#pragma once
/**
 * @file participant.hpp
 * @brief Interface for simulated market participants
 *
 * A participant is driven once per simulated tick through act() and learns
 * about executions through on_fill(). Concrete strategies are picked when
 * the simulation is composed.
 */

#include <lobsim/common/types.hpp>
#include <lobsim/lob/order.hpp>

#include <cstddef>
#include <string>
#include <unordered_set>
#include <utility>

namespace lobsim {

class MatchingEngine;

namespace sim {

class Participant {
protected:
    std::string name_;

    // Orders this participant believes are still resting
    std::unordered_set<OrderId> active_orders_;

public:
    explicit Participant(std::string name)
        : name_(std::move(name)) {
    }

    virtual ~Participant() = default;

    Participant(const Participant&) = delete;
    Participant& operator=(const Participant&) = delete;

    /**
     * @brief Take this tick's trading decisions
     * @param engine Engine to submit to and query
     * @param now_s Simulated time in seconds
     */
    virtual void act(MatchingEngine& engine, double now_s) = 0;

    /**
     * @brief Execution notification for one of this participant's orders
     *
     * The base implementation stops tracking orders that are complete.
     */
    virtual void on_fill(const Fill& fill) {
        if (fill.completes_order()) {
            active_orders_.erase(fill.order_id);
        }
    }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] const std::unordered_set<OrderId>& active_orders() const noexcept {
        return active_orders_;
    }

    [[nodiscard]] std::size_t active_order_count() const noexcept {
        return active_orders_.size();
    }

protected:
    void track(OrderId order_id) { active_orders_.insert(order_id); }
};

} // namespace sim
} // namespace lobsim
