#pragma once
/**
 * @file accounts.hpp
 * @brief Per-participant position and cash tracking driven by fills
 */

#include <lobsim/common/types.hpp>
#include <lobsim/lob/order.hpp>

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace lobsim {

/**
 * @brief Running state of one participant
 */
struct Account {
    ParticipantId participant{constants::INVALID_PARTICIPANT_ID};
    std::int64_t position{0};   // Net position (positive = long)
    double cash{0.0};           // Sale proceeds minus purchase cost
    std::uint64_t fill_count{0};
    std::uint64_t volume{0};

    Account() = default;
    explicit Account(ParticipantId id) : participant(id) {}

    /**
     * @brief Cash plus position valued at the given price
     */
    [[nodiscard]] double mark_to_market(double price) const noexcept {
        return cash + static_cast<double>(position) * price;
    }
};

/**
 * @brief Account manager keyed by participant id
 *
 * Thread Safety: NOT thread-safe. The engine updates it under its
 * exclusive lock and reads it under its shared lock.
 */
class Accounts {
private:
    std::unordered_map<ParticipantId, Account> accounts_;

public:
    Accounts() = default;

    /**
     * @brief Get or create account
     */
    Account& get_or_create(ParticipantId participant);

    /**
     * @brief Get existing account
     * @return Pointer to account, or nullptr if the participant never traded
     */
    [[nodiscard]] const Account* get(ParticipantId participant) const;

    /**
     * @brief Apply one leg of a trade to its owner
     */
    void apply_fill(const Fill& fill);

    [[nodiscard]] std::int64_t get_position(ParticipantId participant) const;
    [[nodiscard]] double get_cash(ParticipantId participant) const;
    [[nodiscard]] double mark_to_market(ParticipantId participant, double price) const;

    /**
     * @brief Sum of all positions; zero whenever every trade has two legs applied
     */
    [[nodiscard]] std::int64_t net_position() const;

    /**
     * @brief Copy of every account, ordered by participant id
     */
    [[nodiscard]] std::vector<Account> snapshot() const;

    [[nodiscard]] std::size_t size() const noexcept { return accounts_.size(); }

    void clear() { accounts_.clear(); }
};

} // namespace lobsim
