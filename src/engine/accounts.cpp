/**
 * @file accounts.cpp
 * @brief Implementation of per-participant account tracking
 */

#include <lobsim/engine/accounts.hpp>

#include <algorithm>

namespace lobsim {

Account& Accounts::get_or_create(ParticipantId participant) {
    return accounts_.try_emplace(participant, participant).first->second;
}

const Account* Accounts::get(ParticipantId participant) const {
    auto it = accounts_.find(participant);
    if (it == accounts_.end()) {
        return nullptr;
    }
    return &it->second;
}

void Accounts::apply_fill(const Fill& fill) {
    Account& account = get_or_create(fill.participant);
    const double notional = fill.price.get() * static_cast<double>(fill.qty.get());

    if (fill.side == Side::Buy) {
        account.position += fill.qty.get();
        account.cash -= notional;
    } else {
        account.position -= fill.qty.get();
        account.cash += notional;
    }

    ++account.fill_count;
    account.volume += static_cast<std::uint64_t>(fill.qty.get());
}

std::int64_t Accounts::get_position(ParticipantId participant) const {
    const Account* account = get(participant);
    return account ? account->position : 0;
}

double Accounts::get_cash(ParticipantId participant) const {
    const Account* account = get(participant);
    return account ? account->cash : 0.0;
}

double Accounts::mark_to_market(ParticipantId participant, double price) const {
    const Account* account = get(participant);
    return account ? account->mark_to_market(price) : 0.0;
}

std::int64_t Accounts::net_position() const {
    std::int64_t total = 0;
    for (const auto& [id, account] : accounts_) {
        total += account.position;
    }
    return total;
}

std::vector<Account> Accounts::snapshot() const {
    std::vector<Account> out;
    out.reserve(accounts_.size());
    for (const auto& [id, account] : accounts_) {
        out.push_back(account);
    }
    std::sort(out.begin(), out.end(), [](const Account& a, const Account& b) {
        return a.participant < b.participant;
    });
    return out;
}

} // namespace lobsim
