/**
 * @file matching_engine.cpp
 * @brief Implementation of the matching engine
 */

#include <lobsim/engine/matching_engine.hpp>

#include <algorithm>
#include <mutex>
#include <utility>

namespace lobsim {

MatchingEngine::MatchingEngine(EngineConfig config, AsyncLogger* logger)
    : config_(std::move(config))
    , book_(config_.max_orders)
    , validator_(config_.limits)
    , logger_(logger) {

    book_.set_trade_callback([this](const Trade& trade) {
        on_trade(trade);
    });
    book_.set_fill_callback([this](const Fill& fill) {
        on_fill(fill);
    });
}

// ============================================================================
// Order Entry
// ============================================================================

SubmitResult MatchingEngine::submit(
    Side side,
    OrderKind kind,
    Price price,
    Qty qty,
    std::string_view owner
) {
    Timestamp start = now_ns();

    SubmitResult result;
    result.kind = kind;
    result.qty_remaining = qty;

    std::vector<Fill> fills;
    std::vector<FillCallback> listeners;
    {
        std::unique_lock lock(mutex_);
        stats_.orders_received.fetch_add(1, std::memory_order_relaxed);

        ValidationResult check = validator_.check(kind, price, qty);
        if LOBSIM_UNLIKELY(check != ValidationResult::Passed) {
            result.result = OrderResult::Invalid;
            result.reason = check;
            stats_.orders_invalid.fetch_add(1, std::memory_order_relaxed);
            if (logger_) {
                logger_->warn("Invalid %s %s order from %.*s: %s (price=%.4f qty=%lld)",
                              to_string(kind), to_string(side),
                              static_cast<int>(owner.size()), owner.data(),
                              to_string(check), price.get(),
                              static_cast<long long>(qty.get()));
            }
            lock.unlock();
            stats_.record_latency(elapsed_ns(start));
            return result;
        }

        ParticipantId participant = intern(owner);
        OrderId order_id{next_order_id_++};

        OrderResponse response = (kind == OrderKind::Limit)
            ? book_.add_limit(order_id, participant, side, price, qty)
            : book_.add_market(order_id, participant, side, qty);

        result.result = response.result;
        result.qty_filled = response.qty_filled;
        result.qty_remaining = response.qty_remaining;
        result.trade_count = response.trade_count;

        if (response.success()) {
            result.accepted = true;
            result.order_id = order_id;
            stats_.orders_accepted.fetch_add(1, std::memory_order_relaxed);
            if (logger_) {
                logger_->debug("Accepted %s %s #%llu from %.*s: qty=%lld filled=%lld -> %s",
                               to_string(kind), to_string(side),
                               static_cast<unsigned long long>(order_id.get()),
                               static_cast<int>(owner.size()), owner.data(),
                               static_cast<long long>(qty.get()),
                               static_cast<long long>(response.qty_filled.get()),
                               to_string(response.result));
            }
        } else {
            result.reason = (kind == OrderKind::Market)
                ? ValidationResult::NoLiquidity
                : ValidationResult::CapacityExceeded;
            stats_.orders_rejected.fetch_add(1, std::memory_order_relaxed);
            if (logger_) {
                logger_->info("Rejected %s %s from %.*s: %s",
                              to_string(kind), to_string(side),
                              static_cast<int>(owner.size()), owner.data(),
                              to_string(result.reason));
            }
        }

        fills.swap(pending_fills_);
        if (!fills.empty()) {
            listeners = fill_listeners_;
        }
    }

    stats_.record_latency(elapsed_ns(start));
    dispatch(fills, listeners);
    return result;
}

bool MatchingEngine::cancel(OrderId order_id) {
    Timestamp start = now_ns();
    bool cancelled = false;

    {
        std::unique_lock lock(mutex_);
        OrderResponse response = book_.cancel(order_id);
        cancelled = (response.result == OrderResult::Cancelled);

        if (cancelled) {
            stats_.orders_cancelled.fetch_add(1, std::memory_order_relaxed);
            if (logger_) {
                logger_->debug("Cancelled #%llu (%lld remaining)",
                               static_cast<unsigned long long>(order_id.get()),
                               static_cast<long long>(response.qty_remaining.get()));
            }
        } else {
            stats_.cancels_not_found.fetch_add(1, std::memory_order_relaxed);
            if (logger_) {
                logger_->debug("Cancel of unknown order #%llu",
                               static_cast<unsigned long long>(order_id.get()));
            }
        }
    }

    stats_.record_latency(elapsed_ns(start));
    return cancelled;
}

void MatchingEngine::add_fill_listener(FillCallback callback) {
    std::unique_lock lock(mutex_);
    fill_listeners_.push_back(std::move(callback));
}

// ============================================================================
// Market Data
// ============================================================================

BookSnapshot MatchingEngine::get_book(std::size_t max_levels) const {
    std::shared_lock lock(mutex_);
    return book_.depth(max_levels);
}

double MatchingEngine::get_mid_price() const {
    std::shared_lock lock(mutex_);

    if (auto mid = book_.mid_price()) {
        return *mid;
    }
    if (!trade_log_.empty()) {
        return trade_log_.back().price.get();
    }
    return config_.default_reference_price;
}

std::optional<Price> MatchingEngine::best_bid() const {
    std::shared_lock lock(mutex_);
    return book_.best_bid();
}

std::optional<Price> MatchingEngine::best_ask() const {
    std::shared_lock lock(mutex_);
    return book_.best_ask();
}

std::optional<double> MatchingEngine::spread() const {
    std::shared_lock lock(mutex_);
    return book_.spread();
}

std::optional<double> MatchingEngine::last_trade_price() const {
    std::shared_lock lock(mutex_);
    if (trade_log_.empty()) {
        return std::nullopt;
    }
    return trade_log_.back().price.get();
}

std::vector<Trade> MatchingEngine::trade_log() const {
    std::shared_lock lock(mutex_);
    return trade_log_;
}

std::vector<Trade> MatchingEngine::recent_trades(std::size_t count) const {
    std::shared_lock lock(mutex_);
    std::size_t n = std::min(count, trade_log_.size());
    return std::vector<Trade>(trade_log_.end() - static_cast<std::ptrdiff_t>(n), trade_log_.end());
}

std::size_t MatchingEngine::trade_count() const {
    std::shared_lock lock(mutex_);
    return trade_log_.size();
}

// ============================================================================
// Order Queries
// ============================================================================

bool MatchingEngine::has_order(OrderId order_id) const {
    std::shared_lock lock(mutex_);
    return book_.has_order(order_id);
}

std::optional<Order> MatchingEngine::find_order(OrderId order_id) const {
    std::shared_lock lock(mutex_);
    if (const Order* order = book_.find_order(order_id)) {
        return *order;
    }
    return std::nullopt;
}

std::size_t MatchingEngine::order_count() const {
    std::shared_lock lock(mutex_);
    return book_.order_count();
}

// ============================================================================
// Participants
// ============================================================================

std::optional<ParticipantId> MatchingEngine::participant_id(std::string_view owner) const {
    std::shared_lock lock(mutex_);
    auto it = participant_ids_.find(std::string(owner));
    if (it == participant_ids_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string MatchingEngine::participant_name(ParticipantId participant) const {
    std::shared_lock lock(mutex_);
    if (participant.get() >= participant_names_.size()) {
        return {};
    }
    return participant_names_[participant.get()];
}

std::int64_t MatchingEngine::position(std::string_view owner) const {
    std::shared_lock lock(mutex_);
    auto it = participant_ids_.find(std::string(owner));
    return it == participant_ids_.end() ? 0 : accounts_.get_position(it->second);
}

double MatchingEngine::cash(std::string_view owner) const {
    std::shared_lock lock(mutex_);
    auto it = participant_ids_.find(std::string(owner));
    return it == participant_ids_.end() ? 0.0 : accounts_.get_cash(it->second);
}

std::vector<Account> MatchingEngine::accounts() const {
    std::shared_lock lock(mutex_);
    return accounts_.snapshot();
}

// ============================================================================
// Internal Methods
// ============================================================================

ParticipantId MatchingEngine::intern(std::string_view owner) {
    std::string key(owner);
    auto it = participant_ids_.find(key);
    if (it != participant_ids_.end()) {
        return it->second;
    }

    ParticipantId id{static_cast<std::uint32_t>(participant_names_.size())};
    participant_names_.push_back(key);
    participant_ids_.emplace(std::move(key), id);
    return id;
}

void MatchingEngine::on_trade(const Trade& trade) {
    trade_log_.push_back(trade);

    stats_.trade_count.fetch_add(1, std::memory_order_relaxed);
    stats_.volume.fetch_add(static_cast<std::uint64_t>(trade.qty.get()), std::memory_order_relaxed);

    if (logger_) {
        logger_->debug("Trade %lld @ %.4f buy=#%llu sell=#%llu aggressor=%s",
                       static_cast<long long>(trade.qty.get()), trade.price.get(),
                       static_cast<unsigned long long>(trade.buy_order_id.get()),
                       static_cast<unsigned long long>(trade.sell_order_id.get()),
                       to_string(trade.aggressor_side));
    }
}

void MatchingEngine::on_fill(const Fill& fill) {
    accounts_.apply_fill(fill);
    stats_.filled_qty.fetch_add(static_cast<std::uint64_t>(fill.qty.get()), std::memory_order_relaxed);
    pending_fills_.push_back(fill);

    if (logger_ && config_.log_fills) {
        logger_->debug("Fill #%llu %s %lld @ %.4f (%lld left)",
                       static_cast<unsigned long long>(fill.order_id.get()),
                       to_string(fill.side),
                       static_cast<long long>(fill.qty.get()), fill.price.get(),
                       static_cast<long long>(fill.qty_remaining.get()));
    }
}

void MatchingEngine::dispatch(const std::vector<Fill>& fills,
                              const std::vector<FillCallback>& listeners) {
    for (const Fill& fill : fills) {
        for (const auto& listener : listeners) {
            listener(fill);
        }
    }
}

} // namespace lobsim
