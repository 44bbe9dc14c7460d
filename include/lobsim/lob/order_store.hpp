#pragma once
/**
 * @file order_store.hpp
 * @brief Fixed-capacity storage for resting orders and the per-price FIFO
 *
 * The book keeps every resting limit order in one OrderStore. A LevelQueue
 * threads the orders resting at one price into arrival order through the
 * slot links carried by each Order, so a cancel unlinks in O(1).
 */

#include <lobsim/common/types.hpp>
#include <lobsim/common/macros.hpp>
#include <lobsim/lob/order.hpp>

#include <algorithm>
#include <cstdint>
#include <vector>

namespace lobsim {

/**
 * @brief Slab of resting orders addressed by slot
 *
 * Capacity is fixed at construction (EngineConfig::max_orders). Released
 * slots are reused most-recent first.
 *
 * Thread Safety: NOT thread-safe. Owned and serialized by OrderBook.
 */
class OrderStore {
private:
    std::vector<Order> orders_;
    std::vector<std::uint8_t> live_;
    std::vector<OrderSlot> free_slots_;  // back() is handed out next

public:
    explicit OrderStore(std::uint32_t capacity)
        : orders_(capacity)
        , live_(capacity, 0) {
        reset_free_slots();
    }

    OrderStore(const OrderStore&) = delete;
    OrderStore& operator=(const OrderStore&) = delete;

    /**
     * @brief Copy an order into a free slot
     * @return The slot, or NO_SLOT when every slot holds a resting order
     */
    [[nodiscard]] OrderSlot insert(const Order& order) {
        if LOBSIM_UNLIKELY(free_slots_.empty()) {
            return NO_SLOT;
        }
        OrderSlot slot = free_slots_.back();
        free_slots_.pop_back();

        orders_[slot] = order;
        orders_[slot].queue_prev = NO_SLOT;
        orders_[slot].queue_next = NO_SLOT;
        live_[slot] = 1;
        return slot;
    }

    void erase(OrderSlot slot) {
        LOBSIM_ASSERT(contains(slot));
        live_[slot] = 0;
        free_slots_.push_back(slot);
    }

    [[nodiscard]] Order& operator[](OrderSlot slot) noexcept {
        LOBSIM_ASSERT(contains(slot));
        return orders_[slot];
    }

    [[nodiscard]] const Order& operator[](OrderSlot slot) const noexcept {
        LOBSIM_ASSERT(contains(slot));
        return orders_[slot];
    }

    [[nodiscard]] bool contains(OrderSlot slot) const noexcept {
        return slot < live_.size() && live_[slot] != 0;
    }

    [[nodiscard]] std::size_t size() const noexcept { return orders_.size() - free_slots_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return orders_.size(); }
    [[nodiscard]] bool full() const noexcept { return free_slots_.empty(); }
    [[nodiscard]] bool empty() const noexcept { return free_slots_.size() == orders_.size(); }

    void clear() {
        std::fill(live_.begin(), live_.end(), std::uint8_t{0});
        reset_free_slots();
    }

private:
    void reset_free_slots() {
        free_slots_.clear();
        free_slots_.reserve(orders_.size());
        for (std::size_t i = orders_.size(); i > 0; --i) {
            free_slots_.push_back(static_cast<OrderSlot>(i - 1));
        }
    }
};

/**
 * @brief Orders resting at one price, oldest first
 *
 * open_qty is the sum of qty_remaining over the queue, which is what the
 * depth snapshot reports for the level.
 */
struct LevelQueue {
    OrderSlot head{NO_SLOT};
    OrderSlot tail{NO_SLOT};
    Qty open_qty{0};
    std::uint32_t order_count{0};

    [[nodiscard]] bool empty() const noexcept { return order_count == 0; }

    void enqueue(OrderStore& store, OrderSlot slot) {
        Order& order = store[slot];
        order.queue_prev = tail;
        order.queue_next = NO_SLOT;

        if (tail == NO_SLOT) {
            head = slot;
        } else {
            store[tail].queue_next = slot;
        }
        tail = slot;

        open_qty += order.qty_remaining;
        ++order_count;
    }

    /**
     * @brief Take an order out of the queue wherever it sits
     *
     * Only its remaining quantity leaves open_qty; filled quantity was
     * already taken off by on_fill().
     */
    void unlink(OrderStore& store, OrderSlot slot) {
        Order& order = store[slot];
        OrderSlot prev = order.queue_prev;
        OrderSlot next = order.queue_next;

        (prev == NO_SLOT ? head : store[prev].queue_next) = next;
        (next == NO_SLOT ? tail : store[next].queue_prev) = prev;

        open_qty -= order.qty_remaining;
        --order_count;
        order.queue_prev = NO_SLOT;
        order.queue_next = NO_SLOT;
    }

    /**
     * @brief Account for a partial or full execution against this level
     */
    void on_fill(Qty qty) noexcept {
        LOBSIM_ASSERT(open_qty >= qty);
        open_qty -= qty;
    }
};

} // namespace lobsim
