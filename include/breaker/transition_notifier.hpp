#pragma once

#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace circuitguard {

/**
 * @brief Delivers circuit transition events to observers, in transition order
 *
 * The breaker enqueue()s events while holding its own mutex, then calls
 * drain() after releasing it. drain() delivers everything queued so far under
 * a delivery mutex, so:
 * - observers run without the breaker mutex held
 * - events reach observers in the order the transitions happened
 * - a caller whose call caused a transition returns only after its event
 *   has been delivered (by itself or by a concurrent drainer)
 *
 * Observers may call back into the breaker. A nested drain() on the
 * delivering thread returns immediately; the outer loop picks the new
 * events up once the current observer returns.
 *
 * Observer exceptions are caught and logged; they never reach the breaker.
 */
class TransitionNotifier {
public:
    explicit TransitionNotifier(std::string breaker_name);

    /**
     * @brief Register an observer
     * @return Subscription id for unsubscribe()
     */
    uint64_t subscribe(CircuitEventCallback callback);

    /**
     * @brief Remove an observer
     * @return false if the id is unknown
     */
    bool unsubscribe(uint64_t id);

    /**
     * @brief Queue an event (caller holds the breaker mutex)
     */
    void enqueue(CircuitEvent event);

    /**
     * @brief Deliver all queued events (caller must NOT hold the breaker mutex)
     */
    void drain();

    /**
     * @brief Recent events (most recent last, capped at kMaxRecentEvents)
     */
    [[nodiscard]] std::vector<CircuitEvent> get_recent_events() const;

    [[nodiscard]] uint64_t transitions_to_open() const {
        return transitions_to_open_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t transitions_to_half_open() const {
        return transitions_to_half_open_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t transitions_to_closed() const {
        return transitions_to_closed_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Number of observer invocations that threw
     */
    [[nodiscard]] uint64_t observer_failures() const {
        return observer_failures_.load(std::memory_order_relaxed);
    }

    static constexpr size_t kMaxRecentEvents = 100;

private:
    void deliver(const CircuitEvent& event);
    static void log_event(const CircuitEvent& event);

    std::string breaker_name_;

    // Observers
    std::vector<std::pair<uint64_t, CircuitEventCallback>> observers_;
    uint64_t next_subscription_id_ = 1;
    mutable std::mutex observers_mutex_;

    // Pending + history
    std::deque<CircuitEvent> pending_;
    std::deque<CircuitEvent> recent_events_;
    mutable std::mutex events_mutex_;

    // Delivery
    std::mutex delivery_mutex_;
    std::atomic<std::thread::id> delivering_thread_{};

    std::atomic<uint64_t> transitions_to_open_{0};
    std::atomic<uint64_t> transitions_to_half_open_{0};
    std::atomic<uint64_t> transitions_to_closed_{0};
    std::atomic<uint64_t> observer_failures_{0};
};

} // namespace circuitguard
