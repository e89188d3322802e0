#include "breaker/transition_notifier.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace circuitguard {

namespace {

// Clears the delivering-thread marker on every exit path
class DeliveringGuard {
public:
    explicit DeliveringGuard(std::atomic<std::thread::id>& owner) : owner_(owner) {
        owner_.store(std::this_thread::get_id(), std::memory_order_release);
    }
    ~DeliveringGuard() {
        owner_.store(std::thread::id{}, std::memory_order_release);
    }
    DeliveringGuard(const DeliveringGuard&) = delete;
    DeliveringGuard& operator=(const DeliveringGuard&) = delete;

private:
    std::atomic<std::thread::id>& owner_;
};

} // anonymous namespace

TransitionNotifier::TransitionNotifier(std::string breaker_name)
    : breaker_name_(std::move(breaker_name)) {}

uint64_t TransitionNotifier::subscribe(CircuitEventCallback callback) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    const uint64_t id = next_subscription_id_++;
    observers_.emplace_back(id, std::move(callback));
    return id;
}

bool TransitionNotifier::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    const auto it = std::find_if(observers_.begin(), observers_.end(),
        [id](const auto& entry) { return entry.first == id; });
    if (it == observers_.end()) {
        return false;
    }
    observers_.erase(it);
    return true;
}

void TransitionNotifier::enqueue(CircuitEvent event) {
    switch (event.type) {
        case CircuitEventType::CIRCUIT_OPENED:
            transitions_to_open_.fetch_add(1, std::memory_order_relaxed);
            break;
        case CircuitEventType::CIRCUIT_HALF_OPENED:
            transitions_to_half_open_.fetch_add(1, std::memory_order_relaxed);
            break;
        case CircuitEventType::CIRCUIT_CLOSED:
            transitions_to_closed_.fetch_add(1, std::memory_order_relaxed);
            break;
    }

    std::lock_guard<std::mutex> lock(events_mutex_);
    recent_events_.push_back(event);
    if (recent_events_.size() > kMaxRecentEvents) {
        recent_events_.pop_front();
    }
    pending_.push_back(std::move(event));
}

void TransitionNotifier::drain() {
    if (delivering_thread_.load(std::memory_order_acquire) == std::this_thread::get_id()) {
        return;  // Re-entered from an observer; the outer loop delivers
    }

    std::lock_guard<std::mutex> delivery_lock(delivery_mutex_);
    DeliveringGuard guard(delivering_thread_);

    for (;;) {
        CircuitEvent event;
        {
            std::lock_guard<std::mutex> lock(events_mutex_);
            if (pending_.empty()) {
                return;
            }
            event = std::move(pending_.front());
            pending_.pop_front();
        }
        deliver(event);
    }
}

std::vector<CircuitEvent> TransitionNotifier::get_recent_events() const {
    std::lock_guard<std::mutex> lock(events_mutex_);
    return {recent_events_.begin(), recent_events_.end()};
}

void TransitionNotifier::deliver(const CircuitEvent& event) {
    log_event(event);

    std::vector<std::pair<uint64_t, CircuitEventCallback>> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers = observers_;
    }

    for (const auto& [id, callback] : observers) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            observer_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format(
                "Circuit breaker '{}': observer #{} threw on {}: {}",
                breaker_name_, id, circuit_event_type_to_string(event.type), e.what()));
        } catch (...) {
            observer_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format(
                "Circuit breaker '{}': observer #{} threw a non-standard exception on {}",
                breaker_name_, id, circuit_event_type_to_string(event.type)));
        }
    }
}

void TransitionNotifier::log_event(const CircuitEvent& event) {
    const auto msg = std::format(
        "Circuit breaker '{}' {}: {} -> {} (window {}/{} failed, op={}{}{})",
        event.breaker_name,
        circuit_event_type_to_string(event.type),
        circuit_state_to_string(event.from),
        circuit_state_to_string(event.to),
        event.snapshot.failures, event.snapshot.total,
        event.operation_id,
        event.last_outcome.empty() ? "" : ", outcome=",
        event.last_outcome);

    switch (event.severity) {
        case Severity::INFO:    utils::log::info(msg); break;
        case Severity::WARNING: utils::log::warn(msg); break;
        case Severity::ERROR:   utils::log::error(msg); break;
    }
}

} // namespace circuitguard
