#include "breaker/state_provider.hpp"

#include <stdexcept>

namespace circuitguard {

CircuitState StateProvider::circuit_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bound_ ? source_.state() : CircuitState::CLOSED;
}

CircuitBreakerStats StateProvider::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bound_ ? source_.stats() : CircuitBreakerStats{};
}

bool StateProvider::is_bound() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bound_;
}

void StateProvider::bind(Source source) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (bound_) {
        throw std::logic_error("StateProvider is already bound to a circuit breaker");
    }
    source_ = std::move(source);
    bound_ = true;
}

void StateProvider::unbind() {
    std::lock_guard<std::mutex> lock(mutex_);
    bound_ = false;
    source_ = Source{};
}

} // namespace circuitguard
