#pragma once

#include "core/types.hpp"

#include <functional>
#include <mutex>

namespace circuitguard {

/**
 * @brief Read-only view of one breaker's state, handed out to observers
 *
 * Bound by the breaker at construction and unbound when it is destroyed.
 * A provider can be bound to a single breaker only. Unbound providers
 * report CLOSED.
 */
class StateProvider {
public:
    struct Source {
        std::function<CircuitState()> state;
        std::function<CircuitBreakerStats()> stats;
    };

    StateProvider() = default;
    StateProvider(const StateProvider&) = delete;
    StateProvider& operator=(const StateProvider&) = delete;

    [[nodiscard]] CircuitState circuit_state() const;

    [[nodiscard]] CircuitBreakerStats stats() const;

    [[nodiscard]] bool is_bound() const;

    /**
     * @throws std::logic_error if already bound to another breaker
     */
    void bind(Source source);

    void unbind();

private:
    mutable std::mutex mutex_;
    bool bound_ = false;
    Source source_;
};

} // namespace circuitguard
