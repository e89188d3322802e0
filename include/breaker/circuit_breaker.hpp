#pragma once

#include "breaker/break_duration_policy.hpp"
#include "breaker/sliding_window_counter.hpp"
#include "breaker/transition_notifier.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace circuitguard {

class ManualControl;
class StateProvider;

/**
 * @brief Circuit Breaker for per-resource failure isolation
 *
 * Four states:
 * - CLOSED:     Normal operation, all requests pass through
 * - OPEN:       Failing, reject requests until the break deadline
 * - HALF_OPEN:  Testing recovery, exactly one probe in flight
 * - ISOLATED:   Manually held open until close()
 *
 * State transitions:
 * - CLOSED → OPEN:        window total >= minimum_throughput and
 *                         failures / total > failure_ratio
 * - OPEN → HALF_OPEN:     first admission at/after the break deadline
 * - HALF_OPEN → CLOSED:   probe succeeded (window reset)
 * - HALF_OPEN → OPEN:     probe failed (deadline recomputed)
 * - any → ISOLATED:       isolate()
 * - ISOLATED → CLOSED:    close()
 *
 * All state (window, deadline, override, probe slot) lives under one mutex
 * held only for the admission check and the outcome recording. The wrapped
 * work, outcome classifiers, break-duration generators and observers always
 * run outside it. There is no background thread: OPEN → HALF_OPEN happens on
 * the admitting caller's thread.
 *
 * On a trip the circuit is OPEN with an unbounded deadline until the break
 * duration has been computed; admissions in between are rejected as BROKEN
 * without a retry hint. Deadlines saturate at TimePoint::max().
 */
class CircuitBreaker {
public:
    /**
     * @brief Configuration
     */
    struct Config {
        double failure_ratio;                   // Trip when failures/total exceeds this, (0, 1]
        uint32_t minimum_throughput;            // Samples required before a trip is possible
        Duration sampling_duration;             // Rolling window length
        uint32_t window_buckets;                // Sub-buckets per window

        // Exactly one of these two
        std::optional<Duration> break_duration;
        BreakDurationGenerator break_duration_generator;
        Duration generator_fallback;            // Used when the generator fails

        std::shared_ptr<ManualControl> manual_control;
        std::shared_ptr<StateProvider> state_provider;

        CircuitEventCallback on_closed;
        CircuitEventCallback on_opened;
        CircuitEventCallback on_half_opened;

        Clock clock;                            // Empty = steady_clock::now

        Config()
            : failure_ratio(0.1),
              minimum_throughput(100),
              sampling_duration(std::chrono::seconds(30)),
              window_buckets(SlidingWindowCounter::kDefaultBuckets),
              break_duration(std::chrono::seconds(5)),
              generator_fallback(BreakDurationPolicy::kDefaultFallback) {}

        /**
         * @brief Check option ranges and combinations
         * @return One message per problem, empty when valid
         */
        [[nodiscard]] std::vector<std::string> validate() const;
    };

    enum class RejectionKind {
        NONE,
        BROKEN,     // OPEN before deadline, or HALF_OPEN probe already running
        ISOLATED    // Manual override
    };

    /**
     * @brief Token for an admitted call, handed back on completion
     */
    struct Permit {
        uint64_t epoch = 0;
        bool probe = false;
        std::string operation_id;
    };

    struct Admission {
        RejectionKind rejection = RejectionKind::NONE;
        std::optional<Duration> retry_after;
        Permit permit;

        [[nodiscard]] bool admitted() const { return rejection == RejectionKind::NONE; }
    };

    /**
     * @brief Construct circuit breaker
     * @param name Circuit breaker identifier
     * @param config Configuration
     * @throws std::invalid_argument if config.validate() reports errors
     */
    explicit CircuitBreaker(std::string name, const Config& config = Config());

    ~CircuitBreaker();

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * @brief Pre-admission check
     *
     * May move OPEN → HALF_OPEN and admit the caller as the probe.
     * @param operation_id Carried into events caused by this call
     */
    [[nodiscard]] Admission try_acquire(std::string_view operation_id = {});

    /**
     * @brief Post-completion step for an admitted call
     *
     * UNHANDLED outcomes only release the probe slot. Outcomes of calls
     * admitted before the last isolate()/close() are discarded.
     * @param outcome_description Reported as the event's last outcome
     */
    void on_completed(const Permit& permit, OutcomeKind outcome,
                      std::string_view outcome_description = {});

    /**
     * @brief Release a permit whose work never started
     */
    void on_cancelled(const Permit& permit);

    /**
     * @brief Force ISOLATED until close(). No-op if already isolated.
     */
    void isolate();

    /**
     * @brief Clear the override and force CLOSED with an empty window.
     * No-op if already CLOSED without override.
     */
    void close();

    [[nodiscard]] CircuitState state() const;

    /**
     * @brief Live window counts
     */
    [[nodiscard]] HealthSnapshot snapshot() const;

    /**
     * @brief Break deadline while OPEN, nullopt otherwise
     */
    [[nodiscard]] std::optional<TimePoint> break_deadline() const;

    [[nodiscard]] CircuitBreakerStats get_stats() const;

    /**
     * @brief Register a transition observer
     * @return Subscription id for unsubscribe()
     */
    uint64_t subscribe(CircuitEventCallback observer);

    bool unsubscribe(uint64_t subscription_id);

    /**
     * @brief Get recent state change events (most recent last)
     */
    [[nodiscard]] std::vector<CircuitEvent> get_recent_events() const;

    /**
     * @brief Break-duration generator failures that fell back to the default
     */
    [[nodiscard]] uint64_t policy_evaluation_failures() const {
        return policy_.evaluation_failures();
    }

    /**
     * @brief Get circuit breaker name
     */
    const std::string& name() const { return name_; }

    [[nodiscard]] const Config& config() const { return config_; }

private:
    // A trip whose break duration is still to be computed
    struct PendingBreak {
        uint64_t generation = 0;
        TimePoint opened_at;
        BreakDurationArgs args;
    };

    [[nodiscard]] TimePoint now() const;

    /**
     * @brief Run the duration policy (mutex_ NOT held) and set the deadline
     * if the circuit is still in the same Open period
     */
    void apply_break_duration(const PendingBreak& pending);

    // All *_locked helpers require mutex_
    void release_permit_locked(const Permit& permit);
    [[nodiscard]] PendingBreak trip_locked(TimePoint now, const Permit* cause);
    void half_open_locked(TimePoint now, const Permit& probe);
    void close_circuit_locked(TimePoint now, const Permit* cause);
    void bump_epoch_locked();
    void emit_transition_locked(CircuitEventType type, CircuitState from, CircuitState to,
                                TimePoint now, const Permit* cause, bool manual);

    std::string name_;
    Config config_;
    BreakDurationPolicy policy_;
    TransitionNotifier notifier_;

    // Guarded state
    mutable std::mutex mutex_;
    mutable SlidingWindowCounter counter_;
    CircuitState state_;
    ManualOverride override_;
    TimePoint break_deadline_;
    bool probe_in_flight_;
    uint64_t epoch_;
    uint64_t in_flight_;            // Permits of the current epoch
    uint64_t stale_in_flight_;      // Permits of older epochs
    uint32_t consecutive_open_count_;
    uint64_t open_generation_;      // Bumped on every trip
    std::string last_outcome_;

    uint64_t success_count_;
    uint64_t failure_count_;
    uint64_t rejected_count_;

    uint64_t manual_control_id_;
};

inline const char* rejection_kind_to_string(CircuitBreaker::RejectionKind kind) {
    switch (kind) {
        case CircuitBreaker::RejectionKind::NONE: return "NONE";
        case CircuitBreaker::RejectionKind::BROKEN: return "BROKEN";
        case CircuitBreaker::RejectionKind::ISOLATED: return "ISOLATED";
        default: return "UNKNOWN";
    }
}

} // namespace circuitguard
