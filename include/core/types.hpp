#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace circuitguard {

// ============================================================================
// Time
// ============================================================================

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;
using Duration = SteadyClock::duration;

/**
 * @brief Injectable monotonic time source.
 *
 * Empty means steady_clock::now(). Tests pass a manually advanced clock.
 */
using Clock = std::function<TimePoint()>;

// ============================================================================
// Circuit State
// ============================================================================

enum class CircuitState {
    CLOSED,         // Normal operation
    OPEN,           // Failing, reject requests
    HALF_OPEN,      // Testing recovery with a single probe
    ISOLATED        // Manually held open
};

/**
 * @brief Manual override flag, folded into the breaker's guarded state.
 *
 * CLOSE_PENDING: close() ran while calls admitted before it were still in
 * flight. Behaves like NONE for admission; reverts to NONE once those calls
 * have completed.
 */
enum class ManualOverride {
    NONE,
    ISOLATED,
    CLOSE_PENDING
};

// ============================================================================
// Outcome Classification
// ============================================================================

/**
 * @brief Verdict of the outcome classifier for one executed call
 */
enum class OutcomeKind {
    HANDLED_SUCCESS,    // Counts as a success sample
    HANDLED_FAILURE,    // Counts as a failure sample
    UNHANDLED           // Passthrough, no effect on counter or state
};

// ============================================================================
// Window Snapshot
// ============================================================================

struct HealthSnapshot {
    uint64_t total = 0;
    uint64_t failures = 0;

    [[nodiscard]] double failure_ratio() const {
        return total == 0 ? 0.0
                          : static_cast<double>(failures) / static_cast<double>(total);
    }
};

/**
 * @brief Input to a dynamic break-duration generator
 */
struct BreakDurationArgs {
    uint64_t failure_count = 0;
    uint64_t total_throughput = 0;
    double failure_ratio = 0.0;
    uint32_t consecutive_open_count = 0;    // 1 on the first trip since Closed
};

using BreakDurationGenerator = std::function<Duration(const BreakDurationArgs&)>;

// ============================================================================
// Telemetry
// ============================================================================

enum class Severity {
    INFO,
    WARNING,
    ERROR
};

enum class CircuitEventType {
    CIRCUIT_CLOSED,
    CIRCUIT_OPENED,
    CIRCUIT_HALF_OPENED
};

/**
 * @brief Structured event emitted on every actual state transition
 */
struct CircuitEvent {
    CircuitEventType type;
    Severity severity;
    std::string breaker_name;
    CircuitState from;
    CircuitState to;
    HealthSnapshot snapshot;
    TimePoint timestamp;
    std::string operation_id;
    std::string last_outcome;   // Empty for CIRCUIT_HALF_OPENED
    bool manual = false;        // Caused by isolate()/close()
};

using CircuitEventCallback = std::function<void(const CircuitEvent&)>;

// ============================================================================
// Stats
// ============================================================================

struct CircuitBreakerStats {
    CircuitState state;
    ManualOverride manual_override;
    uint64_t window_total;
    uint64_t window_failures;
    uint64_t success_count;         // Lifetime handled successes
    uint64_t failure_count;         // Lifetime handled failures
    uint64_t rejected_count;        // Lifetime rejections (never in the window)
    uint64_t transitions_to_open;
    uint64_t transitions_to_half_open;
    uint64_t transitions_to_closed;
    uint32_t consecutive_open_count;
    std::optional<TimePoint> break_deadline;

    CircuitBreakerStats()
        : state(CircuitState::CLOSED),
          manual_override(ManualOverride::NONE),
          window_total(0),
          window_failures(0),
          success_count(0),
          failure_count(0),
          rejected_count(0),
          transitions_to_open(0),
          transitions_to_half_open(0),
          transitions_to_closed(0),
          consecutive_open_count(0) {}
};

// ============================================================================
// Utility Functions
// ============================================================================

inline const char* circuit_state_to_string(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "CLOSED";
        case CircuitState::OPEN: return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
        case CircuitState::ISOLATED: return "ISOLATED";
        default: return "UNKNOWN";
    }
}

inline const char* circuit_event_type_to_string(CircuitEventType type) {
    switch (type) {
        case CircuitEventType::CIRCUIT_CLOSED: return "CircuitClosed";
        case CircuitEventType::CIRCUIT_OPENED: return "CircuitOpened";
        case CircuitEventType::CIRCUIT_HALF_OPENED: return "CircuitHalfOpened";
        default: return "Unknown";
    }
}

inline const char* outcome_kind_to_string(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::HANDLED_SUCCESS: return "HANDLED_SUCCESS";
        case OutcomeKind::HANDLED_FAILURE: return "HANDLED_FAILURE";
        case OutcomeKind::UNHANDLED: return "UNHANDLED";
        default: return "UNKNOWN";
    }
}

} // namespace circuitguard
