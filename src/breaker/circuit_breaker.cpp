#include "breaker/circuit_breaker.hpp"
#include "breaker/manual_control.hpp"
#include "breaker/state_provider.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>
#include <stdexcept>

namespace circuitguard {

namespace {

const CircuitBreaker::Config& validated(const std::string& name,
                                        const CircuitBreaker::Config& config) {
    const auto errors = config.validate();
    if (!errors.empty()) {
        throw std::invalid_argument(std::format(
            "Invalid circuit breaker config for '{}': {}", name, utils::join(errors, "; ")));
    }
    return config;
}

BreakDurationPolicy make_policy(const CircuitBreaker::Config& config) {
    if (config.break_duration_generator) {
        return BreakDurationPolicy::dynamic(config.break_duration_generator,
                                            config.generator_fallback);
    }
    return BreakDurationPolicy::fixed(*config.break_duration);
}

Severity severity_of(CircuitEventType type) {
    switch (type) {
        case CircuitEventType::CIRCUIT_CLOSED: return Severity::INFO;
        case CircuitEventType::CIRCUIT_OPENED: return Severity::ERROR;
        case CircuitEventType::CIRCUIT_HALF_OPENED: return Severity::WARNING;
    }
    return Severity::INFO;
}

TimePoint saturating_deadline(TimePoint from, Duration d) {
    if (d >= TimePoint::max() - from) {
        return TimePoint::max();
    }
    return from + d;
}

// Forwards only one event type to a per-transition callback
CircuitEventCallback filtered(CircuitEventType type, CircuitEventCallback cb) {
    return [type, cb = std::move(cb)](const CircuitEvent& e) {
        if (e.type == type) {
            cb(e);
        }
    };
}

} // anonymous namespace

// ============================================================================
// Config
// ============================================================================

std::vector<std::string> CircuitBreaker::Config::validate() const {
    std::vector<std::string> errors;

    if (!(failure_ratio > 0.0 && failure_ratio <= 1.0)) {
        errors.push_back(std::format("failure_ratio must be in (0, 1], got {}", failure_ratio));
    }
    if (minimum_throughput == 0) {
        errors.push_back("minimum_throughput must be > 0");
    }
    if (sampling_duration <= Duration::zero()) {
        errors.push_back("sampling_duration must be > 0");
    }
    if (window_buckets == 0) {
        errors.push_back("window_buckets must be > 0");
    }

    const bool has_fixed = break_duration.has_value();
    const bool has_generator = static_cast<bool>(break_duration_generator);
    if (has_fixed && has_generator) {
        errors.push_back(
            "break_duration and break_duration_generator are mutually exclusive "
            "(reset break_duration when using a generator)");
    } else if (!has_fixed && !has_generator) {
        errors.push_back("one of break_duration or break_duration_generator is required");
    }
    if (has_fixed && *break_duration <= Duration::zero()) {
        errors.push_back("break_duration must be > 0");
    }
    if (has_generator && generator_fallback <= Duration::zero()) {
        errors.push_back("generator_fallback must be > 0");
    }

    return errors;
}

// ============================================================================
// Lifecycle
// ============================================================================

CircuitBreaker::CircuitBreaker(std::string name, const Config& config)
    : name_(std::move(name)),
      config_(validated(name_, config)),
      policy_(make_policy(config_)),
      notifier_(name_),
      counter_(config_.sampling_duration, config_.window_buckets),
      state_(CircuitState::CLOSED),
      override_(ManualOverride::NONE),
      break_deadline_(),
      probe_in_flight_(false),
      epoch_(0),
      in_flight_(0),
      stale_in_flight_(0),
      consecutive_open_count_(0),
      open_generation_(0),
      success_count_(0),
      failure_count_(0),
      rejected_count_(0),
      manual_control_id_(0) {
    if (config_.on_closed) {
        notifier_.subscribe(filtered(CircuitEventType::CIRCUIT_CLOSED, config_.on_closed));
    }
    if (config_.on_opened) {
        notifier_.subscribe(filtered(CircuitEventType::CIRCUIT_OPENED, config_.on_opened));
    }
    if (config_.on_half_opened) {
        notifier_.subscribe(filtered(CircuitEventType::CIRCUIT_HALF_OPENED, config_.on_half_opened));
    }

    if (config_.state_provider) {
        config_.state_provider->bind(StateProvider::Source{
            [this] { return state(); },
            [this] { return get_stats(); }});
    }

    if (config_.manual_control) {
        bool initially_isolated = false;
        manual_control_id_ = config_.manual_control->attach(
            ManualControl::Target{[this] { isolate(); }, [this] { close(); }},
            initially_isolated);
        if (initially_isolated) {
            // Attached to an isolated handle: start isolated, nothing to report
            state_ = CircuitState::ISOLATED;
            override_ = ManualOverride::ISOLATED;
        }
    }
}

CircuitBreaker::~CircuitBreaker() {
    if (config_.manual_control) {
        config_.manual_control->detach(manual_control_id_);
    }
    if (config_.state_provider) {
        config_.state_provider->unbind();
    }
}

TimePoint CircuitBreaker::now() const {
    return config_.clock ? config_.clock() : SteadyClock::now();
}

// ============================================================================
// Admission / completion
// ============================================================================

CircuitBreaker::Admission CircuitBreaker::try_acquire(std::string_view operation_id) {
    const TimePoint t = now();
    Admission admission;
    admission.permit.operation_id = std::string(operation_id);

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (override_ == ManualOverride::ISOLATED) {
            admission.rejection = RejectionKind::ISOLATED;
            ++rejected_count_;
            return admission;
        }

        switch (state_) {
            case CircuitState::CLOSED:
                break;

            case CircuitState::OPEN:
                if (t < break_deadline_) {
                    admission.rejection = RejectionKind::BROKEN;
                    if (break_deadline_ != TimePoint::max()) {
                        admission.retry_after = break_deadline_ - t;
                    }
                    ++rejected_count_;
                    return admission;
                }
                // Deadline passed: this caller becomes the probe
                admission.permit.probe = true;
                half_open_locked(t, admission.permit);
                break;

            case CircuitState::HALF_OPEN:
                if (probe_in_flight_) {
                    admission.rejection = RejectionKind::BROKEN;
                    ++rejected_count_;
                    return admission;
                }
                probe_in_flight_ = true;
                admission.permit.probe = true;
                break;

            case CircuitState::ISOLATED:
                // Unreachable while override_ mirrors it; reject to be safe
                admission.rejection = RejectionKind::ISOLATED;
                ++rejected_count_;
                return admission;
        }

        admission.permit.epoch = epoch_;
        ++in_flight_;
    }

    notifier_.drain();
    return admission;
}

void CircuitBreaker::on_completed(const Permit& permit, OutcomeKind outcome,
                                  std::string_view outcome_description) {
    const TimePoint t = now();
    std::optional<PendingBreak> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        const bool current = permit.epoch == epoch_;
        release_permit_locked(permit);
        if (!current) {
            return;  // Admitted before the last manual override
        }
        if (permit.probe) {
            probe_in_flight_ = false;
        }
        if (outcome == OutcomeKind::UNHANDLED) {
            return;
        }

        const bool success = outcome == OutcomeKind::HANDLED_SUCCESS;
        counter_.record(success, t);
        if (success) {
            ++success_count_;
        } else {
            ++failure_count_;
        }
        last_outcome_ = outcome_description.empty()
            ? std::string(outcome_kind_to_string(outcome))
            : std::string(outcome_description);

        switch (state_) {
            case CircuitState::CLOSED: {
                const HealthSnapshot snap = counter_.snapshot(t);
                if (snap.total >= config_.minimum_throughput &&
                    snap.failure_ratio() > config_.failure_ratio) {
                    pending = trip_locked(t, &permit);
                }
                break;
            }

            case CircuitState::HALF_OPEN:
                if (permit.probe) {
                    if (success) {
                        close_circuit_locked(t, &permit);
                    } else {
                        pending = trip_locked(t, &permit);
                    }
                }
                break;

            case CircuitState::OPEN:
            case CircuitState::ISOLATED:
                // Admitted while CLOSED, finished after a trip: counted only
                break;
        }
    }

    if (pending) {
        apply_break_duration(*pending);
    }
    notifier_.drain();
}

void CircuitBreaker::apply_break_duration(const PendingBreak& pending) {
    const Duration d = policy_.compute(pending.args);

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == CircuitState::OPEN && open_generation_ == pending.generation) {
        break_deadline_ = saturating_deadline(pending.opened_at, d);
    }
}

void CircuitBreaker::on_cancelled(const Permit& permit) {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool current = permit.epoch == epoch_;
    release_permit_locked(permit);
    if (current && permit.probe) {
        probe_in_flight_ = false;
    }
}

// ============================================================================
// Manual override
// ============================================================================

void CircuitBreaker::isolate() {
    const TimePoint t = now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (override_ == ManualOverride::ISOLATED) {
            return;
        }

        const CircuitState from = state_;
        override_ = ManualOverride::ISOLATED;
        state_ = CircuitState::ISOLATED;
        probe_in_flight_ = false;
        bump_epoch_locked();
        emit_transition_locked(CircuitEventType::CIRCUIT_OPENED, from,
                               CircuitState::ISOLATED, t, nullptr, true);
    }
    notifier_.drain();
}

void CircuitBreaker::close() {
    const TimePoint t = now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == CircuitState::CLOSED && override_ != ManualOverride::ISOLATED) {
            return;
        }

        bump_epoch_locked();
        override_ = stale_in_flight_ > 0 ? ManualOverride::CLOSE_PENDING
                                         : ManualOverride::NONE;
        probe_in_flight_ = false;
        close_circuit_locked(t, nullptr);
    }
    notifier_.drain();
}

// ============================================================================
// Queries
// ============================================================================

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

HealthSnapshot CircuitBreaker::snapshot() const {
    const TimePoint t = now();
    std::lock_guard<std::mutex> lock(mutex_);
    return counter_.snapshot(t);
}

std::optional<TimePoint> CircuitBreaker::break_deadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != CircuitState::OPEN) {
        return std::nullopt;
    }
    return break_deadline_;
}

CircuitBreakerStats CircuitBreaker::get_stats() const {
    const TimePoint t = now();
    CircuitBreakerStats stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const HealthSnapshot snap = counter_.snapshot(t);
        stats.state = state_;
        stats.manual_override = override_;
        stats.window_total = snap.total;
        stats.window_failures = snap.failures;
        stats.success_count = success_count_;
        stats.failure_count = failure_count_;
        stats.rejected_count = rejected_count_;
        stats.consecutive_open_count = consecutive_open_count_;
        if (state_ == CircuitState::OPEN) {
            stats.break_deadline = break_deadline_;
        }
    }
    stats.transitions_to_open = notifier_.transitions_to_open();
    stats.transitions_to_half_open = notifier_.transitions_to_half_open();
    stats.transitions_to_closed = notifier_.transitions_to_closed();
    return stats;
}

uint64_t CircuitBreaker::subscribe(CircuitEventCallback observer) {
    return notifier_.subscribe(std::move(observer));
}

bool CircuitBreaker::unsubscribe(uint64_t subscription_id) {
    return notifier_.unsubscribe(subscription_id);
}

std::vector<CircuitEvent> CircuitBreaker::get_recent_events() const {
    return notifier_.get_recent_events();
}

// ============================================================================
// Transitions (mutex_ held)
// ============================================================================

void CircuitBreaker::release_permit_locked(const Permit& permit) {
    if (permit.epoch == epoch_) {
        if (in_flight_ > 0) --in_flight_;
        return;
    }

    if (stale_in_flight_ > 0) --stale_in_flight_;
    if (stale_in_flight_ == 0 && override_ == ManualOverride::CLOSE_PENDING) {
        override_ = ManualOverride::NONE;
    }
}

CircuitBreaker::PendingBreak CircuitBreaker::trip_locked(TimePoint now, const Permit* cause) {
    const CircuitState from = state_;
    const HealthSnapshot snap = counter_.snapshot(now);

    ++consecutive_open_count_;
    PendingBreak pending;
    pending.generation = ++open_generation_;
    pending.opened_at = now;
    pending.args.failure_count = snap.failures;
    pending.args.total_throughput = snap.total;
    pending.args.failure_ratio = snap.failure_ratio();
    pending.args.consecutive_open_count = consecutive_open_count_;

    // Unbounded until apply_break_duration() runs; the duration is computed
    // once per Open entry and stays fixed for the whole Open period
    break_deadline_ = TimePoint::max();
    state_ = CircuitState::OPEN;
    emit_transition_locked(CircuitEventType::CIRCUIT_OPENED, from, CircuitState::OPEN,
                           now, cause, false);
    return pending;
}

void CircuitBreaker::half_open_locked(TimePoint now, const Permit& probe) {
    state_ = CircuitState::HALF_OPEN;
    probe_in_flight_ = true;
    emit_transition_locked(CircuitEventType::CIRCUIT_HALF_OPENED, CircuitState::OPEN,
                           CircuitState::HALF_OPEN, now, &probe, false);
}

void CircuitBreaker::close_circuit_locked(TimePoint now, const Permit* cause) {
    const CircuitState from = state_;
    counter_.reset();
    consecutive_open_count_ = 0;
    state_ = CircuitState::CLOSED;
    emit_transition_locked(CircuitEventType::CIRCUIT_CLOSED, from, CircuitState::CLOSED,
                           now, cause, cause == nullptr);
}

void CircuitBreaker::bump_epoch_locked() {
    ++epoch_;
    stale_in_flight_ += in_flight_;
    in_flight_ = 0;
}

void CircuitBreaker::emit_transition_locked(CircuitEventType type, CircuitState from,
                                            CircuitState to, TimePoint now,
                                            const Permit* cause, bool manual) {
    CircuitEvent event;
    event.type = type;
    event.severity = severity_of(type);
    event.breaker_name = name_;
    event.from = from;
    event.to = to;
    event.snapshot = counter_.snapshot(now);
    event.timestamp = now;
    if (manual) {
        event.operation_id = "manual";
    } else if (cause && !cause->operation_id.empty()) {
        event.operation_id = cause->operation_id;
    } else {
        event.operation_id = utils::generate_uuid();
    }
    if (type != CircuitEventType::CIRCUIT_HALF_OPENED && !manual) {
        event.last_outcome = last_outcome_;
    }
    event.manual = manual;
    notifier_.enqueue(std::move(event));
}

} // namespace circuitguard
