#pragma once

#include "breaker/circuit_breaker.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace circuitguard {

/**
 * @brief What an admitted call produced: a value, or the exception it threw
 */
template<typename T>
struct CallOutcome {
    std::optional<T> value;
    std::exception_ptr error;

    [[nodiscard]] bool threw() const { return static_cast<bool>(error); }
};

template<>
struct CallOutcome<void> {
    std::exception_ptr error;

    [[nodiscard]] bool threw() const { return static_cast<bool>(error); }
};

/**
 * @brief Public entry point: admission, invocation, classification, recording
 *
 * execute():
 *   1. Ask the breaker for admission. On rejection throw BrokenCircuitError or
 *      IsolatedCircuitError without running the work.
 *   2. Run the work with no breaker lock held.
 *   3. Classify the value/exception. A throwing classifier counts as UNHANDLED.
 *   4. Report the outcome to the breaker.
 *   5. Return the value, or rethrow the work's own exception unchanged.
 *
 * try_execute() reports rejections as Result errors instead of exceptions;
 * the work's own exceptions still propagate.
 *
 * Thread-safe: one gate may be shared by any number of callers.
 */
template<typename T>
class ExecutionGate {
public:
    using Classifier = std::function<OutcomeKind(const CallOutcome<T>&)>;

    /**
     * @throws std::invalid_argument on null breaker or empty classifier
     */
    ExecutionGate(std::shared_ptr<CircuitBreaker> breaker, Classifier classifier)
        : breaker_(std::move(breaker)),
          classifier_(std::move(classifier)) {
        if (!breaker_) {
            throw std::invalid_argument("ExecutionGate requires a circuit breaker");
        }
        if (!classifier_) {
            throw std::invalid_argument("ExecutionGate requires an outcome classifier");
        }
    }

    /**
     * @brief Run `work` through the breaker
     * @throws BrokenCircuitError, IsolatedCircuitError, or whatever `work` threw
     */
    template<typename F>
    T execute(F&& work, std::string_view operation_id = {}) {
        auto admission = breaker_->try_acquire(operation_id);
        if (!admission.admitted()) {
            throw_rejection(admission);
        }
        return run_admitted(admission.permit, std::forward<F>(work));
    }

    /**
     * @brief Like execute(), but rejections come back as error results
     */
    template<typename F>
    Result<T> try_execute(F&& work, std::string_view operation_id = {}) {
        auto admission = breaker_->try_acquire(operation_id);
        if (!admission.admitted()) {
            return Result<T>::error(rejection_category(admission.rejection),
                                    rejection_message(admission),
                                    admission.retry_after);
        }
        if constexpr (std::is_void_v<T>) {
            run_admitted(admission.permit, std::forward<F>(work));
            return Result<T>::ok();
        } else {
            return Result<T>::ok(run_admitted(admission.permit, std::forward<F>(work)));
        }
    }

    [[nodiscard]] CircuitBreaker& breaker() { return *breaker_; }
    [[nodiscard]] const CircuitBreaker& breaker() const { return *breaker_; }

private:
    template<typename F>
    T run_admitted(const CircuitBreaker::Permit& permit, F&& work) {
        CallOutcome<T> outcome;
        try {
            if constexpr (std::is_void_v<T>) {
                std::forward<F>(work)();
            } else {
                outcome.value.emplace(std::forward<F>(work)());
            }
        } catch (...) {
            outcome.error = std::current_exception();
        }

        const OutcomeKind kind = classify(outcome);
        breaker_->on_completed(permit, kind, describe(outcome));

        if (outcome.error) {
            std::rethrow_exception(outcome.error);
        }
        if constexpr (!std::is_void_v<T>) {
            return std::move(*outcome.value);
        }
    }

    OutcomeKind classify(const CallOutcome<T>& outcome) const {
        try {
            return classifier_(outcome);
        } catch (const std::exception& e) {
            utils::log::warn(std::format(
                "Circuit breaker '{}': {} error ({}); treating outcome as unhandled",
                breaker_->name(), error_category_to_string(ErrorCategory::CLASSIFIER), e.what()));
        } catch (...) {
            utils::log::warn(std::format(
                "Circuit breaker '{}': {} error (non-standard exception); "
                "treating outcome as unhandled",
                breaker_->name(), error_category_to_string(ErrorCategory::CLASSIFIER)));
        }
        return OutcomeKind::UNHANDLED;
    }

    static std::string describe(const CallOutcome<T>& outcome) {
        if (!outcome.error) {
            return "success";
        }
        try {
            std::rethrow_exception(outcome.error);
        } catch (const std::exception& e) {
            return std::format("exception: {}", e.what());
        } catch (...) {
            return "exception: non-standard";
        }
    }

    static ErrorCategory rejection_category(CircuitBreaker::RejectionKind kind) {
        return kind == CircuitBreaker::RejectionKind::ISOLATED
            ? ErrorCategory::ISOLATED_CIRCUIT
            : ErrorCategory::BROKEN_CIRCUIT;
    }

    std::string rejection_message(const CircuitBreaker::Admission& admission) const {
        if (admission.rejection == CircuitBreaker::RejectionKind::ISOLATED) {
            return std::format("Circuit breaker '{}' is isolated", breaker_->name());
        }
        if (admission.retry_after) {
            return std::format("Circuit breaker '{}' is open; retry after {} ms",
                               breaker_->name(), utils::to_millis(*admission.retry_after));
        }
        return std::format("Circuit breaker '{}' is half-open; probe in progress",
                           breaker_->name());
    }

    [[noreturn]] void throw_rejection(const CircuitBreaker::Admission& admission) const {
        if (admission.rejection == CircuitBreaker::RejectionKind::ISOLATED) {
            throw IsolatedCircuitError(rejection_message(admission));
        }
        throw BrokenCircuitError(rejection_message(admission), admission.retry_after);
    }

    std::shared_ptr<CircuitBreaker> breaker_;
    Classifier classifier_;
};

/**
 * @brief Classifier counting every exception as a failure and every value as a success
 */
template<typename T>
OutcomeKind classify_exceptions_as_failures(const CallOutcome<T>& outcome) {
    return outcome.threw() ? OutcomeKind::HANDLED_FAILURE : OutcomeKind::HANDLED_SUCCESS;
}

} // namespace circuitguard
