#pragma once

#include "core/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace circuitguard {

/**
 * @brief Error categories for the breaker
 */
enum class ErrorCategory {
    NONE,
    BROKEN_CIRCUIT,
    ISOLATED_CIRCUIT,
    POLICY_EVALUATION,
    CLASSIFIER
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::BROKEN_CIRCUIT: return "BROKEN_CIRCUIT";
        case ErrorCategory::ISOLATED_CIRCUIT: return "ISOLATED_CIRCUIT";
        case ErrorCategory::POLICY_EVALUATION: return "POLICY_EVALUATION";
        case ErrorCategory::CLASSIFIER: return "CLASSIFIER";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message,
                        std::optional<Duration> retry_after = std::nullopt) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        r.retry_after_ = retry_after;
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

    /**
     * @brief Retry hint carried by BROKEN_CIRCUIT errors, if known
     */
    const std::optional<Duration>& retry_after() const { return retry_after_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
    std::optional<Duration> retry_after_;
};

/**
 * @brief Result for operations without a value
 */
template<>
class Result<void> {
public:
    static Result ok() {
        Result r;
        r.success_ = true;
        return r;
    }

    static Result error(ErrorCategory category, std::string message,
                        std::optional<Duration> retry_after = std::nullopt) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        r.retry_after_ = retry_after;
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }
    const std::optional<Duration>& retry_after() const { return retry_after_; }

private:
    bool success_ = false;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
    std::optional<Duration> retry_after_;
};

// ============================================================================
// Exceptions raised at the execution boundary
// ============================================================================

/**
 * @brief Base for errors the breaker raises when it blocks execution itself
 */
class CircuitRejectedError : public std::runtime_error {
public:
    CircuitRejectedError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const { return category_; }

private:
    ErrorCategory category_;
};

/**
 * @brief Circuit is Open or a HalfOpen probe is already in flight
 */
class BrokenCircuitError : public CircuitRejectedError {
public:
    BrokenCircuitError(const std::string& message, std::optional<Duration> retry_after)
        : CircuitRejectedError(ErrorCategory::BROKEN_CIRCUIT, message),
          retry_after_(retry_after) {}

    [[nodiscard]] const std::optional<Duration>& retry_after() const { return retry_after_; }

private:
    std::optional<Duration> retry_after_;
};

/**
 * @brief Circuit was manually isolated; rejected until close()
 */
class IsolatedCircuitError : public CircuitRejectedError {
public:
    explicit IsolatedCircuitError(const std::string& message)
        : CircuitRejectedError(ErrorCategory::ISOLATED_CIRCUIT, message) {}
};

/**
 * @brief Break-duration generator failed. Logged only, never thrown to callers.
 */
class PolicyEvaluationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace circuitguard
