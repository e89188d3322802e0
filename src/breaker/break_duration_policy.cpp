#include "breaker/break_duration_policy.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace circuitguard {

BreakDurationPolicy::BreakDurationPolicy(Mode mode, Duration duration,
                                         BreakDurationGenerator generator)
    : mode_(mode),
      duration_(duration),
      generator_(std::move(generator)) {}

BreakDurationPolicy::BreakDurationPolicy(const BreakDurationPolicy& other)
    : mode_(other.mode_),
      duration_(other.duration_),
      generator_(other.generator_),
      evaluation_failures_(other.evaluation_failures_.load(std::memory_order_relaxed)) {}

BreakDurationPolicy& BreakDurationPolicy::operator=(const BreakDurationPolicy& other) {
    if (this != &other) {
        mode_ = other.mode_;
        duration_ = other.duration_;
        generator_ = other.generator_;
        evaluation_failures_.store(
            other.evaluation_failures_.load(std::memory_order_relaxed),
            std::memory_order_relaxed);
    }
    return *this;
}

BreakDurationPolicy BreakDurationPolicy::fixed(Duration duration) {
    if (duration <= Duration::zero()) {
        throw std::invalid_argument("break_duration must be > 0");
    }
    return BreakDurationPolicy(Mode::FIXED, duration, nullptr);
}

BreakDurationPolicy BreakDurationPolicy::dynamic(BreakDurationGenerator generator,
                                                 Duration fallback) {
    if (!generator) {
        throw std::invalid_argument("break_duration_generator must not be empty");
    }
    if (fallback <= Duration::zero()) {
        throw std::invalid_argument("generator_fallback must be > 0");
    }
    return BreakDurationPolicy(Mode::DYNAMIC, fallback, std::move(generator));
}

Duration BreakDurationPolicy::compute(const BreakDurationArgs& args) const noexcept {
    if (mode_ == Mode::FIXED) {
        return duration_;
    }

    try {
        const Duration d = generator_(args);
        if (d < Duration::zero()) {
            throw PolicyEvaluationError(std::format(
                "generator returned negative duration ({} ms)", utils::to_millis(d)));
        }
        return d;
    } catch (const std::exception& e) {
        evaluation_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format(
            "Break duration generator failed ({}): {}; using fallback {} ms",
            error_category_to_string(ErrorCategory::POLICY_EVALUATION), e.what(),
            utils::to_millis(duration_)));
    } catch (...) {
        evaluation_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format(
            "Break duration generator threw a non-standard exception; using fallback {} ms",
            utils::to_millis(duration_)));
    }
    return duration_;
}

} // namespace circuitguard
