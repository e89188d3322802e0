#pragma once

#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace circuitguard {

/**
 * @brief Computes how long the circuit stays Open after each trip
 *
 * Two modes:
 * - FIXED:   same duration for every Open entry
 * - DYNAMIC: generator called once per Open entry with the window counts and
 *            the number of consecutive trips since the circuit last closed
 *
 * A throwing generator, or one returning a negative duration, never reaches
 * the caller: the failure is logged and the fallback duration is used.
 */
class BreakDurationPolicy {
public:
    enum class Mode { FIXED, DYNAMIC };

    static constexpr Duration kDefaultFallback = std::chrono::seconds(5);

    [[nodiscard]] static BreakDurationPolicy fixed(Duration duration);

    [[nodiscard]] static BreakDurationPolicy dynamic(
        BreakDurationGenerator generator, Duration fallback = kDefaultFallback);

    BreakDurationPolicy(const BreakDurationPolicy& other);
    BreakDurationPolicy& operator=(const BreakDurationPolicy& other);

    /**
     * @brief Duration for the Open period being entered now
     */
    [[nodiscard]] Duration compute(const BreakDurationArgs& args) const noexcept;

    [[nodiscard]] Mode mode() const { return mode_; }

    /**
     * @brief Number of generator failures that fell back to the default
     */
    [[nodiscard]] uint64_t evaluation_failures() const {
        return evaluation_failures_.load(std::memory_order_relaxed);
    }

private:
    BreakDurationPolicy(Mode mode, Duration duration, BreakDurationGenerator generator);

    Mode mode_;
    Duration duration_;     // FIXED: the duration. DYNAMIC: the fallback.
    BreakDurationGenerator generator_;
    mutable std::atomic<uint64_t> evaluation_failures_{0};
};

} // namespace circuitguard
