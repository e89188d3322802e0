#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <vector>

namespace circuitguard {

/**
 * @brief Rolling success/failure tally over a fixed sampling duration
 *
 * The sampling duration is split into N equal sub-buckets kept in a circular
 * buffer. A bucket opens at the time of the first sample that does not fit
 * the newest bucket and covers [start, start + bucket_duration). It stays
 * live until its end precedes now - sampling_duration, so a snapshot may
 * include up to one bucket of samples just older than the window. Expired
 * buckets are dropped lazily on record()/snapshot(); nothing sweeps them in
 * the background.
 *
 * Cost: O(N) per call, independent of call volume.
 *
 * Thread-safety: none. The owning CircuitBreaker serializes access under its
 * own mutex so that (total, failures) is always read as a consistent pair.
 */
class SlidingWindowCounter {
public:
    static constexpr uint32_t kDefaultBuckets = 10;

    SlidingWindowCounter(Duration sampling_duration, uint32_t bucket_count = kDefaultBuckets);

    /**
     * @brief Add one executed-call sample at time `now`
     */
    void record(bool success, TimePoint now);

    /**
     * @brief Aggregate of all live buckets at time `now`
     */
    [[nodiscard]] HealthSnapshot snapshot(TimePoint now);

    /**
     * @brief Drop all samples
     */
    void reset();

    [[nodiscard]] Duration sampling_duration() const { return sampling_duration_; }
    [[nodiscard]] Duration bucket_duration() const { return bucket_duration_; }
    [[nodiscard]] size_t live_buckets() const { return size_; }

private:
    struct Bucket {
        TimePoint start{};
        uint64_t successes = 0;
        uint64_t failures = 0;
    };

    void evict_expired(TimePoint now);
    Bucket& current_bucket(TimePoint now);

    Duration sampling_duration_;
    Duration bucket_duration_;
    std::vector<Bucket> buckets_;
    size_t head_ = 0;   // Oldest live bucket
    size_t size_ = 0;   // Number of live buckets
};

} // namespace circuitguard
