#include "breaker/sliding_window_counter.hpp"

#include <format>
#include <stdexcept>

namespace circuitguard {

SlidingWindowCounter::SlidingWindowCounter(Duration sampling_duration, uint32_t bucket_count)
    : sampling_duration_(sampling_duration),
      bucket_duration_(0) {
    if (sampling_duration <= Duration::zero()) {
        throw std::invalid_argument("sampling_duration must be > 0");
    }
    if (bucket_count == 0) {
        throw std::invalid_argument("bucket_count must be > 0");
    }

    bucket_duration_ = sampling_duration / bucket_count;
    if (bucket_duration_ <= Duration::zero()) {
        // Duration too short to split: one bucket spans the whole window
        bucket_duration_ = sampling_duration;
    }

    // Live starts lie in [now - sampling - bucket, now], at least one bucket
    // duration apart
    buckets_.resize(static_cast<size_t>(sampling_duration_ / bucket_duration_) + 2);
}

void SlidingWindowCounter::record(bool success, TimePoint now) {
    Bucket& bucket = current_bucket(now);
    if (success) {
        ++bucket.successes;
    } else {
        ++bucket.failures;
    }
}

HealthSnapshot SlidingWindowCounter::snapshot(TimePoint now) {
    evict_expired(now);

    HealthSnapshot snap;
    for (size_t i = 0; i < size_; ++i) {
        const Bucket& b = buckets_[(head_ + i) % buckets_.size()];
        snap.total += b.successes + b.failures;
        snap.failures += b.failures;
    }
    return snap;
}

void SlidingWindowCounter::reset() {
    for (auto& b : buckets_) {
        b = Bucket{};
    }
    head_ = 0;
    size_ = 0;
}

void SlidingWindowCounter::evict_expired(TimePoint now) {
    // A bucket expires once its end falls more than sampling_duration_ behind now
    while (size_ > 0 &&
           (now - buckets_[head_].start) - bucket_duration_ > sampling_duration_) {
        buckets_[head_] = Bucket{};
        head_ = (head_ + 1) % buckets_.size();
        --size_;
    }
}

SlidingWindowCounter::Bucket& SlidingWindowCounter::current_bucket(TimePoint now) {
    evict_expired(now);

    if (size_ > 0) {
        Bucket& newest = buckets_[(head_ + size_ - 1) % buckets_.size()];
        if (now - newest.start < bucket_duration_) {
            return newest;
        }
    }

    // Full only if the clock jumped backwards; drop the oldest
    if (size_ == buckets_.size()) {
        buckets_[head_] = Bucket{};
        head_ = (head_ + 1) % buckets_.size();
        --size_;
    }

    Bucket& fresh = buckets_[(head_ + size_) % buckets_.size()];
    fresh = Bucket{};
    fresh.start = now;
    ++size_;
    return fresh;
}

} // namespace circuitguard
