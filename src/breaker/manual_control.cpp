#include "breaker/manual_control.hpp"
#include "core/utils.hpp"

#include <format>
#include <vector>

namespace circuitguard {

/**
 * @brief Marks an entry busy and releases the handle mutex for one call
 *
 * Re-acquires the mutex on exit (also when the call throws) and wakes a
 * detach() waiting for the entry to go idle.
 */
class ManualControl::CallScope {
public:
    CallScope(std::unique_lock<std::mutex>& lock, Entry& entry, std::condition_variable& idle)
        : lock_(lock), entry_(entry), idle_(idle) {
        ++entry_.in_call;
        lock_.unlock();
    }

    ~CallScope() {
        lock_.lock();
        if (--entry_.in_call == 0) {
            idle_.notify_all();
        }
    }

    CallScope(const CallScope&) = delete;
    CallScope& operator=(const CallScope&) = delete;

private:
    std::unique_lock<std::mutex>& lock_;
    Entry& entry_;
    std::condition_variable& idle_;
};

void ManualControl::isolate() {
    fan_out(true);
}

void ManualControl::close() {
    fan_out(false);
}

void ManualControl::fan_out(bool isolate) {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        isolated_ = isolate;
        ++generation_;
        entries.reserve(targets_.size());
        for (const auto& [id, entry] : targets_) {
            entries.push_back(entry);
        }
    }

    if (isolate) {
        utils::log::warn(std::format(
            "Manual control: isolating {} circuit breaker(s)", entries.size()));
    } else {
        utils::log::info(std::format(
            "Manual control: closing {} circuit breaker(s)", entries.size()));
    }

    for (const auto& entry : entries) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (entry->attached) {
            const bool want_isolated = isolated_;
            const uint64_t seen = generation_;
            {
                CallScope scope(lock, *entry, idle_);
                if (want_isolated) {
                    entry->target.isolate();
                } else {
                    entry->target.close();
                }
            }
            if (generation_ == seen) {
                break;
            }
            // A newer isolate()/close() started during the call; re-apply
        }
    }
}

bool ManualControl::is_isolated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return isolated_;
}

size_t ManualControl::attached_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return targets_.size();
}

uint64_t ManualControl::attach(Target target, bool& initially_isolated) {
    std::lock_guard<std::mutex> lock(mutex_);
    const uint64_t id = next_id_++;
    auto entry = std::make_shared<Entry>();
    entry->target = std::move(target);
    targets_.emplace(id, std::move(entry));
    initially_isolated = isolated_;
    return id;
}

void ManualControl::detach(uint64_t id) {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto it = targets_.find(id);
    if (it == targets_.end()) {
        return;
    }
    const std::shared_ptr<Entry> entry = it->second;
    targets_.erase(it);
    entry->attached = false;
    idle_.wait(lock, [&entry] { return entry->in_call == 0; });
}

} // namespace circuitguard
