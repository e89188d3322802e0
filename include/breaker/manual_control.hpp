#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace circuitguard {

/**
 * @brief Shareable manual override handle
 *
 * Breakers constructed with a ManualControl attach to it and detach when
 * destroyed. isolate()/close() on the handle are applied to every attached
 * breaker. A breaker that attaches while the handle is isolated starts in
 * ISOLATED.
 *
 * The handle's mutex is never held while a breaker is called, so observers
 * of attached breakers may call back into the handle. When fan-outs overlap
 * (from several threads, or nested from an observer) every breaker ends in
 * the state of the most recent one: a fan-out that finds itself superseded
 * after calling a breaker calls it again with the newer setting.
 *
 * detach() blocks until no fan-out is inside that breaker's callbacks, so a
 * breaker must not be destroyed from one of its own observers while a
 * fan-out is delivering to it.
 */
class ManualControl {
public:
    struct Target {
        std::function<void()> isolate;
        std::function<void()> close;
    };

    ManualControl() = default;
    ManualControl(const ManualControl&) = delete;
    ManualControl& operator=(const ManualControl&) = delete;

    /**
     * @brief Isolate every attached breaker (and any attached later)
     */
    void isolate();

    /**
     * @brief Close every attached breaker and clear the isolated flag
     */
    void close();

    [[nodiscard]] bool is_isolated() const;

    [[nodiscard]] size_t attached_count() const;

    /**
     * @brief Register a breaker
     * @param initially_isolated Set to the handle flag at attach time
     * @return Attachment id for detach()
     */
    uint64_t attach(Target target, bool& initially_isolated);

    void detach(uint64_t id);

private:
    struct Entry {
        Target target;
        bool attached = true;
        uint32_t in_call = 0;   // Fan-outs currently inside target
    };

    class CallScope;

    void fan_out(bool isolate);

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    bool isolated_ = false;
    uint64_t generation_ = 0;   // Bumped by every isolate()/close()
    uint64_t next_id_ = 1;
    std::map<uint64_t, std::shared_ptr<Entry>> targets_;
};

} // namespace circuitguard
