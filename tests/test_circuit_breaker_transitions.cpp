#include <catch2/catch_test_macros.hpp>
#include "breaker/circuit_breaker.hpp"
#include "mocks/fake_clock.hpp"

#include <stdexcept>

using namespace circuitguard;
using namespace std::chrono_literals;

namespace {

CircuitBreaker::Config scenario_config(const testing::FakeClock& clock) {
    CircuitBreaker::Config cfg;
    cfg.sampling_duration = 2s;
    cfg.minimum_throughput = 2;
    cfg.failure_ratio = 0.5;
    cfg.break_duration = 1s;
    cfg.clock = clock.as_clock();
    return cfg;
}

void run(CircuitBreaker& cb, OutcomeKind outcome) {
    const auto admission = cb.try_acquire();
    REQUIRE(admission.admitted());
    cb.on_completed(admission.permit, outcome);
}

void fail(CircuitBreaker& cb) { run(cb, OutcomeKind::HANDLED_FAILURE); }
void succeed(CircuitBreaker& cb) { run(cb, OutcomeKind::HANDLED_SUCCESS); }

} // anonymous namespace

TEST_CASE("CircuitBreaker: two failures open the circuit (reference scenario)", "[circuit_breaker][transitions]") {
    testing::FakeClock clock;
    CircuitBreaker cb("scenario", scenario_config(clock));

    fail(cb);
    CHECK(cb.state() == CircuitState::CLOSED);
    fail(cb);
    CHECK(cb.state() == CircuitState::OPEN);
    REQUIRE(cb.break_deadline().has_value());
    CHECK(*cb.break_deadline() == clock.now() + 1s);

    // call3: immediate rejection with retry hint
    const auto rejected = cb.try_acquire();
    CHECK_FALSE(rejected.admitted());
    CHECK(rejected.rejection == CircuitBreaker::RejectionKind::BROKEN);
    REQUIRE(rejected.retry_after.has_value());
    CHECK(*rejected.retry_after == Duration(1s));

    clock.advance(400ms);
    const auto later = cb.try_acquire();
    CHECK_FALSE(later.admitted());
    REQUIRE(later.retry_after.has_value());
    CHECK(*later.retry_after == Duration(600ms));

    // call4 after the break: admitted as probe
    clock.advance(600ms);
    const auto probe = cb.try_acquire();
    REQUIRE(probe.admitted());
    CHECK(probe.permit.probe);
    CHECK(cb.state() == CircuitState::HALF_OPEN);

    SECTION("probe success closes with an empty window") {
        cb.on_completed(probe.permit, OutcomeKind::HANDLED_SUCCESS);
        CHECK(cb.state() == CircuitState::CLOSED);
        CHECK(cb.snapshot().total == 0);
    }

    SECTION("probe failure reopens with a fresh deadline") {
        clock.advance(250ms);
        cb.on_completed(probe.permit, OutcomeKind::HANDLED_FAILURE);
        CHECK(cb.state() == CircuitState::OPEN);
        REQUIRE(cb.break_deadline().has_value());
        CHECK(*cb.break_deadline() == clock.now() + 1s);
    }
}

TEST_CASE("CircuitBreaker: below minimum throughput never trips", "[circuit_breaker][transitions]") {
    testing::FakeClock clock;
    CircuitBreaker::Config cfg = scenario_config(clock);
    cfg.minimum_throughput = 5;
    CircuitBreaker cb("throughput", cfg);

    for (int i = 0; i < 4; ++i) {
        fail(cb);
    }
    CHECK(cb.state() == CircuitState::CLOSED);
    CHECK(cb.snapshot().failures == 4);

    fail(cb);
    CHECK(cb.state() == CircuitState::OPEN);
}

TEST_CASE("CircuitBreaker: ratio equal to threshold does not trip", "[circuit_breaker][transitions]") {
    testing::FakeClock clock;
    CircuitBreaker cb("ratio", scenario_config(clock));

    fail(cb);
    succeed(cb);
    CHECK(cb.state() == CircuitState::CLOSED);   // 1/2 is not > 0.5

    fail(cb);
    CHECK(cb.state() == CircuitState::OPEN);     // 2/3 > 0.5
}

TEST_CASE("CircuitBreaker: failures outside the sampling window are forgotten", "[circuit_breaker][transitions]") {
    testing::FakeClock clock;
    CircuitBreaker cb("window", scenario_config(clock));

    fail(cb);
    clock.advance(2500ms);
    fail(cb);
    CHECK(cb.state() == CircuitState::CLOSED);
    CHECK(cb.snapshot().total == 1);
}

TEST_CASE("CircuitBreaker: after recovery one failure does not reopen", "[circuit_breaker][transitions]") {
    testing::FakeClock clock;
    CircuitBreaker cb("recovery", scenario_config(clock));

    fail(cb);
    fail(cb);
    clock.advance(1s);
    succeed(cb);    // probe
    REQUIRE(cb.state() == CircuitState::CLOSED);

    fail(cb);
    CHECK(cb.state() == CircuitState::CLOSED);
    CHECK(cb.snapshot().total == 1);

    fail(cb);
    CHECK(cb.state() == CircuitState::OPEN);
}

TEST_CASE("CircuitBreaker: half-open admits a single probe", "[circuit_breaker][transitions]") {
    testing::FakeClock clock;
    CircuitBreaker cb("probe", scenario_config(clock));
    fail(cb);
    fail(cb);
    clock.advance(1s);

    const auto probe = cb.try_acquire();
    REQUIRE(probe.admitted());
    CHECK(probe.permit.probe);

    for (int i = 0; i < 5; ++i) {
        const auto other = cb.try_acquire();
        CHECK_FALSE(other.admitted());
        CHECK(other.rejection == CircuitBreaker::RejectionKind::BROKEN);
        CHECK_FALSE(other.retry_after.has_value());
    }

    cb.on_completed(probe.permit, OutcomeKind::HANDLED_SUCCESS);
    CHECK(cb.state() == CircuitState::CLOSED);
}

TEST_CASE("CircuitBreaker: unhandled probe outcome frees the slot", "[circuit_breaker][transitions]") {
    testing::FakeClock clock;
    CircuitBreaker cb("unhandled-probe", scenario_config(clock));
    fail(cb);
    fail(cb);
    clock.advance(1s);

    const auto probe = cb.try_acquire();
    REQUIRE(probe.admitted());
    cb.on_completed(probe.permit, OutcomeKind::UNHANDLED);
    CHECK(cb.state() == CircuitState::HALF_OPEN);

    const auto next = cb.try_acquire();
    REQUIRE(next.admitted());
    CHECK(next.permit.probe);
    cb.on_completed(next.permit, OutcomeKind::HANDLED_FAILURE);
    CHECK(cb.state() == CircuitState::OPEN);
}

TEST_CASE("CircuitBreaker: cancelled probe frees the slot without recording", "[circuit_breaker][transitions]") {
    testing::FakeClock clock;
    CircuitBreaker cb("cancel", scenario_config(clock));
    fail(cb);
    fail(cb);
    clock.advance(1s);

    const auto probe = cb.try_acquire();
    REQUIRE(probe.admitted());
    const auto before = cb.get_stats();
    cb.on_cancelled(probe.permit);

    const auto after = cb.get_stats();
    CHECK(after.success_count == before.success_count);
    CHECK(after.failure_count == before.failure_count);
    CHECK(cb.state() == CircuitState::HALF_OPEN);
    CHECK(cb.try_acquire().admitted());
}

TEST_CASE("CircuitBreaker: rejected calls never reach the window", "[circuit_breaker][transitions]") {
    testing::FakeClock clock;
    CircuitBreaker cb("rejections", scenario_config(clock));
    fail(cb);
    fail(cb);
    const auto window_before = cb.snapshot();

    for (int i = 0; i < 20; ++i) {
        CHECK_FALSE(cb.try_acquire().admitted());
    }

    const auto window_after = cb.snapshot();
    CHECK(window_after.total == window_before.total);
    CHECK(window_after.failures == window_before.failures);
    CHECK(cb.get_stats().rejected_count == 20);
}

TEST_CASE("CircuitBreaker: late completion while open is counted but cannot transition", "[circuit_breaker][transitions]") {
    testing::FakeClock clock;
    CircuitBreaker cb("late", scenario_config(clock));

    const auto slow = cb.try_acquire();
    REQUIRE(slow.admitted());
    fail(cb);
    fail(cb);
    REQUIRE(cb.state() == CircuitState::OPEN);
    const auto deadline = cb.break_deadline();

    cb.on_completed(slow.permit, OutcomeKind::HANDLED_SUCCESS);
    CHECK(cb.state() == CircuitState::OPEN);
    CHECK(cb.break_deadline() == deadline);
    CHECK(cb.snapshot().total == 3);
}

TEST_CASE("CircuitBreaker: unhandled outcomes leave the window alone", "[circuit_breaker][transitions]") {
    testing::FakeClock clock;
    CircuitBreaker cb("passthrough", scenario_config(clock));

    for (int i = 0; i < 10; ++i) {
        run(cb, OutcomeKind::UNHANDLED);
    }
    CHECK(cb.state() == CircuitState::CLOSED);
    CHECK(cb.snapshot().total == 0);
}

TEST_CASE("CircuitBreaker: dynamic break duration recomputed on each open", "[circuit_breaker][transitions]") {
    testing::FakeClock clock;
    CircuitBreaker::Config cfg = scenario_config(clock);
    cfg.break_duration.reset();
    cfg.break_duration_generator = [](const BreakDurationArgs& args) {
        return Duration(std::chrono::seconds(args.consecutive_open_count));
    };
    CircuitBreaker cb("dynamic", cfg);

    fail(cb);
    fail(cb);
    REQUIRE(cb.state() == CircuitState::OPEN);
    CHECK(*cb.break_deadline() == clock.now() + 1s);
    CHECK(cb.get_stats().consecutive_open_count == 1);

    clock.advance(1s);
    fail(cb);   // probe fails
    REQUIRE(cb.state() == CircuitState::OPEN);
    CHECK(*cb.break_deadline() == clock.now() + 2s);
    CHECK(cb.get_stats().consecutive_open_count == 2);

    clock.advance(2s);
    succeed(cb);
    CHECK(cb.state() == CircuitState::CLOSED);
    CHECK(cb.get_stats().consecutive_open_count == 0);
}

TEST_CASE("CircuitBreaker: failing generator falls back without surfacing", "[circuit_breaker][transitions]") {
    testing::FakeClock clock;
    CircuitBreaker::Config cfg = scenario_config(clock);
    cfg.break_duration.reset();
    cfg.break_duration_generator = [](const BreakDurationArgs&) -> Duration {
        throw std::runtime_error("no duration today");
    };
    cfg.generator_fallback = 3s;
    CircuitBreaker cb("fallback", cfg);

    fail(cb);
    CHECK_NOTHROW(fail(cb));
    REQUIRE(cb.state() == CircuitState::OPEN);
    CHECK(*cb.break_deadline() == clock.now() + 3s);
    CHECK(cb.policy_evaluation_failures() == 1);
}

TEST_CASE("CircuitBreaker: invalid config fails at construction", "[circuit_breaker][config]") {
    CircuitBreaker::Config cfg;

    SECTION("ratio zero") {
        cfg.failure_ratio = 0.0;
        CHECK_THROWS_AS(CircuitBreaker("bad", cfg), std::invalid_argument);
    }
    SECTION("ratio above one") {
        cfg.failure_ratio = 1.5;
        CHECK_THROWS_AS(CircuitBreaker("bad", cfg), std::invalid_argument);
    }
    SECTION("zero throughput") {
        cfg.minimum_throughput = 0;
        CHECK_THROWS_AS(CircuitBreaker("bad", cfg), std::invalid_argument);
    }
    SECTION("non-positive sampling duration") {
        cfg.sampling_duration = Duration::zero();
        CHECK_THROWS_AS(CircuitBreaker("bad", cfg), std::invalid_argument);
    }
    SECTION("non-positive break duration") {
        cfg.break_duration = -1s;
        CHECK_THROWS_AS(CircuitBreaker("bad", cfg), std::invalid_argument);
    }
    SECTION("both break duration options") {
        cfg.break_duration_generator = [](const BreakDurationArgs&) { return Duration(1s); };
        CHECK_THROWS_AS(CircuitBreaker("bad", cfg), std::invalid_argument);
    }
    SECTION("neither break duration option") {
        cfg.break_duration.reset();
        CHECK_THROWS_AS(CircuitBreaker("bad", cfg), std::invalid_argument);
    }
}

TEST_CASE("CircuitBreaker: config validation lists every problem", "[circuit_breaker][config]") {
    CircuitBreaker::Config cfg;
    cfg.failure_ratio = 2.0;
    cfg.minimum_throughput = 0;
    cfg.window_buckets = 0;

    const auto errors = cfg.validate();
    CHECK(errors.size() == 3);
    CHECK(CircuitBreaker::Config().validate().empty());
}

TEST_CASE("CircuitBreaker: generator may read its own breaker", "[circuit_breaker][transitions]") {
    testing::FakeClock clock;
    CircuitBreaker* self = nullptr;
    CircuitState state_seen = CircuitState::CLOSED;
    CircuitBreaker::RejectionKind rejection_seen = CircuitBreaker::RejectionKind::NONE;
    bool hint_seen = true;

    CircuitBreaker::Config cfg = scenario_config(clock);
    cfg.break_duration.reset();
    cfg.break_duration_generator = [&](const BreakDurationArgs&) {
        state_seen = self->get_stats().state;
        const auto nested = self->try_acquire();
        rejection_seen = nested.rejection;
        hint_seen = nested.retry_after.has_value();
        return Duration(2s);
    };
    CircuitBreaker cb("self-reading", cfg);
    self = &cb;

    fail(cb);
    fail(cb);

    CHECK(state_seen == CircuitState::OPEN);
    CHECK(rejection_seen == CircuitBreaker::RejectionKind::BROKEN);
    CHECK_FALSE(hint_seen);
    REQUIRE(cb.break_deadline().has_value());
    CHECK(*cb.break_deadline() == clock.now() + 2s);
    CHECK(cb.get_stats().rejected_count == 1);
}

TEST_CASE("CircuitBreaker: huge break duration saturates the deadline", "[circuit_breaker][transitions]") {
    testing::FakeClock clock;
    CircuitBreaker::Config cfg = scenario_config(clock);

    SECTION("fixed") {
        cfg.break_duration = Duration::max();
    }
    SECTION("generated") {
        cfg.break_duration.reset();
        cfg.break_duration_generator = [](const BreakDurationArgs&) { return Duration::max(); };
    }

    CircuitBreaker cb("saturated", cfg);
    fail(cb);
    fail(cb);
    REQUIRE(cb.state() == CircuitState::OPEN);
    REQUIRE(cb.break_deadline().has_value());
    CHECK(*cb.break_deadline() == TimePoint::max());

    clock.advance(24h);
    const auto later = cb.try_acquire();
    CHECK_FALSE(later.admitted());
    CHECK(later.rejection == CircuitBreaker::RejectionKind::BROKEN);
    CHECK(cb.state() == CircuitState::OPEN);
}
