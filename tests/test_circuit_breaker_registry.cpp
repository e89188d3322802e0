#include <catch2/catch_test_macros.hpp>
#include "breaker/circuit_breaker_registry.hpp"
#include "breaker/state_provider.hpp"
#include "config/config_loader.hpp"
#include "mocks/fake_clock.hpp"

#include <latch>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace circuitguard;
using namespace std::chrono_literals;

TEST_CASE("CircuitBreakerRegistry: one breaker per resource", "[registry]") {
    CircuitBreakerRegistry registry{CircuitBreaker::Config()};

    auto a1 = registry.get_breaker("orders");
    auto a2 = registry.get_breaker("orders");
    auto b = registry.get_breaker("inventory");

    CHECK(a1 == a2);
    CHECK(a1 != b);
    CHECK(a1->name() == "orders");
    CHECK(registry.size() == 2);
}

TEST_CASE("CircuitBreakerRegistry: resources are isolated from each other", "[registry]") {
    testing::FakeClock clock;
    CircuitBreaker::Config cfg;
    cfg.failure_ratio = 0.5;
    cfg.minimum_throughput = 2;
    cfg.clock = clock.as_clock();
    CircuitBreakerRegistry registry(cfg);

    auto failing = registry.get_breaker("failing");
    for (int i = 0; i < 2; ++i) {
        const auto admission = failing->try_acquire();
        REQUIRE(admission.admitted());
        failing->on_completed(admission.permit, OutcomeKind::HANDLED_FAILURE);
    }

    CHECK(failing->state() == CircuitState::OPEN);
    CHECK(registry.get_breaker("healthy")->state() == CircuitState::CLOSED);
}

TEST_CASE("CircuitBreakerRegistry: per-resource config override", "[registry]") {
    CircuitBreakerRegistry registry{CircuitBreaker::Config()};

    CircuitBreaker::Config strict;
    strict.failure_ratio = 0.2;
    strict.minimum_throughput = 3;
    registry.set_resource_config("payments", strict);

    CHECK(registry.get_breaker("payments")->config().minimum_throughput == 3);
    CHECK(registry.get_breaker("other")->config().minimum_throughput == 100);
}

TEST_CASE("CircuitBreakerRegistry: invalid configs rejected", "[registry]") {
    CircuitBreaker::Config bad;
    bad.failure_ratio = 0.0;
    CHECK_THROWS_AS(CircuitBreakerRegistry(bad), std::invalid_argument);

    CircuitBreakerRegistry registry{CircuitBreaker::Config()};
    CHECK_THROWS_AS(registry.set_resource_config("x", bad), std::invalid_argument);
    CHECK(registry.size() == 0);
}

TEST_CASE("CircuitBreakerRegistry: default state provider is dropped", "[registry]") {
    CircuitBreaker::Config cfg;
    cfg.state_provider = std::make_shared<StateProvider>();
    CircuitBreakerRegistry registry(cfg);

    CHECK_NOTHROW(registry.get_breaker("a"));
    CHECK_NOTHROW(registry.get_breaker("b"));
    CHECK_FALSE(cfg.state_provider->is_bound());
}

TEST_CASE("CircuitBreakerRegistry: failed creation leaves no entry", "[registry]") {
    auto provider = std::make_shared<StateProvider>();
    CircuitBreaker::Config with_provider;
    with_provider.state_provider = provider;

    CircuitBreakerRegistry registry{CircuitBreaker::Config()};
    registry.set_resource_config("one", with_provider);
    registry.set_resource_config("two", with_provider);

    auto one = registry.get_breaker("one");
    CHECK(provider->is_bound());
    CHECK_THROWS_AS(registry.get_breaker("two"), std::logic_error);
    CHECK(registry.size() == 1);
}

TEST_CASE("CircuitBreakerRegistry: stats for every breaker", "[registry]") {
    CircuitBreakerRegistry registry{CircuitBreaker::Config()};
    registry.get_breaker("a")->isolate();
    (void)registry.get_breaker("b");

    const auto all = registry.get_all_stats();
    REQUIRE(all.size() == 2);
    for (const auto& [resource, stats] : all) {
        if (resource == "a") {
            CHECK(stats.state == CircuitState::ISOLATED);
        } else {
            CHECK(stats.state == CircuitState::CLOSED);
        }
    }
}

TEST_CASE("CircuitBreakerRegistry: concurrent lookups create one breaker", "[registry][concurrency]") {
    CircuitBreakerRegistry registry{CircuitBreaker::Config()};
    constexpr int kThreads = 8;

    std::latch start(kThreads);
    std::vector<std::shared_ptr<CircuitBreaker>> seen(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            start.arrive_and_wait();
            seen[t] = registry.get_breaker("shared");
        });
    }
    for (auto& t : threads) t.join();

    CHECK(registry.size() == 1);
    for (const auto& b : seen) {
        CHECK(b == seen.front());
    }
}

TEST_CASE("CircuitBreakerRegistry: built from TOML config", "[registry][config]") {
    const std::string toml = R"(
[circuit_breaker]
minimum_throughput = 50

[circuit_breaker.resources.payments]
minimum_throughput = 5
break_duration_ms = 30000
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);

    auto registry = make_registry(result.config);
    REQUIRE(registry);

    const auto payments = registry->get_breaker("payments");
    CHECK(payments->config().minimum_throughput == 5);
    CHECK(*payments->config().break_duration == Duration(30s));
    CHECK(registry->get_breaker("search")->config().minimum_throughput == 50);
}
