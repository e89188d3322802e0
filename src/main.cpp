#include "breaker/circuit_breaker_registry.hpp"
#include "breaker/execution_gate.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <format>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

using namespace circuitguard;

namespace {

class DownstreamError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Simulated dependency: healthy, then an outage window, then healthy again
int call_downstream(int request, std::mt19937& rng) {
    const bool outage = request >= 40 && request < 120;
    std::uniform_int_distribution<int> dist(0, 99);
    const int failure_pct = outage ? 90 : 5;
    if (dist(rng) < failure_pct) {
        throw DownstreamError(std::format("request {} failed", request));
    }
    return request;
}

OutcomeKind classify(const CallOutcome<int>& outcome) {
    if (!outcome.threw()) {
        return OutcomeKind::HANDLED_SUCCESS;
    }
    try {
        std::rethrow_exception(outcome.error);
    } catch (const DownstreamError&) {
        return OutcomeKind::HANDLED_FAILURE;
    } catch (...) {
        return OutcomeKind::UNHANDLED;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("circuitguard demo starting...");

        std::string config_file = "config/circuitguard.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/3] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);

        BreakerConfig breaker_config;
        if (config_result.success) {
            breaker_config = config_result.config;
            utils::log::info(std::format("Config loaded: {} resource override(s)",
                                         breaker_config.resources.size()));
        } else {
            utils::log::warn(std::format("{}; using built-in defaults",
                                         config_result.error_message));
        }

        utils::log::info("[2/3] Creating circuit breakers");
        auto registry = make_registry(breaker_config);
        auto breaker = registry->get_breaker("downstream");
        ExecutionGate<int> gate(breaker, classify);

        utils::log::info("[3/3] Running simulated workload");
        std::mt19937 rng(42);
        int served = 0, failed = 0, rejected = 0;
        for (int request = 0; request < 200; ++request) {
            try {
                gate.execute([&] { return call_downstream(request, rng); },
                             std::format("req-{}", request));
                ++served;
            } catch (const BrokenCircuitError& e) {
                ++rejected;
                if (e.retry_after()) {
                    std::this_thread::sleep_for(*e.retry_after());
                }
            } catch (const CircuitRejectedError&) {
                ++rejected;
            } catch (const DownstreamError&) {
                ++failed;
            }
        }

        const auto stats = breaker->get_stats();
        utils::log::info(std::format(
            "Done: served={} failed={} rejected={} state={} opened={} closed={}",
            served, failed, rejected, circuit_state_to_string(stats.state),
            stats.transitions_to_open, stats.transitions_to_closed));

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
