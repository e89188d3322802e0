#include "breaker/circuit_breaker_registry.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace circuitguard {

CircuitBreakerRegistry::CircuitBreakerRegistry(const CircuitBreaker::Config& default_config)
    : default_config_(default_config) {
    const auto errors = default_config_.validate();
    if (!errors.empty()) {
        throw std::invalid_argument(std::format(
            "Invalid default circuit breaker config: {}", utils::join(errors, "; ")));
    }
    if (default_config_.state_provider) {
        // A provider observes exactly one breaker
        utils::log::warn("CircuitBreakerRegistry: ignoring state_provider in default config");
        default_config_.state_provider.reset();
    }
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get_breaker(const std::string& resource) {
    // Fast path: shared lock (read-only)
    {
        std::shared_lock lock(breakers_mutex_);
        const auto it = breakers_.find(resource);
        if (it != breakers_.end()) {
            return it->second;
        }
    }

    // Pre-compute config BEFORE taking breakers_mutex_ unique lock
    // (eliminates nested config_mutex_ inside breakers_mutex_)
    CircuitBreaker::Config cfg = default_config_;
    {
        std::shared_lock cfg_lock(config_mutex_);
        const auto cfg_it = resource_configs_.find(resource);
        if (cfg_it != resource_configs_.end()) {
            cfg = cfg_it->second;
        }
    }

    // Slow path: unique lock + try_emplace
    std::unique_lock lock(breakers_mutex_);
    auto [it, inserted] = breakers_.try_emplace(resource, nullptr);
    if (inserted) {
        try {
            it->second = std::make_shared<CircuitBreaker>(resource, cfg);
        } catch (...) {
            breakers_.erase(it);
            throw;
        }
        utils::log::info(std::format("Circuit breaker '{}' created", resource));
    }
    return it->second;
}

void CircuitBreakerRegistry::set_resource_config(
    const std::string& resource, const CircuitBreaker::Config& config) {
    const auto errors = config.validate();
    if (!errors.empty()) {
        throw std::invalid_argument(std::format(
            "Invalid circuit breaker config for '{}': {}", resource, utils::join(errors, "; ")));
    }
    std::unique_lock lock(config_mutex_);
    resource_configs_[resource] = config;
}

std::vector<std::pair<std::string, CircuitBreakerStats>>
CircuitBreakerRegistry::get_all_stats() const {
    std::shared_lock lock(breakers_mutex_);
    std::vector<std::pair<std::string, CircuitBreakerStats>> result;
    result.reserve(breakers_.size());
    for (const auto& [resource, breaker] : breakers_) {
        result.emplace_back(resource, breaker->get_stats());
    }
    return result;
}

size_t CircuitBreakerRegistry::size() const {
    std::shared_lock lock(breakers_mutex_);
    return breakers_.size();
}

} // namespace circuitguard
