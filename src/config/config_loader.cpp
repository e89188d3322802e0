#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>

namespace circuitguard {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

/**
 * @brief Numeric key that may also be written as a string ("${BREAK_MS}")
 */
int64_t int_or_string(const toml::table& tbl, std::string_view key, int64_t fallback) {
    const auto node = tbl[key];
    if (const auto* s = node.as_string()) {
        const std::string& text = s->get();
        char* end = nullptr;
        const long long parsed = std::strtoll(text.c_str(), &end, 10);
        if (text.empty() || end == nullptr || *end != '\0') {
            throw std::runtime_error(std::format("'{}' is not an integer: \"{}\"", key, text));
        }
        return static_cast<int64_t>(parsed);
    }
    return node.value_or(fallback);
}

double double_or_string(const toml::table& tbl, std::string_view key, double fallback) {
    const auto node = tbl[key];
    if (const auto* s = node.as_string()) {
        const std::string& text = s->get();
        char* end = nullptr;
        const double parsed = std::strtod(text.c_str(), &end);
        if (text.empty() || end == nullptr || *end != '\0') {
            throw std::runtime_error(std::format("'{}' is not a number: \"{}\"", key, text));
        }
        return parsed;
    }
    return node.value_or(fallback);
}

} // anonymous namespace

// ============================================================================
// Conversion
// ============================================================================

CircuitBreaker::Config to_breaker_config(const BreakerSection& section) {
    CircuitBreaker::Config cfg;
    cfg.failure_ratio = section.failure_ratio;
    cfg.minimum_throughput = static_cast<uint32_t>(section.minimum_throughput);
    cfg.sampling_duration = std::chrono::milliseconds(section.sampling_duration_ms);
    cfg.window_buckets = static_cast<uint32_t>(section.window_buckets);
    cfg.break_duration = std::chrono::milliseconds(section.break_duration_ms);
    return cfg;
}

std::unique_ptr<CircuitBreakerRegistry> make_registry(const BreakerConfig& config) {
    auto registry = std::make_unique<CircuitBreakerRegistry>(to_breaker_config(config.defaults));
    for (const auto& [name, section] : config.resources) {
        registry->set_resource_config(name, to_breaker_config(section));
    }
    return registry;
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

BreakerSection ConfigLoader::extract_section(const toml::table& tbl, const BreakerSection& base) {
    BreakerSection section = base;
    section.failure_ratio        = double_or_string(tbl, "failure_ratio", base.failure_ratio);
    section.minimum_throughput   = int_or_string(tbl, "minimum_throughput", base.minimum_throughput);
    section.sampling_duration_ms = int_or_string(tbl, "sampling_duration_ms", base.sampling_duration_ms);
    section.window_buckets       = int_or_string(tbl, "window_buckets", base.window_buckets);
    section.break_duration_ms    = int_or_string(tbl, "break_duration_ms", base.break_duration_ms);
    return section;
}

BreakerConfig ConfigLoader::extract_circuit_breaker(const toml::table& root) {
    BreakerConfig cfg;
    const auto* cb = root["circuit_breaker"].as_table();
    if (!cb) return cfg;

    cfg.defaults = extract_section(*cb, BreakerSection{});

    if (const auto* resources = (*cb)["resources"].as_table()) {
        for (auto&& [name, node] : *resources) {
            const auto* res_tbl = node.as_table();
            if (!res_tbl) {
                throw std::runtime_error(std::format(
                    "circuit_breaker.resources.{} must be a table", name.str()));
            }
            cfg.resources.emplace(std::string(name.str()),
                                  extract_section(*res_tbl, cfg.defaults));
        }
    }
    return cfg;
}

// ---- Validation ------------------------------------------------------------

void ConfigLoader::validate_section(const BreakerSection& section, const std::string& prefix,
                                    std::vector<std::string>& errors) {
    constexpr int64_t kMaxU32 = std::numeric_limits<uint32_t>::max();
    // Largest millisecond count a nanosecond Duration can hold
    constexpr int64_t kMaxMillis =
        std::chrono::duration_cast<std::chrono::milliseconds>(Duration::max()).count();

    if (!(section.failure_ratio > 0.0 && section.failure_ratio <= 1.0)) {
        errors.push_back(std::format("{}.failure_ratio must be in (0, 1], got {}",
                                     prefix, section.failure_ratio));
    }
    if (section.minimum_throughput <= 0 || section.minimum_throughput > kMaxU32) {
        errors.push_back(std::format("{}.minimum_throughput must be > 0, got {}",
                                     prefix, section.minimum_throughput));
    }
    if (section.sampling_duration_ms <= 0) {
        errors.push_back(std::format("{}.sampling_duration_ms must be > 0, got {}",
                                     prefix, section.sampling_duration_ms));
    } else if (section.sampling_duration_ms > kMaxMillis) {
        errors.push_back(std::format("{}.sampling_duration_ms must be <= {}, got {}",
                                     prefix, kMaxMillis, section.sampling_duration_ms));
    }
    if (section.window_buckets <= 0 || section.window_buckets > kMaxU32) {
        errors.push_back(std::format("{}.window_buckets must be > 0, got {}",
                                     prefix, section.window_buckets));
    }
    if (section.break_duration_ms <= 0) {
        errors.push_back(std::format("{}.break_duration_ms must be > 0, got {}",
                                     prefix, section.break_duration_ms));
    } else if (section.break_duration_ms > kMaxMillis) {
        errors.push_back(std::format("{}.break_duration_ms must be <= {}, got {}",
                                     prefix, kMaxMillis, section.break_duration_ms));
    }
}

std::vector<std::string> ConfigLoader::validate_config(const BreakerConfig& config) {
    std::vector<std::string> errors;
    validate_section(config.defaults, "circuit_breaker", errors);
    for (const auto& [name, section] : config.resources) {
        if (name.empty()) {
            errors.push_back("circuit_breaker.resources: resource name must not be empty");
        }
        validate_section(section, std::format("circuit_breaker.resources.{}", name), errors);
    }
    return errors;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(BreakerConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_circuit_breaker(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_circuit_breaker(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

} // namespace circuitguard
