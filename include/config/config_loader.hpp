#pragma once

#include "breaker/circuit_breaker.hpp"
#include "breaker/circuit_breaker_registry.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace circuitguard {

// ============================================================================
// Breaker Config (mirrors TOML hierarchy)
// ============================================================================

/**
 * @brief One [circuit_breaker] or [circuit_breaker.resources.<name>] table
 */
struct BreakerSection {
    double failure_ratio = 0.1;
    int64_t minimum_throughput = 100;
    int64_t sampling_duration_ms = 30000;
    int64_t window_buckets = 10;
    int64_t break_duration_ms = 5000;
};

struct BreakerConfig {
    BreakerSection defaults;

    // Per-resource overrides; unspecified keys inherit from defaults
    std::unordered_map<std::string, BreakerSection> resources;
};

/**
 * @brief Convert a validated section into breaker options
 *
 * Only the statistical options come from TOML. Callbacks, clock, manual
 * control and state provider are attached in code.
 */
[[nodiscard]] CircuitBreaker::Config to_breaker_config(const BreakerSection& section);

/**
 * @brief Registry using `config.defaults`, with every resource override applied
 */
[[nodiscard]] std::unique_ptr<CircuitBreakerRegistry> make_registry(const BreakerConfig& config);

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * Example:
 *
 *   [circuit_breaker]
 *   failure_ratio = 0.5
 *   minimum_throughput = 20
 *   sampling_duration_ms = 10000
 *   break_duration_ms = 30000
 *
 *   [circuit_breaker.resources.payments]
 *   break_duration_ms = 60000
 *
 * String values may reference environment variables as ${NAME}.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        BreakerConfig config;

        static LoadResult ok(BreakerConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load breaker config from TOML file
     * @param config_path Path to .toml file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load breaker config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check ranges of every section
     * @return One message per problem, prefixed with the TOML key path
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const BreakerConfig& config);

private:
    static BreakerConfig extract_circuit_breaker(const toml::table& root);
    static BreakerSection extract_section(const toml::table& tbl, const BreakerSection& base);
    static void validate_section(const BreakerSection& section, const std::string& prefix,
                                 std::vector<std::string>& errors);
    static LoadResult validate_and_return(BreakerConfig config);
};

} // namespace circuitguard
