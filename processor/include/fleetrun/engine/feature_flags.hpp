#pragma once

#include <string>
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace fleetrun {
namespace engine {

/**
 * Runtime feature flags
 *
 * Flags default to `false` and are read from environment variables:
 * - FLEETRUN_METRICS_ENABLED
 * - FLEETRUN_TRACING_ENABLED
 * - FLEETRUN_DEBUG_LOGS
 */
class FeatureFlags {
public:
    /**
     * Check if Prometheus metrics are enabled
     *
     * Gates:
     * - Metric collection for steps, executions, slots and schedules
     * - `/metrics` endpoint
     */
    static bool is_metrics_enabled() {
        return get_env_bool("FLEETRUN_METRICS_ENABLED", false);
    }

    /**
     * Check if OpenTelemetry spans are recorded for executions and schedule runs
     */
    static bool is_tracing_enabled() {
        return get_env_bool("FLEETRUN_TRACING_ENABLED", false);
    }

    /**
     * Check if DEBUG log lines are emitted
     */
    static bool is_debug_logging_enabled() {
        return get_env_bool("FLEETRUN_DEBUG_LOGS", false);
    }

private:
    /**
     * Get boolean value from environment variable
     *
     * Returns `true` if environment variable is set to:
     * - "true" (case-insensitive)
     * - "1"
     * - "yes" (case-insensitive)
     *
     * Returns `default_value` if environment variable is not set or has other value.
     */
    static bool get_env_bool(const char* env_var, bool default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr) {
            return default_value;
        }

        std::string str_value(value);
        std::transform(str_value.begin(), str_value.end(), str_value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        return (str_value == "true" || str_value == "1" || str_value == "yes");
    }
};

} // namespace engine
} // namespace fleetrun
