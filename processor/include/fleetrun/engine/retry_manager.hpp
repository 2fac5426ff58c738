#pragma once

#include "fleetrun/engine/core.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace fleetrun {
namespace engine {

enum class BackoffStrategy {
    none,
    fixed,
    linear,
    exponential
};

const char* to_string(BackoffStrategy strategy);
caf::expected<BackoffStrategy> parse_backoff_strategy(const std::string& name);

struct RetryConfig {
    int32_t max_retries = 3;
    BackoffStrategy strategy = BackoffStrategy::exponential;
    int64_t base_delay_ms = 1000;
    int64_t max_delay_ms = 60000;
    bool jitter = true;                          // +/-20%
    std::vector<std::string> retryable_patterns = default_patterns();

    static std::vector<std::string> default_patterns();

    /**
     * Reads camelCase keys (maxRetries, strategy, baseDelay, maxDelay,
     * jitter, retryableErrors) on top of `base`. Missing keys keep base values.
     */
    static caf::expected<RetryConfig> from_json(const json& j, const RetryConfig& base = RetryConfig());

    // Named presets: aggressive, standard, conservative, none
    static caf::expected<RetryConfig> preset(const std::string& name);
};

void to_json(json& j, const RetryConfig& config);

struct RetryInfo {
    bool will_retry = false;
    int32_t retry_count = 0;
    int32_t max_retries = 0;
    int64_t delay_ms = 0;
    BackoffStrategy strategy = BackoffStrategy::none;
};

void to_json(json& j, const RetryInfo& info);

/**
 * Retry decisions and backoff delays.
 *
 * Classification is a case-insensitive substring match of the error text
 * against the configured patterns. An unrelated message that happens to
 * contain "timeout" is treated as retryable.
 */
class RetryManager {
public:
    using RetryCallback = std::function<void(const std::string& error, int32_t retry_count, int64_t delay_ms)>;

    explicit RetryManager(RetryConfig config = RetryConfig()) : config_(std::move(config)) {}

    /**
     * False once retry_count reaches max_retries or when the strategy is none,
     * regardless of the error text.
     */
    bool should_retry(const std::string& error, int32_t retry_count) const;

    bool is_retryable(const std::string& error) const;

    /**
     * Delay before retry number `retry_count` (0-based):
     * fixed: base; linear: base * (n + 1); exponential: base * 2^n.
     * Capped at max_delay_ms, then jittered by +/-20% when enabled.
     */
    int64_t get_delay(int32_t retry_count) const;

    RetryInfo retry_info(const std::string& error, int32_t retry_count) const;

    /**
     * Runs `fn` (returning caf::expected<T>) until it succeeds, the error is
     * not retryable, or retries are exhausted. Sleeps get_delay() between attempts.
     */
    template <class F>
    auto execute(F&& fn, const RetryCallback& on_retry = RetryCallback()) const -> decltype(fn()) {
        int32_t retry_count = 0;
        for (;;) {
            auto result = fn();
            if (result) {
                return result;
            }
            std::string error = error_message(result.error());
            if (!should_retry(error, retry_count)) {
                return result;
            }
            int64_t delay = get_delay(retry_count);
            ++retry_count;
            if (on_retry) {
                on_retry(error, retry_count, delay);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
    }

    const RetryConfig& config() const { return config_; }
    int32_t max_retries() const { return config_.max_retries; }

private:
    RetryConfig config_;
};

} // namespace engine
} // namespace fleetrun
