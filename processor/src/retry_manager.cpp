#include "fleetrun/engine/retry_manager.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <random>

namespace fleetrun {
namespace engine {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

int64_t json_int(const json& j, const char* key, int64_t fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return fallback;
    }
    return it->get<int64_t>();
}

} // namespace

const char* to_string(BackoffStrategy strategy) {
    switch (strategy) {
        case BackoffStrategy::none: return "none";
        case BackoffStrategy::fixed: return "fixed";
        case BackoffStrategy::linear: return "linear";
        case BackoffStrategy::exponential: return "exponential";
    }
    return "none";
}

caf::expected<BackoffStrategy> parse_backoff_strategy(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "none") return BackoffStrategy::none;
    if (lower == "fixed") return BackoffStrategy::fixed;
    if (lower == "linear") return BackoffStrategy::linear;
    if (lower == "exponential") return BackoffStrategy::exponential;
    return caf::make_error(caf::sec::invalid_argument, "Unknown retry strategy: " + name);
}

std::vector<std::string> RetryConfig::default_patterns() {
    return {
        "timeout",
        "TimeoutError",
        "network_error",
        "NetworkError",
        "ECONNREFUSED",
        "ECONNRESET",
        "ETIMEDOUT",
        "element_not_found",
        "ElementNotFound",
        "Navigation timeout",
        "net::ERR_",
        "Target closed",
        "Session closed",
        "Context destroyed"
    };
}

caf::expected<RetryConfig> RetryConfig::from_json(const json& j, const RetryConfig& base) {
    if (!j.is_object()) {
        return caf::make_error(caf::sec::invalid_argument, "Retry config must be an object");
    }

    RetryConfig config = base;
    config.max_retries = static_cast<int32_t>(json_int(j, "maxRetries", config.max_retries));
    config.base_delay_ms = json_int(j, "baseDelay", config.base_delay_ms);
    config.max_delay_ms = json_int(j, "maxDelay", config.max_delay_ms);

    if (j.contains("strategy") && j.at("strategy").is_string()) {
        auto strategy = parse_backoff_strategy(j.at("strategy").get<std::string>());
        if (!strategy) {
            return strategy.error();
        }
        config.strategy = *strategy;
    }
    if (j.contains("jitter") && j.at("jitter").is_boolean()) {
        config.jitter = j.at("jitter").get<bool>();
    }
    if (j.contains("retryableErrors") && j.at("retryableErrors").is_array()) {
        config.retryable_patterns.clear();
        for (const auto& pattern : j.at("retryableErrors")) {
            if (pattern.is_string()) {
                config.retryable_patterns.push_back(pattern.get<std::string>());
            }
        }
    }

    if (config.max_retries < 0 || config.base_delay_ms < 0 || config.max_delay_ms < 0) {
        return caf::make_error(caf::sec::invalid_argument, "Retry limits must not be negative");
    }
    return config;
}

caf::expected<RetryConfig> RetryConfig::preset(const std::string& name) {
    RetryConfig config;
    if (name == "aggressive") {
        config.max_retries = 5;
        config.strategy = BackoffStrategy::exponential;
        config.base_delay_ms = 500;
        config.max_delay_ms = 30000;
    } else if (name == "standard") {
        config.max_retries = 3;
        config.strategy = BackoffStrategy::exponential;
        config.base_delay_ms = 1000;
        config.max_delay_ms = 60000;
    } else if (name == "conservative") {
        config.max_retries = 2;
        config.strategy = BackoffStrategy::linear;
        config.base_delay_ms = 2000;
        config.max_delay_ms = 120000;
    } else if (name == "none") {
        config.max_retries = 0;
        config.strategy = BackoffStrategy::none;
    } else {
        return caf::make_error(caf::sec::invalid_argument, "Unknown retry preset: " + name);
    }
    return config;
}

void to_json(json& j, const RetryConfig& config) {
    j = json{
        {"maxRetries", config.max_retries},
        {"strategy", to_string(config.strategy)},
        {"baseDelay", config.base_delay_ms},
        {"maxDelay", config.max_delay_ms},
        {"jitter", config.jitter},
        {"retryableErrors", config.retryable_patterns}
    };
}

void to_json(json& j, const RetryInfo& info) {
    j = json{
        {"willRetry", info.will_retry},
        {"retryCount", info.retry_count},
        {"maxRetries", info.max_retries},
        {"delayMs", info.delay_ms},
        {"strategy", to_string(info.strategy)}
    };
}

bool RetryManager::is_retryable(const std::string& error) const {
    std::string lower_error = to_lower(error);
    for (const auto& pattern : config_.retryable_patterns) {
        if (!pattern.empty() && lower_error.find(to_lower(pattern)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool RetryManager::should_retry(const std::string& error, int32_t retry_count) const {
    if (retry_count >= config_.max_retries) {
        return false;
    }
    if (config_.strategy == BackoffStrategy::none) {
        return false;
    }
    return is_retryable(error);
}

int64_t RetryManager::get_delay(int32_t retry_count) const {
    double delay = 0;
    switch (config_.strategy) {
        case BackoffStrategy::none:
            return 0;
        case BackoffStrategy::fixed:
            delay = static_cast<double>(config_.base_delay_ms);
            break;
        case BackoffStrategy::linear:
            delay = static_cast<double>(config_.base_delay_ms) * (retry_count + 1);
            break;
        case BackoffStrategy::exponential:
            delay = static_cast<double>(config_.base_delay_ms) * std::pow(2.0, retry_count);
            break;
    }

    delay = std::min(delay, static_cast<double>(config_.max_delay_ms));

    if (config_.jitter) {
        thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_real_distribution<double> factor(-0.2, 0.2);
        delay += delay * factor(rng);
    }

    return static_cast<int64_t>(std::llround(std::max(0.0, delay)));
}

RetryInfo RetryManager::retry_info(const std::string& error, int32_t retry_count) const {
    RetryInfo info;
    info.will_retry = should_retry(error, retry_count);
    info.retry_count = retry_count;
    info.max_retries = config_.max_retries;
    info.delay_ms = info.will_retry ? get_delay(retry_count) : 0;
    info.strategy = config_.strategy;
    return info;
}

} // namespace engine
} // namespace fleetrun
