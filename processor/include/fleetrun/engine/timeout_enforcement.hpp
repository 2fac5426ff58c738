#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

namespace fleetrun {
namespace engine {

/**
 * Cooperative cancellation for one execution.
 *
 * The step executor checks the token before every step; long-running
 * actions (wait-time, http-request) poll it or sleep on it. A deadline,
 * when set, cancels the token with reason `timeout` the first time it is
 * checked after expiry.
 */
class CancellationToken {
public:
    enum class Reason {
        none,
        user,
        timeout
    };

    using clock = std::chrono::steady_clock;

    void cancel(Reason reason, const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (reason_ != Reason::none) {
                return;
            }
            reason_ = reason;
            message_ = message;
        }
        cv_.notify_all();
    }

    void set_deadline(int64_t timeout_ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (timeout_ms > 0) {
            deadline_ = clock::now() + std::chrono::milliseconds(timeout_ms);
            timeout_ms_ = timeout_ms;
        }
    }

    // Also applies an expired deadline
    bool is_cancelled() {
        std::lock_guard<std::mutex> lock(mutex_);
        apply_deadline_locked();
        return reason_ != Reason::none;
    }

    Reason reason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reason_;
    }

    std::string message() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return message_;
    }

    /**
     * Sleeps for `duration` or until cancelled or past the deadline.
     * Returns false if the wait ended because of cancellation.
     */
    bool wait_for(std::chrono::milliseconds duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto until = clock::now() + duration;
        bool has_deadline = deadline_ != clock::time_point{};
        if (has_deadline && deadline_ < until) {
            until = deadline_;
        }
        cv_.wait_until(lock, until, [this] { return reason_ != Reason::none; });
        apply_deadline_locked();
        return reason_ == Reason::none;
    }

    static std::string timeout_message(int64_t timeout_ms) {
        return "Execution timeout after " + std::to_string(timeout_ms) + "ms";
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    Reason reason_ = Reason::none;
    std::string message_;
    clock::time_point deadline_{};
    int64_t timeout_ms_ = 0;

    void apply_deadline_locked() {
        if (reason_ == Reason::none && deadline_ != clock::time_point{} && clock::now() >= deadline_) {
            reason_ = Reason::timeout;
            message_ = timeout_message(timeout_ms_);
        }
    }
};

class TimeoutEnforcement {
public:
    /**
     * HTTP connection timeout, bounded by the total request timeout
     */
    static int64_t get_http_connection_timeout_ms(int64_t request_timeout_ms) {
        const int64_t connection_timeout = 5000;
        if (request_timeout_ms > 0 && request_timeout_ms < connection_timeout) {
            return request_timeout_ms;
        }
        return connection_timeout;
    }

    // Default per-slot execution timeout
    static constexpr int64_t default_slot_timeout_ms = 300000;

    // Default request timeout for http-request
    static constexpr int64_t default_http_timeout_ms = 30000;
};

} // namespace engine
} // namespace fleetrun
