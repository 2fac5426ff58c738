#pragma once

#include "fleetrun/engine/core.hpp"
#include "fleetrun/engine/observability.hpp"
#include "fleetrun/engine/timeout_enforcement.hpp"
#include "fleetrun/engine/variable_store.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fleetrun {
namespace engine {

class WorkflowExecutor;

// Page primitives supplied by the browser driver
class PageHandle {
public:
    virtual ~PageHandle() = default;

    virtual caf::expected<void> navigate(const std::string& url, int64_t timeout_ms) = 0;
    virtual caf::expected<void> click(const std::string& selector) = 0;
    virtual caf::expected<void> type(const std::string& selector, const std::string& text) = 0;
    virtual caf::expected<std::string> text_content(const std::string& selector) = 0;
    virtual caf::expected<int64_t> count(const std::string& selector) = 0;
    virtual caf::expected<bool> is_visible(const std::string& selector) = 0;
    virtual std::string url() const = 0;
};

// An isolated browser context for one profile
class BrowserSession {
public:
    virtual ~BrowserSession() = default;

    virtual std::shared_ptr<PageHandle> page() = 0;
    virtual void close() = 0;
};

/**
 * Per-run state shared by every step of one execution.
 *
 * Owned by the executor for the duration of a run. Steps of one run
 * execute sequentially, so the context is not synchronized.
 */
struct ExecutionContext {
    VariableStore variables;
    std::shared_ptr<PageHandle> page;
    std::shared_ptr<Observability> observability;
    std::shared_ptr<CancellationToken> cancellation;
    LogContext log_context;
    std::vector<StepResult> results;
    bool continue_on_error = false;
    int32_t depth = 0;
    WorkflowExecutor* executor = nullptr;

    void log(const std::string& level, const std::string& message,
             const std::unordered_map<std::string, std::string>& details = {}) const {
        if (observability) {
            observability->log(level, message, log_context, details);
        }
    }

    bool is_cancelled() const { return cancellation && cancellation->is_cancelled(); }
};

// Outcome of one action call
struct ActionResult {
    bool success = true;
    json data = json::object();
    ErrorCode error_code = ErrorCode::none;
    std::string error;

    static ActionResult ok(json data = json::object()) {
        ActionResult result;
        result.data = std::move(data);
        return result;
    }

    static ActionResult failure(ErrorCode code, const std::string& message) {
        ActionResult result;
        result.success = false;
        result.error_code = code;
        result.error = message;
        return result;
    }
};

struct ActionMetrics {
    int64_t latency_ms = 0;
    int64_t success_count = 0;
    int64_t error_count = 0;
};

class Action {
public:
    virtual ~Action() = default;

    virtual std::string type() const = 0;

    /**
     * Runs the action with an already interpolated config.
     * Business failures come back as ActionResult{success=false};
     * a caf::error means the action could not run at all.
     */
    virtual caf::expected<ActionResult> execute(ExecutionContext& ctx, const json& config) = 0;

    virtual ActionMetrics metrics() const = 0;
};

// Base Action implementation with common functionality
class BaseAction : public Action {
public:
    explicit BaseAction(std::string action_type) : action_type_(std::move(action_type)) {}

    std::string type() const override { return action_type_; }

    caf::expected<ActionResult> execute(ExecutionContext& ctx, const json& config) override {
        auto start_time = std::chrono::steady_clock::now();
        auto result = execute_impl(ctx, config);
        auto latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();
        if (result && result->success) {
            record_success(latency_ms);
        } else {
            record_error(latency_ms);
        }
        return result;
    }

    ActionMetrics metrics() const override {
        ActionMetrics m;
        m.latency_ms = latency_ms_.load();
        m.success_count = success_count_.load();
        m.error_count = error_count_.load();
        return m;
    }

protected:
    std::string action_type_;

    virtual caf::expected<ActionResult> execute_impl(ExecutionContext& ctx, const json& config) = 0;

    static bool validate_required(const json& config, const std::vector<std::string>& required) {
        for (const auto& key : required) {
            if (!config.contains(key) || config.at(key).is_null() ||
                (config.at(key).is_string() && config.at(key).get<std::string>().empty())) {
                return false;
            }
        }
        return true;
    }

    static std::string get_config_or_default(const json& config, const std::string& key,
                                             const std::string& default_value = "") {
        auto it = config.find(key);
        if (it == config.end() || it->is_null()) {
            return default_value;
        }
        return it->is_string() ? it->get<std::string>() : it->dump();
    }

    static ActionResult missing_fields(const std::string& fields) {
        return ActionResult::failure(ErrorCode::missing_required_field, "Missing required config: " + fields);
    }

    // Fails with session_unavailable when the run has no page
    static caf::expected<std::shared_ptr<PageHandle>> require_page(const ExecutionContext& ctx) {
        if (!ctx.page) {
            return caf::make_error(caf::sec::runtime_error, "No page available for this execution");
        }
        return ctx.page;
    }

private:
    std::atomic<int64_t> latency_ms_{0};
    std::atomic<int64_t> success_count_{0};
    std::atomic<int64_t> error_count_{0};

    void record_success(int64_t latency_ms) {
        latency_ms_ = latency_ms;
        ++success_count_;
    }

    void record_error(int64_t latency_ms) {
        latency_ms_ = latency_ms;
        ++error_count_;
    }
};

/**
 * Action registry keyed by step type.
 *
 * Registration normally happens before any run starts; lookups are
 * guarded so actions may be added while runs are in flight.
 */
class ActionRegistry {
public:
    void register_action(std::shared_ptr<Action> action) {
        std::lock_guard<std::mutex> lock(mutex_);
        actions_[action->type()] = std::move(action);
    }

    bool has_action(const std::string& type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return actions_.count(type) > 0;
    }

    std::shared_ptr<Action> get_action(const std::string& type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = actions_.find(type);
        return it != actions_.end() ? it->second : nullptr;
    }

    std::vector<std::string> types() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        for (const auto& entry : actions_) {
            result.push_back(entry.first);
        }
        return result;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Action>> actions_;
};

// Step types interpreted by the executor itself
bool is_control_step(const std::string& type);

// Registers set-variable, calculate, wait-time, http-request, navigate, click, type, extract-text
void register_builtin_actions(ActionRegistry& registry);

} // namespace engine
} // namespace fleetrun
