#pragma once

#include "fleetrun/engine/core.hpp"
#include "fleetrun/engine/observability.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fleetrun {
namespace engine {

/**
 * Named values for one workflow run.
 *
 * Lookup order for get(name):
 * 1. loop-local overlays, innermost first
 * 2. base variables
 * 3. dotted paths: profile.<path>, session.<path>, loop.<path>, <var>.<path>
 *    (path segments may index arrays with key[n])
 *
 * Not thread-safe. A run executes its steps sequentially; callers that
 * touch a store from another thread (debug sessions) serialize externally.
 */
class VariableStore {
public:
    explicit VariableStore(const json& initial = json::object());

    /**
     * Writes to the innermost loop overlay that already defines `name`,
     * otherwise to the base map.
     */
    void set(const std::string& name, json value);

    std::optional<json> get(const std::string& name) const;
    bool has(const std::string& name) const;
    bool remove(const std::string& name);
    void clear();

    void set_profile(json profile) { profile_ = std::move(profile); }
    void set_session(json session) { session_ = std::move(session); }
    const json& profile() const { return profile_; }
    const json& session() const { return session_; }

    /**
     * Pushes a loop overlay. `loop_context` is visible as `loop.*`; when
     * `variable_name` is non-empty it is bound inside the overlay only.
     */
    void push_loop(json loop_context, const std::string& variable_name = "", json variable_value = nullptr);
    void pop_loop();
    size_t loop_depth() const { return frames_.size(); }
    std::optional<json> current_loop() const;

    // Base variables merged with the visible overlay bindings
    json snapshot() const;

    // Replaces {{name | transform:arg}} placeholders; unresolved ones stay literal
    std::string interpolate(const std::string& tmpl) const;

    // Interpolates every string inside objects and arrays
    json interpolate_value(const json& value) const;

    // Interpolates then evaluates; errors are returned, not logged
    caf::expected<json> try_evaluate(const std::string& expression) const;

    // Interpolates then evaluates; on failure logs a warning and returns `fallback`
    json evaluate(const std::string& expression, json fallback = false) const;

    bool evaluate_condition(const std::string& expression) const;

    void set_observability(std::shared_ptr<Observability> observability, LogContext log_context = {}) {
        observability_ = std::move(observability);
        log_context_ = std::move(log_context);
    }

private:
    struct LoopFrame {
        json context;
        std::map<std::string, json> locals;
    };

    std::map<std::string, json> variables_;
    std::vector<LoopFrame> frames_;
    json profile_;
    json session_;
    std::shared_ptr<Observability> observability_;
    LogContext log_context_;

    std::optional<json> resolve_placeholder(const std::string& name) const;
};

// Pushes a loop overlay for its lifetime
class LoopScope {
public:
    LoopScope(VariableStore& store, json loop_context,
              const std::string& variable_name = "", json variable_value = nullptr)
        : store_(store) {
        store_.push_loop(std::move(loop_context), variable_name, std::move(variable_value));
    }
    ~LoopScope() { store_.pop_loop(); }

    LoopScope(const LoopScope&) = delete;
    LoopScope& operator=(const LoopScope&) = delete;

private:
    VariableStore& store_;
};

// Value of a built-in placeholder (timestamp, date, time, datetime, random, uuid)
std::optional<json> builtin_variable(const std::string& name);

// Applies a `|`-separated transform chain such as "trim | truncate:10"
json apply_transforms(json value, const std::string& chain);

} // namespace engine
} // namespace fleetrun
