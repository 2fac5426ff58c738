#pragma once

#include "fleetrun/engine/core.hpp"
#include "fleetrun/engine/step_executor.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fleetrun {
namespace engine {

enum class DebugStatus {
    paused,
    running,
    completed,
    failed,
    stopped
};

const char* to_string(DebugStatus status);

struct DebugState {
    std::string id;
    std::string workflow_id;
    std::string workflow_name;
    DebugStatus status = DebugStatus::paused;
    size_t current_step_index = 0;
    size_t total_steps = 0;
    std::optional<Step> next_step;
    std::vector<std::string> breakpoints;
    json variables = json::object();
    std::vector<StepResult> results;
    std::optional<StepResult> last_result;
    std::string error;
    int64_t started_at = 0;

    bool finished() const {
        return status == DebugStatus::completed || status == DebugStatus::failed ||
               status == DebugStatus::stopped;
    }
};

void to_json(json& j, const DebugState& state);

struct DebugSummary {
    std::string id;
    std::string workflow_id;
    std::string workflow_name;
    DebugStatus status = DebugStatus::paused;
    size_t current_step_index = 0;
    size_t total_steps = 0;
    int64_t started_at = 0;
};

void to_json(json& j, const DebugSummary& summary);

/**
 * Registry of step-by-step workflow runs.
 *
 * Each session owns its execution context and is addressed by an opaque id.
 * Operations on one session are serialized by that session's mutex; any
 * number of sessions may be paused at once.
 */
class DebugController {
public:
    explicit DebugController(std::shared_ptr<WorkflowExecutor> executor);

    // Creates a paused session positioned at the first top-level step
    caf::expected<DebugState> start(const Workflow& workflow,
                                    ExecutionOptions options = ExecutionOptions(),
                                    const std::vector<std::string>& breakpoints = {});

    /**
     * Executes exactly one top-level step and advances the index.
     * Fails when the session is unknown or already finished.
     */
    caf::expected<DebugState> step(const std::string& session_id);

    /**
     * Steps until the next step is a breakpoint or the run ends. The step the
     * session is paused on is never treated as a breakpoint, so resuming from
     * a breakpoint makes progress.
     */
    caf::expected<DebugState> continue_run(const std::string& session_id);

    caf::expected<DebugState> set_breakpoint(const std::string& session_id, const std::string& step_id,
                                             bool enabled = true);

    // Writes into the live variable store; visible to the next step
    caf::expected<DebugState> set_variable(const std::string& session_id, const std::string& name, json value);

    caf::expected<DebugState> state(const std::string& session_id) const;

    // Marks the session stopped and cancels a step in flight
    caf::expected<DebugState> stop(const std::string& session_id);

    std::vector<DebugSummary> list() const;
    bool dispose(const std::string& session_id);
    size_t dispose_all();

private:
    struct DebugSession {
        mutable std::mutex mutex;
        std::string id;
        Workflow workflow;
        std::unique_ptr<ExecutionContext> ctx;
        DebugStatus status = DebugStatus::paused;
        size_t current_step_index = 0;
        std::set<std::string> breakpoints;
        std::optional<StepResult> last_result;
        std::string error;
        int64_t started_at = 0;
    };

    std::shared_ptr<WorkflowExecutor> executor_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<DebugSession>> sessions_;

    caf::expected<std::shared_ptr<DebugSession>> find(const std::string& session_id) const;
    void step_locked(DebugSession& session);
    static DebugState snapshot_locked(const DebugSession& session);
};

} // namespace engine
} // namespace fleetrun
