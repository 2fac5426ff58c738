#pragma once

#include "fleetrun/engine/action.hpp"
#include "fleetrun/engine/core.hpp"
#include "fleetrun/engine/observability.hpp"
#include "fleetrun/engine/worker_pool.hpp"
#include "fleetrun/engine/workflow_registry.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fleetrun {
namespace engine {

struct ExecutionOptions {
    json parameters = json::object();   // override workflow variables
    json profile;                       // visible as profile.*
    json session;                       // visible as session.*
    std::shared_ptr<PageHandle> page;
    std::shared_ptr<CancellationToken> cancellation;
    std::optional<bool> continue_on_error;  // default: workflow settings, then false
    int64_t timeout_ms = 0;             // 0 = no deadline
    std::string run_id;                 // generated when empty
    std::string profile_id;
    int32_t depth = 0;

    // Called before each top-level step with (index, total, step)
    std::function<void(size_t, size_t, const Step&)> on_progress;
};

// How a sequence of steps ended
enum class FlowOutcome {
    completed,
    break_loop,
    continue_loop,
    stopped,
    failed
};

struct SequenceResult {
    FlowOutcome outcome = FlowOutcome::completed;
    ErrorCode error_code = ErrorCode::none;
    std::string error;

    bool failed() const { return outcome == FlowOutcome::failed; }
};

/**
 * Interprets a workflow's step tree.
 *
 * Control flow travels as StepResult signals, never as exceptions:
 * - break/continue end the current sequence and are consumed by the nearest loop
 * - stop ends the whole run (failed when its status is "failed")
 * - a failed step ends the sequence unless continue_on_error is set
 *
 * Every executed step, nested ones included, appends one StepResult to the
 * context in completion order.
 */
class WorkflowExecutor {
public:
    static constexpr int32_t max_call_depth = 10;
    static constexpr int64_t max_loop_iterations = 10000;
    static constexpr int64_t default_while_iterations = 100;

    WorkflowExecutor(std::shared_ptr<ActionRegistry> actions,
                     std::shared_ptr<WorkflowRegistry> workflows = nullptr,
                     std::shared_ptr<Observability> observability = nullptr,
                     int32_t background_threads = 0);

    // Drains queued asynchronous workflow calls before any member goes away
    ~WorkflowExecutor();

    WorkflowExecutor(const WorkflowExecutor&) = delete;
    WorkflowExecutor& operator=(const WorkflowExecutor&) = delete;

    /**
     * Runs the workflow to a terminal state. Never throws: failures are
     * reported through Execution::status and Execution::error.
     */
    Execution execute(const Workflow& workflow, ExecutionOptions options = ExecutionOptions());

    // Builds the per-run context the same way execute() does
    std::unique_ptr<ExecutionContext> create_context(const Workflow& workflow,
                                                     const ExecutionOptions& options,
                                                     const std::string& run_id);

    SequenceResult execute_steps(const std::vector<Step>& steps, ExecutionContext& ctx);

    // Executes one step (and its children); the result is not appended to ctx.results
    StepResult execute_step(const Step& step, ExecutionContext& ctx);

    const std::shared_ptr<ActionRegistry>& actions() const { return actions_; }
    const std::shared_ptr<WorkflowRegistry>& workflows() const { return workflows_; }
    const std::shared_ptr<Observability>& observability() const { return observability_; }

private:
    std::shared_ptr<ActionRegistry> actions_;
    std::shared_ptr<WorkflowRegistry> workflows_;
    std::shared_ptr<Observability> observability_;
    // Runs waitForCompletion=false calls; null when the executor has no background threads
    std::unique_ptr<WorkerPool> background_;

    SequenceResult run_sequence(const std::vector<Step>& steps, ExecutionContext& ctx, Execution* top_level,
                                const std::function<void(size_t, size_t, const Step&)>& on_progress);

    StepResult execute_action(const Step& step, ExecutionContext& ctx);
    StepResult execute_condition(const Step& step, ExecutionContext& ctx);
    StepResult execute_loop(const Step& step, ExecutionContext& ctx);
    StepResult execute_try_catch(const Step& step, ExecutionContext& ctx);
    StepResult execute_call_workflow(const Step& step, ExecutionContext& ctx);
    StepResult execute_signal(const Step& step, ExecutionContext& ctx);

    bool evaluate_condition(const Step& step, ExecutionContext& ctx);
};

} // namespace engine
} // namespace fleetrun
