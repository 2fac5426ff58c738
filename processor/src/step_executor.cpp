#include "fleetrun/engine/step_executor.hpp"
#include "fleetrun/engine/expression.hpp"
#include <algorithm>
#include <chrono>

namespace fleetrun {
namespace engine {

namespace {

std::string config_string(const json& config, const std::string& key, const std::string& default_value = "") {
    auto it = config.find(key);
    if (it == config.end() || it->is_null()) {
        return default_value;
    }
    return display_string(*it);
}

bool config_bool(const json& config, const std::string& key, bool default_value) {
    auto it = config.find(key);
    if (it == config.end() || it->is_null()) {
        return default_value;
    }
    if (it->is_boolean()) {
        return it->get<bool>();
    }
    std::string text = display_string(*it);
    if (text == "true" || text == "1") return true;
    if (text == "false" || text == "0" || text.empty()) return false;
    return default_value;
}

std::optional<int64_t> config_int(const json& config, const std::string& key) {
    auto it = config.find(key);
    double number = 0;
    if (it == config.end() || !to_number(*it, number)) {
        return std::nullopt;
    }
    return static_cast<int64_t>(number);
}

bool is_cancellation(ErrorCode code) {
    return code == ErrorCode::cancelled_by_user || code == ErrorCode::cancelled_by_timeout;
}

// Converts a failed child sequence into the failed result of its container step
StepResult propagate_failure(const Step& step, const SequenceResult& seq, json data = json::object()) {
    StepResult result = StepResult::error_result(step, seq.error_code, seq.error);
    for (auto it = data.begin(); it != data.end(); ++it) {
        result.data[it.key()] = it.value();
    }
    if (seq.error_code == ErrorCode::stopped_by_step) {
        result.signal = StopSignal{true, seq.error};
    }
    return result;
}

// Re-raises break/continue/stop of a child sequence on the container result
StepSignal signal_of(const SequenceResult& seq, json& data, StepSignal fallback) {
    switch (seq.outcome) {
        case FlowOutcome::break_loop:
            data["break"] = true;
            return BreakSignal{};
        case FlowOutcome::continue_loop:
            data["continue"] = true;
            return ContinueSignal{};
        case FlowOutcome::stopped:
            data["stop"] = true;
            return StopSignal{false, ""};
        case FlowOutcome::completed:
        case FlowOutcome::failed:
            break;
    }
    return fallback;
}

caf::expected<json> resolve_loop_items(const json& raw, const VariableStore& variables) {
    if (raw.is_array()) {
        return raw;
    }
    if (raw.is_string()) {
        std::string text = raw.get<std::string>();
        size_t first = text.find_first_not_of(" \t\r\n");
        if (first != std::string::npos && text[first] == '[') {
            try {
                json parsed = json::parse(text);
                if (parsed.is_array()) {
                    return parsed;
                }
            } catch (const json::parse_error& e) {
                return caf::make_error(caf::sec::invalid_argument,
                                       "Invalid array JSON: " + std::string(e.what()));
            }
        }
        auto value = variables.get(text);
        if (value && value->is_array()) {
            return *value;
        }
    }
    return caf::make_error(caf::sec::invalid_argument,
                           "loop-array requires a JSON array or the name of an array variable");
}

// Restores the context's continue_on_error flag on scope exit
class ContinueOnErrorScope {
public:
    ContinueOnErrorScope(ExecutionContext& ctx, bool value) : ctx_(ctx), saved_(ctx.continue_on_error) {
        ctx_.continue_on_error = value;
    }
    ~ContinueOnErrorScope() { ctx_.continue_on_error = saved_; }

    ContinueOnErrorScope(const ContinueOnErrorScope&) = delete;
    ContinueOnErrorScope& operator=(const ContinueOnErrorScope&) = delete;

private:
    ExecutionContext& ctx_;
    bool saved_;
};

} // namespace

WorkflowExecutor::WorkflowExecutor(std::shared_ptr<ActionRegistry> actions,
                                   std::shared_ptr<WorkflowRegistry> workflows,
                                   std::shared_ptr<Observability> observability,
                                   int32_t background_threads)
    : actions_(std::move(actions)),
      workflows_(std::move(workflows)),
      observability_(std::move(observability)) {
    if (!actions_) {
        actions_ = std::make_shared<ActionRegistry>();
        register_builtin_actions(*actions_);
    }
    if (background_threads > 0) {
        background_ = std::make_unique<WorkerPool>(background_threads, observability_, "workflow-calls");
    }
}

WorkflowExecutor::~WorkflowExecutor() {
    background_.reset();
}

std::unique_ptr<ExecutionContext> WorkflowExecutor::create_context(const Workflow& workflow,
                                                                   const ExecutionOptions& options,
                                                                   const std::string& run_id) {
    auto ctx = std::make_unique<ExecutionContext>();
    ctx->variables = VariableStore(workflow.variables);
    if (options.parameters.is_object()) {
        for (auto it = options.parameters.begin(); it != options.parameters.end(); ++it) {
            ctx->variables.set(it.key(), it.value());
        }
    }
    if (!options.profile.is_null()) {
        ctx->variables.set_profile(options.profile);
    }
    if (!options.session.is_null()) {
        json session = options.session;
        if (session.is_object() && options.page && !session.contains("url")) {
            session["url"] = options.page->url();
        }
        ctx->variables.set_session(std::move(session));
    }

    ctx->page = options.page;
    ctx->observability = observability_;
    ctx->cancellation = options.cancellation ? options.cancellation : std::make_shared<CancellationToken>();
    ctx->log_context.workflow_id = workflow.id;
    ctx->log_context.run_id = run_id;
    ctx->log_context.profile_id = options.profile_id;
    ctx->depth = options.depth;
    ctx->executor = this;

    bool settings_continue = false;
    if (workflow.settings.is_object()) {
        settings_continue = config_bool(workflow.settings, "continueOnError", false);
    }
    ctx->continue_on_error = options.continue_on_error.value_or(settings_continue);

    ctx->variables.set_observability(observability_, ctx->log_context);
    return ctx;
}

Execution WorkflowExecutor::execute(const Workflow& workflow, ExecutionOptions options) {
    Execution execution;
    execution.id = options.run_id.empty() ? generate_id("exec") : options.run_id;
    execution.workflow_id = workflow.id;
    execution.workflow_name = workflow.name;
    execution.total_steps = workflow.steps.size();
    execution.started_at = now_epoch_ms();
    execution.status = ExecutionStatus::running;

    if (!options.cancellation) {
        options.cancellation = std::make_shared<CancellationToken>();
    }
    if (options.timeout_ms > 0) {
        options.cancellation->set_deadline(options.timeout_ms);
    }

    LogContext log_context{workflow.id, execution.id, options.profile_id, "", ""};
    ScopedSpan span;
    if (observability_) {
        span = observability_->start_span("workflow.execute", log_context, {
            {"workflow.name", workflow.name},
            {"workflow.depth", std::to_string(options.depth)}
        });
        observability_->log_info("Workflow execution started", log_context, {
            {"workflow_name", workflow.name},
            {"total_steps", std::to_string(workflow.steps.size())}
        });
    }

    try {
        auto ctx = create_context(workflow, options, execution.id);
        SequenceResult seq = run_sequence(workflow.steps, *ctx, &execution, options.on_progress);

        execution.results = std::move(ctx->results);
        execution.variables = ctx->variables.snapshot();

        if (seq.failed()) {
            execution.status = seq.error_code == ErrorCode::cancelled_by_user
                ? ExecutionStatus::stopped : ExecutionStatus::failed;
            execution.error = seq.error;
            execution.error_code = seq.error_code;
        } else {
            execution.status = ExecutionStatus::completed;
        }
    } catch (const std::exception& e) {
        execution.status = ExecutionStatus::failed;
        execution.error = std::string("Internal error: ") + e.what();
        execution.error_code = ErrorCode::internal_error;
    }

    execution.completed_at = now_epoch_ms();

    if (observability_) {
        double seconds = static_cast<double>(execution.duration_ms()) / 1000.0;
        observability_->record_workflow_execution(execution.status, seconds);
        span.set_attribute("workflow.status", to_string(execution.status));
        if (execution.status == ExecutionStatus::completed) {
            observability_->log_info("Workflow execution completed", log_context, {
                {"duration_ms", std::to_string(execution.duration_ms())},
                {"results", std::to_string(execution.results.size())}
            });
        } else {
            span.set_error(execution.error);
            observability_->log_error("Workflow execution " + std::string(to_string(execution.status)), log_context, {
                {"error", execution.error},
                {"error_code", error_code_name(execution.error_code)}
            });
        }
    }
    return execution;
}

SequenceResult WorkflowExecutor::execute_steps(const std::vector<Step>& steps, ExecutionContext& ctx) {
    return run_sequence(steps, ctx, nullptr, nullptr);
}

SequenceResult WorkflowExecutor::run_sequence(const std::vector<Step>& steps, ExecutionContext& ctx,
                                              Execution* top_level,
                                              const std::function<void(size_t, size_t, const Step&)>& on_progress) {
    SequenceResult seq;

    for (size_t i = 0; i < steps.size(); ++i) {
        const Step& step = steps[i];

        if (ctx.is_cancelled()) {
            seq.outcome = FlowOutcome::failed;
            seq.error_code = ctx.cancellation->reason() == CancellationToken::Reason::timeout
                ? ErrorCode::cancelled_by_timeout : ErrorCode::cancelled_by_user;
            seq.error = ctx.cancellation->message();
            return seq;
        }

        if (on_progress) {
            on_progress(i, steps.size(), step);
        }

        StepResult result = execute_step(step, ctx);
        ctx.results.push_back(result);

        if (!result.success && top_level && !top_level->failed_step) {
            top_level->failed_step = FailedStep{i, step.id, step.name, step.type};
        }

        if (auto* stop = std::get_if<StopSignal>(&result.signal)) {
            if (stop->failed) {
                seq.outcome = FlowOutcome::failed;
                seq.error_code = ErrorCode::stopped_by_step;
                seq.error = stop->message.empty() ? "Workflow stopped with failed status" : stop->message;
            } else {
                seq.outcome = FlowOutcome::stopped;
            }
            return seq;
        }
        if (result.is_break()) {
            seq.outcome = FlowOutcome::break_loop;
            return seq;
        }
        if (result.is_continue()) {
            seq.outcome = FlowOutcome::continue_loop;
            return seq;
        }

        if (!result.success && (!ctx.continue_on_error || is_cancellation(result.error_code))) {
            seq.outcome = FlowOutcome::failed;
            seq.error_code = result.error_code == ErrorCode::none ? ErrorCode::step_failed : result.error_code;
            if (is_cancellation(result.error_code)) {
                seq.error = result.error_message;
            } else {
                seq.error = "Step \"" + step.label() + "\" failed: " +
                            (result.error_message.empty() ? std::string("Unknown error") : result.error_message);
            }
            return seq;
        }
    }

    return seq;
}

StepResult WorkflowExecutor::execute_step(const Step& step, ExecutionContext& ctx) {
    auto start_time = std::chrono::steady_clock::now();

    LogContext step_log = ctx.log_context;
    step_log.step_id = step.id;
    if (observability_) {
        observability_->log_debug("Executing step", step_log, {{"type", step.type}, {"name", step.label()}});
    }

    StepResult result;
    try {
        const std::string& type = step.type;
        if (type == "condition") {
            result = execute_condition(step, ctx);
        } else if (type == "loop-count" || type == "loop-array" || type == "loop-elements" || type == "loop-while") {
            result = execute_loop(step, ctx);
        } else if (type == "try-catch") {
            result = execute_try_catch(step, ctx);
        } else if (type == "call-workflow") {
            result = execute_call_workflow(step, ctx);
        } else if (type == "break" || type == "continue" || type == "stop" || type == "log" || type == "comment") {
            result = execute_signal(step, ctx);
        } else {
            result = execute_action(step, ctx);
        }
    } catch (const std::exception& e) {
        result = StepResult::error_result(step, ErrorCode::internal_error, e.what());
    }

    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();

    if (observability_) {
        double seconds = static_cast<double>(result.duration_ms) / 1000.0;
        observability_->record_step_execution(step.type, result.success, seconds);
        if (!result.success) {
            observability_->record_step_error(step.type, result.error_code);
            observability_->log_warn("Step failed", step_log, {
                {"type", step.type},
                {"error", result.error_message},
                {"error_code", error_code_name(result.error_code)}
            });
        }
    }
    return result;
}

StepResult WorkflowExecutor::execute_action(const Step& step, ExecutionContext& ctx) {
    auto action = actions_->get_action(step.type);
    if (!action) {
        return StepResult::error_result(step, ErrorCode::unknown_action, "Unknown action type: " + step.type);
    }

    json config = ctx.variables.interpolate_value(step.config);

    caf::expected<ActionResult> outcome = caf::make_error(caf::sec::runtime_error, "Action did not run");
    try {
        outcome = action->execute(ctx, config);
    } catch (const std::exception& e) {
        return StepResult::error_result(step, ErrorCode::action_failed, e.what());
    }

    if (!outcome) {
        std::string message = error_message(outcome.error());
        // require_page() is the only way an action fails to run for lack of a session
        ErrorCode code = ctx.page ? ErrorCode::action_failed : ErrorCode::session_unavailable;
        return StepResult::error_result(step, code, message);
    }

    if (!outcome->success) {
        ErrorCode code = outcome->error_code == ErrorCode::none ? ErrorCode::action_failed : outcome->error_code;
        StepResult result = StepResult::error_result(step, code, outcome->error);
        for (auto it = outcome->data.begin(); it != outcome->data.end(); ++it) {
            result.data[it.key()] = it.value();
        }
        return result;
    }

    json data = outcome->data.is_object() ? outcome->data : json{{"value", outcome->data}};
    data["success"] = true;
    return StepResult::success_result(step, std::move(data));
}

bool WorkflowExecutor::evaluate_condition(const Step& step, ExecutionContext& ctx) {
    json config = ctx.variables.interpolate_value(step.config);
    std::string condition_type = config_string(config, "conditionType");
    bool result = false;

    if (condition_type == "element-exists") {
        if (ctx.page) {
            auto count = ctx.page->count(config_string(config, "selector"));
            result = count && *count > 0;
        }
    } else if (condition_type == "element-visible") {
        if (ctx.page) {
            auto visible = ctx.page->is_visible(config_string(config, "selector"));
            result = visible && *visible;
        }
    } else if (condition_type == "text-contains") {
        if (ctx.page) {
            auto content = ctx.page->text_content(config_string(config, "selector", "body"));
            result = content && content->find(config_string(config, "text")) != std::string::npos;
        }
    } else if (condition_type == "url-contains") {
        if (ctx.page) {
            result = ctx.page->url().find(config_string(config, "urlPattern")) != std::string::npos;
        }
    } else if (condition_type == "compare") {
        result = ExpressionEvaluator::compare(json(config_string(config, "left")),
                                              config_string(config, "operator", "=="),
                                              json(config_string(config, "right")));
    } else if (condition_type == "expression") {
        // Raw text: the store interpolates and evaluates in one pass
        result = ctx.variables.evaluate_condition(config_string(step.config, "expression"));
    }

    if (config_bool(config, "negate", false)) {
        result = !result;
    }
    return result;
}

StepResult WorkflowExecutor::execute_condition(const Step& step, ExecutionContext& ctx) {
    bool met = evaluate_condition(step, ctx);
    std::string branch = met ? "then" : "else";
    const std::vector<Step>& branch_steps = met ? step.then_steps : step.else_steps;
    ctx.log("debug", "Condition evaluated", {{"step_id", step.id}, {"branch", branch}});

    json data = {{"conditionResult", met}, {"branch", branch}};
    StepSignal signal = ConditionBranch{met, branch};
    if (branch_steps.empty()) {
        return StepResult::success_result(step, std::move(data), std::move(signal));
    }

    SequenceResult seq = execute_steps(branch_steps, ctx);
    if (seq.failed()) {
        return propagate_failure(step, seq, data);
    }
    signal = signal_of(seq, data, signal);
    return StepResult::success_result(step, std::move(data), std::move(signal));
}

StepResult WorkflowExecutor::execute_loop(const Step& step, ExecutionContext& ctx) {
    json config = ctx.variables.interpolate_value(step.config);
    std::string loop_type = step.type.substr(std::string("loop-").size());

    int64_t bound = 0;
    std::string variable_name;
    json items = json::array();
    std::string selector;
    std::string while_condition;

    if (loop_type == "count") {
        bound = std::max<int64_t>(0, config_int(config, "count").value_or(0));
        variable_name = config_string(config, "variableName", "i");
        if (auto max_iterations = config_int(config, "maxIterations")) {
            bound = std::min(bound, std::max<int64_t>(0, *max_iterations));
        }
    } else if (loop_type == "array") {
        const json raw = config.contains("array") ? config.at("array") : json();
        auto resolved = resolve_loop_items(raw, ctx.variables);
        if (!resolved) {
            return StepResult::error_result(step, ErrorCode::invalid_format, error_message(resolved.error()));
        }
        items = std::move(*resolved);
        bound = static_cast<int64_t>(items.size());
        variable_name = config_string(config, "variableName", "item");
        if (auto max_items = config_int(config, "maxItems")) {
            bound = std::min(bound, std::max<int64_t>(0, *max_items));
        }
    } else if (loop_type == "elements") {
        if (!ctx.page) {
            return StepResult::error_result(step, ErrorCode::session_unavailable, "loop-elements requires a page");
        }
        selector = config_string(config, "selector");
        auto count = ctx.page->count(selector);
        if (!count) {
            return StepResult::error_result(step, ErrorCode::action_failed, error_message(count.error()));
        }
        bound = *count;
        variable_name = config_string(config, "variableName", "element");
        if (auto max_items = config_int(config, "maxItems")) {
            bound = std::min(bound, std::max<int64_t>(0, *max_items));
        }
    } else {
        bound = config_int(config, "maxIterations").value_or(default_while_iterations);
        variable_name = config_string(config, "variableName", "iteration");
        // Re-evaluated every iteration, so taken before interpolation
        while_condition = config_string(step.config, "condition");
    }
    bound = std::min(bound, max_loop_iterations);

    int64_t iterations = 0;
    json data = json::object();
    for (int64_t i = 0; i < bound; ++i) {
        if (ctx.is_cancelled()) {
            SequenceResult cancelled;
            cancelled.outcome = FlowOutcome::failed;
            cancelled.error_code = ctx.cancellation->reason() == CancellationToken::Reason::timeout
                ? ErrorCode::cancelled_by_timeout : ErrorCode::cancelled_by_user;
            cancelled.error = ctx.cancellation->message();
            return propagate_failure(step, cancelled, {{"loopType", loop_type}, {"iterations", iterations}});
        }
        if (loop_type == "while" && !ctx.variables.evaluate_condition(while_condition)) {
            ctx.log("debug", "While condition false, exiting loop", {{"step_id", step.id}});
            break;
        }

        json loop_context = {
            {"index", i},
            {"count", i + 1},
            {"first", i == 0},
            {"last", i == bound - 1}
        };
        json value;
        if (loop_type == "array") {
            value = items[static_cast<size_t>(i)];
            loop_context["item"] = value;
        } else if (loop_type == "elements") {
            value = {{"index", i}, {"selector", selector + " >> nth=" + std::to_string(i)}};
        } else {
            value = i;
        }

        ++iterations;
        SequenceResult seq;
        {
            LoopScope scope(ctx.variables, std::move(loop_context), variable_name, std::move(value));
            seq = execute_steps(step.body, ctx);
        }

        if (seq.outcome == FlowOutcome::break_loop) {
            ctx.log("debug", "Loop break", {{"step_id", step.id}, {"iteration", std::to_string(i)}});
            break;
        }
        if (seq.outcome == FlowOutcome::continue_loop) {
            continue;
        }
        if (seq.outcome == FlowOutcome::stopped) {
            data = {{"loopType", loop_type}, {"iterations", iterations}, {"stop", true}};
            return StepResult::success_result(step, std::move(data), StopSignal{false, ""});
        }
        if (seq.failed()) {
            return propagate_failure(step, seq, {{"loopType", loop_type}, {"iterations", iterations}});
        }
    }

    data = {{"loopType", loop_type}, {"iterations", iterations}};
    return StepResult::success_result(step, std::move(data), LoopDescriptor{loop_type, iterations});
}

StepResult WorkflowExecutor::execute_try_catch(const Step& step, ExecutionContext& ctx) {
    json config = ctx.variables.interpolate_value(step.config);
    std::string error_variable = config_string(config, "errorVariable", "error");
    bool continue_after_catch = config_bool(config, "continueOnError", true);

    SequenceResult try_seq;
    {
        ContinueOnErrorScope scope(ctx, false);
        try_seq = execute_steps(step.try_steps, ctx);
    }

    if (!try_seq.failed() || is_cancellation(try_seq.error_code)) {
        SequenceResult finally_seq = execute_steps(step.finally_steps, ctx);
        if (try_seq.failed()) {
            return propagate_failure(step, try_seq);
        }
        if (finally_seq.failed()) {
            return propagate_failure(step, finally_seq);
        }
        json data = {{"caught", false}};
        StepSignal signal = signal_of(try_seq, data, NormalOutcome{});
        signal = signal_of(finally_seq, data, signal);
        return StepResult::success_result(step, std::move(data), std::move(signal));
    }

    ctx.log("info", "Caught error", {{"step_id", step.id}, {"error", try_seq.error}});
    ctx.variables.set(error_variable, {
        {"message", try_seq.error},
        {"code", error_code_name(try_seq.error_code)},
        {"stack", "at " + step.label()}
    });

    SequenceResult catch_seq = execute_steps(step.catch_steps, ctx);
    SequenceResult finally_seq = execute_steps(step.finally_steps, ctx);

    if (catch_seq.failed()) {
        return propagate_failure(step, catch_seq, {{"caught", true}});
    }
    if (finally_seq.failed()) {
        return propagate_failure(step, finally_seq, {{"caught", true}});
    }
    if (!continue_after_catch) {
        return propagate_failure(step, try_seq, {{"caught", true}});
    }

    json data = {{"caught", true}, {"error", try_seq.error}};
    StepSignal signal = signal_of(catch_seq, data, NormalOutcome{});
    signal = signal_of(finally_seq, data, signal);
    return StepResult::success_result(step, std::move(data), std::move(signal));
}

StepResult WorkflowExecutor::execute_call_workflow(const Step& step, ExecutionContext& ctx) {
    json config = ctx.variables.interpolate_value(step.config);
    std::string workflow_id = config_string(config, "workflowId");
    bool wait = config_bool(config, "waitForCompletion", true);

    if (workflow_id.empty()) {
        return StepResult::error_result(step, ErrorCode::missing_required_field, "Missing required config: workflowId");
    }
    if (ctx.depth + 1 > max_call_depth) {
        return StepResult::error_result(step, ErrorCode::call_depth_exceeded,
                                        "Maximum workflow call depth (" + std::to_string(max_call_depth) +
                                        ") exceeded calling " + workflow_id);
    }

    std::optional<Workflow> target;
    if (workflows_) {
        target = workflows_->get(workflow_id);
    }
    if (!target) {
        return StepResult::error_result(step, ErrorCode::workflow_not_found, "Workflow not found: " + workflow_id);
    }

    ExecutionOptions options;
    options.parameters = config.contains("parameters") && config.at("parameters").is_object()
        ? config.at("parameters") : json::object();
    options.profile = ctx.variables.profile();
    options.session = ctx.variables.session();
    options.page = ctx.page;
    options.cancellation = ctx.cancellation;
    options.profile_id = ctx.log_context.profile_id;
    options.depth = ctx.depth + 1;
    options.run_id = generate_id("exec");

    if (!wait) {
        if (!background_) {
            return StepResult::error_result(step, ErrorCode::internal_error,
                                            "No background worker pool for asynchronous workflow calls");
        }
        std::string run_id = options.run_id;
        Workflow workflow = *target;
        background_->submit([this, workflow, options]() {
            Execution child = execute(workflow, options);
            if (observability_ && child.status != ExecutionStatus::completed) {
                observability_->log_warn("Asynchronous workflow call did not complete",
                                         {workflow.id, child.id, options.profile_id, "", ""},
                                         {{"status", to_string(child.status)}, {"error", child.error}});
            }
        });
        return StepResult::success_result(step, {{"workflowId", workflow_id}, {"executionId", run_id}, {"async", true}});
    }

    Execution child = execute(*target, options);
    json data = {
        {"workflowId", workflow_id},
        {"executionId", child.id},
        {"status", to_string(child.status)},
        {"variables", child.variables}
    };
    if (child.status != ExecutionStatus::completed) {
        ErrorCode code = child.error_code == ErrorCode::none ? ErrorCode::step_failed : child.error_code;
        SequenceResult failed;
        failed.outcome = FlowOutcome::failed;
        failed.error_code = code;
        failed.error = is_cancellation(code) ? child.error : "Workflow " + workflow_id + " failed: " + child.error;
        return propagate_failure(step, failed, data);
    }
    return StepResult::success_result(step, std::move(data));
}

StepResult WorkflowExecutor::execute_signal(const Step& step, ExecutionContext& ctx) {
    const std::string& type = step.type;
    if (type == "break") {
        return StepResult::success_result(step, {{"break", true}}, BreakSignal{});
    }
    if (type == "continue") {
        return StepResult::success_result(step, {{"continue", true}}, ContinueSignal{});
    }

    json config = ctx.variables.interpolate_value(step.config);
    if (type == "stop") {
        std::string status = config_string(config, "status", "success");
        std::string message = config_string(config, "message");
        bool failed = status == "failed";
        json data = {{"stop", true}, {"status", status}, {"message", message}};
        StepResult result = StepResult::success_result(step, std::move(data), StopSignal{failed, message});
        return result;
    }
    if (type == "log") {
        std::string level = config_string(config, "level", "info");
        std::string message = config_string(config, "message");
        ctx.log(level, message, {{"step_id", step.id}});
        return StepResult::success_result(step, {{"logged", message}, {"level", level}});
    }
    return StepResult::success_result(step, {{"comment", config_string(config, "text")}});
}

} // namespace engine
} // namespace fleetrun
