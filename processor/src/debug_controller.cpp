#include "fleetrun/engine/debug_controller.hpp"

namespace fleetrun {
namespace engine {

const char* to_string(DebugStatus status) {
    switch (status) {
        case DebugStatus::paused: return "paused";
        case DebugStatus::running: return "running";
        case DebugStatus::completed: return "completed";
        case DebugStatus::failed: return "failed";
        case DebugStatus::stopped: return "stopped";
    }
    return "unknown";
}

void to_json(json& j, const DebugState& state) {
    j = json{
        {"id", state.id},
        {"workflowId", state.workflow_id},
        {"workflowName", state.workflow_name},
        {"status", to_string(state.status)},
        {"currentStepIndex", state.current_step_index},
        {"totalSteps", state.total_steps},
        {"nextStep", state.next_step ? json(*state.next_step) : json(nullptr)},
        {"breakpoints", state.breakpoints},
        {"variables", state.variables},
        {"results", state.results},
        {"startedAt", state.started_at}
    };
    if (state.last_result) {
        j["stepResult"] = *state.last_result;
    }
    j["error"] = state.error.empty() ? json(nullptr) : json(state.error);
}

void to_json(json& j, const DebugSummary& summary) {
    j = json{
        {"id", summary.id},
        {"workflowId", summary.workflow_id},
        {"workflowName", summary.workflow_name},
        {"status", to_string(summary.status)},
        {"currentStepIndex", summary.current_step_index},
        {"totalSteps", summary.total_steps},
        {"startedAt", summary.started_at}
    };
}

DebugController::DebugController(std::shared_ptr<WorkflowExecutor> executor)
    : executor_(std::move(executor)) {}

caf::expected<DebugState> DebugController::start(const Workflow& workflow, ExecutionOptions options,
                                                 const std::vector<std::string>& breakpoints) {
    if (!executor_) {
        return caf::make_error(caf::sec::runtime_error, "Debug controller has no executor");
    }

    auto session = std::make_shared<DebugSession>();
    session->id = generate_id("debug");
    session->workflow = workflow;
    session->breakpoints.insert(breakpoints.begin(), breakpoints.end());
    session->started_at = now_epoch_ms();
    if (workflow.steps.empty()) {
        session->status = DebugStatus::completed;
    }

    // Steps run one at a time, so a run deadline does not apply
    options.timeout_ms = 0;
    session->ctx = executor_->create_context(workflow, options, session->id);

    DebugState state = snapshot_locked(*session);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_[session->id] = session;
    }

    if (auto obs = executor_->observability()) {
        obs->log_info("Debug session started", session->ctx->log_context, {
            {"total_steps", std::to_string(workflow.steps.size())},
            {"breakpoints", std::to_string(breakpoints.size())}
        });
    }
    return state;
}

caf::expected<std::shared_ptr<DebugController::DebugSession>>
DebugController::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return caf::make_error(caf::sec::invalid_argument, "Debug session not found: " + session_id);
    }
    return it->second;
}

void DebugController::step_locked(DebugSession& session) {
    const auto& steps = session.workflow.steps;
    if (session.current_step_index >= steps.size()) {
        session.status = DebugStatus::completed;
        return;
    }

    session.status = DebugStatus::running;
    const Step& step = steps[session.current_step_index];

    StepResult result;
    if (session.ctx->is_cancelled()) {
        result = StepResult::error_result(step, ErrorCode::cancelled_by_user, session.ctx->cancellation->message());
    } else {
        result = executor_->execute_step(step, *session.ctx);
    }
    session.ctx->results.push_back(result);
    session.last_result = result;
    ++session.current_step_index;

    if (auto* stop = std::get_if<StopSignal>(&result.signal)) {
        if (stop->failed) {
            session.status = DebugStatus::failed;
            session.error = stop->message.empty() ? "Workflow stopped with failed status" : stop->message;
        } else {
            session.status = DebugStatus::completed;
        }
        return;
    }

    if (!result.success && !session.ctx->continue_on_error) {
        session.status = DebugStatus::failed;
        session.error = "Step \"" + step.label() + "\" failed: " +
                        (result.error_message.empty() ? std::string("Unknown error") : result.error_message);
        return;
    }

    session.status = session.current_step_index >= steps.size() ? DebugStatus::completed : DebugStatus::paused;
}

caf::expected<DebugState> DebugController::step(const std::string& session_id) {
    auto session = find(session_id);
    if (!session) {
        return session.error();
    }

    DebugSession& s = **session;
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.status == DebugStatus::completed || s.status == DebugStatus::failed || s.status == DebugStatus::stopped) {
        return caf::make_error(caf::sec::runtime_error, "Debug session already finished: " + session_id);
    }

    step_locked(s);

    if (auto obs = executor_->observability()) {
        obs->log_debug("Debug step executed", s.ctx->log_context, {
            {"status", to_string(s.status)},
            {"current_step_index", std::to_string(s.current_step_index)}
        });
    }
    return snapshot_locked(s);
}

caf::expected<DebugState> DebugController::continue_run(const std::string& session_id) {
    auto session = find(session_id);
    if (!session) {
        return session.error();
    }

    DebugSession& s = **session;
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.status == DebugStatus::completed || s.status == DebugStatus::failed || s.status == DebugStatus::stopped) {
        return caf::make_error(caf::sec::runtime_error, "Debug session already finished: " + session_id);
    }

    const auto& steps = s.workflow.steps;
    bool resumed = true;
    while (s.status == DebugStatus::paused || s.status == DebugStatus::running) {
        if (s.current_step_index >= steps.size()) {
            s.status = DebugStatus::completed;
            break;
        }
        const std::string& step_id = steps[s.current_step_index].id;
        if (!resumed && s.breakpoints.count(step_id) > 0) {
            s.status = DebugStatus::paused;
            break;
        }
        resumed = false;
        step_locked(s);
    }

    if (auto obs = executor_->observability()) {
        obs->log_debug("Debug continue finished", s.ctx->log_context, {
            {"status", to_string(s.status)},
            {"current_step_index", std::to_string(s.current_step_index)}
        });
    }
    return snapshot_locked(s);
}

caf::expected<DebugState> DebugController::set_breakpoint(const std::string& session_id,
                                                          const std::string& step_id, bool enabled) {
    auto session = find(session_id);
    if (!session) {
        return session.error();
    }

    DebugSession& s = **session;
    std::lock_guard<std::mutex> lock(s.mutex);
    if (enabled) {
        s.breakpoints.insert(step_id);
    } else {
        s.breakpoints.erase(step_id);
    }
    return snapshot_locked(s);
}

caf::expected<DebugState> DebugController::set_variable(const std::string& session_id,
                                                        const std::string& name, json value) {
    if (name.empty()) {
        return caf::make_error(caf::sec::invalid_argument, "Variable name is required");
    }
    auto session = find(session_id);
    if (!session) {
        return session.error();
    }

    DebugSession& s = **session;
    std::lock_guard<std::mutex> lock(s.mutex);
    s.ctx->variables.set(name, std::move(value));
    return snapshot_locked(s);
}

caf::expected<DebugState> DebugController::state(const std::string& session_id) const {
    auto session = find(session_id);
    if (!session) {
        return session.error();
    }

    const DebugSession& s = **session;
    std::lock_guard<std::mutex> lock(s.mutex);
    return snapshot_locked(s);
}

caf::expected<DebugState> DebugController::stop(const std::string& session_id) {
    auto session = find(session_id);
    if (!session) {
        return session.error();
    }

    DebugSession& s = **session;
    // Token first: a step in flight holds the session mutex
    s.ctx->cancellation->cancel(CancellationToken::Reason::user, "Debug session stopped");

    std::lock_guard<std::mutex> lock(s.mutex);
    s.status = DebugStatus::stopped;

    if (auto obs = executor_->observability()) {
        obs->log_info("Debug session stopped", s.ctx->log_context, {
            {"current_step_index", std::to_string(s.current_step_index)}
        });
    }
    return snapshot_locked(s);
}

std::vector<DebugSummary> DebugController::list() const {
    std::vector<std::shared_ptr<DebugSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : sessions_) {
            sessions.push_back(entry.second);
        }
    }

    std::vector<DebugSummary> result;
    for (const auto& session : sessions) {
        std::lock_guard<std::mutex> lock(session->mutex);
        DebugSummary summary;
        summary.id = session->id;
        summary.workflow_id = session->workflow.id;
        summary.workflow_name = session->workflow.name;
        summary.status = session->status;
        summary.current_step_index = session->current_step_index;
        summary.total_steps = session->workflow.steps.size();
        summary.started_at = session->started_at;
        result.push_back(std::move(summary));
    }
    return result;
}

bool DebugController::dispose(const std::string& session_id) {
    std::shared_ptr<DebugSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        session = it->second;
        sessions_.erase(it);
    }
    session->ctx->cancellation->cancel(CancellationToken::Reason::user, "Debug session disposed");
    return true;
}

size_t DebugController::dispose_all() {
    std::map<std::string, std::shared_ptr<DebugSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    for (auto& entry : sessions) {
        entry.second->ctx->cancellation->cancel(CancellationToken::Reason::user, "Debug session disposed");
    }
    return sessions.size();
}

DebugState DebugController::snapshot_locked(const DebugSession& session) {
    DebugState state;
    state.id = session.id;
    state.workflow_id = session.workflow.id;
    state.workflow_name = session.workflow.name;
    state.status = session.status;
    state.current_step_index = session.current_step_index;
    state.total_steps = session.workflow.steps.size();
    if (session.current_step_index < session.workflow.steps.size() &&
        session.status != DebugStatus::completed && session.status != DebugStatus::failed &&
        session.status != DebugStatus::stopped) {
        state.next_step = session.workflow.steps[session.current_step_index];
    }
    state.breakpoints.assign(session.breakpoints.begin(), session.breakpoints.end());
    state.variables = session.ctx->variables.snapshot();
    state.results = session.ctx->results;
    state.last_result = session.last_result;
    state.error = session.error;
    state.started_at = session.started_at;
    return state;
}

} // namespace engine
} // namespace fleetrun
