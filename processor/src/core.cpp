#include "fleetrun/engine/core.hpp"
#include <random>
#include <sstream>
#include <iomanip>

namespace fleetrun {
namespace engine {

namespace {

std::vector<Step> steps_from(const json& j, const char* key) {
    std::vector<Step> steps;
    auto it = j.find(key);
    if (it != j.end() && it->is_array()) {
        steps = it->get<std::vector<Step>>();
    }
    return steps;
}

void put_steps(json& j, const char* key, const std::vector<Step>& steps) {
    if (!steps.empty()) {
        j[key] = steps;
    }
}

} // namespace

void to_json(json& j, const Step& step) {
    j = json{{"id", step.id}, {"type", step.type}, {"config", step.config}};
    if (!step.name.empty()) {
        j["name"] = step.name;
    }
    put_steps(j, "then", step.then_steps);
    put_steps(j, "else", step.else_steps);
    put_steps(j, "body", step.body);
    put_steps(j, "try", step.try_steps);
    put_steps(j, "catch", step.catch_steps);
    put_steps(j, "finally", step.finally_steps);
}

void from_json(const json& j, Step& step) {
    step.id = j.value("id", "");
    step.type = j.value("type", "");
    step.name = j.value("name", "");
    step.config = j.contains("config") && j.at("config").is_object() ? j.at("config") : json::object();
    step.then_steps = steps_from(j, "then");
    step.else_steps = steps_from(j, "else");
    step.body = steps_from(j, "body");
    step.try_steps = steps_from(j, "try");
    step.catch_steps = steps_from(j, "catch");
    step.finally_steps = steps_from(j, "finally");
}

void to_json(json& j, const Workflow& workflow) {
    j = json{
        {"id", workflow.id},
        {"name", workflow.name},
        {"description", workflow.description},
        {"steps", workflow.steps},
        {"variables", workflow.variables},
        {"settings", workflow.settings}
    };
}

void from_json(const json& j, Workflow& workflow) {
    workflow.id = j.value("id", "");
    workflow.name = j.value("name", "");
    workflow.description = j.value("description", "");
    workflow.steps = steps_from(j, "steps");
    workflow.variables = j.contains("variables") && j.at("variables").is_object()
        ? j.at("variables") : json::object();
    workflow.settings = j.contains("settings") && j.at("settings").is_object()
        ? j.at("settings") : json::object();
}

void to_json(json& j, const StepResult& result) {
    j = json{
        {"stepId", result.step_id},
        {"type", result.step_type},
        {"success", result.success},
        {"timestamp", result.timestamp},
        {"duration", result.duration_ms},
        {"data", result.data}
    };
    if (!result.success) {
        j["error"] = result.error_message;
        j["errorCode"] = error_code_name(result.error_code);
    }
}

const char* to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::pending: return "pending";
        case ExecutionStatus::running: return "running";
        case ExecutionStatus::completed: return "completed";
        case ExecutionStatus::failed: return "failed";
        case ExecutionStatus::stopped: return "stopped";
    }
    return "unknown";
}

void to_json(json& j, const FailedStep& step) {
    j = json{{"index", step.index}, {"id", step.id}, {"name", step.name}, {"type", step.type}};
}

void to_json(json& j, const Execution& execution) {
    j = json{
        {"id", execution.id},
        {"workflowId", execution.workflow_id},
        {"workflowName", execution.workflow_name},
        {"status", to_string(execution.status)},
        {"startedAt", execution.started_at},
        {"completedAt", execution.completed_at > 0 ? json(execution.completed_at) : json(nullptr)},
        {"duration", execution.duration_ms()},
        {"results", execution.results},
        {"error", execution.error.empty() ? json(nullptr) : json(execution.error)}
    };
    if (execution.failed_step) {
        j["failedStep"] = *execution.failed_step;
    }
}

std::string generate_id(const std::string& prefix) {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << prefix << "-" << now_epoch_ms() << "-"
        << std::hex << std::setw(8) << std::setfill('0') << (rng() & 0xffffffffULL);
    return oss.str();
}

} // namespace engine
} // namespace fleetrun
