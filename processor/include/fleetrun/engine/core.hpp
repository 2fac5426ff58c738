#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <memory>
#include <chrono>
#include <variant>
#include <optional>
#include <cstdint>
#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/sec.hpp>
#include <caf/message.hpp>
#include <nlohmann/json.hpp>

namespace fleetrun {
namespace engine {

using json = nlohmann::json;

// Machine-readable error codes for programmatic error handling
enum class ErrorCode {
    none = 0,
    // Validation errors (1xxx)
    invalid_workflow = 1001,
    missing_required_field = 1002,
    invalid_format = 1003,
    // Execution errors (2xxx)
    action_failed = 2001,
    unknown_action = 2002,
    workflow_not_found = 2003,
    session_unavailable = 2004,
    step_failed = 2005,
    stopped_by_step = 2006,
    // Network errors (3xxx)
    network_error = 3001,
    connection_timeout = 3002,
    http_error = 3003,
    // System errors (4xxx)
    internal_error = 4001,
    call_depth_exceeded = 4002,
    // Cancellation (5xxx)
    cancelled_by_user = 5001,
    cancelled_by_timeout = 5002
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::none: return "none";
        case ErrorCode::invalid_workflow: return "invalid_workflow";
        case ErrorCode::missing_required_field: return "missing_required_field";
        case ErrorCode::invalid_format: return "invalid_format";
        case ErrorCode::action_failed: return "action_failed";
        case ErrorCode::unknown_action: return "unknown_action";
        case ErrorCode::workflow_not_found: return "workflow_not_found";
        case ErrorCode::session_unavailable: return "session_unavailable";
        case ErrorCode::step_failed: return "step_failed";
        case ErrorCode::stopped_by_step: return "stopped_by_step";
        case ErrorCode::network_error: return "network_error";
        case ErrorCode::connection_timeout: return "connection_timeout";
        case ErrorCode::http_error: return "http_error";
        case ErrorCode::internal_error: return "internal_error";
        case ErrorCode::call_depth_exceeded: return "call_depth_exceeded";
        case ErrorCode::cancelled_by_user: return "cancelled_by_user";
        case ErrorCode::cancelled_by_timeout: return "cancelled_by_timeout";
    }
    return "unknown";
}

/**
 * Extract the human-readable text from an error created with
 * caf::make_error(code, "message"). Falls back to CAF's rendering.
 */
inline std::string error_message(const caf::error& err) {
    const auto& ctx = err.context();
    if (ctx.match_elements<std::string>()) {
        return ctx.get_as<std::string>(0);
    }
    return caf::to_string(err);
}

inline int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ---------------------------------------------------------------------------
// Workflow definition
// ---------------------------------------------------------------------------

struct Step {
    std::string id;
    std::string type;
    std::string name;
    json config = json::object();

    // Children, by step type
    std::vector<Step> then_steps;     // condition
    std::vector<Step> else_steps;     // condition
    std::vector<Step> body;           // loops
    std::vector<Step> try_steps;      // try-catch
    std::vector<Step> catch_steps;    // try-catch
    std::vector<Step> finally_steps;  // try-catch

    // Display label used in error messages
    const std::string& label() const { return name.empty() ? id : name; }
};

struct Workflow {
    std::string id;
    std::string name;
    std::string description;
    std::vector<Step> steps;
    json variables = json::object();
    json settings = json::object();
};

void to_json(json& j, const Step& step);
void from_json(const json& j, Step& step);
void to_json(json& j, const Workflow& workflow);
void from_json(const json& j, Workflow& workflow);

// ---------------------------------------------------------------------------
// Step results and control signals
// ---------------------------------------------------------------------------

// Ordinary leaf result, no control flow payload
struct NormalOutcome {};

struct BreakSignal {};

struct ContinueSignal {};

struct StopSignal {
    bool failed = false;
    std::string message;
};

struct ConditionBranch {
    bool condition_result = false;
    std::string branch;  // "then" | "else"
};

struct LoopDescriptor {
    std::string loop_type;
    int64_t iterations = 0;
};

using StepSignal = std::variant<NormalOutcome, BreakSignal, ContinueSignal,
                                StopSignal, ConditionBranch, LoopDescriptor>;

struct StepResult {
    std::string step_id;
    std::string step_type;
    bool success = true;
    int64_t timestamp = 0;    // epoch ms
    int64_t duration_ms = 0;
    json data = json::object();
    StepSignal signal = NormalOutcome{};
    ErrorCode error_code = ErrorCode::none;
    std::string error_message;

    bool is_break() const { return std::holds_alternative<BreakSignal>(signal); }
    bool is_continue() const { return std::holds_alternative<ContinueSignal>(signal); }
    bool is_stop() const { return std::holds_alternative<StopSignal>(signal); }

    static StepResult success_result(const Step& step, json data = json::object(),
                                     StepSignal signal = NormalOutcome{}) {
        StepResult result;
        result.step_id = step.id;
        result.step_type = step.type;
        result.success = true;
        result.timestamp = now_epoch_ms();
        result.data = std::move(data);
        result.signal = std::move(signal);
        return result;
    }

    static StepResult error_result(const Step& step, ErrorCode code, const std::string& message) {
        StepResult result;
        result.step_id = step.id;
        result.step_type = step.type;
        result.success = false;
        result.timestamp = now_epoch_ms();
        result.error_code = code;
        result.error_message = message;
        result.data = json{{"error", message}};
        return result;
    }
};

void to_json(json& j, const StepResult& result);

// ---------------------------------------------------------------------------
// Execution
// ---------------------------------------------------------------------------

enum class ExecutionStatus {
    pending,
    running,
    completed,
    failed,
    stopped
};

const char* to_string(ExecutionStatus status);

struct FailedStep {
    size_t index = 0;
    std::string id;
    std::string name;
    std::string type;
};

struct Execution {
    std::string id;
    std::string workflow_id;
    std::string workflow_name;
    ExecutionStatus status = ExecutionStatus::pending;
    int64_t started_at = 0;
    int64_t completed_at = 0;
    std::vector<StepResult> results;
    std::string error;
    ErrorCode error_code = ErrorCode::none;
    std::optional<FailedStep> failed_step;
    size_t total_steps = 0;
    json variables = json::object();

    bool is_terminal() const {
        return status == ExecutionStatus::completed ||
               status == ExecutionStatus::failed ||
               status == ExecutionStatus::stopped;
    }
    int64_t duration_ms() const { return completed_at > 0 ? completed_at - started_at : 0; }
};

void to_json(json& j, const FailedStep& step);
void to_json(json& j, const Execution& execution);

// Generates ids of the form "<prefix>-<epoch ms>-<random hex>"
std::string generate_id(const std::string& prefix);

} // namespace engine
} // namespace fleetrun
