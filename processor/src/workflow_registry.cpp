#include "fleetrun/engine/workflow_registry.hpp"
#include <set>

namespace fleetrun {
namespace engine {

namespace {

void validate_steps(const std::vector<Step>& steps, const std::string& path,
                    std::set<std::string>& seen_ids, const ActionRegistry* actions,
                    ValidationReport& report) {
    for (size_t i = 0; i < steps.size(); ++i) {
        const Step& step = steps[i];
        std::string where = path + "[" + std::to_string(i) + "]";

        if (step.id.empty()) {
            report.errors.push_back(where + ": step id is required");
        } else if (!seen_ids.insert(step.id).second) {
            report.errors.push_back(where + ": duplicate step id '" + step.id + "'");
        }

        if (step.type.empty()) {
            report.errors.push_back(where + ": step type is required");
        } else if (actions && !is_control_step(step.type) && !actions->has_action(step.type)) {
            report.warnings.push_back(where + ": unknown action type '" + step.type + "'");
        }

        validate_steps(step.then_steps, where + ".then", seen_ids, actions, report);
        validate_steps(step.else_steps, where + ".else", seen_ids, actions, report);
        validate_steps(step.body, where + ".body", seen_ids, actions, report);
        validate_steps(step.try_steps, where + ".try", seen_ids, actions, report);
        validate_steps(step.catch_steps, where + ".catch", seen_ids, actions, report);
        validate_steps(step.finally_steps, where + ".finally", seen_ids, actions, report);
    }
}

} // namespace

void to_json(json& j, const ValidationReport& report) {
    j = json{{"valid", report.valid()}, {"errors", report.errors}, {"warnings", report.warnings}};
}

ValidationReport validate_workflow(const Workflow& workflow, const ActionRegistry* actions) {
    ValidationReport report;
    if (workflow.id.empty()) {
        report.errors.push_back("Workflow id is required");
    }
    if (workflow.name.empty()) {
        report.errors.push_back("Workflow name is required");
    }

    std::set<std::string> seen_ids;
    validate_steps(workflow.steps, "steps", seen_ids, actions, report);
    return report;
}

caf::expected<ValidationReport> WorkflowRegistry::add_loaded(const Workflow& workflow) {
    auto report = validate_workflow(workflow, actions_.get());
    if (!report.valid()) {
        return caf::make_error(caf::sec::invalid_argument,
                               "Invalid workflow " + workflow.id + ": " + report.errors.front());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    workflows_[workflow.id] = workflow;
    return report;
}

caf::expected<ValidationReport> WorkflowRegistry::register_workflow(const Workflow& workflow) {
    auto report = validate_workflow(workflow, actions_.get());
    if (!report.valid()) {
        return caf::make_error(caf::sec::invalid_argument,
                               "Invalid workflow " + workflow.id + ": " + report.errors.front());
    }

    if (store_) {
        auto saved = store_->save_workflow(workflow);
        if (!saved) {
            return saved.error();
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    workflows_[workflow.id] = workflow;
    return report;
}

std::optional<Workflow> WorkflowRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workflows_.find(id);
    if (it == workflows_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool WorkflowRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workflows_.count(id) > 0;
}

std::vector<Workflow> WorkflowRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Workflow> result;
    result.reserve(workflows_.size());
    for (const auto& entry : workflows_) {
        result.push_back(entry.second);
    }
    return result;
}

caf::expected<void> WorkflowRegistry::remove(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (workflows_.erase(id) == 0) {
            return caf::make_error(caf::sec::invalid_argument, "Workflow not found: " + id);
        }
    }
    if (store_) {
        return store_->delete_workflow(id);
    }
    return caf::unit;
}

caf::expected<size_t> WorkflowRegistry::load_from_store(std::vector<std::string>* rejected) {
    if (!store_) {
        return caf::make_error(caf::sec::runtime_error, "No state store attached");
    }
    auto workflows = store_->load_workflows();
    if (!workflows) {
        return workflows.error();
    }

    size_t loaded = 0;
    for (const auto& workflow : *workflows) {
        auto added = add_loaded(workflow);
        if (added) {
            ++loaded;
        } else if (rejected) {
            rejected->push_back(error_message(added.error()));
        }
    }
    return loaded;
}

} // namespace engine
} // namespace fleetrun
