#pragma once

#include "fleetrun/engine/action.hpp"
#include "fleetrun/engine/core.hpp"
#include "fleetrun/engine/state_store.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fleetrun {
namespace engine {

struct ValidationReport {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    bool valid() const { return errors.empty(); }
};

void to_json(json& j, const ValidationReport& report);

/**
 * Structural checks: id and name present, every step has id and type,
 * step ids unique across the whole tree. Unknown action types are
 * warnings only when `actions` is given.
 */
ValidationReport validate_workflow(const Workflow& workflow, const ActionRegistry* actions = nullptr);

/**
 * Workflows addressable by id, used by call-workflow steps and the scheduler.
 * With a state store attached, register/remove write through to it.
 */
class WorkflowRegistry {
public:
    explicit WorkflowRegistry(std::shared_ptr<ActionRegistry> actions = nullptr,
                              std::shared_ptr<StateStore> store = nullptr)
        : actions_(std::move(actions)), store_(std::move(store)) {}

    // Validates and stores the workflow; replaces an existing one with the same id
    caf::expected<ValidationReport> register_workflow(const Workflow& workflow);

    // Inserts without persisting (used when loading from the store)
    caf::expected<ValidationReport> add_loaded(const Workflow& workflow);

    std::optional<Workflow> get(const std::string& id) const;
    bool contains(const std::string& id) const;
    std::vector<Workflow> list() const;
    caf::expected<void> remove(const std::string& id);

    // Loads every stored workflow into memory; returns the count.
    // Records that fail validation are skipped and described in `rejected`.
    caf::expected<size_t> load_from_store(std::vector<std::string>* rejected = nullptr);

private:
    mutable std::mutex mutex_;
    std::map<std::string, Workflow> workflows_;
    std::shared_ptr<ActionRegistry> actions_;
    std::shared_ptr<StateStore> store_;
};

} // namespace engine
} // namespace fleetrun
