#pragma once

#include "fleetrun/engine/core.hpp"
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;

namespace fleetrun {
namespace engine {

/**
 * SQLite persistence for workflow definitions and schedule records.
 *
 * Tables:
 * - workflows(id, name, description, steps, variables, settings, created_at, updated_at)
 * - schedules(id, workflow_id, data, created_at, updated_at)
 *
 * JSON columns hold serialized text. Saves are upserts; deleting a workflow
 * also deletes its schedules. All calls are serialized on one connection.
 */
class StateStore {
public:
    StateStore() = default;
    ~StateStore();

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    // Opens (or creates) the database and its tables. ":memory:" is accepted.
    caf::expected<void> open(const std::string& path);
    void close();
    bool is_open() const;

    caf::expected<void> save_workflow(const Workflow& workflow);
    caf::expected<std::vector<Workflow>> load_workflows();
    caf::expected<void> delete_workflow(const std::string& id);

    caf::expected<void> save_schedule(const std::string& id, const std::string& workflow_id, const json& data);
    caf::expected<std::vector<json>> load_schedules();
    caf::expected<void> delete_schedule(const std::string& id);

private:
    mutable std::mutex mutex_;
    sqlite3* db_ = nullptr;

    caf::expected<void> exec_locked(const std::string& sql);
};

} // namespace engine
} // namespace fleetrun
