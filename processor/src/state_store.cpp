#include "fleetrun/engine/state_store.hpp"
#include <sqlite3.h>

namespace fleetrun {
namespace engine {

namespace {

// RAII wrapper to ensure a statement is finalized
struct StatementGuard {
    sqlite3_stmt* stmt_ = nullptr;

    explicit StatementGuard(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~StatementGuard() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    // Non-copyable
    StatementGuard(const StatementGuard&) = delete;
    StatementGuard& operator=(const StatementGuard&) = delete;
};

caf::error sqlite_error(sqlite3* db, const std::string& what) {
    return caf::make_error(caf::sec::runtime_error, what + ": " + std::string(sqlite3_errmsg(db)));
}

std::string column_text(sqlite3_stmt* stmt, int column) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? std::string(text) : std::string();
}

json column_json(sqlite3_stmt* stmt, int column, json fallback) {
    std::string text = column_text(stmt, column);
    if (text.empty()) {
        return fallback;
    }
    try {
        return json::parse(text);
    } catch (const json::parse_error&) {
        return fallback;
    }
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

} // namespace

StateStore::~StateStore() {
    close();
}

caf::expected<void> StateStore::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        return caf::make_error(caf::sec::runtime_error, "State store already open");
    }

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        auto err = sqlite_error(db_, "Failed to open state database " + path);
        sqlite3_close(db_);
        db_ = nullptr;
        return err;
    }

    const char* schema = R"SQL(
        CREATE TABLE IF NOT EXISTS workflows (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            description TEXT,
            steps TEXT NOT NULL,
            variables TEXT,
            settings TEXT,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );
        CREATE TABLE IF NOT EXISTS schedules (
            id TEXT PRIMARY KEY,
            workflow_id TEXT NOT NULL,
            data TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_schedules_workflow ON schedules(workflow_id);
    )SQL";

    auto created = exec_locked(schema);
    if (!created) {
        sqlite3_close(db_);
        db_ = nullptr;
        return created.error();
    }
    return caf::unit;
}

void StateStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool StateStore::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

caf::expected<void> StateStore::exec_locked(const std::string& sql) {
    char* error = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        std::string message = error ? error : "unknown error";
        sqlite3_free(error);
        return caf::make_error(caf::sec::runtime_error, "SQL execution failed: " + message);
    }
    return caf::unit;
}

caf::expected<void> StateStore::save_workflow(const Workflow& workflow) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return caf::make_error(caf::sec::runtime_error, "State store is not open");
    }

    const char* sql =
        "INSERT INTO workflows (id, name, description, steps, variables, settings, created_at, updated_at) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?7) "
        "ON CONFLICT(id) DO UPDATE SET name = excluded.name, description = excluded.description, "
        "steps = excluded.steps, variables = excluded.variables, settings = excluded.settings, "
        "updated_at = excluded.updated_at";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return sqlite_error(db_, "Failed to prepare statement");
    }
    StatementGuard guard(stmt);

    json steps = workflow.steps;
    bind_text(stmt, 1, workflow.id);
    bind_text(stmt, 2, workflow.name);
    bind_text(stmt, 3, workflow.description);
    bind_text(stmt, 4, steps.dump());
    bind_text(stmt, 5, workflow.variables.dump());
    bind_text(stmt, 6, workflow.settings.dump());
    sqlite3_bind_int64(stmt, 7, now_epoch_ms());

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        return sqlite_error(db_, "Failed to save workflow " + workflow.id);
    }
    return caf::unit;
}

caf::expected<std::vector<Workflow>> StateStore::load_workflows() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return caf::make_error(caf::sec::runtime_error, "State store is not open");
    }

    const char* sql = "SELECT id, name, description, steps, variables, settings FROM workflows ORDER BY created_at";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return sqlite_error(db_, "Failed to prepare statement");
    }
    StatementGuard guard(stmt);

    std::vector<Workflow> workflows;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        json record = {
            {"id", column_text(stmt, 0)},
            {"name", column_text(stmt, 1)},
            {"description", column_text(stmt, 2)},
            {"steps", column_json(stmt, 3, json::array())},
            {"variables", column_json(stmt, 4, json::object())},
            {"settings", column_json(stmt, 5, json::object())}
        };
        try {
            workflows.push_back(record.get<Workflow>());
        } catch (const json::exception& e) {
            return caf::make_error(caf::sec::runtime_error,
                                   "Corrupt workflow record " + column_text(stmt, 0) + ": " + e.what());
        }
    }

    if (rc != SQLITE_DONE) {
        return sqlite_error(db_, "Query execution failed");
    }
    return workflows;
}

caf::expected<void> StateStore::delete_workflow(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return caf::make_error(caf::sec::runtime_error, "State store is not open");
    }

    for (const char* sql : {"DELETE FROM schedules WHERE workflow_id = ?1",
                            "DELETE FROM workflows WHERE id = ?1"}) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return sqlite_error(db_, "Failed to prepare statement");
        }
        StatementGuard guard(stmt);
        bind_text(stmt, 1, id);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            return sqlite_error(db_, "Failed to delete workflow " + id);
        }
    }
    return caf::unit;
}

caf::expected<void> StateStore::save_schedule(const std::string& id, const std::string& workflow_id,
                                              const json& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return caf::make_error(caf::sec::runtime_error, "State store is not open");
    }

    const char* sql =
        "INSERT INTO schedules (id, workflow_id, data, created_at, updated_at) VALUES (?1, ?2, ?3, ?4, ?4) "
        "ON CONFLICT(id) DO UPDATE SET workflow_id = excluded.workflow_id, data = excluded.data, "
        "updated_at = excluded.updated_at";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return sqlite_error(db_, "Failed to prepare statement");
    }
    StatementGuard guard(stmt);

    bind_text(stmt, 1, id);
    bind_text(stmt, 2, workflow_id);
    bind_text(stmt, 3, data.dump());
    sqlite3_bind_int64(stmt, 4, now_epoch_ms());

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        return sqlite_error(db_, "Failed to save schedule " + id);
    }
    return caf::unit;
}

caf::expected<std::vector<json>> StateStore::load_schedules() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return caf::make_error(caf::sec::runtime_error, "State store is not open");
    }

    const char* sql = "SELECT id, data FROM schedules ORDER BY created_at";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return sqlite_error(db_, "Failed to prepare statement");
    }
    StatementGuard guard(stmt);

    std::vector<json> schedules;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        json data = column_json(stmt, 1, json::object());
        if (!data.is_object()) {
            return caf::make_error(caf::sec::runtime_error, "Corrupt schedule record " + column_text(stmt, 0));
        }
        data["id"] = column_text(stmt, 0);
        schedules.push_back(std::move(data));
    }

    if (rc != SQLITE_DONE) {
        return sqlite_error(db_, "Query execution failed");
    }
    return schedules;
}

caf::expected<void> StateStore::delete_schedule(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return caf::make_error(caf::sec::runtime_error, "State store is not open");
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM schedules WHERE id = ?1", -1, &stmt, nullptr) != SQLITE_OK) {
        return sqlite_error(db_, "Failed to prepare statement");
    }
    StatementGuard guard(stmt);
    bind_text(stmt, 1, id);
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        return sqlite_error(db_, "Failed to delete schedule " + id);
    }
    return caf::unit;
}

} // namespace engine
} // namespace fleetrun
