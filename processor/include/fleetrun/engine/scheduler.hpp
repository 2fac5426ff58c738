#pragma once

#include "fleetrun/engine/core.hpp"
#include "fleetrun/engine/cron_expression.hpp"
#include "fleetrun/engine/observability.hpp"
#include "fleetrun/engine/parallel_executor.hpp"
#include "fleetrun/engine/state_store.hpp"
#include "fleetrun/engine/worker_pool.hpp"
#include "fleetrun/engine/workflow_registry.hpp"
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace fleetrun {
namespace engine {

struct Schedule {
    std::string id;
    std::string name;
    std::string description;
    std::string workflow_id;
    std::string workflow_name;
    std::optional<Workflow> workflow;      // snapshot re-registered after restart
    std::vector<std::string> profile_ids;
    std::string cron;
    std::string cron_description;
    bool enabled = true;
    bool run_on_start = false;
    int32_t max_retries = 0;
    int64_t timeout_ms = 300000;
    int32_t max_concurrent = 0;            // 0 = scheduler default
    int64_t created_at = 0;
    int64_t updated_at = 0;
    std::optional<int64_t> last_run;
    std::optional<int64_t> next_run;
    std::string last_status;               // running | success | failed
    std::string last_error;
    int64_t run_count = 0;
    int64_t success_count = 0;
    int64_t failure_count = 0;
};

void to_json(json& j, const Schedule& schedule);
void from_json(const json& j, Schedule& schedule);

struct ProfileRunResult {
    std::string profile_id;
    bool success = false;
    std::string error;
};

struct ScheduleRunResult {
    bool success = false;
    std::vector<ProfileRunResult> results;
    std::string error;
};

void to_json(json& j, const ProfileRunResult& result);
void to_json(json& j, const ScheduleRunResult& result);

struct UpcomingRun {
    std::string id;
    std::string name;
    int64_t next_run = 0;
    std::string cron_description;
};

struct SchedulerStatus {
    bool running = false;
    size_t total_schedules = 0;
    size_t enabled_schedules = 0;
    std::vector<UpcomingRun> upcoming;     // first five by next_run
    int64_t server_time = 0;
};

void to_json(json& j, const UpcomingRun& run);
void to_json(json& j, const SchedulerStatus& status);

struct SchedulerConfig {
    int64_t check_interval_ms = 60000;
    int32_t worker_threads = 0;            // 0 = runs execute on the ticking thread
};

// Executes a resolved workflow for a schedule's profiles
using ScheduleRunner = std::function<ScheduleRunResult(const Schedule&, const Workflow&)>;

// Maps profile ids to profile payloads; unknown ids are left out
using ProfileResolver = std::function<std::vector<json>(const std::vector<std::string>&)>;

/**
 * Runs each schedule's workflow across its profiles on a ParallelExecutor.
 * The schedule's max_concurrent, timeout and max_retries override `base`.
 * Profiles the resolver does not return are reported as failed.
 */
ScheduleRunner make_parallel_schedule_runner(std::shared_ptr<WorkflowExecutor> executor,
                                             SessionFactory session_factory,
                                             ProfileResolver resolver,
                                             ParallelOptions base = ParallelOptions(),
                                             std::shared_ptr<Observability> observability = nullptr);

/**
 * Cron-driven trigger for workflow runs.
 *
 * A timer thread calls tick() every check interval; tick() triggers every
 * enabled schedule whose next_run has passed. A schedule that is still
 * running is not triggered again. With worker_threads > 0 runs go to an
 * owned worker pool, otherwise they execute on the calling thread.
 *
 * With a state store attached every mutation is written through, and
 * load() restores schedules after a restart.
 */
class Scheduler {
public:
    Scheduler(std::shared_ptr<WorkflowRegistry> workflows,
              ScheduleRunner runner,
              std::shared_ptr<StateStore> store = nullptr,
              std::shared_ptr<Observability> observability = nullptr,
              SchedulerConfig config = SchedulerConfig());
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * Replaces in-memory schedules with the stored ones, recomputes next_run
     * and registers workflow snapshots that the registry does not know.
     */
    caf::expected<size_t> load();

    // Loads (with a store), triggers run_on_start schedules and starts the timer
    caf::expected<void> start();
    void stop();
    bool is_running() const;

    /**
     * Creates a schedule from camelCase fields (name, description, workflowId,
     * workflowName, workflow, profileIds, cron, enabled, runOnStart,
     * maxRetries, timeout, maxConcurrent). The cron expression must parse.
     */
    caf::expected<Schedule> create(const json& data);
    caf::expected<Schedule> update(const std::string& id, const json& data);
    caf::expected<void> remove(const std::string& id);
    std::optional<Schedule> get(const std::string& id) const;
    std::vector<Schedule> list() const;

    caf::expected<Schedule> enable(const std::string& id);
    caf::expected<Schedule> disable(const std::string& id);

    // Triggers immediately on the calling thread, bypassing the cron cadence
    caf::expected<ScheduleRunResult> run_now(const std::string& id);

    // Triggers every due schedule; returns how many were triggered
    size_t tick(int64_t now_ms);

    SchedulerStatus status() const;

private:
    std::shared_ptr<WorkflowRegistry> workflows_;
    ScheduleRunner runner_;
    std::shared_ptr<StateStore> store_;
    std::shared_ptr<Observability> observability_;
    SchedulerConfig config_;

    mutable std::mutex mutex_;
    std::map<std::string, Schedule> schedules_;
    std::set<std::string> in_flight_;

    mutable std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    bool running_ = false;
    std::thread timer_;

    // Declared last: destruction drains queued runs while the members above are alive
    std::unique_ptr<WorkerPool> pool_;

    // Marks the schedule running and advances its counters; false if already running
    bool begin_run_locked(Schedule& schedule, int64_t now_ms);
    void dispatch(const std::vector<std::string>& ids);
    ScheduleRunResult execute(const std::string& id);
    caf::expected<void> persist_locked(const Schedule& schedule);
    void register_snapshot(const Schedule& schedule);
    void timer_loop();
};

} // namespace engine
} // namespace fleetrun
