#include "fleetrun/engine/scheduler.hpp"
#include "fleetrun/engine/expression.hpp"
#include <algorithm>
#include <chrono>

namespace fleetrun {
namespace engine {

namespace {

json optional_ms(const std::optional<int64_t>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<int64_t> read_optional_ms(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<int64_t>();
}

// Applies the fields present in `data`; unknown keys are ignored
caf::expected<void> apply_fields(Schedule& schedule, const json& data) {
    if (!data.is_object()) {
        return caf::make_error(caf::sec::invalid_argument, "Schedule data must be an object");
    }
    try {
        if (data.contains("name")) schedule.name = data.at("name").get<std::string>();
        if (data.contains("description")) schedule.description = data.at("description").get<std::string>();
        if (data.contains("workflowId")) schedule.workflow_id = data.at("workflowId").get<std::string>();
        if (data.contains("workflowName")) schedule.workflow_name = data.at("workflowName").get<std::string>();
        if (data.contains("workflow")) {
            if (data.at("workflow").is_object()) {
                schedule.workflow = data.at("workflow").get<Workflow>();
            } else {
                schedule.workflow.reset();
            }
        }
        if (data.contains("profileIds")) {
            schedule.profile_ids.clear();
            for (const auto& id : data.at("profileIds")) {
                schedule.profile_ids.push_back(display_string(id));
            }
        }
        if (data.contains("cron")) schedule.cron = data.at("cron").get<std::string>();
        if (data.contains("enabled")) schedule.enabled = data.at("enabled").get<bool>();
        if (data.contains("runOnStart")) schedule.run_on_start = data.at("runOnStart").get<bool>();
        if (data.contains("maxRetries")) schedule.max_retries = data.at("maxRetries").get<int32_t>();
        if (data.contains("timeout")) schedule.timeout_ms = data.at("timeout").get<int64_t>();
        if (data.contains("maxConcurrent")) schedule.max_concurrent = data.at("maxConcurrent").get<int32_t>();
    } catch (const json::exception& e) {
        return caf::make_error(caf::sec::invalid_argument, std::string("Invalid schedule field: ") + e.what());
    }

    if (schedule.max_retries < 0 || schedule.timeout_ms < 0 || schedule.max_concurrent < 0) {
        return caf::make_error(caf::sec::invalid_argument, "maxRetries, timeout and maxConcurrent must not be negative");
    }
    return caf::unit;
}

} // namespace

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

void to_json(json& j, const Schedule& schedule) {
    j = json{
        {"id", schedule.id},
        {"name", schedule.name},
        {"description", schedule.description},
        {"workflowId", schedule.workflow_id},
        {"workflowName", schedule.workflow_name},
        {"workflow", schedule.workflow ? json(*schedule.workflow) : json(nullptr)},
        {"profileIds", schedule.profile_ids},
        {"cron", schedule.cron},
        {"cronDescription", schedule.cron_description},
        {"enabled", schedule.enabled},
        {"runOnStart", schedule.run_on_start},
        {"maxRetries", schedule.max_retries},
        {"timeout", schedule.timeout_ms},
        {"maxConcurrent", schedule.max_concurrent},
        {"createdAt", schedule.created_at},
        {"updatedAt", schedule.updated_at},
        {"lastRun", optional_ms(schedule.last_run)},
        {"nextRun", optional_ms(schedule.next_run)},
        {"lastStatus", schedule.last_status.empty() ? json(nullptr) : json(schedule.last_status)},
        {"lastError", schedule.last_error.empty() ? json(nullptr) : json(schedule.last_error)},
        {"runCount", schedule.run_count},
        {"successCount", schedule.success_count},
        {"failureCount", schedule.failure_count}
    };
}

void from_json(const json& j, Schedule& schedule) {
    schedule = Schedule();
    schedule.id = j.value("id", "");
    schedule.name = j.value("name", "");
    schedule.description = j.value("description", "");
    schedule.workflow_id = j.value("workflowId", "");
    schedule.workflow_name = j.value("workflowName", "");
    if (j.contains("workflow") && j.at("workflow").is_object()) {
        schedule.workflow = j.at("workflow").get<Workflow>();
    }
    if (j.contains("profileIds") && j.at("profileIds").is_array()) {
        for (const auto& id : j.at("profileIds")) {
            schedule.profile_ids.push_back(display_string(id));
        }
    }
    schedule.cron = j.value("cron", "");
    schedule.cron_description = j.value("cronDescription", "");
    schedule.enabled = j.value("enabled", true);
    schedule.run_on_start = j.value("runOnStart", false);
    schedule.max_retries = j.value("maxRetries", 0);
    schedule.timeout_ms = j.value("timeout", static_cast<int64_t>(300000));
    schedule.max_concurrent = j.value("maxConcurrent", 0);
    schedule.created_at = j.value("createdAt", static_cast<int64_t>(0));
    schedule.updated_at = j.value("updatedAt", static_cast<int64_t>(0));
    schedule.last_run = read_optional_ms(j, "lastRun");
    schedule.next_run = read_optional_ms(j, "nextRun");
    if (j.contains("lastStatus") && j.at("lastStatus").is_string()) {
        schedule.last_status = j.at("lastStatus").get<std::string>();
    }
    if (j.contains("lastError") && j.at("lastError").is_string()) {
        schedule.last_error = j.at("lastError").get<std::string>();
    }
    schedule.run_count = j.value("runCount", static_cast<int64_t>(0));
    schedule.success_count = j.value("successCount", static_cast<int64_t>(0));
    schedule.failure_count = j.value("failureCount", static_cast<int64_t>(0));
}

void to_json(json& j, const ProfileRunResult& result) {
    j = json{{"profileId", result.profile_id}, {"success", result.success}};
    if (!result.error.empty()) {
        j["error"] = result.error;
    }
}

void to_json(json& j, const ScheduleRunResult& result) {
    j = json{
        {"success", result.success},
        {"results", result.results},
        {"error", result.error.empty() ? json(nullptr) : json(result.error)}
    };
}

void to_json(json& j, const UpcomingRun& run) {
    j = json{
        {"id", run.id},
        {"name", run.name},
        {"nextRun", run.next_run},
        {"cronDescription", run.cron_description}
    };
}

void to_json(json& j, const SchedulerStatus& status) {
    j = json{
        {"running", status.running},
        {"totalSchedules", status.total_schedules},
        {"enabledSchedules", status.enabled_schedules},
        {"upcomingExecutions", status.upcoming},
        {"serverTime", status.server_time}
    };
}

// ---------------------------------------------------------------------------
// Default runner
// ---------------------------------------------------------------------------

ScheduleRunner make_parallel_schedule_runner(std::shared_ptr<WorkflowExecutor> executor,
                                             SessionFactory session_factory,
                                             ProfileResolver resolver,
                                             ParallelOptions base,
                                             std::shared_ptr<Observability> observability) {
    return [executor, session_factory, resolver, base, observability](const Schedule& schedule,
                                                                      const Workflow& workflow) {
        ScheduleRunResult result;

        std::vector<json> profiles;
        if (resolver) {
            profiles = resolver(schedule.profile_ids);
        } else {
            // Without a resolver the ids themselves are the profile payloads
            for (const auto& id : schedule.profile_ids) {
                profiles.push_back({{"id", id}});
            }
        }

        std::set<std::string> resolved;
        for (const auto& profile : profiles) {
            if (profile.contains("id")) {
                resolved.insert(display_string(profile.at("id")));
            }
        }
        for (const auto& id : schedule.profile_ids) {
            if (resolved.count(id) == 0) {
                result.results.push_back({id, false, "Profile not found"});
            }
        }

        if (profiles.empty()) {
            result.error = "No profiles found for schedule " + schedule.id;
            return result;
        }

        ParallelOptions options = base;
        if (schedule.max_concurrent > 0) {
            options.max_concurrent = schedule.max_concurrent;
        }
        if (schedule.timeout_ms > 0) {
            options.timeout_ms = schedule.timeout_ms;
        }
        options.retry.max_retries = schedule.max_retries;

        ParallelExecutor parallel(options, session_factory, observability);
        auto status = parallel.run(make_workflow_runner(executor), workflow, profiles);
        if (!status) {
            result.error = error_message(status.error());
            return result;
        }

        for (const auto& entry : status->completed_list) {
            result.results.push_back({entry.profile_id, true, ""});
        }
        for (const auto& entry : status->failed_list) {
            result.results.push_back({entry.profile_id, false, entry.error});
        }
        for (const auto& entry : status->queue_list) {
            result.results.push_back({entry.profile_id, false, "Not executed"});
        }

        result.success = !result.results.empty() &&
            std::all_of(result.results.begin(), result.results.end(),
                        [](const ProfileRunResult& r) { return r.success; });
        if (!result.success) {
            result.error = "Some executions failed";
        }
        return result;
    };
}

// ---------------------------------------------------------------------------
// Scheduler
// ---------------------------------------------------------------------------

Scheduler::Scheduler(std::shared_ptr<WorkflowRegistry> workflows,
                     ScheduleRunner runner,
                     std::shared_ptr<StateStore> store,
                     std::shared_ptr<Observability> observability,
                     SchedulerConfig config)
    : workflows_(std::move(workflows)),
      runner_(std::move(runner)),
      store_(std::move(store)),
      observability_(std::move(observability)),
      config_(config) {
    if (config_.worker_threads > 0) {
        pool_ = std::make_unique<WorkerPool>(config_.worker_threads, observability_, "scheduler");
    }
}

Scheduler::~Scheduler() {
    stop();
}

caf::expected<size_t> Scheduler::load() {
    if (!store_) {
        return caf::make_error(caf::sec::runtime_error, "No state store attached");
    }
    auto records = store_->load_schedules();
    if (!records) {
        return records.error();
    }

    int64_t now = now_epoch_ms();
    std::map<std::string, Schedule> loaded;
    for (const auto& record : *records) {
        Schedule schedule;
        try {
            schedule = record.get<Schedule>();
        } catch (const json::exception& e) {
            if (observability_) {
                observability_->log_warn("Skipping unreadable schedule record", {}, {{"error", e.what()}});
            }
            continue;
        }

        auto cron = CronExpression::parse(schedule.cron);
        if (cron) {
            schedule.next_run = cron->next_run(now);
        } else {
            schedule.next_run.reset();
            if (observability_) {
                observability_->log_warn("Stored schedule has an invalid cron expression",
                                         {schedule.workflow_id, "", "", "", schedule.id},
                                         {{"cron", schedule.cron}, {"error", error_message(cron.error())}});
            }
        }
        schedule.cron_description = describe_cron(schedule.cron);
        register_snapshot(schedule);
        loaded[schedule.id] = std::move(schedule);
    }

    size_t count = loaded.size();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        schedules_ = std::move(loaded);
    }
    if (observability_) {
        observability_->log_info("Schedules loaded", {}, {{"count", std::to_string(count)}});
    }
    return count;
}

void Scheduler::register_snapshot(const Schedule& schedule) {
    if (!schedule.workflow || !workflows_ || workflows_->contains(schedule.workflow->id)) {
        return;
    }
    auto added = workflows_->add_loaded(*schedule.workflow);
    if (observability_) {
        if (added) {
            observability_->log_info("Registered workflow from schedule snapshot",
                                     {schedule.workflow->id, "", "", "", schedule.id},
                                     {{"workflow_name", schedule.workflow->name}});
        } else {
            observability_->log_error("Failed to register workflow snapshot",
                                      {schedule.workflow->id, "", "", "", schedule.id},
                                      {{"error", error_message(added.error())}});
        }
    }
}

caf::expected<void> Scheduler::start() {
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        if (running_) {
            return caf::make_error(caf::sec::runtime_error, "Scheduler is already running");
        }
    }

    if (store_) {
        auto loaded = load();
        if (!loaded) {
            return loaded.error();
        }
    }

    std::vector<std::string> on_start;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now = now_epoch_ms();
        for (auto& entry : schedules_) {
            Schedule& schedule = entry.second;
            if (schedule.enabled && schedule.run_on_start && begin_run_locked(schedule, now)) {
                on_start.push_back(schedule.id);
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        running_ = true;
        timer_ = std::thread(&Scheduler::timer_loop, this);
    }

    if (observability_) {
        observability_->set_health_status("scheduler", 1);
        observability_->log_info("Scheduler started", {}, {
            {"schedules", std::to_string(list().size())},
            {"check_interval_ms", std::to_string(config_.check_interval_ms)},
            {"run_on_start", std::to_string(on_start.size())}
        });
    }

    dispatch(on_start);
    return caf::unit;
}

void Scheduler::stop() {
    std::thread timer;
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        timer = std::move(timer_);
    }
    timer_cv_.notify_all();
    if (timer.joinable()) {
        timer.join();
    }
    if (observability_) {
        observability_->set_health_status("scheduler", 0);
        observability_->log_info("Scheduler stopped");
    }
}

bool Scheduler::is_running() const {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    return running_;
}

void Scheduler::timer_loop() {
    std::unique_lock<std::mutex> lock(timer_mutex_);
    while (running_) {
        lock.unlock();
        tick(now_epoch_ms());
        lock.lock();
        timer_cv_.wait_for(lock, std::chrono::milliseconds(config_.check_interval_ms),
                           [this] { return !running_; });
    }
}

size_t Scheduler::tick(int64_t now_ms) {
    std::vector<std::string> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : schedules_) {
            Schedule& schedule = entry.second;
            if (!schedule.enabled || !schedule.next_run || *schedule.next_run > now_ms) {
                continue;
            }
            if (begin_run_locked(schedule, now_ms)) {
                due.push_back(schedule.id);
            }
        }
    }
    dispatch(due);
    return due.size();
}

void Scheduler::dispatch(const std::vector<std::string>& ids) {
    for (const auto& id : ids) {
        if (pool_) {
            pool_->submit([this, id]() { execute(id); });
        } else {
            execute(id);
        }
    }
}

bool Scheduler::begin_run_locked(Schedule& schedule, int64_t now_ms) {
    if (in_flight_.count(schedule.id) > 0) {
        return false;
    }
    in_flight_.insert(schedule.id);

    schedule.last_run = now_ms;
    auto cron = CronExpression::parse(schedule.cron);
    schedule.next_run = cron ? cron->next_run(now_ms) : std::nullopt;
    schedule.last_status = "running";
    schedule.last_error.clear();
    ++schedule.run_count;

    auto saved = persist_locked(schedule);
    if (!saved && observability_) {
        observability_->log_warn("Failed to persist schedule", {schedule.workflow_id, "", "", "", schedule.id},
                                 {{"error", error_message(saved.error())}});
    }
    return true;
}

ScheduleRunResult Scheduler::execute(const std::string& id) {
    Schedule schedule;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = schedules_.find(id);
        if (it == schedules_.end()) {
            in_flight_.erase(id);
            return ScheduleRunResult{false, {}, "Schedule not found: " + id};
        }
        schedule = it->second;
    }

    LogContext log_context{schedule.workflow_id, "", "", "", schedule.id};
    auto started = std::chrono::steady_clock::now();
    ScopedSpan span;
    if (observability_) {
        span = observability_->start_span("schedule.run", log_context, {{"schedule.name", schedule.name}});
        observability_->log_info("Executing schedule", log_context, {
            {"name", schedule.name},
            {"profiles", std::to_string(schedule.profile_ids.size())}
        });
    }

    std::optional<Workflow> workflow;
    if (workflows_) {
        workflow = workflows_->get(schedule.workflow_id);
    }
    if (!workflow && schedule.workflow) {
        register_snapshot(schedule);
        workflow = schedule.workflow;
    }

    ScheduleRunResult result;
    if (!workflow) {
        result.error = "Workflow not found: " + schedule.workflow_id;
    } else if (!runner_) {
        result.error = "No schedule runner configured";
    } else {
        try {
            result = runner_(schedule, *workflow);
        } catch (const std::exception& e) {
            result = ScheduleRunResult{false, {}, e.what()};
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.erase(id);
        auto it = schedules_.find(id);
        if (it != schedules_.end()) {
            Schedule& stored = it->second;
            stored.last_status = result.success ? "success" : "failed";
            stored.last_error = result.error;
            if (result.success) {
                ++stored.success_count;
            } else {
                ++stored.failure_count;
            }
            auto saved = persist_locked(stored);
            if (!saved && observability_) {
                observability_->log_warn("Failed to persist schedule", log_context,
                                         {{"error", error_message(saved.error())}});
            }
        }
    }

    if (observability_) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        observability_->record_schedule_run(id, result.success);
        span.set_attribute("schedule.status", result.success ? "success" : "failed");
        if (result.success) {
            observability_->log_info("Schedule completed", log_context, {
                {"duration_ms", std::to_string(elapsed)}
            });
        } else {
            span.set_error(result.error);
            observability_->log_error("Schedule failed", log_context, {
                {"error", result.error},
                {"duration_ms", std::to_string(elapsed)}
            });
        }
    }
    return result;
}

caf::expected<void> Scheduler::persist_locked(const Schedule& schedule) {
    if (!store_) {
        return caf::unit;
    }
    return store_->save_schedule(schedule.id, schedule.workflow_id, json(schedule));
}

caf::expected<Schedule> Scheduler::create(const json& data) {
    Schedule schedule;
    auto applied = apply_fields(schedule, data);
    if (!applied) {
        return applied.error();
    }

    auto cron = CronExpression::parse(schedule.cron);
    if (!cron) {
        return cron.error();
    }
    if (schedule.workflow_id.empty() && schedule.workflow) {
        schedule.workflow_id = schedule.workflow->id;
    }
    if (schedule.workflow_id.empty()) {
        return caf::make_error(caf::sec::invalid_argument, "workflowId is required");
    }

    int64_t now = now_epoch_ms();
    schedule.id = generate_id("schedule");
    if (schedule.name.empty()) {
        schedule.name = "Unnamed Schedule";
    }
    if (schedule.workflow_name.empty() && schedule.workflow) {
        schedule.workflow_name = schedule.workflow->name;
    }
    schedule.cron_description = describe_cron(schedule.cron);
    schedule.created_at = now;
    schedule.updated_at = now;
    schedule.next_run = cron->next_run(now);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto saved = persist_locked(schedule);
        if (!saved) {
            return saved.error();
        }
        schedules_[schedule.id] = schedule;
    }

    if (observability_) {
        observability_->log_info("Schedule created", {schedule.workflow_id, "", "", "", schedule.id}, {
            {"name", schedule.name},
            {"cron", schedule.cron_description}
        });
    }
    return schedule;
}

caf::expected<Schedule> Scheduler::update(const std::string& id, const json& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = schedules_.find(id);
    if (it == schedules_.end()) {
        return caf::make_error(caf::sec::invalid_argument, "Schedule not found: " + id);
    }

    Schedule updated = it->second;
    auto applied = apply_fields(updated, data);
    if (!applied) {
        return applied.error();
    }

    int64_t now = now_epoch_ms();
    bool cron_changed = updated.cron != it->second.cron;
    bool enabled_now = updated.enabled && !it->second.enabled;
    if (cron_changed || enabled_now) {
        auto cron = CronExpression::parse(updated.cron);
        if (!cron) {
            return cron.error();
        }
        updated.cron_description = describe_cron(updated.cron);
        updated.next_run = cron->next_run(now);
    }
    updated.id = id;
    updated.updated_at = now;

    auto saved = persist_locked(updated);
    if (!saved) {
        return saved.error();
    }
    it->second = updated;

    if (observability_) {
        observability_->log_info("Schedule updated", {updated.workflow_id, "", "", "", id},
                                 {{"name", updated.name}, {"enabled", updated.enabled ? "true" : "false"}});
    }
    return updated;
}

caf::expected<void> Scheduler::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = schedules_.find(id);
    if (it == schedules_.end()) {
        return caf::make_error(caf::sec::invalid_argument, "Schedule not found: " + id);
    }
    if (store_) {
        auto deleted = store_->delete_schedule(id);
        if (!deleted) {
            return deleted.error();
        }
    }
    if (observability_) {
        observability_->log_info("Schedule deleted", {it->second.workflow_id, "", "", "", id},
                                 {{"name", it->second.name}});
    }
    schedules_.erase(it);
    return caf::unit;
}

std::optional<Schedule> Scheduler::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = schedules_.find(id);
    if (it == schedules_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Schedule> Scheduler::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Schedule> result;
    result.reserve(schedules_.size());
    for (const auto& entry : schedules_) {
        result.push_back(entry.second);
    }
    return result;
}

caf::expected<Schedule> Scheduler::enable(const std::string& id) {
    return update(id, {{"enabled", true}});
}

caf::expected<Schedule> Scheduler::disable(const std::string& id) {
    return update(id, {{"enabled", false}});
}

caf::expected<ScheduleRunResult> Scheduler::run_now(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = schedules_.find(id);
        if (it == schedules_.end()) {
            return caf::make_error(caf::sec::invalid_argument, "Schedule not found: " + id);
        }
        if (!begin_run_locked(it->second, now_epoch_ms())) {
            return caf::make_error(caf::sec::runtime_error, "Schedule is already running: " + id);
        }
    }
    return execute(id);
}

SchedulerStatus Scheduler::status() const {
    SchedulerStatus status;
    status.running = is_running();
    status.server_time = now_epoch_ms();

    std::lock_guard<std::mutex> lock(mutex_);
    status.total_schedules = schedules_.size();
    for (const auto& entry : schedules_) {
        const Schedule& schedule = entry.second;
        if (!schedule.enabled) {
            continue;
        }
        ++status.enabled_schedules;
        if (schedule.next_run) {
            status.upcoming.push_back({schedule.id, schedule.name, *schedule.next_run, schedule.cron_description});
        }
    }
    std::sort(status.upcoming.begin(), status.upcoming.end(),
              [](const UpcomingRun& a, const UpcomingRun& b) { return a.next_run < b.next_run; });
    if (status.upcoming.size() > 5) {
        status.upcoming.resize(5);
    }
    return status;
}

} // namespace engine
} // namespace fleetrun
