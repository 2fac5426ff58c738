#pragma once

#include "fleetrun/engine/action.hpp"
#include "fleetrun/engine/core.hpp"
#include "fleetrun/engine/observability.hpp"
#include "fleetrun/engine/retry_manager.hpp"
#include "fleetrun/engine/step_executor.hpp"
#include "fleetrun/engine/work_queue.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fleetrun {
namespace engine {

struct ParallelOptions {
    int32_t max_concurrent = 3;
    int64_t delay_between_ms = 1000;
    int64_t timeout_ms = 300000;
    bool stop_on_error = false;
    QueueMode queue_mode = QueueMode::fifo;
    RetryConfig retry;

    /**
     * Reads maxConcurrent, delayBetween, timeout, stopOnError, queueMode and
     * retry (object or preset name) on top of `base`.
     */
    static caf::expected<ParallelOptions> from_json(const json& j, const ParallelOptions& base = ParallelOptions());
};

void to_json(json& j, const ParallelOptions& options);

// One lifecycle notification: start, slotStart, progress, slotSuccess, slotRetry,
// slotFailure, slotSkipped, slotEnd, queueUpdated, pause, resume, stop, complete
struct ParallelEvent {
    std::string type;
    json payload = json::object();
};

/**
 * Subscriber list owned by one executor. Handlers run on the thread that
 * published the event, outside the executor's lock, so they may query
 * status() or call control operations.
 */
class EventBus {
public:
    using Handler = std::function<void(const ParallelEvent&)>;

    uint64_t subscribe(Handler handler);
    bool unsubscribe(uint64_t subscription);
    void publish(const ParallelEvent& event) const;
    size_t subscriber_count() const;

private:
    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;
    std::map<uint64_t, Handler> handlers_;
};

// Provisions an isolated browser session for one profile payload
using SessionFactory = std::function<caf::expected<std::shared_ptr<BrowserSession>>(const json& profile)>;

// Runs one workflow for one profile; normally bound to WorkflowExecutor::execute
using WorkflowRunner = std::function<Execution(const Workflow&, ExecutionOptions)>;

WorkflowRunner make_workflow_runner(std::shared_ptr<WorkflowExecutor> executor);

struct CompletedEntry {
    std::string profile_id;
    std::string profile_name;
    Execution result;
    int64_t duration_ms = 0;
};

struct FailedEntry {
    std::string profile_id;
    std::string profile_name;
    std::string error;            // annotated with the failing step
    std::string original_error;
    FailedStep failed_step;
    int32_t retry_count = 0;
    int64_t duration_ms = 0;
};

struct SlotStatus {
    std::string id;
    std::string profile_id;
    std::string profile_name;
    int32_t progress = 0;         // percent of top-level steps started
    size_t current_step = 0;
    size_t total_steps = 0;
    std::string current_action;
    std::string status;           // starting | running
};

struct QueueEntry {
    std::string id;
    std::string profile_id;
    std::string profile_name;
    Priority priority = Priority::normal;
    int32_t retry_count = 0;
};

struct ParallelStatus {
    bool running = false;
    bool paused = false;
    size_t total_profiles = 0;
    size_t completed = 0;
    size_t failed = 0;
    size_t queued = 0;
    size_t active = 0;
    size_t pending_retries = 0;
    int32_t progress = 0;
    int64_t elapsed_ms = 0;
    int64_t eta_ms = 0;
    std::vector<SlotStatus> slots;
    std::vector<CompletedEntry> completed_list;
    std::vector<FailedEntry> failed_list;
    std::vector<QueueEntry> queue_list;
};

void to_json(json& j, const CompletedEntry& entry);
void to_json(json& j, const FailedEntry& entry);
void to_json(json& j, const SlotStatus& slot);
void to_json(json& j, const QueueEntry& entry);
void to_json(json& j, const ParallelStatus& status);

/**
 * Runs one workflow across many profiles with at most max_concurrent slots.
 *
 * A single dispatcher thread owns slot admission; every slot runs on its own
 * thread. Queue, slot table, result lists and pending retries are guarded by
 * one mutex, and the dispatcher sleeps on a condition variable that is
 * signalled on enqueue, slot exit, pause/resume/stop and config changes. It
 * also wakes for the next retry due time, slot deadline or stagger gate.
 *
 * Slot timeouts are cooperative: the slot's cancellation token carries the
 * deadline and the dispatcher closes the slot's session once it expires.
 */
class ParallelExecutor {
public:
    ParallelExecutor(ParallelOptions options = ParallelOptions(),
                     SessionFactory session_factory = nullptr,
                     std::shared_ptr<Observability> observability = nullptr);
    ~ParallelExecutor();

    ParallelExecutor(const ParallelExecutor&) = delete;
    ParallelExecutor& operator=(const ParallelExecutor&) = delete;

    EventBus& events() { return events_; }

    /**
     * Enqueues one item per profile ({id, name?, priority?}) and starts the
     * dispatcher. Returns immediately; fails if a run is in progress.
     */
    caf::expected<void> start(WorkflowRunner runner, const Workflow& workflow, const std::vector<json>& profiles);

    // Blocks until the current run has finished and every slot thread has exited
    ParallelStatus wait();

    // start() followed by wait()
    caf::expected<ParallelStatus> run(WorkflowRunner runner, const Workflow& workflow,
                                      const std::vector<json>& profiles);

    void pause();
    void resume();

    /**
     * Halts admission, records every active slot as failed with
     * "Execution stopped", cancels their runs and closes their sessions.
     * Queued items stay queued.
     */
    void stop();

    // Releases the slot with this slot id or profile id without recording a result
    bool skip_slot(const std::string& id);

    void add_profiles(const std::vector<json>& profiles);
    bool remove_from_queue(const std::string& profile_id);

    // Applies camelCase option keys; a queueMode change re-orders the queue
    caf::expected<void> update_config(const json& changes);

    ParallelStatus status() const;
    bool is_running() const;
    ParallelOptions options() const;

private:
    using clock = std::chrono::steady_clock;

    struct Slot {
        std::string id;
        QueueItem item;
        std::string profile_id;
        std::string profile_name;
        std::shared_ptr<CancellationToken> token;
        std::shared_ptr<BrowserSession> session;
        clock::time_point started;
        clock::time_point deadline;
        int32_t progress = 0;
        size_t current_step = 0;
        size_t total_steps = 0;
        std::string current_action;
        std::string status = "starting";
        bool timed_out = false;
    };

    struct PendingRetry {
        clock::time_point due;
        QueueItem item;
    };

    ParallelOptions options_;
    SessionFactory session_factory_;
    std::shared_ptr<Observability> observability_;
    EventBus events_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    WorkQueue queue_;
    RetryManager retry_;
    WorkflowRunner runner_;
    Workflow workflow_;
    bool running_ = false;
    bool paused_ = false;
    bool stopping_ = false;
    clock::time_point started_;
    clock::time_point next_start_allowed_;
    std::map<std::string, std::shared_ptr<Slot>> slots_;
    std::vector<CompletedEntry> completed_;
    std::vector<FailedEntry> failed_;
    std::vector<PendingRetry> pending_retries_;

    std::map<std::string, std::thread> slot_threads_;
    std::vector<std::thread> finished_threads_;

    std::mutex control_mutex_;
    std::thread dispatcher_;

    void dispatch_loop();
    void launch_slot_locked(QueueItem item, std::vector<ParallelEvent>& events);
    void run_slot(std::shared_ptr<Slot> slot);
    void finish_slot_locked(const std::shared_ptr<Slot>& slot, const Execution* execution,
                            const std::string& setup_error, std::vector<ParallelEvent>& events,
                            std::vector<std::shared_ptr<BrowserSession>>& to_close);
    // Records success, a scheduled retry or a failure for a slot already removed from slots_
    void record_outcome_locked(const Slot& slot, const Execution* execution, const std::string& error,
                               std::vector<ParallelEvent>& events,
                               std::vector<std::shared_ptr<BrowserSession>>& to_close);
    FailedStep failed_step_locked(const Slot& slot, const Execution* execution) const;
    void stop_locked(std::vector<ParallelEvent>& events, std::vector<std::shared_ptr<BrowserSession>>& to_close);
    void enqueue_profiles_locked(const std::vector<json>& profiles);

    ParallelStatus status_locked() const;
    json slot_payload(const Slot& slot) const;
    void publish_all(const std::vector<ParallelEvent>& events);
    void close_sessions(std::vector<std::shared_ptr<BrowserSession>>& sessions);
    void join_threads(std::vector<std::thread>& threads);
};

} // namespace engine
} // namespace fleetrun
