#include "fleetrun/engine/parallel_executor.hpp"
#include "fleetrun/engine/expression.hpp"
#include "fleetrun/engine/timeout_enforcement.hpp"
#include <algorithm>
#include <cmath>
#include <system_error>

namespace fleetrun {
namespace engine {

namespace {

std::string profile_field(const json& profile, const char* key) {
    auto it = profile.find(key);
    if (it == profile.end() || it->is_null()) {
        return "";
    }
    return display_string(*it);
}

int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count();
}

} // namespace

// ---------------------------------------------------------------------------
// Options and serialization
// ---------------------------------------------------------------------------

caf::expected<ParallelOptions> ParallelOptions::from_json(const json& j, const ParallelOptions& base) {
    if (!j.is_object()) {
        return caf::make_error(caf::sec::invalid_argument, "Parallel options must be an object");
    }

    ParallelOptions options = base;
    if (j.contains("maxConcurrent") && j.at("maxConcurrent").is_number()) {
        options.max_concurrent = j.at("maxConcurrent").get<int32_t>();
    }
    if (j.contains("delayBetween") && j.at("delayBetween").is_number()) {
        options.delay_between_ms = j.at("delayBetween").get<int64_t>();
    }
    if (j.contains("timeout") && j.at("timeout").is_number()) {
        options.timeout_ms = j.at("timeout").get<int64_t>();
    }
    if (j.contains("stopOnError") && j.at("stopOnError").is_boolean()) {
        options.stop_on_error = j.at("stopOnError").get<bool>();
    }
    if (j.contains("queueMode") && j.at("queueMode").is_string()) {
        auto mode = parse_queue_mode(j.at("queueMode").get<std::string>());
        if (!mode) {
            return mode.error();
        }
        options.queue_mode = *mode;
    }
    if (j.contains("retry")) {
        const json& retry = j.at("retry");
        auto config = retry.is_string() ? RetryConfig::preset(retry.get<std::string>())
                                        : RetryConfig::from_json(retry, options.retry);
        if (!config) {
            return config.error();
        }
        options.retry = std::move(*config);
    }

    if (options.max_concurrent < 1) {
        return caf::make_error(caf::sec::invalid_argument, "maxConcurrent must be at least 1");
    }
    if (options.delay_between_ms < 0 || options.timeout_ms < 0) {
        return caf::make_error(caf::sec::invalid_argument, "delayBetween and timeout must not be negative");
    }
    return options;
}

void to_json(json& j, const ParallelOptions& options) {
    j = json{
        {"maxConcurrent", options.max_concurrent},
        {"delayBetween", options.delay_between_ms},
        {"timeout", options.timeout_ms},
        {"stopOnError", options.stop_on_error},
        {"queueMode", to_string(options.queue_mode)},
        {"retry", options.retry}
    };
}

void to_json(json& j, const CompletedEntry& entry) {
    j = json{
        {"profileId", entry.profile_id},
        {"profileName", entry.profile_name},
        {"result", entry.result},
        {"duration", entry.duration_ms}
    };
}

void to_json(json& j, const FailedEntry& entry) {
    j = json{
        {"profileId", entry.profile_id},
        {"profileName", entry.profile_name},
        {"error", entry.error},
        {"originalError", entry.original_error},
        {"failedStep", entry.failed_step},
        {"retryCount", entry.retry_count},
        {"duration", entry.duration_ms}
    };
}

void to_json(json& j, const SlotStatus& slot) {
    j = json{
        {"id", slot.id},
        {"profileId", slot.profile_id},
        {"profileName", slot.profile_name},
        {"progress", slot.progress},
        {"currentStep", slot.current_step},
        {"totalSteps", slot.total_steps},
        {"currentAction", slot.current_action},
        {"status", slot.status}
    };
}

void to_json(json& j, const QueueEntry& entry) {
    j = json{
        {"id", entry.id},
        {"profileId", entry.profile_id},
        {"profileName", entry.profile_name},
        {"priority", to_string(entry.priority)},
        {"retryCount", entry.retry_count}
    };
}

void to_json(json& j, const ParallelStatus& status) {
    j = json{
        {"running", status.running},
        {"paused", status.paused},
        {"totalProfiles", status.total_profiles},
        {"completed", status.completed},
        {"failed", status.failed},
        {"queued", status.queued},
        {"active", status.active},
        {"pendingRetries", status.pending_retries},
        {"progress", status.progress},
        {"elapsed", status.elapsed_ms},
        {"eta", status.eta_ms},
        {"slots", status.slots},
        {"completedList", status.completed_list},
        {"failedList", status.failed_list},
        {"queueList", status.queue_list}
    };
}

// ---------------------------------------------------------------------------
// EventBus
// ---------------------------------------------------------------------------

uint64_t EventBus::subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    handlers_[id] = std::move(handler);
    return id;
}

bool EventBus::unsubscribe(uint64_t subscription) {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.erase(subscription) > 0;
}

void EventBus::publish(const ParallelEvent& event) const {
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : handlers_) {
            handlers.push_back(entry.second);
        }
    }
    for (const auto& handler : handlers) {
        handler(event);
    }
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}

WorkflowRunner make_workflow_runner(std::shared_ptr<WorkflowExecutor> executor) {
    return [executor](const Workflow& workflow, ExecutionOptions options) {
        return executor->execute(workflow, std::move(options));
    };
}

// ---------------------------------------------------------------------------
// ParallelExecutor
// ---------------------------------------------------------------------------

ParallelExecutor::ParallelExecutor(ParallelOptions options,
                                   SessionFactory session_factory,
                                   std::shared_ptr<Observability> observability)
    : options_(std::move(options)),
      session_factory_(std::move(session_factory)),
      observability_(std::move(observability)),
      queue_(options_.queue_mode),
      retry_(options_.retry) {}

ParallelExecutor::~ParallelExecutor() {
    stop();
    wait();
}

caf::expected<void> ParallelExecutor::start(WorkflowRunner runner, const Workflow& workflow,
                                            const std::vector<json>& profiles) {
    if (!runner) {
        return caf::make_error(caf::sec::invalid_argument, "A workflow runner is required");
    }

    std::lock_guard<std::mutex> control(control_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return caf::make_error(caf::sec::runtime_error, "Executor is already running");
        }
    }
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }

    ParallelEvent started{"start", json::object()};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        runner_ = std::move(runner);
        workflow_ = workflow;
        running_ = true;
        paused_ = false;
        stopping_ = false;
        started_ = clock::now();
        next_start_allowed_ = started_;
        slots_.clear();
        completed_.clear();
        failed_.clear();
        pending_retries_.clear();
        queue_.clear();
        queue_.set_mode(options_.queue_mode);
        retry_ = RetryManager(options_.retry);
        enqueue_profiles_locked(profiles);

        started.payload = {
            {"workflowId", workflow.id},
            {"workflowName", workflow.name},
            {"totalProfiles", profiles.size()},
            {"maxConcurrent", options_.max_concurrent}
        };
    }

    if (observability_) {
        observability_->log_info("Parallel run started", {workflow.id, "", "", "", ""}, {
            {"profiles", std::to_string(profiles.size())},
            {"max_concurrent", std::to_string(options_.max_concurrent)}
        });
        observability_->set_queue_depth(static_cast<int64_t>(profiles.size()));
    }
    events_.publish(started);

    try {
        dispatcher_ = std::thread(&ParallelExecutor::dispatch_loop, this);
    } catch (const std::system_error& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        return caf::make_error(caf::sec::runtime_error, std::string("Failed to start dispatcher: ") + e.what());
    }
    return caf::unit;
}

ParallelStatus ParallelExecutor::wait() {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
    return status();
}

caf::expected<ParallelStatus> ParallelExecutor::run(WorkflowRunner runner, const Workflow& workflow,
                                                    const std::vector<json>& profiles) {
    auto started = start(std::move(runner), workflow, profiles);
    if (!started) {
        return started.error();
    }
    return wait();
}

void ParallelExecutor::enqueue_profiles_locked(const std::vector<json>& profiles) {
    for (const auto& profile : profiles) {
        QueueItem item;
        item.id = profile_field(profile, "id");
        item.payload = profile;
        item.priority = parse_priority(profile.is_object() && profile.contains("priority")
                                           ? profile_field(profile, "priority") : "normal");
        queue_.add(std::move(item));
    }
}

void ParallelExecutor::dispatch_loop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stopping_) {
        std::vector<ParallelEvent> events;
        std::vector<std::shared_ptr<BrowserSession>> to_close;
        std::vector<std::thread> finished;
        finished.swap(finished_threads_);

        auto now = clock::now();

        for (auto it = pending_retries_.begin(); it != pending_retries_.end();) {
            if (it->due <= now) {
                queue_.add(std::move(it->item));
                it = pending_retries_.erase(it);
            } else {
                ++it;
            }
        }

        // An expired slot fails now and gives up its place; whatever its run
        // returns later is ignored by finish_slot_locked
        std::vector<std::shared_ptr<Slot>> expired;
        for (const auto& entry : slots_) {
            if (!entry.second->timed_out && now >= entry.second->deadline) {
                expired.push_back(entry.second);
            }
        }
        for (const auto& slot : expired) {
            if (stopping_) {
                break;
            }
            slot->timed_out = true;
            slots_.erase(slot->id);
            std::string message = CancellationToken::timeout_message(options_.timeout_ms);
            slot->token->cancel(CancellationToken::Reason::timeout, message);
            if (slot->session) {
                to_close.push_back(std::move(slot->session));
                slot->session = nullptr;
            }
            if (observability_) {
                observability_->log_warn("Slot timed out", {workflow_.id, "", slot->profile_id, "", ""}, {
                    {"slot_id", slot->id},
                    {"timeout_ms", std::to_string(options_.timeout_ms)}
                });
            }
            record_outcome_locked(*slot, nullptr, message, events, to_close);
        }

        if (queue_.empty() && slots_.empty() && pending_retries_.empty() &&
            events.empty() && finished.empty() && to_close.empty()) {
            break;
        }

        bool launched = false;
        if (!paused_ && static_cast<int32_t>(slots_.size()) < options_.max_concurrent &&
            !queue_.empty() && now >= next_start_allowed_) {
            auto item = queue_.next();
            if (item) {
                launch_slot_locked(std::move(*item), events);
                next_start_allowed_ = now + std::chrono::milliseconds(options_.delay_between_ms);
                launched = true;
            }
        }

        if (observability_) {
            observability_->set_queue_depth(static_cast<int64_t>(queue_.size()));
            observability_->set_active_slots(static_cast<int64_t>(slots_.size()));
        }

        if (!events.empty() || !finished.empty() || !to_close.empty()) {
            lock.unlock();
            close_sessions(to_close);
            join_threads(finished);
            publish_all(events);
            lock.lock();
            continue;
        }
        if (launched) {
            continue;
        }

        // Every state change below happens under the lock, so re-checking
        // before each wait means no notification is missed.
        std::optional<clock::time_point> wake;
        auto earliest = [&wake](clock::time_point t) {
            if (!wake || t < *wake) {
                wake = t;
            }
        };
        for (const auto& retry : pending_retries_) {
            earliest(retry.due);
        }
        for (const auto& entry : slots_) {
            if (!entry.second->timed_out && entry.second->deadline != clock::time_point::max()) {
                earliest(entry.second->deadline);
            }
        }
        if (!paused_ && static_cast<int32_t>(slots_.size()) < options_.max_concurrent && !queue_.empty()) {
            earliest(next_start_allowed_);
        }

        if (wake) {
            cv_.wait_until(lock, *wake);
        } else {
            cv_.wait(lock);
        }
    }

    // Released slots still own threads until their runs notice the cancellation
    cv_.wait(lock, [this] { return slot_threads_.empty(); });

    std::vector<std::thread> finished;
    finished.swap(finished_threads_);
    running_ = false;
    paused_ = false;
    ParallelStatus final_status = status_locked();
    lock.unlock();

    join_threads(finished);

    if (observability_) {
        observability_->set_active_slots(0);
        observability_->set_queue_depth(static_cast<int64_t>(final_status.queued));
        observability_->log_info("Parallel run finished", {workflow_.id, "", "", "", ""}, {
            {"completed", std::to_string(final_status.completed)},
            {"failed", std::to_string(final_status.failed)},
            {"queued", std::to_string(final_status.queued)},
            {"elapsed_ms", std::to_string(final_status.elapsed_ms)}
        });
    }
    events_.publish(ParallelEvent{"complete", json(final_status)});
}

void ParallelExecutor::launch_slot_locked(QueueItem item, std::vector<ParallelEvent>& events) {
    auto slot = std::make_shared<Slot>();
    slot->id = generate_id("slot");
    slot->profile_id = profile_field(item.payload, "id");
    if (slot->profile_id.empty()) {
        slot->profile_id = item.id;
    }
    slot->profile_name = profile_field(item.payload, "name");
    slot->item = std::move(item);
    slot->token = std::make_shared<CancellationToken>();
    slot->token->set_deadline(options_.timeout_ms);
    slot->started = clock::now();
    slot->deadline = options_.timeout_ms > 0
        ? slot->started + std::chrono::milliseconds(options_.timeout_ms)
        : clock::time_point::max();
    slot->total_steps = workflow_.steps.size();

    slots_[slot->id] = slot;
    try {
        slot_threads_[slot->id] = std::thread(&ParallelExecutor::run_slot, this, slot);
    } catch (const std::system_error& e) {
        slots_.erase(slot->id);
        slot_threads_.erase(slot->id);
        FailedEntry entry;
        entry.profile_id = slot->profile_id;
        entry.profile_name = slot->profile_name;
        entry.original_error = std::string("Failed to start slot: ") + e.what();
        entry.error = entry.original_error;
        entry.retry_count = slot->item.retry_count;
        failed_.push_back(entry);
        events.push_back({"slotFailure", slot_payload(*slot)});
        return;
    }

    if (observability_) {
        observability_->record_slot_event("start");
    }
    json payload = slot_payload(*slot);
    payload["profile"] = slot->item.payload;
    events.push_back({"slotStart", std::move(payload)});
}

void ParallelExecutor::run_slot(std::shared_ptr<Slot> slot) {
    Execution execution;
    bool ran = false;
    std::string setup_error;

    try {
        std::shared_ptr<BrowserSession> session;
        if (session_factory_) {
            auto created = session_factory_(slot->item.payload);
            if (created) {
                session = std::move(*created);
            } else {
                setup_error = error_message(created.error());
            }
        }

        if (setup_error.empty()) {
            bool abandoned = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (slots_.count(slot->id) == 0 || slot->timed_out) {
                    abandoned = true;
                } else {
                    slot->session = session;
                    slot->status = "running";
                }
            }

            if (abandoned) {
                std::vector<std::shared_ptr<BrowserSession>> orphan{session};
                close_sessions(orphan);
                setup_error = slot->token->message();
            } else {
                ExecutionOptions options;
                options.profile = slot->item.payload;
                options.profile_id = slot->profile_id;
                options.session = {{"id", slot->id}};
                options.page = session ? session->page() : nullptr;
                options.cancellation = slot->token;
                options.on_progress = [this, slot](size_t index, size_t total, const Step& step) {
                    json payload;
                    {
                        std::lock_guard<std::mutex> lock(mutex_);
                        slot->current_step = index;
                        slot->total_steps = total;
                        slot->progress = total > 0 ? static_cast<int32_t>(index * 100 / total) : 0;
                        slot->current_action = step.type;
                        payload = slot_payload(*slot);
                    }
                    payload["percentage"] = slot->progress;
                    payload["action"] = step.type;
                    events_.publish({"progress", std::move(payload)});
                };

                execution = runner_(workflow_, std::move(options));
                ran = true;
            }
        }
    } catch (const std::exception& e) {
        setup_error = e.what();
        ran = false;
    }

    std::vector<std::shared_ptr<BrowserSession>> to_close;
    std::vector<ParallelEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (slot->session) {
            to_close.push_back(std::move(slot->session));
            slot->session = nullptr;
        }
        finish_slot_locked(slot, ran ? &execution : nullptr, setup_error, events, to_close);

        auto it = slot_threads_.find(slot->id);
        if (it != slot_threads_.end()) {
            finished_threads_.push_back(std::move(it->second));
            slot_threads_.erase(it);
        }
    }
    cv_.notify_all();

    close_sessions(to_close);
    publish_all(events);
}

FailedStep ParallelExecutor::failed_step_locked(const Slot& slot, const Execution* execution) const {
    if (execution && execution->failed_step) {
        return *execution->failed_step;
    }
    FailedStep failed_step;
    failed_step.index = slot.current_step;
    if (slot.current_step < workflow_.steps.size()) {
        const Step& step = workflow_.steps[slot.current_step];
        failed_step.id = step.id;
        failed_step.name = step.name;
        failed_step.type = step.type;
    }
    return failed_step;
}

void ParallelExecutor::finish_slot_locked(const std::shared_ptr<Slot>& slot, const Execution* execution,
                                          const std::string& setup_error, std::vector<ParallelEvent>& events,
                                          std::vector<std::shared_ptr<BrowserSession>>& to_close) {
    // Slots released by a deadline, stop() or skip_slot() have already been accounted for
    bool released = slots_.erase(slot->id) == 0;
    if (!released) {
        record_outcome_locked(*slot, execution, setup_error, events, to_close);
    }

    json payload = slot_payload(*slot);
    payload["duration"] = elapsed_ms(slot->started);
    events.push_back({"slotEnd", std::move(payload)});
}

void ParallelExecutor::record_outcome_locked(const Slot& slot, const Execution* execution,
                                             const std::string& error, std::vector<ParallelEvent>& events,
                                             std::vector<std::shared_ptr<BrowserSession>>& to_close) {
    int64_t duration = elapsed_ms(slot.started);

    if (execution && execution->status == ExecutionStatus::completed) {
        completed_.push_back({slot.profile_id, slot.profile_name, *execution, duration});
        json payload = slot_payload(slot);
        payload["executionId"] = execution->id;
        payload["duration"] = duration;
        events.push_back({"slotSuccess", std::move(payload)});
        if (observability_) {
            observability_->record_slot_event("success");
        }
        return;
    }

    std::string original = execution ? execution->error : error;
    if (original.empty()) {
        original = "Unknown error";
    }
    FailedStep failed_step = failed_step_locked(slot, execution);
    std::string label = failed_step.name.empty() ? failed_step.id : failed_step.name;
    std::string annotated = "[Step " + std::to_string(failed_step.index + 1) + "/" +
                            std::to_string(workflow_.steps.size()) + ": " + label + "] " + original;

    if (!stopping_ && retry_.should_retry(original, slot.item.retry_count)) {
        int64_t delay = retry_.get_delay(slot.item.retry_count);
        QueueItem item = slot.item;
        ++item.retry_count;
        pending_retries_.push_back({clock::now() + std::chrono::milliseconds(delay), item});

        json payload = slot_payload(slot);
        payload["error"] = annotated;
        payload["failedStep"] = failed_step;
        payload["retryCount"] = item.retry_count;
        payload["delay"] = delay;
        events.push_back({"slotRetry", std::move(payload)});
        if (observability_) {
            observability_->record_slot_event("retry");
            observability_->log_warn("Slot failed, retry scheduled", {workflow_.id, "", slot.profile_id, "", ""}, {
                {"error", original},
                {"retry_count", std::to_string(item.retry_count)},
                {"delay_ms", std::to_string(delay)}
            });
        }
        return;
    }

    failed_.push_back({slot.profile_id, slot.profile_name, annotated, original, failed_step,
                       slot.item.retry_count, duration});
    json payload = slot_payload(slot);
    payload["error"] = annotated;
    payload["failedStep"] = failed_step;
    events.push_back({"slotFailure", std::move(payload)});
    if (observability_) {
        observability_->record_slot_event("failure");
        observability_->log_error("Slot failed", {workflow_.id, "", slot.profile_id, "", ""}, {
            {"error", annotated},
            {"retry_count", std::to_string(slot.item.retry_count)}
        });
    }
    if (options_.stop_on_error) {
        stop_locked(events, to_close);
    }
}

void ParallelExecutor::stop_locked(std::vector<ParallelEvent>& events,
                                   std::vector<std::shared_ptr<BrowserSession>>& to_close) {
    if (!running_ || stopping_) {
        return;
    }
    stopping_ = true;
    paused_ = false;

    for (auto& entry : slots_) {
        Slot& slot = *entry.second;
        slot.token->cancel(CancellationToken::Reason::user, "Execution stopped");
        if (slot.session) {
            to_close.push_back(std::move(slot.session));
            slot.session = nullptr;
        }
        FailedStep failed_step = failed_step_locked(slot, nullptr);
        failed_.push_back({slot.profile_id, slot.profile_name, "Execution stopped", "Execution stopped",
                           failed_step, slot.item.retry_count, elapsed_ms(slot.started)});
    }
    slots_.clear();

    // Items waiting out a retry delay go back to the queue unprocessed
    for (auto& retry : pending_retries_) {
        queue_.add(std::move(retry.item));
    }
    pending_retries_.clear();

    events.push_back({"stop", json::object()});
    if (observability_) {
        observability_->record_slot_event("stop");
        observability_->log_info("Parallel run stopped", {workflow_.id, "", "", "", ""}, {
            {"queued", std::to_string(queue_.size())}
        });
    }
    cv_.notify_all();
}

void ParallelExecutor::stop() {
    std::vector<ParallelEvent> events;
    std::vector<std::shared_ptr<BrowserSession>> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_locked(events, to_close);
    }
    close_sessions(to_close);
    publish_all(events);
}

void ParallelExecutor::pause() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || paused_) {
            return;
        }
        paused_ = true;
    }
    cv_.notify_all();
    events_.publish({"pause", json::object()});
}

void ParallelExecutor::resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || !paused_) {
            return;
        }
        paused_ = false;
    }
    cv_.notify_all();
    events_.publish({"resume", json::object()});
}

bool ParallelExecutor::skip_slot(const std::string& id) {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = slots_.begin(); it != slots_.end(); ++it) {
            if (it->second->id == id || it->second->profile_id == id) {
                slot = it->second;
                slots_.erase(it);
                break;
            }
        }
        if (!slot) {
            return false;
        }
        slot->token->cancel(CancellationToken::Reason::user, "Slot skipped");
    }
    cv_.notify_all();

    std::vector<std::shared_ptr<BrowserSession>> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (slot->session) {
            to_close.push_back(std::move(slot->session));
            slot->session = nullptr;
        }
    }
    close_sessions(to_close);

    if (observability_) {
        observability_->record_slot_event("skipped");
    }
    events_.publish({"slotSkipped", slot_payload(*slot)});
    return true;
}

void ParallelExecutor::add_profiles(const std::vector<json>& profiles) {
    size_t queue_size = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        enqueue_profiles_locked(profiles);
        queue_size = queue_.size();
    }
    cv_.notify_all();
    events_.publish({"queueUpdated", {{"queueSize", queue_size}}});
}

bool ParallelExecutor::remove_from_queue(const std::string& profile_id) {
    size_t removed = 0;
    size_t queue_size = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = queue_.remove_by_payload_key("id", json(profile_id));
        if (removed == 0) {
            removed = queue_.remove(profile_id) ? 1 : 0;
        }
        queue_size = queue_.size();
    }
    cv_.notify_all();
    events_.publish({"queueUpdated", {{"queueSize", queue_size}}});
    return removed > 0;
}

caf::expected<void> ParallelExecutor::update_config(const json& changes) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto updated = ParallelOptions::from_json(changes, options_);
        if (!updated) {
            return updated.error();
        }
        options_ = std::move(*updated);
        if (changes.contains("queueMode")) {
            queue_.set_mode(options_.queue_mode);
        }
        if (changes.contains("retry")) {
            retry_ = RetryManager(options_.retry);
        }
    }
    cv_.notify_all();
    return caf::unit;
}

ParallelStatus ParallelExecutor::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_locked();
}

bool ParallelExecutor::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

ParallelOptions ParallelExecutor::options() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return options_;
}

ParallelStatus ParallelExecutor::status_locked() const {
    ParallelStatus status;
    status.running = running_;
    status.paused = paused_;
    status.completed = completed_.size();
    status.failed = failed_.size();
    status.queued = queue_.size();
    status.active = slots_.size();
    status.pending_retries = pending_retries_.size();
    status.total_profiles = status.completed + status.failed + status.queued + status.active + status.pending_retries;
    status.elapsed_ms = started_ == clock::time_point{} ? 0 : elapsed_ms(started_);

    if (status.total_profiles > 0) {
        status.progress = static_cast<int32_t>(std::lround(
            100.0 * static_cast<double>(status.completed) / static_cast<double>(status.total_profiles)));
    }
    if (status.completed > 0 && status.total_profiles > status.completed) {
        double average = static_cast<double>(status.elapsed_ms) / static_cast<double>(status.completed);
        status.eta_ms = static_cast<int64_t>(average * static_cast<double>(status.total_profiles - status.completed));
    }

    for (const auto& entry : slots_) {
        const Slot& slot = *entry.second;
        status.slots.push_back({slot.id, slot.profile_id, slot.profile_name, slot.progress,
                                slot.current_step, slot.total_steps, slot.current_action, slot.status});
    }
    status.completed_list = completed_;
    status.failed_list = failed_;
    for (const auto& item : queue_.items()) {
        std::string profile_id = profile_field(item.payload, "id");
        status.queue_list.push_back({item.id, profile_id.empty() ? item.id : profile_id,
                                     profile_field(item.payload, "name"), item.priority, item.retry_count});
    }
    return status;
}

json ParallelExecutor::slot_payload(const Slot& slot) const {
    return json{
        {"slotId", slot.id},
        {"profileId", slot.profile_id},
        {"profileName", slot.profile_name},
        {"currentStep", slot.current_step},
        {"totalSteps", slot.total_steps}
    };
}

void ParallelExecutor::publish_all(const std::vector<ParallelEvent>& events) {
    for (const auto& event : events) {
        events_.publish(event);
    }
}

void ParallelExecutor::close_sessions(std::vector<std::shared_ptr<BrowserSession>>& sessions) {
    for (auto& session : sessions) {
        if (!session) {
            continue;
        }
        try {
            session->close();
        } catch (const std::exception& e) {
            if (observability_) {
                observability_->log_warn("Failed to close browser session", {}, {{"error", e.what()}});
            }
        }
    }
    sessions.clear();
}

void ParallelExecutor::join_threads(std::vector<std::thread>& threads) {
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads.clear();
}

} // namespace engine
} // namespace fleetrun
