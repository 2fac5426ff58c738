#include <iostream>
#include <cassert>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "fleetrun/engine/parallel_executor.hpp"
#include "test_fakes.hpp"

using namespace fleetrun::engine;
using fleetrun::test::FakeSessionFactory;
using fleetrun::test::ScriptedAction;
using fleetrun::test::make_profiles;
using fleetrun::test::make_step;
using fleetrun::test::make_workflow;
using fleetrun::test::wait_until;

namespace {

// Collects every published event; handlers run on executor threads
class EventLog {
public:
    explicit EventLog(EventBus& bus) : bus_(bus) {
        subscription_ = bus_.subscribe([this](const ParallelEvent& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        });
    }

    ~EventLog() { bus_.unsubscribe(subscription_); }

    size_t count(const std::string& type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(events_.begin(), events_.end(),
                                                  [&type](const ParallelEvent& e) { return e.type == type; }));
    }

    std::vector<ParallelEvent> of(const std::string& type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ParallelEvent> result;
        for (const auto& event : events_) {
            if (event.type == type) {
                result.push_back(event);
            }
        }
        return result;
    }

private:
    EventBus& bus_;
    uint64_t subscription_ = 0;
    mutable std::mutex mutex_;
    std::vector<ParallelEvent> events_;
};

ParallelOptions fast_options(int32_t max_concurrent) {
    ParallelOptions options;
    options.max_concurrent = max_concurrent;
    options.delay_between_ms = 0;
    options.timeout_ms = 0;
    options.retry = *RetryConfig::preset("none");
    return options;
}

struct Fixture {
    std::shared_ptr<ActionRegistry> actions = std::make_shared<ActionRegistry>();
    std::shared_ptr<ScriptedAction> work;
    std::shared_ptr<WorkflowExecutor> executor;
    Workflow workflow = make_workflow("batch", {make_step("work", "work")});

    explicit Fixture(int64_t latency_ms = 0) : work(std::make_shared<ScriptedAction>("work", latency_ms)) {
        register_builtin_actions(*actions);
        actions->register_action(work);
        executor = std::make_shared<WorkflowExecutor>(actions);
    }

    WorkflowRunner runner() const { return make_workflow_runner(executor); }
};

} // namespace

void test_runs_every_profile_within_limit() {
    std::cout << "Testing concurrency limit..." << std::endl;

    Fixture f(50);
    ParallelExecutor parallel(fast_options(2));
    EventLog log(parallel.events());

    std::atomic<int> in_flight{0};
    std::atomic<int> max_seen{0};
    WorkflowRunner inner = f.runner();
    WorkflowRunner counting = [&](const Workflow& workflow, ExecutionOptions options) {
        int now = ++in_flight;
        int previous = max_seen.load();
        while (now > previous && !max_seen.compare_exchange_weak(previous, now)) {
        }
        Execution execution = inner(workflow, std::move(options));
        --in_flight;
        return execution;
    };

    auto status = parallel.run(counting, f.workflow, make_profiles(6));
    assert(status);
    assert(!status->running);
    assert(status->completed == 6);
    assert(status->failed == 0);
    assert(status->queued == 0);
    assert(status->progress == 100);
    assert(status->eta_ms == 0);
    assert(max_seen.load() == 2);
    assert(f.work->calls() == 6);

    assert(log.count("start") == 1);
    assert(log.count("slotStart") == 6);
    assert(log.count("slotSuccess") == 6);
    assert(log.count("slotEnd") == 6);
    assert(log.count("progress") == 6);
    assert(log.count("complete") == 1);
    assert(log.of("start")[0].payload["totalProfiles"] == 6);
    assert(log.of("complete")[0].payload["completed"] == 6);

    // Profiles reach the workflow as profile.*
    for (const auto& entry : status->completed_list) {
        assert(entry.result.status == ExecutionStatus::completed);
        assert(!entry.profile_name.empty());
    }

    json j = *status;
    assert(j["completedList"].size() == 6);
    assert(j["totalProfiles"] == 6);

    std::cout << "✓ concurrency limit test passed" << std::endl;
}

void test_priority_queue_order() {
    std::cout << "Testing priority admission order..." << std::endl;

    Fixture f;
    ParallelOptions options = fast_options(1);
    options.queue_mode = QueueMode::priority;
    ParallelExecutor parallel(options);

    std::vector<json> profiles = {
        json{{"id", "low"}, {"priority", "low"}},
        json{{"id", "normal"}},
        json{{"id", "urgent"}, {"priority", "critical"}}
    };
    auto status = parallel.run(f.runner(), f.workflow, profiles);
    assert(status && status->completed == 3);
    assert(status->completed_list[0].profile_id == "urgent");
    assert(status->completed_list[1].profile_id == "normal");
    assert(status->completed_list[2].profile_id == "low");

    std::cout << "✓ priority admission order test passed" << std::endl;
}

void test_retries_and_failures() {
    std::cout << "Testing slot retries..." << std::endl;

    Fixture f;
    ParallelOptions options = fast_options(1);
    options.retry.max_retries = 2;
    options.retry.strategy = BackoffStrategy::fixed;
    options.retry.base_delay_ms = 10;
    options.retry.jitter = false;

    {
        ParallelExecutor parallel(options);
        EventLog log(parallel.events());
        f.work->fail_next("net::ERR_CONNECTION_RESET", 2);
        auto status = parallel.run(f.runner(), f.workflow, make_profiles(1));
        assert(status->completed == 1);
        assert(status->failed == 0);
        auto retries = log.of("slotRetry");
        assert(retries.size() == 2);
        assert(retries[0].payload["retryCount"] == 1);
        assert(retries[1].payload["retryCount"] == 2);
        assert(retries[0].payload["delay"] == 10);
        assert(f.work->calls() == 3);
    }

    {
        ParallelExecutor parallel(options);
        f.work->fail_next("Invalid selector");
        auto status = parallel.run(f.runner(), f.workflow, make_profiles(1));
        assert(status->failed == 1);
        const FailedEntry& failure = status->failed_list[0];
        assert(failure.original_error == "Step \"work\" failed: Invalid selector");
        assert(failure.error == "[Step 1/1: work] Step \"work\" failed: Invalid selector");
        assert(failure.failed_step.id == "work");
        assert(failure.failed_step.index == 0);
        assert(failure.retry_count == 0);
    }

    {
        ParallelExecutor parallel(options);
        f.work->fail_next("timeout waiting for selector", 3);
        auto status = parallel.run(f.runner(), f.workflow, make_profiles(1));
        assert(status->failed == 1);
        assert(status->failed_list[0].retry_count == 2);
        assert(status->pending_retries == 0);
    }

    std::cout << "✓ slot retries test passed" << std::endl;
}

void test_stop_on_error() {
    std::cout << "Testing stopOnError..." << std::endl;

    Fixture f;
    ParallelOptions options = fast_options(1);
    options.stop_on_error = true;
    ParallelExecutor parallel(options);
    EventLog log(parallel.events());

    f.work->fail_for_profile("p1", "Invalid selector");
    auto status = parallel.run(f.runner(), f.workflow, make_profiles(4));
    assert(status->failed == 1);
    assert(status->completed == 0);
    assert(status->queued == 3);
    assert(status->queue_list[0].profile_id == "p2");
    assert(log.count("stop") == 1);
    assert(log.count("slotFailure") == 1);

    std::cout << "✓ stopOnError test passed" << std::endl;
}

void test_pause_and_resume() {
    std::cout << "Testing pause/resume..." << std::endl;

    Fixture f(100);
    ParallelExecutor parallel(fast_options(1));
    EventLog log(parallel.events());

    assert(parallel.start(f.runner(), f.workflow, make_profiles(3)));
    assert(wait_until([&]() { return parallel.status().active == 1; }));
    parallel.pause();
    assert(parallel.status().paused);

    // The active slot finishes, nothing new is admitted
    assert(wait_until([&]() { return parallel.status().completed == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    ParallelStatus paused = parallel.status();
    assert(paused.active == 0);
    assert(paused.completed == 1);
    assert(paused.queued == 2);
    assert(paused.progress == 33);
    assert(paused.eta_ms > 0);

    parallel.resume();
    ParallelStatus done = parallel.wait();
    assert(done.completed == 3);
    assert(!done.paused);
    assert(log.count("pause") == 1);
    assert(log.count("resume") == 1);

    std::cout << "✓ pause/resume test passed" << std::endl;
}

void test_stop_releases_active_slots() {
    std::cout << "Testing stop..." << std::endl;

    Fixture f(5000);
    FakeSessionFactory sessions;
    ParallelExecutor parallel(fast_options(2), sessions.factory());

    auto started = std::chrono::steady_clock::now();
    assert(parallel.start(f.runner(), f.workflow, make_profiles(5)));
    assert(wait_until([&]() {
        ParallelStatus status = parallel.status();
        return status.slots.size() == 2 &&
               std::all_of(status.slots.begin(), status.slots.end(),
                           [](const SlotStatus& slot) { return slot.status == "running"; });
    }));

    parallel.stop();
    ParallelStatus status = parallel.wait();
    assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(3));
    assert(!status.running);
    assert(status.failed == 2);
    assert(status.completed == 0);
    assert(status.queued == 3);
    for (const auto& failure : status.failed_list) {
        assert(failure.error == "Execution stopped");
    }
    assert(sessions.opened == 2);
    assert(sessions.closed == 2);

    // Stopping again is a no-op
    parallel.stop();
    assert(parallel.status().failed == 2);

    std::cout << "✓ stop test passed" << std::endl;
}

void test_skip_slot() {
    std::cout << "Testing skip_slot..." << std::endl;

    Fixture f(300);
    ParallelExecutor parallel(fast_options(1));
    EventLog log(parallel.events());

    assert(parallel.start(f.runner(), f.workflow, make_profiles(2)));
    assert(wait_until([&]() { return parallel.status().active == 1; }));
    assert(!parallel.skip_slot("nope"));
    assert(parallel.skip_slot("p1"));

    ParallelStatus status = parallel.wait();
    assert(status.completed == 1);
    assert(status.failed == 0);
    assert(status.completed_list[0].profile_id == "p2");
    assert(status.total_profiles == 1);
    assert(log.count("slotSkipped") == 1);

    std::cout << "✓ skip_slot test passed" << std::endl;
}

void test_queue_changes_while_running() {
    std::cout << "Testing queue changes..." << std::endl;

    Fixture f(100);
    ParallelExecutor parallel(fast_options(1));
    EventLog log(parallel.events());

    assert(parallel.start(f.runner(), f.workflow, make_profiles(3)));
    assert(parallel.remove_from_queue("p3"));
    assert(!parallel.remove_from_queue("missing"));
    parallel.add_profiles({json{{"id", "p9"}, {"name", "Late"}}});

    auto already = parallel.start(f.runner(), f.workflow, make_profiles(1));
    assert(!already);
    assert(error_message(already.error()) == "Executor is already running");

    ParallelStatus status = parallel.wait();
    assert(status.completed == 3);
    std::vector<std::string> ids;
    for (const auto& entry : status.completed_list) {
        ids.push_back(entry.profile_id);
    }
    assert(std::find(ids.begin(), ids.end(), "p9") != ids.end());
    assert(std::find(ids.begin(), ids.end(), "p3") == ids.end());
    assert(log.count("queueUpdated") == 3);

    // A finished executor can run again
    auto again = parallel.run(f.runner(), f.workflow, make_profiles(1, "q"));
    assert(again && again->completed == 1);

    assert(!parallel.start(nullptr, f.workflow, make_profiles(1)));

    std::cout << "✓ queue changes test passed" << std::endl;
}

void test_slot_timeout_and_session_errors() {
    std::cout << "Testing slot timeout and session errors..." << std::endl;

    {
        Fixture f(5000);
        FakeSessionFactory sessions;
        ParallelOptions options = fast_options(1);
        options.timeout_ms = 100;
        ParallelExecutor parallel(options, sessions.factory());

        auto started = std::chrono::steady_clock::now();
        auto status = parallel.run(f.runner(), f.workflow, make_profiles(1));
        assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(3));
        assert(status->failed == 1);
        assert(status->failed_list[0].original_error == "Execution timeout after 100ms");
        assert(status->failed_list[0].error == "[Step 1/1: work] Execution timeout after 100ms");
        assert(sessions.closed == 1);
    }

    {
        Fixture f;
        FakeSessionFactory sessions;
        sessions.refuse_profile = "p2";
        ParallelExecutor parallel(fast_options(2), sessions.factory());
        auto status = parallel.run(f.runner(), f.workflow, make_profiles(2));
        assert(status->completed == 1);
        assert(status->failed == 1);
        const FailedEntry& failure = status->failed_list[0];
        assert(failure.profile_id == "p2");
        assert(failure.original_error == "Failed to launch browser");
        assert(failure.failed_step.id == "work");
        assert(sessions.opened == 1);
        assert(sessions.closed == 1);
    }

    std::cout << "✓ slot timeout and session errors test passed" << std::endl;
}

void test_deadline_ignores_late_success() {
    std::cout << "Testing slot deadline with a runner that ignores cancellation..." << std::endl;

    using clock = std::chrono::steady_clock;
    std::mutex mutex;
    std::map<std::string, clock::time_point> starts;
    std::atomic<int> finished{0};

    // Sleeps past the deadline without looking at the token, then reports success
    WorkflowRunner stubborn = [&](const Workflow& workflow, ExecutionOptions options) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            starts[options.profile_id] = clock::now();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(600));
        Execution execution;
        execution.id = generate_id("exec");
        execution.workflow_id = workflow.id;
        execution.status = ExecutionStatus::completed;
        ++finished;
        return execution;
    };

    Workflow workflow = make_workflow("batch", {make_step("work", "work")});
    ParallelOptions options = fast_options(1);
    options.timeout_ms = 100;
    ParallelExecutor parallel(options);
    EventLog log(parallel.events());

    auto status = parallel.run(stubborn, workflow, make_profiles(2));
    assert(status);
    assert(finished == 2);
    assert(status->completed == 0);
    assert(status->failed == 2);
    for (const auto& failure : status->failed_list) {
        assert(failure.original_error == "Execution timeout after 100ms");
    }
    assert(log.count("slotSuccess") == 0);
    assert(log.count("slotFailure") == 2);

    // The expired slot gave up its place before its runner returned
    assert(starts.size() == 2);
    assert(starts["p2"] - starts["p1"] < std::chrono::milliseconds(450));

    std::cout << "✓ slot deadline test passed" << std::endl;
}

void test_options_parsing_and_updates() {
    std::cout << "Testing options..." << std::endl;

    auto parsed = ParallelOptions::from_json(json{
        {"maxConcurrent", 5}, {"delayBetween", 250}, {"timeout", 60000},
        {"stopOnError", true}, {"queueMode", "priority"}, {"retry", "aggressive"}
    });
    assert(parsed);
    assert(parsed->max_concurrent == 5);
    assert(parsed->delay_between_ms == 250);
    assert(parsed->stop_on_error);
    assert(parsed->queue_mode == QueueMode::priority);
    assert(parsed->retry.max_retries == 5);

    json j = *parsed;
    assert(j["queueMode"] == "priority");
    assert(j["retry"]["maxRetries"] == 5);

    assert(!ParallelOptions::from_json(json::array()));
    assert(!ParallelOptions::from_json(json{{"maxConcurrent", 0}}));
    assert(!ParallelOptions::from_json(json{{"delayBetween", -1}}));
    assert(!ParallelOptions::from_json(json{{"retry", "reckless"}}));
    auto bad_mode = ParallelOptions::from_json(json{{"queueMode", "sideways"}});
    assert(!bad_mode);
    assert(error_message(bad_mode.error()) == "Unknown queue mode: sideways");

    ParallelExecutor parallel(fast_options(1));
    assert(parallel.update_config(json{{"maxConcurrent", 3}, {"retry", {{"maxRetries", 1}}}}));
    assert(parallel.options().max_concurrent == 3);
    assert(parallel.options().retry.max_retries == 1);
    assert(!parallel.update_config(json{{"maxConcurrent", 0}}));
    assert(parallel.options().max_concurrent == 3);

    std::cout << "✓ options test passed" << std::endl;
}

void test_event_bus_subscriptions() {
    std::cout << "Testing event bus..." << std::endl;

    EventBus bus;
    int first = 0;
    int second = 0;
    uint64_t a = bus.subscribe([&first](const ParallelEvent&) { ++first; });
    uint64_t b = bus.subscribe([&second](const ParallelEvent& event) {
        if (event.type == "progress") ++second;
    });
    assert(a != b);
    assert(bus.subscriber_count() == 2);

    bus.publish(ParallelEvent{"progress", json{{"progress", 50}}});
    bus.publish(ParallelEvent{"pause", json::object()});
    assert(first == 2);
    assert(second == 1);

    assert(bus.unsubscribe(a));
    assert(!bus.unsubscribe(a));
    bus.publish(ParallelEvent{"progress", json::object()});
    assert(first == 2);
    assert(second == 2);

    {
        ParallelExecutor parallel(fast_options(1));
        EventLog log(parallel.events());
        assert(parallel.events().subscriber_count() == 1);
    }

    std::cout << "✓ event bus test passed" << std::endl;
}

int main() {
    std::cout << "Running parallel executor tests..." << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        std::cout << "\n[Scheduling]" << std::endl;
        test_runs_every_profile_within_limit();
        test_priority_queue_order();
        test_retries_and_failures();
        test_stop_on_error();

        std::cout << "\n[Control]" << std::endl;
        test_pause_and_resume();
        test_stop_releases_active_slots();
        test_skip_slot();
        test_queue_changes_while_running();

        std::cout << "\n[Slots and Options]" << std::endl;
        test_slot_timeout_and_session_errors();
        test_deadline_ignores_late_success();
        test_options_parsing_and_updates();
        test_event_bus_subscriptions();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All parallel executor tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    } catch (...) {
        std::cerr << "\n❌ Test failed with unknown exception" << std::endl;
        return 1;
    }
}
