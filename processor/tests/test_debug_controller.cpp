#include <iostream>
#include <cassert>
#include <memory>
#include <string>
#include "fleetrun/engine/debug_controller.hpp"
#include "test_fakes.hpp"

using namespace fleetrun::engine;
using fleetrun::test::ScriptedAction;
using fleetrun::test::make_step;
using fleetrun::test::make_workflow;

namespace {

struct Fixture {
    std::shared_ptr<ActionRegistry> actions = std::make_shared<ActionRegistry>();
    std::shared_ptr<ScriptedAction> record = std::make_shared<ScriptedAction>("record");
    std::shared_ptr<WorkflowExecutor> executor;
    std::unique_ptr<DebugController> controller;

    Fixture() {
        register_builtin_actions(*actions);
        actions->register_action(record);
        executor = std::make_shared<WorkflowExecutor>(actions);
        controller = std::make_unique<DebugController>(executor);
    }

    DebugController& debugger() { return *controller; }
};

Workflow counter_workflow() {
    Workflow workflow = make_workflow("counter", {
        make_step("s1", "calculate", json{{"expression", "{{n}} + 1"}, {"saveAs", "n"}}),
        make_step("s2", "calculate", json{{"expression", "{{n}} + 1"}, {"saveAs", "n"}}),
        make_step("s3", "record", json{{"value", "{{n}}"}}),
        make_step("s4", "calculate", json{{"expression", "{{n}} * 10"}, {"saveAs", "n"}})
    });
    workflow.variables = json{{"n", 0}};
    return workflow;
}

} // namespace

void test_start_and_step() {
    std::cout << "Testing debug start/step..." << std::endl;

    Fixture f;
    auto started = f.debugger().start(counter_workflow());
    assert(started);
    assert(started->status == DebugStatus::paused);
    assert(started->current_step_index == 0);
    assert(started->total_steps == 4);
    assert(started->next_step && started->next_step->id == "s1");
    assert(started->results.empty());
    assert(started->id.rfind("debug-", 0) == 0);

    auto stepped = f.debugger().step(started->id);
    assert(stepped);
    assert(stepped->status == DebugStatus::paused);
    assert(stepped->current_step_index == 1);
    assert(stepped->variables["n"] == 1);
    assert(stepped->last_result && stepped->last_result->step_id == "s1");
    assert(stepped->next_step->id == "s2");

    json j = *stepped;
    assert(j["status"] == "paused");
    assert(j["nextStep"]["id"] == "s2");
    assert(j["stepResult"]["stepId"] == "s1");
    assert(j["error"].is_null());

    for (int i = 0; i < 3; ++i) {
        stepped = f.debugger().step(started->id);
        assert(stepped);
    }
    assert(stepped->status == DebugStatus::completed);
    assert(stepped->variables["n"] == 20);
    assert(stepped->results.size() == 4);
    assert(!stepped->next_step);

    auto finished = f.debugger().step(started->id);
    assert(!finished);
    assert(error_message(finished.error()).find("already finished") != std::string::npos);

    std::cout << "✓ debug start/step test passed" << std::endl;
}

void test_empty_workflow_starts_completed() {
    std::cout << "Testing debug start on an empty workflow..." << std::endl;

    Fixture f;
    auto started = f.debugger().start(make_workflow("empty", {}));
    assert(started);
    assert(started->status == DebugStatus::completed);
    assert(started->total_steps == 0);
    assert(!started->next_step);
    assert(started->results.empty());

    auto stepped = f.debugger().step(started->id);
    assert(!stepped);
    assert(error_message(stepped.error()).find("already finished") != std::string::npos);
    auto resumed = f.debugger().continue_run(started->id);
    assert(!resumed);
    assert(error_message(resumed.error()).find("already finished") != std::string::npos);

    std::cout << "✓ debug start on an empty workflow test passed" << std::endl;
}

void test_continue_honours_breakpoints() {
    std::cout << "Testing continue with breakpoints..." << std::endl;

    Fixture f;
    auto session = f.debugger().start(counter_workflow(), ExecutionOptions(), {"s3"});
    assert(session);
    assert(session->breakpoints.size() == 1);

    auto paused = f.debugger().continue_run(session->id);
    assert(paused);
    assert(paused->status == DebugStatus::paused);
    assert(paused->current_step_index == 2);
    assert(paused->next_step->id == "s3");
    assert(f.record->calls() == 0);

    // Resuming from the breakpoint executes it
    assert(f.debugger().set_breakpoint(session->id, "s4"));
    paused = f.debugger().continue_run(session->id);
    assert(paused->current_step_index == 3);
    assert(f.record->calls() == 1);

    assert(f.debugger().set_breakpoint(session->id, "s4", false)->breakpoints.size() == 1);
    auto done = f.debugger().continue_run(session->id);
    assert(done->status == DebugStatus::completed);
    assert(done->variables["n"] == 20);

    std::cout << "✓ continue with breakpoints test passed" << std::endl;
}

void test_set_variable_is_visible_to_next_step() {
    std::cout << "Testing set_variable..." << std::endl;

    Fixture f;
    auto session = f.debugger().start(counter_workflow());
    assert(f.debugger().step(session->id));

    auto updated = f.debugger().set_variable(session->id, "n", 41);
    assert(updated && updated->variables["n"] == 41);
    auto stepped = f.debugger().step(session->id);
    assert(stepped->variables["n"] == 42);

    assert(!f.debugger().set_variable(session->id, "", 1));
    assert(!f.debugger().set_variable("debug-missing", "n", 1));

    std::cout << "✓ set_variable test passed" << std::endl;
}

void test_failures_and_stop_steps() {
    std::cout << "Testing debug failures..." << std::endl;

    Fixture f;
    f.record->fail_next("boom");
    auto session = f.debugger().start(make_workflow("failing", {
        make_step("bad", "record"),
        make_step("never", "record")
    }));
    auto failed = f.debugger().continue_run(session->id);
    assert(failed->status == DebugStatus::failed);
    assert(failed->error == "Step \"bad\" failed: boom");
    assert(failed->current_step_index == 1);

    // continueOnError keeps the session going
    ExecutionOptions lenient;
    lenient.continue_on_error = true;
    f.record->fail_next("boom");
    session = f.debugger().start(make_workflow("lenient", {make_step("bad", "record"), make_step("ok", "record")}),
                               lenient);
    auto done = f.debugger().continue_run(session->id);
    assert(done->status == DebugStatus::completed);
    assert(!done->results[0].success);

    session = f.debugger().start(make_workflow("halting", {
        make_step("halt", "stop", json{{"status", "failed"}, {"message", "halt here"}}),
        make_step("after", "record")
    }));
    auto halted = f.debugger().step(session->id);
    assert(halted->status == DebugStatus::failed);
    assert(halted->error == "halt here");

    session = f.debugger().start(make_workflow("ending", {make_step("end", "stop"), make_step("after", "record")}));
    auto ended = f.debugger().step(session->id);
    assert(ended->status == DebugStatus::completed);

    std::cout << "✓ debug failures test passed" << std::endl;
}

void test_stop_list_and_dispose() {
    std::cout << "Testing stop/list/dispose..." << std::endl;

    Fixture f;
    auto first = f.debugger().start(counter_workflow());
    auto second = f.debugger().start(make_workflow("other", {make_step("only", "record")}));
    assert(first && second);
    assert(first->id != second->id);
    assert(f.debugger().list().size() == 2);

    auto stopped = f.debugger().stop(first->id);
    assert(stopped->status == DebugStatus::stopped);
    assert(!stopped->next_step);
    assert(!f.debugger().step(first->id));
    assert(!f.debugger().continue_run(first->id));
    assert(f.debugger().state(first->id)->status == DebugStatus::stopped);

    for (const auto& summary : f.debugger().list()) {
        json j = summary;
        if (summary.id == first->id) {
            assert(j["status"] == "stopped");
            assert(j["totalSteps"] == 4);
        }
    }

    assert(f.debugger().dispose(first->id));
    assert(!f.debugger().dispose(first->id));
    auto gone = f.debugger().state(first->id);
    assert(!gone);
    assert(error_message(gone.error()) == "Debug session not found: " + first->id);

    assert(f.debugger().start(counter_workflow()));
    assert(f.debugger().dispose_all() == 2);
    assert(f.debugger().list().empty());

    DebugController detached(nullptr);
    assert(!detached.start(counter_workflow()));

    std::cout << "✓ stop/list/dispose test passed" << std::endl;
}

int main() {
    std::cout << "Running debug controller tests..." << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        test_start_and_step();
        test_empty_workflow_starts_completed();
        test_continue_honours_breakpoints();
        test_set_variable_is_visible_to_next_step();
        test_failures_and_stop_steps();
        test_stop_list_and_dispose();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All debug controller tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    } catch (...) {
        std::cerr << "\n❌ Test failed with unknown exception" << std::endl;
        return 1;
    }
}
