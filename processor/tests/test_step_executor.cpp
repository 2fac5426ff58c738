#include <iostream>
#include <cassert>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "fleetrun/engine/expression.hpp"
#include "fleetrun/engine/step_executor.hpp"
#include "test_fakes.hpp"

using namespace fleetrun::engine;
using fleetrun::test::FakePage;
using fleetrun::test::ScriptedAction;
using fleetrun::test::make_step;
using fleetrun::test::make_workflow;

namespace {

struct Fixture {
    std::shared_ptr<ActionRegistry> actions = std::make_shared<ActionRegistry>();
    std::shared_ptr<ScriptedAction> record = std::make_shared<ScriptedAction>("record");
    std::shared_ptr<ScriptedAction> flaky = std::make_shared<ScriptedAction>("flaky");
    std::shared_ptr<WorkflowRegistry> workflows;
    std::unique_ptr<WorkflowExecutor> executor;

    Fixture() {
        register_builtin_actions(*actions);
        actions->register_action(record);
        actions->register_action(flaky);
        workflows = std::make_shared<WorkflowRegistry>(actions);
        executor = std::make_unique<WorkflowExecutor>(actions, workflows);
    }
};

const StepResult* find_result(const Execution& execution, const std::string& step_id) {
    for (const auto& result : execution.results) {
        if (result.step_id == step_id) {
            return &result;
        }
    }
    return nullptr;
}

Step with_children(Step step, std::vector<Step> children) {
    step.body = std::move(children);
    return step;
}

} // namespace

void test_actions_share_variables() {
    std::cout << "Testing action data flow..." << std::endl;

    Fixture f;
    Workflow workflow = make_workflow("flow", {
        make_step("greet", "set-variable", json{{"name", "greeting"}, {"value", "hi {{who}}"}}),
        make_step("double", "calculate", json{{"expression", "{{n}} * 2"}, {"saveAs", "doubled"}}),
        make_step("note", "log", json{{"message", "{{greeting}}"}}),
        make_step("aside", "comment", json{{"text", "nothing to do"}})
    });
    workflow.variables = json{{"who", "ada"}, {"n", 21}};

    Execution execution = f.executor->execute(workflow);
    assert(execution.status == ExecutionStatus::completed);
    assert(execution.results.size() == 4);
    assert(execution.variables["greeting"] == "hi ada");
    assert(execution.variables["doubled"] == 42);
    assert(execution.results[0].data["success"] == true);
    assert(find_result(execution, "note")->data["logged"] == "hi ada");
    assert(!execution.failed_step);

    // Parameters override workflow variables
    ExecutionOptions options;
    options.parameters = json{{"who", "grace"}};
    execution = f.executor->execute(workflow, options);
    assert(execution.variables["greeting"] == "hi grace");

    std::cout << "✓ action data flow test passed" << std::endl;
}

void test_conditions() {
    std::cout << "Testing condition steps..." << std::endl;

    Fixture f;
    auto page = std::make_shared<FakePage>();
    page->elements["#login"] = FakePage::Element{1, true, ""};
    page->elements["h1"] = FakePage::Element{1, true, "Welcome back"};
    page->elements["#hidden"] = FakePage::Element{1, false, ""};
    page->current_url = "https://shop.example.com/cart";

    Step exists = make_step("exists", "condition", json{{"conditionType", "element-exists"}, {"selector", "#login"}});
    exists.then_steps.push_back(make_step("click-login", "click", json{{"selector", "#login"}}));
    exists.else_steps.push_back(make_step("never", "record"));

    Step visible = make_step("visible", "condition", json{{"conditionType", "element-visible"}, {"selector", "#hidden"}});
    visible.else_steps.push_back(make_step("hidden-branch", "record", json{{"branch", "else"}}));

    Step text = make_step("text", "condition",
                          json{{"conditionType", "text-contains"}, {"selector", "h1"}, {"text", "Welcome"}});
    Step url = make_step("url", "condition",
                         json{{"conditionType", "url-contains"}, {"urlPattern", "/cart"}, {"negate", true}});
    Step compare = make_step("compare", "condition",
                             json{{"conditionType", "compare"}, {"left", "{{n}}"}, {"operator", ">"}, {"right", "5"}});
    Step expression = make_step("expression", "condition",
                                json{{"conditionType", "expression"}, {"expression", "{{n}} == 21 && {{mode}} == fast"}});

    Workflow workflow = make_workflow("conditions", {exists, visible, text, url, compare, expression});
    workflow.variables = json{{"n", 21}, {"mode", "fast"}};

    ExecutionOptions options;
    options.page = page;
    Execution execution = f.executor->execute(workflow, options);
    assert(execution.status == ExecutionStatus::completed);

    assert(page->clicks.size() == 1);
    assert(find_result(execution, "exists")->data["branch"] == "then");
    assert(!find_result(execution, "never"));
    assert(find_result(execution, "visible")->data["conditionResult"] == false);
    assert(find_result(execution, "hidden-branch"));
    assert(find_result(execution, "text")->data["conditionResult"] == true);
    assert(find_result(execution, "url")->data["conditionResult"] == false);
    assert(find_result(execution, "compare")->data["conditionResult"] == true);
    assert(find_result(execution, "expression")->data["conditionResult"] == true);

    // Nested results come before their container
    assert(execution.results[0].step_id == "click-login");
    assert(execution.results[1].step_id == "exists");

    // Page conditions without a page are false
    Execution detached = f.executor->execute(make_workflow("detached", {exists}));
    assert(detached.status == ExecutionStatus::completed);
    assert(find_result(detached, "exists")->data["branch"] == "else");
    assert(f.record->calls() == 2);

    std::cout << "✓ condition steps test passed" << std::endl;
}

void test_count_and_while_loops() {
    std::cout << "Testing count/while loops..." << std::endl;

    Fixture f;
    Step count = with_children(make_step("sum", "loop-count", json{{"count", 3}}), {
        make_step("add", "calculate", json{{"expression", "{{total}} + {{i}}"}, {"saveAs", "total"}})
    });
    Step zero = with_children(make_step("zero", "loop-count", json{{"count", 0}}), {make_step("z", "record")});
    Step until = with_children(make_step("until", "loop-while", json{{"condition", "{{n}} < 3"}}), {
        make_step("inc", "calculate", json{{"expression", "{{n}} + 1"}, {"saveAs", "n"}})
    });
    Step capped = with_children(make_step("capped", "loop-while",
                                          json{{"condition", "true"}, {"maxIterations", 5}}), {
        make_step("tick", "record")
    });

    Workflow workflow = make_workflow("loops", {count, zero, until, capped});
    workflow.variables = json{{"total", 0}, {"n", 0}};

    Execution execution = f.executor->execute(workflow);
    assert(execution.status == ExecutionStatus::completed);
    assert(execution.variables["total"] == 3);
    assert(!execution.variables.contains("i"));
    assert(find_result(execution, "zero")->data["iterations"] == 0);
    assert(execution.variables["n"] == 3);
    assert(find_result(execution, "until")->data["iterations"] == 3);
    assert(find_result(execution, "capped")->data["iterations"] == 5);
    assert(f.record->calls() == 5);

    std::cout << "✓ count/while loops test passed" << std::endl;
}

void test_array_and_element_loops() {
    std::cout << "Testing array/element loops..." << std::endl;

    Fixture f;
    auto page = std::make_shared<FakePage>();
    page->elements[".row"] = FakePage::Element{3, true, ""};

    Step literal = with_children(make_step("literal", "loop-array", json{{"array", {"a", "b"}}}), {
        make_step("seen", "record", json{{"value", "{{item}}"}, {"index", "{{loop.index}}"}, {"last", "{{loop.last}}"}})
    });
    Step named = with_children(make_step("named", "loop-array",
                                         json{{"array", "colors"}, {"variableName", "color"}}), {
        make_step("paint", "record", json{{"value", "{{color}}"}})
    });
    Step rows = with_children(make_step("rows", "loop-elements", json{{"selector", ".row"}, {"maxItems", 2}}), {
        make_step("row", "record", json{{"value", "{{element.selector}}"}})
    });

    Workflow workflow = make_workflow("arrays", {literal, named, rows});
    workflow.variables = json{{"colors", {"red"}}};
    ExecutionOptions options;
    options.page = page;

    Execution execution = f.executor->execute(workflow, options);
    assert(execution.status == ExecutionStatus::completed);

    auto configs = f.record->configs();
    assert(configs.size() == 5);
    assert(configs[0]["value"] == "a");
    assert(configs[0]["last"] == "false");
    assert(configs[1]["value"] == "b");
    assert(configs[1]["index"] == "1");
    assert(configs[1]["last"] == "true");
    assert(configs[2]["value"] == "red");
    assert(configs[3]["value"] == ".row >> nth=0");
    assert(configs[4]["value"] == ".row >> nth=1");

    // A string that is neither JSON nor an array variable fails the loop
    Step bad = make_step("bad", "loop-array", json{{"array", "nope"}});
    Execution failed = f.executor->execute(make_workflow("bad", {bad}));
    assert(failed.status == ExecutionStatus::failed);
    assert(failed.error_code == ErrorCode::invalid_format);

    // loop-elements needs a page
    Execution no_page = f.executor->execute(make_workflow("no-page", {rows}));
    assert(no_page.error_code == ErrorCode::session_unavailable);

    std::cout << "✓ array/element loops test passed" << std::endl;
}

void test_break_and_continue() {
    std::cout << "Testing break/continue..." << std::endl;

    Fixture f;
    Step stop_at_b = make_step("is-b", "condition", json{{"conditionType", "expression"}, {"expression", "{{item}} == b"}});
    stop_at_b.then_steps.push_back(make_step("brk", "break"));
    Step breaking = with_children(make_step("letters", "loop-array", json{{"array", {"a", "b", "c"}}}), {
        stop_at_b,
        make_step("letter", "record", json{{"value", "{{item}}"}})
    });

    Step skip_even = make_step("even", "condition", json{{"conditionType", "expression"}, {"expression", "{{i}} % 2 == 0"}});
    skip_even.then_steps.push_back(make_step("cont", "continue"));
    Step continuing = with_children(make_step("numbers", "loop-count", json{{"count", 4}}), {
        skip_even,
        make_step("odd", "record", json{{"value", "{{i}}"}})
    });

    Execution execution = f.executor->execute(make_workflow("signals", {breaking, continuing}));
    assert(execution.status == ExecutionStatus::completed);
    assert(find_result(execution, "letters")->data["iterations"] == 2);
    assert(find_result(execution, "numbers")->data["iterations"] == 4);

    auto configs = f.record->configs();
    assert(configs.size() == 3);
    assert(configs[0]["value"] == "a");
    assert(configs[1]["value"] == "1");
    assert(configs[2]["value"] == "3");

    std::cout << "✓ break/continue test passed" << std::endl;
}

void test_try_catch_finally() {
    std::cout << "Testing try-catch-finally..." << std::endl;

    Fixture f;
    f.flaky->fail_next("boom");
    Step guarded = make_step("guarded", "try-catch");
    guarded.try_steps.push_back(make_step("risky", "flaky"));
    guarded.try_steps.push_back(make_step("skipped", "record"));
    guarded.catch_steps.push_back(make_step("remember", "set-variable",
                                            json{{"name", "caught"}, {"value", "{{error.message}}|{{error.code}}|{{error.stack}}"}}));
    guarded.finally_steps.push_back(make_step("cleanup", "set-variable", json{{"name", "cleaned"}, {"value", "yes"}}));

    Execution execution = f.executor->execute(make_workflow("try", {guarded}));
    assert(execution.status == ExecutionStatus::completed);
    assert(execution.variables["caught"] == "Step \"risky\" failed: boom|action_failed|at guarded");
    assert(execution.variables["cleaned"] == "yes");
    assert(find_result(execution, "guarded")->data["caught"] == true);
    assert(f.record->calls() == 0);

    // continueOnError=false re-raises after catch and finally
    f.flaky->fail_next("boom again");
    Step rethrow = guarded;
    rethrow.id = "rethrow";
    rethrow.config = json{{"continueOnError", false}};
    execution = f.executor->execute(make_workflow("rethrow", {rethrow}));
    assert(execution.status == ExecutionStatus::failed);
    assert(execution.error.find("boom again") != std::string::npos);
    assert(execution.variables["cleaned"] == "yes");

    // A failed stop inside try is caught like any other step error
    Step halting = make_step("halting", "try-catch");
    halting.try_steps.push_back(make_step("halt", "stop", json{{"status", "failed"}, {"message", "halt"}}));
    halting.try_steps.push_back(make_step("skipped", "record"));
    halting.catch_steps.push_back(make_step("noted", "set-variable",
                                            json{{"name", "halted"}, {"value", "{{error.message}}|{{error.code}}"}}));
    halting.finally_steps.push_back(make_step("cleanup", "set-variable", json{{"name", "cleaned"}, {"value", "yes"}}));
    execution = f.executor->execute(make_workflow("halting", {halting, make_step("after", "record")}));
    assert(execution.status == ExecutionStatus::completed);
    assert(execution.variables["halted"] == "halt|stopped_by_step");
    assert(execution.variables["cleaned"] == "yes");
    assert(find_result(execution, "halting")->data["caught"] == true);
    assert(find_result(execution, "halting")->data["error"] == "halt");
    assert(f.record->calls() == 1);

    // Without continueOnError the caught stop still fails the run after finally
    Step strict = halting;
    strict.id = "strict";
    strict.config = json{{"continueOnError", false}};
    execution = f.executor->execute(make_workflow("strict", {strict, make_step("after", "record")}));
    assert(execution.status == ExecutionStatus::failed);
    assert(execution.error == "halt");
    assert(execution.error_code == ErrorCode::stopped_by_step);
    assert(f.record->calls() == 1);

    std::cout << "✓ try-catch-finally test passed" << std::endl;
}

void test_call_workflow() {
    std::cout << "Testing call-workflow..." << std::endl;

    Fixture f;
    Workflow child = make_workflow("child", {
        make_step("out", "set-variable", json{{"name", "out"}, {"value", "{{input}}-done"}})
    });
    assert(f.workflows->register_workflow(child));
    Workflow failing = make_workflow("child-bad", {make_step("explode", "flaky")});
    assert(f.workflows->register_workflow(failing));
    Workflow recursive = make_workflow("recurse", {
        make_step("again", "call-workflow", json{{"workflowId", "recurse"}})
    });
    assert(f.workflows->register_workflow(recursive));

    Workflow parent = make_workflow("parent", {
        make_step("call", "call-workflow", json{{"workflowId", "child"}, {"parameters", {{"input", "{{seed}}"}}}})
    });
    parent.variables = json{{"seed", "x"}};
    Execution execution = f.executor->execute(parent);
    assert(execution.status == ExecutionStatus::completed);
    const StepResult* call = find_result(execution, "call");
    assert(call->data["status"] == "completed");
    assert(call->data["variables"]["out"] == "x-done");
    assert(!execution.variables.contains("out"));

    execution = f.executor->execute(make_workflow("ghost", {
        make_step("call", "call-workflow", json{{"workflowId", "ghost"}})
    }));
    assert(execution.status == ExecutionStatus::failed);
    assert(execution.error_code == ErrorCode::workflow_not_found);
    assert(execution.error.find("Workflow not found: ghost") != std::string::npos);

    f.flaky->fail_next("child broke");
    execution = f.executor->execute(make_workflow("wrapper", {
        make_step("call", "call-workflow", json{{"workflowId", "child-bad"}})
    }));
    assert(execution.status == ExecutionStatus::failed);
    assert(execution.error.find("Workflow child-bad failed") != std::string::npos);
    assert(execution.error.find("child broke") != std::string::npos);

    execution = f.executor->execute(recursive);
    assert(execution.status == ExecutionStatus::failed);
    assert(execution.error_code == ErrorCode::call_depth_exceeded);
    assert(execution.error.find("Maximum workflow call depth (10) exceeded") != std::string::npos);

    execution = f.executor->execute(make_workflow("async", {
        make_step("call", "call-workflow", json{{"workflowId", "child"}, {"waitForCompletion", false}})
    }));
    assert(execution.status == ExecutionStatus::failed);
    assert(execution.error_code == ErrorCode::internal_error);

    std::cout << "✓ call-workflow test passed" << std::endl;
}

void test_async_calls_drain_on_shutdown() {
    std::cout << "Testing asynchronous workflow calls..." << std::endl;

    Fixture f;
    auto slow = std::make_shared<ScriptedAction>("slow", 50);
    f.actions->register_action(slow);
    assert(f.workflows->register_workflow(make_workflow("slow-child", {make_step("wait", "slow")})));

    auto executor = std::make_unique<WorkflowExecutor>(f.actions, f.workflows, nullptr, 1);
    std::vector<Step> calls;
    for (int i = 0; i < 3; ++i) {
        calls.push_back(make_step("call-" + std::to_string(i), "call-workflow",
                                  json{{"workflowId", "slow-child"}, {"waitForCompletion", false}}));
    }
    Execution execution = executor->execute(make_workflow("fan-out", calls));
    assert(execution.status == ExecutionStatus::completed);
    const StepResult* first = find_result(execution, "call-0");
    assert(first->data["async"] == true);
    assert(first->data["executionId"].get<std::string>().rfind("exec", 0) == 0);

    // Destroying the executor runs every queued call to completion first
    executor.reset();
    assert(slow->calls() == 3);

    std::cout << "✓ asynchronous workflow calls test passed" << std::endl;
}

void test_stop_steps() {
    std::cout << "Testing stop steps..." << std::endl;

    Fixture f;
    Execution execution = f.executor->execute(make_workflow("stop-ok", {
        make_step("done", "stop"),
        make_step("after", "record")
    }));
    assert(execution.status == ExecutionStatus::completed);
    assert(f.record->calls() == 0);

    Step inner = with_children(make_step("loop", "loop-count", json{{"count", 5}}), {
        make_step("stop-in-loop", "stop")
    });
    execution = f.executor->execute(make_workflow("stop-nested", {inner, make_step("after", "record")}));
    assert(execution.status == ExecutionStatus::completed);
    assert(find_result(execution, "loop")->data["iterations"] == 1);
    assert(f.record->calls() == 0);

    execution = f.executor->execute(make_workflow("stop-failed", {
        make_step("abort", "stop", json{{"status", "failed"}})
    }));
    assert(execution.status == ExecutionStatus::failed);
    assert(execution.error == "Workflow stopped with failed status");
    assert(execution.error_code == ErrorCode::stopped_by_step);

    std::cout << "✓ stop steps test passed" << std::endl;
}

void test_continue_on_error_and_failed_step() {
    std::cout << "Testing continueOnError and failedStep..." << std::endl;

    Fixture f;
    Step second = make_step("second", "flaky");
    second.name = "Second step";
    Workflow workflow = make_workflow("errors", {make_step("first", "record"), second, make_step("third", "record")});

    f.flaky->fail_next("boom");
    Execution execution = f.executor->execute(workflow);
    assert(execution.status == ExecutionStatus::failed);
    assert(execution.error == "Step \"Second step\" failed: boom");
    assert(execution.error_code == ErrorCode::action_failed);
    assert(execution.failed_step);
    assert(execution.failed_step->index == 1);
    assert(execution.failed_step->id == "second");
    assert(execution.results.size() == 2);

    json j = execution;
    assert(j["status"] == "failed");
    assert(j["failedStep"]["index"] == 1);

    workflow.settings = json{{"continueOnError", true}};
    f.flaky->fail_next("boom");
    execution = f.executor->execute(workflow);
    assert(execution.status == ExecutionStatus::completed);
    assert(execution.results.size() == 3);
    assert(!execution.results[1].success);
    assert(execution.failed_step && execution.failed_step->index == 1);

    // Options win over settings
    ExecutionOptions strict;
    strict.continue_on_error = false;
    f.flaky->fail_next("boom");
    execution = f.executor->execute(workflow, strict);
    assert(execution.status == ExecutionStatus::failed);

    std::cout << "✓ continueOnError and failedStep test passed" << std::endl;
}

void test_cancellation_and_timeout() {
    std::cout << "Testing cancellation and timeout..." << std::endl;

    Fixture f;
    Workflow workflow = make_workflow("long", {make_step("a", "record"), make_step("b", "record")});

    auto token = std::make_shared<CancellationToken>();
    token->cancel(CancellationToken::Reason::user, "Stopped by user");
    ExecutionOptions cancelled;
    cancelled.cancellation = token;
    Execution execution = f.executor->execute(workflow, cancelled);
    assert(execution.status == ExecutionStatus::stopped);
    assert(execution.error == "Stopped by user");
    assert(execution.results.empty());

    // Cancellation while an action is in flight
    auto slow = std::make_shared<ScriptedAction>("slow", 5000);
    f.actions->register_action(slow);
    auto live = std::make_shared<CancellationToken>();
    ExecutionOptions running;
    running.cancellation = live;
    std::thread canceller([live]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        live->cancel(CancellationToken::Reason::user, "Stopped by user");
    });
    auto started = std::chrono::steady_clock::now();
    execution = f.executor->execute(make_workflow("slow", {make_step("wait", "slow"), make_step("after", "record")}),
                                    running);
    canceller.join();
    assert(execution.status == ExecutionStatus::stopped);
    assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));
    assert(f.record->calls() == 0);

    ExecutionOptions limited;
    limited.timeout_ms = 50;
    execution = f.executor->execute(make_workflow("timeout", {
        make_step("sleep", "wait-time", json{{"duration", 5}})
    }), limited);
    assert(execution.status == ExecutionStatus::failed);
    assert(execution.error_code == ErrorCode::cancelled_by_timeout);
    assert(execution.error == "Execution timeout after 50ms");

    std::cout << "✓ cancellation and timeout test passed" << std::endl;
}

void test_progress_and_errors() {
    std::cout << "Testing progress callback and action errors..." << std::endl;

    Fixture f;
    std::vector<std::string> progress;
    ExecutionOptions options;
    options.on_progress = [&progress](size_t index, size_t total, const Step& step) {
        progress.push_back(std::to_string(index) + "/" + std::to_string(total) + ":" + step.id);
    };
    Step loop = with_children(make_step("loop", "loop-count", json{{"count", 2}}), {make_step("inner", "record")});
    Execution execution = f.executor->execute(make_workflow("progress", {make_step("first", "record"), loop}), options);
    assert(execution.status == ExecutionStatus::completed);
    assert((progress == std::vector<std::string>{"0/2:first", "1/2:loop"}));

    execution = f.executor->execute(make_workflow("unknown", {make_step("mystery", "teleport")}));
    assert(execution.status == ExecutionStatus::failed);
    assert(execution.results[0].error_code == ErrorCode::unknown_action);
    assert(execution.results[0].error_message == "Unknown action type: teleport");

    execution = f.executor->execute(make_workflow("no-page", {make_step("press", "click", json{{"selector", "#go"}})}));
    assert(execution.results[0].error_code == ErrorCode::session_unavailable);

    auto page = std::make_shared<FakePage>();
    ExecutionOptions with_page;
    with_page.page = page;
    execution = f.executor->execute(make_workflow("missing", {make_step("press", "click", json{{"selector", "#go"}})}),
                                    with_page);
    assert(execution.results[0].error_code == ErrorCode::action_failed);
    assert(execution.results[0].error_message == "element_not_found: #go");

    execution = f.executor->execute(make_workflow("required", {make_step("nav", "navigate")}), with_page);
    assert(execution.results[0].error_code == ErrorCode::missing_required_field);

    std::cout << "✓ progress callback and action errors test passed" << std::endl;
}

int main() {
    std::cout << "Running step executor tests..." << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        std::cout << "\n[Actions]" << std::endl;
        test_actions_share_variables();
        test_progress_and_errors();

        std::cout << "\n[Control Flow]" << std::endl;
        test_conditions();
        test_count_and_while_loops();
        test_array_and_element_loops();
        test_break_and_continue();
        test_try_catch_finally();
        test_call_workflow();
        test_async_calls_drain_on_shutdown();
        test_stop_steps();

        std::cout << "\n[Run Lifecycle]" << std::endl;
        test_continue_on_error_and_failed_step();
        test_cancellation_and_timeout();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All step executor tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    } catch (...) {
        std::cerr << "\n❌ Test failed with unknown exception" << std::endl;
        return 1;
    }
}
