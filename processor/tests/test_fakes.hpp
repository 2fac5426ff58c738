#pragma once

#include "fleetrun/engine/action.hpp"
#include "fleetrun/engine/parallel_executor.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace fleetrun {
namespace test {

using engine::json;

/**
 * Action whose outcome is scripted per call. Calls beyond the script use
 * the default outcome. Records every config it was called with.
 */
class ScriptedAction : public engine::BaseAction {
public:
    struct Outcome {
        bool success = true;
        std::string error;
        engine::ErrorCode code = engine::ErrorCode::action_failed;
        json data = json::object();
    };

    explicit ScriptedAction(std::string type, int64_t latency_ms = 0)
        : BaseAction(std::move(type)), latency_ms_(latency_ms) {}

    void push(Outcome outcome) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(std::move(outcome));
    }

    void fail_next(const std::string& error, int times = 1) {
        for (int i = 0; i < times; ++i) {
            push(Outcome{false, error});
        }
    }

    void set_default(Outcome outcome) {
        std::lock_guard<std::mutex> lock(mutex_);
        default_ = std::move(outcome);
    }

    // Fails every call whose profile.id equals `profile_id`
    void fail_for_profile(const std::string& profile_id, const std::string& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        profile_failures_[profile_id] = error;
    }

    int calls() const { return calls_.load(); }

    std::vector<json> configs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return configs_;
    }

protected:
    caf::expected<engine::ActionResult> execute_impl(engine::ExecutionContext& ctx, const json& config) override {
        ++calls_;
        if (latency_ms_ > 0 && ctx.cancellation) {
            if (!ctx.cancellation->wait_for(std::chrono::milliseconds(latency_ms_))) {
                engine::ErrorCode code = ctx.cancellation->reason() == engine::CancellationToken::Reason::timeout
                    ? engine::ErrorCode::cancelled_by_timeout : engine::ErrorCode::cancelled_by_user;
                return engine::ActionResult::failure(code, ctx.cancellation->message());
            }
        } else if (latency_ms_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(latency_ms_));
        }

        Outcome outcome;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            configs_.push_back(config);
            auto profile = ctx.variables.get("profile.id");
            if (profile && profile->is_string()) {
                auto it = profile_failures_.find(profile->get<std::string>());
                if (it != profile_failures_.end()) {
                    return engine::ActionResult::failure(engine::ErrorCode::action_failed, it->second);
                }
            }
            if (!script_.empty()) {
                outcome = script_.front();
                script_.pop_front();
            } else {
                outcome = default_;
            }
        }
        if (!outcome.success) {
            return engine::ActionResult::failure(outcome.code, outcome.error);
        }
        return engine::ActionResult::ok(outcome.data);
    }

private:
    int64_t latency_ms_;
    mutable std::mutex mutex_;
    std::deque<Outcome> script_;
    Outcome default_;
    std::map<std::string, std::string> profile_failures_;
    std::vector<json> configs_;
    std::atomic<int> calls_{0};
};

// Page backed by a selector table
class FakePage : public engine::PageHandle {
public:
    struct Element {
        int64_t count = 1;
        bool visible = true;
        std::string text;
    };

    std::map<std::string, Element> elements;
    std::string current_url = "about:blank";
    std::vector<std::string> clicks;

    caf::expected<void> navigate(const std::string& url, int64_t) override {
        current_url = url;
        return caf::unit;
    }

    caf::expected<void> click(const std::string& selector) override {
        if (!elements.count(selector)) {
            return caf::make_error(caf::sec::runtime_error, "element_not_found: " + selector);
        }
        clicks.push_back(selector);
        return caf::unit;
    }

    caf::expected<void> type(const std::string& selector, const std::string&) override {
        if (!elements.count(selector)) {
            return caf::make_error(caf::sec::runtime_error, "element_not_found: " + selector);
        }
        return caf::unit;
    }

    caf::expected<std::string> text_content(const std::string& selector) override {
        auto it = elements.find(selector);
        if (it == elements.end()) {
            return caf::make_error(caf::sec::runtime_error, "element_not_found: " + selector);
        }
        return it->second.text;
    }

    caf::expected<int64_t> count(const std::string& selector) override {
        auto it = elements.find(selector);
        return it == elements.end() ? 0 : it->second.count;
    }

    caf::expected<bool> is_visible(const std::string& selector) override {
        auto it = elements.find(selector);
        return it != elements.end() && it->second.visible;
    }

    std::string url() const override { return current_url; }
};

class FakeSession : public engine::BrowserSession {
public:
    explicit FakeSession(std::atomic<int>& closed) : closed_(closed) {}

    std::shared_ptr<engine::PageHandle> page() override { return page_; }

    void close() override {
        bool expected = false;
        if (is_closed_.compare_exchange_strong(expected, true)) {
            ++closed_;
        }
    }

private:
    std::shared_ptr<engine::PageHandle> page_ = std::make_shared<FakePage>();
    std::atomic<int>& closed_;
    std::atomic<bool> is_closed_{false};
};

// Counts sessions opened and closed; can refuse profiles by id
class FakeSessionFactory {
public:
    std::atomic<int> opened{0};
    std::atomic<int> closed{0};
    std::string refuse_profile;

    engine::SessionFactory factory() {
        return [this](const json& profile) -> caf::expected<std::shared_ptr<engine::BrowserSession>> {
            if (!refuse_profile.empty() && profile.value("id", "") == refuse_profile) {
                return caf::make_error(caf::sec::runtime_error, "Failed to launch browser");
            }
            ++opened;
            return std::shared_ptr<engine::BrowserSession>(std::make_shared<FakeSession>(closed));
        };
    }
};

inline engine::Step make_step(const std::string& id, const std::string& type, json config = json::object()) {
    engine::Step step;
    step.id = id;
    step.type = type;
    step.config = std::move(config);
    return step;
}

inline engine::Workflow make_workflow(const std::string& id, std::vector<engine::Step> steps) {
    engine::Workflow workflow;
    workflow.id = id;
    workflow.name = id + " workflow";
    workflow.steps = std::move(steps);
    return workflow;
}

inline std::vector<json> make_profiles(int count, const std::string& prefix = "p") {
    std::vector<json> profiles;
    for (int i = 1; i <= count; ++i) {
        profiles.push_back(json{{"id", prefix + std::to_string(i)}, {"name", "Profile " + std::to_string(i)}});
    }
    return profiles;
}

// Polls `pred` until it holds or `timeout_ms` passes
template <class Pred>
bool wait_until(Pred pred, int64_t timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace test
} // namespace fleetrun
