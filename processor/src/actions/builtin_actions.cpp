#include "fleetrun/engine/action.hpp"
#include "fleetrun/engine/expression.hpp"
#include <algorithm>
#include <random>
#include <set>
#include <thread>

namespace fleetrun {
namespace engine {

std::shared_ptr<Action> make_http_request_action();

namespace {

class SetVariableAction : public BaseAction {
public:
    SetVariableAction() : BaseAction("set-variable") {}

protected:
    caf::expected<ActionResult> execute_impl(ExecutionContext& ctx, const json& config) override {
        if (!validate_required(config, {"name"})) {
            return missing_fields("name");
        }

        std::string name = get_config_or_default(config, "name");
        std::string type = get_config_or_default(config, "type", "string");
        json value = config.contains("value") ? config.at("value") : json("");

        if (type == "number") {
            double number = 0;
            if (!to_number(value, number)) {
                return ActionResult::failure(ErrorCode::invalid_format,
                                             "Value is not a number: " + display_string(value));
            }
            value = ExpressionEvaluator::parse_literal(display_string(json(number)));
        } else if (type == "boolean") {
            std::string text = display_string(value);
            value = text == "true" || text == "1";
        } else if (type == "json") {
            if (value.is_string()) {
                try {
                    value = json::parse(value.get<std::string>());
                } catch (const json::parse_error&) {
                    // Invalid JSON is kept as the raw string
                }
            }
        } else if (!value.is_string()) {
            value = display_string(value);
        }

        ctx.variables.set(name, value);
        return ActionResult::ok({{"variable", name}, {"value", value}});
    }
};

class CalculateAction : public BaseAction {
public:
    CalculateAction() : BaseAction("calculate") {}

protected:
    caf::expected<ActionResult> execute_impl(ExecutionContext& ctx, const json& config) override {
        if (!validate_required(config, {"expression", "saveAs"})) {
            return missing_fields("expression, saveAs");
        }

        std::string expression = get_config_or_default(config, "expression");
        std::string save_as = get_config_or_default(config, "saveAs");

        auto result = ctx.variables.try_evaluate(expression);
        if (!result) {
            return ActionResult::failure(ErrorCode::invalid_format,
                                         "Cannot evaluate '" + expression + "': " + error_message(result.error()));
        }

        ctx.variables.set(save_as, *result);
        return ActionResult::ok({{"expression", expression}, {"result", *result}, {"variable", save_as}});
    }
};

class WaitTimeAction : public BaseAction {
public:
    WaitTimeAction() : BaseAction("wait-time") {}

protected:
    caf::expected<ActionResult> execute_impl(ExecutionContext& ctx, const json& config) override {
        double seconds = 1;
        if (config.contains("duration") && !to_number(config.at("duration"), seconds)) {
            return ActionResult::failure(ErrorCode::invalid_format, "duration must be a number of seconds");
        }

        int64_t duration_ms = static_cast<int64_t>(seconds * 1000);
        double variation_s = 0;
        if (config.contains("randomVariation") && to_number(config.at("randomVariation"), variation_s) &&
            variation_s > 0) {
            thread_local std::mt19937 rng{std::random_device{}()};
            int64_t variation_ms = static_cast<int64_t>(variation_s * 1000);
            std::uniform_int_distribution<int64_t> dist(-variation_ms, variation_ms);
            duration_ms = std::max<int64_t>(100, duration_ms + dist(rng));
        }
        duration_ms = std::max<int64_t>(0, duration_ms);

        if (ctx.cancellation) {
            if (!ctx.cancellation->wait_for(std::chrono::milliseconds(duration_ms))) {
                ErrorCode code = ctx.cancellation->reason() == CancellationToken::Reason::timeout
                    ? ErrorCode::cancelled_by_timeout : ErrorCode::cancelled_by_user;
                return ActionResult::failure(code, ctx.cancellation->message());
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(duration_ms));
        }
        return ActionResult::ok({{"duration", duration_ms}});
    }
};

class NavigateAction : public BaseAction {
public:
    NavigateAction() : BaseAction("navigate") {}

protected:
    caf::expected<ActionResult> execute_impl(ExecutionContext& ctx, const json& config) override {
        if (!validate_required(config, {"url"})) {
            return missing_fields("url");
        }
        auto page = require_page(ctx);
        if (!page) {
            return page.error();
        }

        std::string url = get_config_or_default(config, "url");
        int64_t timeout_ms = 30000;
        if (config.contains("timeout") && config.at("timeout").is_number()) {
            timeout_ms = config.at("timeout").get<int64_t>();
        }

        auto navigated = (*page)->navigate(url, timeout_ms);
        if (!navigated) {
            return ActionResult::failure(ErrorCode::action_failed, error_message(navigated.error()));
        }
        return ActionResult::ok({{"url", url}});
    }
};

class ClickAction : public BaseAction {
public:
    ClickAction() : BaseAction("click") {}

protected:
    caf::expected<ActionResult> execute_impl(ExecutionContext& ctx, const json& config) override {
        if (!validate_required(config, {"selector"})) {
            return missing_fields("selector");
        }
        auto page = require_page(ctx);
        if (!page) {
            return page.error();
        }

        std::string selector = get_config_or_default(config, "selector");
        auto clicked = (*page)->click(selector);
        if (!clicked) {
            return ActionResult::failure(ErrorCode::action_failed, error_message(clicked.error()));
        }
        return ActionResult::ok({{"selector", selector}});
    }
};

class TypeAction : public BaseAction {
public:
    TypeAction() : BaseAction("type") {}

protected:
    caf::expected<ActionResult> execute_impl(ExecutionContext& ctx, const json& config) override {
        if (!validate_required(config, {"selector"})) {
            return missing_fields("selector");
        }
        auto page = require_page(ctx);
        if (!page) {
            return page.error();
        }

        std::string selector = get_config_or_default(config, "selector");
        std::string text = get_config_or_default(config, "text");
        auto typed = (*page)->type(selector, text);
        if (!typed) {
            return ActionResult::failure(ErrorCode::action_failed, error_message(typed.error()));
        }
        return ActionResult::ok({{"selector", selector}, {"length", text.size()}});
    }
};

class ExtractTextAction : public BaseAction {
public:
    ExtractTextAction() : BaseAction("extract-text") {}

protected:
    caf::expected<ActionResult> execute_impl(ExecutionContext& ctx, const json& config) override {
        if (!validate_required(config, {"selector"})) {
            return missing_fields("selector");
        }
        auto page = require_page(ctx);
        if (!page) {
            return page.error();
        }

        std::string selector = get_config_or_default(config, "selector");
        auto text = (*page)->text_content(selector);
        if (!text) {
            return ActionResult::failure(ErrorCode::action_failed, error_message(text.error()));
        }

        std::string save_as = get_config_or_default(config, "saveAs");
        if (!save_as.empty()) {
            ctx.variables.set(save_as, *text);
        }
        return ActionResult::ok({{"selector", selector}, {"text", *text}});
    }
};

} // namespace

bool is_control_step(const std::string& type) {
    static const std::set<std::string> control_steps = {
        "condition", "loop-count", "loop-array", "loop-elements", "loop-while",
        "try-catch", "break", "continue", "stop", "log", "comment", "call-workflow"
    };
    return control_steps.count(type) > 0;
}

void register_builtin_actions(ActionRegistry& registry) {
    registry.register_action(std::make_shared<SetVariableAction>());
    registry.register_action(std::make_shared<CalculateAction>());
    registry.register_action(std::make_shared<WaitTimeAction>());
    registry.register_action(make_http_request_action());
    registry.register_action(std::make_shared<NavigateAction>());
    registry.register_action(std::make_shared<ClickAction>());
    registry.register_action(std::make_shared<TypeAction>());
    registry.register_action(std::make_shared<ExtractTextAction>());
}

} // namespace engine
} // namespace fleetrun
