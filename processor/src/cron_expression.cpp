#include "fleetrun/engine/cron_expression.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace fleetrun {
namespace engine {

namespace {

constexpr int64_t two_years_minutes = 2LL * 365 * 24 * 60;

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(text);
    while (std::getline(stream, part, delimiter)) {
        parts.push_back(part);
    }
    if (!text.empty() && text.back() == delimiter) {
        parts.push_back("");
    }
    return parts;
}

std::vector<std::string> fields_of(const std::string& expression) {
    std::vector<std::string> fields;
    std::istringstream stream(expression);
    std::string field;
    while (stream >> field) {
        fields.push_back(field);
    }
    return fields;
}

caf::expected<int> parse_number(const std::string& text, const std::string& field_name) {
    if (text.empty() || text.size() > 4) {
        return caf::make_error(caf::sec::invalid_argument, "Invalid value '" + text + "' in " + field_name);
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return caf::make_error(caf::sec::invalid_argument, "Invalid value '" + text + "' in " + field_name);
        }
    }
    return std::stoi(text);
}

caf::expected<std::set<int>> parse_field(const std::string& field, int min, int max, const std::string& field_name) {
    std::set<int> values;
    for (const auto& part : split(field, ',')) {
        std::string range = part;
        int step = 1;

        auto slash = part.find('/');
        if (slash != std::string::npos) {
            range = part.substr(0, slash);
            auto parsed_step = parse_number(part.substr(slash + 1), field_name);
            if (!parsed_step) {
                return parsed_step.error();
            }
            if (*parsed_step <= 0) {
                return caf::make_error(caf::sec::invalid_argument, "Step must be positive in " + field_name);
            }
            step = *parsed_step;
        }

        int start = min;
        int end = max;
        if (range != "*") {
            auto dash = range.find('-');
            if (dash != std::string::npos) {
                auto low = parse_number(range.substr(0, dash), field_name);
                if (!low) {
                    return low.error();
                }
                auto high = parse_number(range.substr(dash + 1), field_name);
                if (!high) {
                    return high.error();
                }
                start = *low;
                end = *high;
            } else {
                auto value = parse_number(range, field_name);
                if (!value) {
                    return value.error();
                }
                start = *value;
                end = slash != std::string::npos ? max : *value;
            }
        }

        if (start < min || end > max || start > end) {
            return caf::make_error(caf::sec::invalid_argument,
                                   "Value out of range in " + field_name + ": " + part + " (allowed " +
                                   std::to_string(min) + "-" + std::to_string(max) + ")");
        }
        for (int i = start; i <= end; i += step) {
            values.insert(i);
        }
    }
    return values;
}

std::string two_digits(int value) {
    std::ostringstream out;
    out << std::setw(2) << std::setfill('0') << value;
    return out.str();
}

bool all_digits(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // namespace

caf::expected<CronExpression> CronExpression::parse(const std::string& expression) {
    auto fields = fields_of(expression);
    if (fields.size() != 5) {
        return caf::make_error(caf::sec::invalid_argument, "Invalid cron expression: Expected 5 fields");
    }

    CronExpression cron;
    cron.expression_ = expression;

    struct FieldSpec {
        std::set<int>* target;
        int min;
        int max;
        const char* name;
    };
    const FieldSpec specs[] = {
        {&cron.minutes_, 0, 59, "minute"},
        {&cron.hours_, 0, 23, "hour"},
        {&cron.days_of_month_, 1, 31, "day of month"},
        {&cron.months_, 1, 12, "month"},
        {&cron.days_of_week_, 0, 6, "day of week"},
    };
    for (size_t i = 0; i < 5; ++i) {
        auto values = parse_field(fields[i], specs[i].min, specs[i].max, specs[i].name);
        if (!values) {
            return caf::make_error(caf::sec::invalid_argument,
                                   "Invalid cron expression: " + error_message(values.error()));
        }
        *specs[i].target = std::move(*values);
    }
    return cron;
}

bool CronExpression::matches(const std::tm& local_time) const {
    return minutes_.count(local_time.tm_min) > 0 &&
           hours_.count(local_time.tm_hour) > 0 &&
           days_of_month_.count(local_time.tm_mday) > 0 &&
           months_.count(local_time.tm_mon + 1) > 0 &&
           days_of_week_.count(local_time.tm_wday) > 0;
}

std::optional<int64_t> CronExpression::next_run(int64_t after_ms) const {
    std::time_t t = static_cast<std::time_t>(after_ms / 1000);
    t -= t % 60;
    t += 60;
    const std::time_t limit = t + static_cast<std::time_t>(two_years_minutes * 60);

    while (t <= limit) {
        std::tm local{};
        if (localtime_r(&t, &local) == nullptr) {
            return std::nullopt;
        }
        // Realign after a DST shift of a non-whole-minute offset
        if (local.tm_sec != 0) {
            t -= local.tm_sec;
            continue;
        }

        if (months_.count(local.tm_mon + 1) == 0 ||
            days_of_month_.count(local.tm_mday) == 0 ||
            days_of_week_.count(local.tm_wday) == 0) {
            // Skip to the next local midnight
            t += static_cast<std::time_t>(((23 - local.tm_hour) * 60 + (60 - local.tm_min)) * 60);
            continue;
        }
        if (hours_.count(local.tm_hour) == 0) {
            t += static_cast<std::time_t>((60 - local.tm_min) * 60);
            continue;
        }
        if (minutes_.count(local.tm_min) > 0) {
            return static_cast<int64_t>(t) * 1000;
        }
        t += 60;
    }
    return std::nullopt;
}

std::string describe_cron(const std::string& expression) {
    // Only expressions that parse get a description
    if (!CronExpression::parse(expression)) {
        return expression;
    }
    auto fields = fields_of(expression);
    const std::string& minute = fields[0];
    const std::string& hour = fields[1];
    bool every_day = fields[2] == "*" && fields[3] == "*" && fields[4] == "*";

    if (minute == "*" && hour == "*" && every_day) return "Every minute";
    if (minute == "0" && hour == "*" && every_day) return "Every hour";
    if (minute == "0" && hour == "0" && every_day) return "Every day at midnight";

    if (minute.compare(0, 2, "*/") == 0 && hour == "*" && every_day) {
        return "Every " + minute.substr(2) + " minutes";
    }
    if (minute == "0" && hour.compare(0, 2, "*/") == 0 && every_day) {
        return "Every " + hour.substr(2) + " hours";
    }
    if (every_day && all_digits(minute) && all_digits(hour)) {
        return "Daily at " + two_digits(std::stoi(hour)) + ":" + two_digits(std::stoi(minute));
    }
    return expression;
}

void to_json(json& j, const CronPreset& preset) {
    j = json{{"label", preset.label}, {"value", preset.value}};
}

const std::vector<CronPreset>& cron_presets() {
    static const std::vector<CronPreset> presets = {
        {"Every minute", "* * * * *"},
        {"Every 5 minutes", "*/5 * * * *"},
        {"Every 15 minutes", "*/15 * * * *"},
        {"Every 30 minutes", "*/30 * * * *"},
        {"Every hour", "0 * * * *"},
        {"Every 2 hours", "0 */2 * * *"},
        {"Every 6 hours", "0 */6 * * *"},
        {"Daily at midnight", "0 0 * * *"},
        {"Daily at 6 AM", "0 6 * * *"},
        {"Daily at 9 AM", "0 9 * * *"},
        {"Daily at 12 PM", "0 12 * * *"},
        {"Daily at 6 PM", "0 18 * * *"},
        {"Weekly (Sunday)", "0 0 * * 0"},
        {"Weekly (Monday)", "0 9 * * 1"},
        {"Weekdays at 9 AM", "0 9 * * 1-5"},
        {"First of month", "0 0 1 * *"},
    };
    return presets;
}

} // namespace engine
} // namespace fleetrun
