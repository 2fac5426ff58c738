#pragma once

#include "fleetrun/engine/core.hpp"
#include <ctime>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fleetrun {
namespace engine {

/**
 * Five-field cron expression: minute hour day-of-month month day-of-week.
 *
 * Each field accepts `*`, a value, `a-b`, `*`/n, `a-b/n` and comma lists.
 * Day-of-week runs 0-6 with 0 = Sunday. A time matches only when all five
 * fields match; times are interpreted in the process's local time zone.
 */
class CronExpression {
public:
    static caf::expected<CronExpression> parse(const std::string& expression);

    bool matches(const std::tm& local_time) const;

    /**
     * First matching minute strictly after `after_ms` (epoch ms).
     * Empty when nothing matches within two years.
     */
    std::optional<int64_t> next_run(int64_t after_ms) const;

    const std::string& expression() const { return expression_; }

    const std::set<int>& minutes() const { return minutes_; }
    const std::set<int>& hours() const { return hours_; }
    const std::set<int>& days_of_month() const { return days_of_month_; }
    const std::set<int>& months() const { return months_; }
    const std::set<int>& days_of_week() const { return days_of_week_; }

private:
    std::string expression_;
    std::set<int> minutes_;
    std::set<int> hours_;
    std::set<int> days_of_month_;
    std::set<int> months_;
    std::set<int> days_of_week_;
};

// Human-readable text such as "Every 5 minutes" or "Daily at 09:30"; the raw expression otherwise
std::string describe_cron(const std::string& expression);

struct CronPreset {
    std::string label;
    std::string value;
};

void to_json(json& j, const CronPreset& preset);

const std::vector<CronPreset>& cron_presets();

} // namespace engine
} // namespace fleetrun
