#include <iostream>
#include <caf/actor_system.hpp>
#include <caf/actor_system_config.hpp>
#include "fleetrun/engine/core.hpp"
#include "fleetrun/engine/observability.hpp"
#include "fleetrun/engine/scheduler.hpp"
#include "fleetrun/engine/state_store.hpp"
#include "fleetrun/engine/step_executor.hpp"
#include "fleetrun/engine/workflow_registry.hpp"
#include <algorithm>
#include <unistd.h>

namespace {

struct DaemonOptions {
    std::string state_db = "fleetrun.db";
    int32_t max_concurrent = 3;
    int64_t delay_between_ms = 1000;
    int64_t slot_timeout_ms = 300000;
    int64_t check_interval_s = 60;
    int32_t worker_threads = 2;
    std::string retry_preset = "standard";
    std::string http_endpoint = "0.0.0.0:9090";
};

class DaemonConfig : public caf::actor_system_config {
public:
    DaemonConfig() {
        opt_group{custom_options_, "global"}
            .add(options.state_db, "state-db", "SQLite database path (\":memory:\" for none)")
            .add(options.max_concurrent, "max-concurrent", "Default parallel slots per run")
            .add(options.delay_between_ms, "delay-between-ms", "Stagger between slot starts (ms)")
            .add(options.slot_timeout_ms, "slot-timeout-ms", "Per-profile execution timeout (ms)")
            .add(options.check_interval_s, "check-interval-s", "Scheduler check interval (s)")
            .add(options.worker_threads, "worker-threads", "Threads running scheduled workflows")
            .add(options.retry_preset, "retry-preset", "aggressive | standard | conservative | none")
            .add(options.http_endpoint, "http-endpoint", "Base address:port (health on +1, metrics on +2)");
    }

    DaemonOptions options;
};

using fleetrun::engine::BrowserSession;
using fleetrun::engine::PageHandle;

// Page used when no browser driver is attached: every page operation fails
class DetachedPage : public PageHandle {
public:
    caf::expected<void> navigate(const std::string&, int64_t) override { return detached(); }
    caf::expected<void> click(const std::string&) override { return detached(); }
    caf::expected<void> type(const std::string&, const std::string&) override { return detached(); }
    caf::expected<std::string> text_content(const std::string&) override { return detached(); }
    caf::expected<int64_t> count(const std::string&) override { return detached(); }
    caf::expected<bool> is_visible(const std::string&) override { return detached(); }
    std::string url() const override { return "about:blank"; }

private:
    static caf::error detached() {
        return caf::make_error(caf::sec::runtime_error, "No browser driver attached");
    }
};

class DetachedSession : public BrowserSession {
public:
    std::shared_ptr<PageHandle> page() override { return page_; }
    void close() override {}

private:
    std::shared_ptr<PageHandle> page_ = std::make_shared<DetachedPage>();
};

} // namespace

void caf_main(caf::actor_system& system, const DaemonConfig& config) {
    namespace engine = fleetrun::engine;
    (void)system;
    const DaemonOptions& opts = config.options;
    std::shared_ptr<engine::Observability> observability;

    try {
        observability = std::make_shared<engine::Observability>("scheduler_" + std::to_string(getpid()));
        observability->log_info("Scheduler daemon starting", {}, {
            {"state_db", opts.state_db},
            {"max_concurrent", std::to_string(opts.max_concurrent)},
            {"check_interval_s", std::to_string(opts.check_interval_s)},
            {"retry_preset", opts.retry_preset}
        });

        // Parse http_endpoint (format: "address:port")
        std::string address = "0.0.0.0";
        int base_port = 9090;
        size_t colon_pos = opts.http_endpoint.find(':');
        if (colon_pos != std::string::npos) {
            address = opts.http_endpoint.substr(0, colon_pos);
            base_port = std::stoi(opts.http_endpoint.substr(colon_pos + 1));
        }
        observability->start_health_endpoint(address, static_cast<uint16_t>(base_port + 1));
        observability->start_metrics_endpoint(address, static_cast<uint16_t>(base_port + 2));

        auto store = std::make_shared<engine::StateStore>();
        if (auto opened = store->open(opts.state_db); !opened) {
            observability->log_error("Failed to open state store", {}, {
                {"path", opts.state_db}, {"error", engine::error_message(opened.error())}
            });
            return;
        }

        auto actions = std::make_shared<engine::ActionRegistry>();
        engine::register_builtin_actions(*actions);
        auto workflows = std::make_shared<engine::WorkflowRegistry>(actions, store);

        std::vector<std::string> rejected;
        auto loaded = workflows->load_from_store(&rejected);
        if (!loaded) {
            observability->log_error("Failed to load workflows", {}, {
                {"error", engine::error_message(loaded.error())}
            });
            return;
        }
        for (const auto& reason : rejected) {
            observability->log_warn("Stored workflow rejected", {}, {{"reason", reason}});
        }
        observability->log_info("Workflows loaded", {}, {{"count", std::to_string(*loaded)}});

        auto retry = engine::RetryConfig::preset(opts.retry_preset);
        if (!retry) {
            observability->log_error("Invalid retry preset", {}, {
                {"preset", opts.retry_preset}, {"error", engine::error_message(retry.error())}
            });
            return;
        }

        engine::ParallelOptions parallel;
        parallel.max_concurrent = opts.max_concurrent;
        parallel.delay_between_ms = opts.delay_between_ms;
        parallel.timeout_ms = opts.slot_timeout_ms;
        parallel.retry = *retry;

        auto executor = std::make_shared<engine::WorkflowExecutor>(actions, workflows, observability,
                                                                   std::max(opts.worker_threads, 1));

        engine::SessionFactory sessions = [](const engine::json&)
            -> caf::expected<std::shared_ptr<BrowserSession>> {
            return std::shared_ptr<BrowserSession>(std::make_shared<DetachedSession>());
        };
        // No profile catalogue is attached; each id stands for itself
        engine::ProfileResolver resolver = [](const std::vector<std::string>& ids) {
            std::vector<engine::json> profiles;
            for (const auto& id : ids) {
                profiles.push_back(engine::json{{"id", id}, {"name", id}});
            }
            return profiles;
        };

        engine::SchedulerConfig scheduler_config;
        scheduler_config.check_interval_ms = opts.check_interval_s * 1000;
        scheduler_config.worker_threads = opts.worker_threads;
        engine::Scheduler scheduler(workflows,
                                    engine::make_parallel_schedule_runner(executor, sessions, resolver,
                                                                          parallel, observability),
                                    store, observability, scheduler_config);

        if (auto started = scheduler.start(); !started) {
            observability->log_error("Failed to start scheduler", {}, {
                {"error", engine::error_message(started.error())}
            });
            return;
        }

        observability->log_info("Scheduler is running. Press Enter to exit...", {}, {});
        std::cin.get();

        observability->log_info("Scheduler shutting down", {}, {});
        scheduler.stop();
        observability->set_health_status("scheduler", 0);
        observability->stop_metrics_endpoint();
        observability->stop_health_endpoint();
        store->close();

    } catch (const std::exception& e) {
        if (observability) {
            observability->log_error("Scheduler fatal error", {}, {{"error", e.what()}});
        } else {
            // Fallback to stderr if observability is not initialized
            std::cerr << "Scheduler fatal error (observability not initialized): " << e.what() << std::endl;
        }
        return;
    }
}

int main(int argc, char** argv) {
    DaemonConfig config;

    // Parse command line arguments
    if (auto err = config.parse(argc, argv)) {
        // Use stderr for argument parsing errors (before observability is initialized)
        std::cerr << "Failed to parse arguments: " << caf::to_string(err) << std::endl;
        return 1;
    }

    caf::actor_system system(config);
    caf_main(system, config);

    return 0;
}
