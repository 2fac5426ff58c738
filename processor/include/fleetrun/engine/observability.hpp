#pragma once

#include "fleetrun/engine/core.hpp"
#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/tracer.h>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <atomic>
#include <cstdint>

namespace fleetrun {
namespace engine {

// Correlation fields printed at the top level of every log line
struct LogContext {
    std::string workflow_id;
    std::string run_id;
    std::string profile_id;
    std::string step_id;
    std::string schedule_id;
};

// Ends the wrapped span when it goes out of scope. Holds nothing when tracing is disabled.
class ScopedSpan {
public:
    ScopedSpan() = default;
    explicit ScopedSpan(opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span)
        : span_(std::move(span)) {}
    ~ScopedSpan() { end(); }

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;
    ScopedSpan(ScopedSpan&&) = default;
    ScopedSpan& operator=(ScopedSpan&&) = default;

    void set_attribute(const std::string& key, const std::string& value);
    void set_error(const std::string& message);
    void end();

private:
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span_;
};

class Observability {
public:
    explicit Observability(const std::string& instance_id);
    ~Observability();

    Observability(const Observability&) = delete;
    Observability& operator=(const Observability&) = delete;

    // Metrics (gated behind FLEETRUN_METRICS_ENABLED)
    void record_step_execution(const std::string& step_type, bool success, double duration_seconds);
    void record_step_error(const std::string& step_type, ErrorCode error_code);
    void record_workflow_execution(ExecutionStatus status, double duration_seconds);
    void record_slot_event(const std::string& event);
    void record_schedule_run(const std::string& schedule_id, bool success);
    void set_queue_depth(int64_t depth);
    void set_active_slots(int64_t count);
    void set_health_status(const std::string& check, int64_t status); // 1 = healthy, 0 = unhealthy

    void start_metrics_endpoint(const std::string& address, uint16_t port);
    void stop_metrics_endpoint();
    std::string get_metrics_response(); // Prometheus text format

    // Tracing (gated behind FLEETRUN_TRACING_ENABLED)
    ScopedSpan start_span(const std::string& operation,
                          const LogContext& ctx,
                          const std::unordered_map<std::string, std::string>& attributes = {});

    // Logging
    void log_info(const std::string& message,
                  const LogContext& ctx = {},
                  const std::unordered_map<std::string, std::string>& context = {});

    void log_warn(const std::string& message,
                  const LogContext& ctx = {},
                  const std::unordered_map<std::string, std::string>& context = {});

    void log_error(const std::string& message,
                   const LogContext& ctx = {},
                   const std::unordered_map<std::string, std::string>& context = {});

    void log_debug(const std::string& message,
                   const LogContext& ctx = {},
                   const std::unordered_map<std::string, std::string>& context = {});

    // Log at a level given by name ("debug", "info", "warn", "error")
    void log(const std::string& level,
             const std::string& message,
             const LogContext& ctx = {},
             const std::unordered_map<std::string, std::string>& context = {});

    std::shared_ptr<prometheus::Registry> registry() { return registry_; }
    const std::string& instance_id() const { return instance_id_; }

    // Health endpoint
    void start_health_endpoint(const std::string& address, uint16_t port);
    void stop_health_endpoint();

    std::string format_json_log(const std::string& level,
                                const std::string& message,
                                const LogContext& ctx,
                                const std::unordered_map<std::string, std::string>& context) const;

private:
    std::string instance_id_;
    std::shared_ptr<prometheus::Registry> registry_;
    std::mutex output_mutex_;

    prometheus::Family<prometheus::Counter>* step_executions_total_family_ = nullptr;
    prometheus::Family<prometheus::Histogram>* step_duration_seconds_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* step_errors_total_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* workflow_executions_total_family_ = nullptr;
    prometheus::Family<prometheus::Histogram>* workflow_duration_seconds_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* slot_events_total_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* schedule_runs_total_family_ = nullptr;
    prometheus::Family<prometheus::Gauge>* queue_depth_family_ = nullptr;
    prometheus::Family<prometheus::Gauge>* active_slots_family_ = nullptr;
    prometheus::Family<prometheus::Gauge>* health_status_family_ = nullptr;

    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;

    std::thread health_server_thread_;
    std::atomic<bool> health_server_running_{false};
    int health_server_socket_{-1};

    std::thread metrics_server_thread_;
    std::atomic<bool> metrics_server_running_{false};
    int metrics_server_socket_{-1};

    void initialize_metrics();
    void initialize_tracing();
    void write_line(const std::string& level, const std::string& line);
    int open_listen_socket(const std::string& address, uint16_t port, const std::string& endpoint);
    void serve_loop(int socket_fd, std::atomic<bool>& running, const std::string& path,
                    const std::string& content_type, bool metrics);
    std::string get_health_response();
};

} // namespace engine
} // namespace fleetrun
