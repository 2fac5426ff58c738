#include "fleetrun/engine/observability.hpp"
#include "fleetrun/engine/feature_flags.hpp"
#include <prometheus/text_serializer.h>
#include <opentelemetry/trace/provider.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <algorithm>
#include <cctype>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cstring>
#include <cerrno>
#include <map>

namespace fleetrun {
namespace engine {

// Secret fields to filter
static const std::vector<std::string> REDACTED_FIELDS = {
    "password", "api_key", "secret", "token", "authorization",
    "cookie", "credit_card", "ssn", "email", "phone"
};

// Case-insensitive substring match against REDACTED_FIELDS
static bool is_redacted_field(const std::string& field_name) {
    std::string lower_field = field_name;
    std::transform(lower_field.begin(), lower_field.end(), lower_field.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& redacted : REDACTED_FIELDS) {
        if (lower_field.find(redacted) != std::string::npos) {
            return true;
        }
    }
    return false;
}

static void redact_recursive(json& obj) {
    if (obj.is_object()) {
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (is_redacted_field(it.key())) {
                it.value() = "[REDACTED]";
            } else if (it.value().is_structured()) {
                redact_recursive(it.value());
            }
        }
    } else if (obj.is_array()) {
        for (auto& item : obj) {
            if (item.is_structured()) {
                redact_recursive(item);
            }
        }
    }
}

// ISO 8601 timestamp with microseconds
static std::string get_iso8601_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()) % 1000000;

    std::tm tm_buf;
    gmtime_r(&time_t, &tm_buf);

    char buf[40];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ldZ",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<long>(microseconds.count()));

    return std::string(buf);
}

// ---------------------------------------------------------------------------
// ScopedSpan
// ---------------------------------------------------------------------------

void ScopedSpan::set_attribute(const std::string& key, const std::string& value) {
    if (span_) {
        span_->SetAttribute(key, value.c_str());
    }
}

void ScopedSpan::set_error(const std::string& message) {
    if (span_) {
        span_->SetStatus(opentelemetry::trace::StatusCode::kError, message);
    }
}

void ScopedSpan::end() {
    if (span_) {
        span_->End();
        span_ = opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span>();
    }
}

// ---------------------------------------------------------------------------
// Observability
// ---------------------------------------------------------------------------

Observability::Observability(const std::string& instance_id) : instance_id_(instance_id) {
    initialize_metrics();
    initialize_tracing();
}

Observability::~Observability() {
    stop_health_endpoint();
    stop_metrics_endpoint();
}

void Observability::initialize_metrics() {
    registry_ = std::make_shared<prometheus::Registry>();
    const std::map<std::string, std::string> constant_labels = {{"instance_id", instance_id_}};

    step_executions_total_family_ = &prometheus::BuildCounter()
        .Name("fleetrun_step_executions_total")
        .Help("Total number of workflow step executions")
        .Labels(constant_labels)
        .Register(*registry_);

    step_duration_seconds_family_ = &prometheus::BuildHistogram()
        .Name("fleetrun_step_duration_seconds")
        .Help("Workflow step duration in seconds")
        .Labels(constant_labels)
        .Register(*registry_);

    step_errors_total_family_ = &prometheus::BuildCounter()
        .Name("fleetrun_step_errors_total")
        .Help("Total number of failed workflow steps")
        .Labels(constant_labels)
        .Register(*registry_);

    workflow_executions_total_family_ = &prometheus::BuildCounter()
        .Name("fleetrun_workflow_executions_total")
        .Help("Total number of workflow executions by terminal status")
        .Labels(constant_labels)
        .Register(*registry_);

    workflow_duration_seconds_family_ = &prometheus::BuildHistogram()
        .Name("fleetrun_workflow_duration_seconds")
        .Help("Workflow execution duration in seconds")
        .Labels(constant_labels)
        .Register(*registry_);

    slot_events_total_family_ = &prometheus::BuildCounter()
        .Name("fleetrun_slot_events_total")
        .Help("Parallel executor slot lifecycle events")
        .Labels(constant_labels)
        .Register(*registry_);

    schedule_runs_total_family_ = &prometheus::BuildCounter()
        .Name("fleetrun_schedule_runs_total")
        .Help("Scheduled workflow runs by outcome")
        .Labels(constant_labels)
        .Register(*registry_);

    queue_depth_family_ = &prometheus::BuildGauge()
        .Name("fleetrun_queue_depth")
        .Help("Profiles waiting in the parallel executor queue")
        .Labels(constant_labels)
        .Register(*registry_);

    active_slots_family_ = &prometheus::BuildGauge()
        .Name("fleetrun_active_slots")
        .Help("Currently running parallel executor slots")
        .Labels(constant_labels)
        .Register(*registry_);

    health_status_family_ = &prometheus::BuildGauge()
        .Name("fleetrun_health_status")
        .Help("Health status (1 = healthy, 0 = unhealthy)")
        .Labels(constant_labels)
        .Register(*registry_);
}

void Observability::initialize_tracing() {
    // The process may install an SDK provider; the default global provider is a no-op.
    auto provider = opentelemetry::trace::Provider::GetTracerProvider();
    tracer_ = provider->GetTracer("fleetrun_engine", "1.0.0");
}

void Observability::record_step_execution(const std::string& step_type, bool success,
                                          double duration_seconds) {
    if (!FeatureFlags::is_metrics_enabled()) {
        return;
    }
    const std::string status = success ? "success" : "error";
    step_executions_total_family_->Add({{"step_type", step_type}, {"status", status}}).Increment();
    step_duration_seconds_family_->Add(
        {{"step_type", step_type}, {"status", status}},
        prometheus::Histogram::BucketBoundaries{0.001, 0.01, 0.05, 0.1, 0.5, 1.0, 5.0, 30.0}
    ).Observe(duration_seconds);
}

void Observability::record_step_error(const std::string& step_type, ErrorCode error_code) {
    if (!FeatureFlags::is_metrics_enabled()) {
        return;
    }
    step_errors_total_family_->Add({
        {"step_type", step_type},
        {"error_code", error_code_name(error_code)}
    }).Increment();
}

void Observability::record_workflow_execution(ExecutionStatus status, double duration_seconds) {
    if (!FeatureFlags::is_metrics_enabled()) {
        return;
    }
    workflow_executions_total_family_->Add({{"status", to_string(status)}}).Increment();
    workflow_duration_seconds_family_->Add(
        {{"status", to_string(status)}},
        prometheus::Histogram::BucketBoundaries{0.1, 1.0, 5.0, 10.0, 30.0, 60.0, 300.0, 900.0}
    ).Observe(duration_seconds);
}

void Observability::record_slot_event(const std::string& event) {
    if (!FeatureFlags::is_metrics_enabled()) {
        return;
    }
    slot_events_total_family_->Add({{"event", event}}).Increment();
}

void Observability::record_schedule_run(const std::string& schedule_id, bool success) {
    if (!FeatureFlags::is_metrics_enabled()) {
        return;
    }
    schedule_runs_total_family_->Add({
        {"schedule_id", schedule_id},
        {"status", success ? "success" : "failure"}
    }).Increment();
}

void Observability::set_queue_depth(int64_t depth) {
    if (!FeatureFlags::is_metrics_enabled()) {
        return;
    }
    queue_depth_family_->Add({}).Set(static_cast<double>(depth));
}

void Observability::set_active_slots(int64_t count) {
    if (!FeatureFlags::is_metrics_enabled()) {
        return;
    }
    active_slots_family_->Add({}).Set(static_cast<double>(count));
}

void Observability::set_health_status(const std::string& check, int64_t status) {
    if (!FeatureFlags::is_metrics_enabled()) {
        return;
    }
    health_status_family_->Add({{"check", check}}).Set(static_cast<double>(status));
}

ScopedSpan Observability::start_span(const std::string& operation,
                                     const LogContext& ctx,
                                     const std::unordered_map<std::string, std::string>& attributes) {
    if (!FeatureFlags::is_tracing_enabled() || !tracer_) {
        return ScopedSpan();
    }

    ScopedSpan span(tracer_->StartSpan(operation));
    span.set_attribute("instance_id", instance_id_);
    if (!ctx.workflow_id.empty()) span.set_attribute("workflow_id", ctx.workflow_id);
    if (!ctx.run_id.empty()) span.set_attribute("run_id", ctx.run_id);
    if (!ctx.profile_id.empty()) span.set_attribute("profile_id", ctx.profile_id);
    if (!ctx.schedule_id.empty()) span.set_attribute("schedule_id", ctx.schedule_id);
    for (const auto& [key, value] : attributes) {
        span.set_attribute(key, value);
    }
    return span;
}

void Observability::log_info(const std::string& message,
                             const LogContext& ctx,
                             const std::unordered_map<std::string, std::string>& context) {
    write_line("INFO", format_json_log("INFO", message, ctx, context));
}

void Observability::log_warn(const std::string& message,
                             const LogContext& ctx,
                             const std::unordered_map<std::string, std::string>& context) {
    write_line("WARN", format_json_log("WARN", message, ctx, context));
}

void Observability::log_error(const std::string& message,
                              const LogContext& ctx,
                              const std::unordered_map<std::string, std::string>& context) {
    write_line("ERROR", format_json_log("ERROR", message, ctx, context));
}

void Observability::log_debug(const std::string& message,
                              const LogContext& ctx,
                              const std::unordered_map<std::string, std::string>& context) {
    if (!FeatureFlags::is_debug_logging_enabled()) {
        return;
    }
    write_line("DEBUG", format_json_log("DEBUG", message, ctx, context));
}

void Observability::log(const std::string& level,
                        const std::string& message,
                        const LogContext& ctx,
                        const std::unordered_map<std::string, std::string>& context) {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "error") {
        log_error(message, ctx, context);
    } else if (lower == "warn" || lower == "warning") {
        log_warn(message, ctx, context);
    } else if (lower == "debug") {
        log_debug(message, ctx, context);
    } else {
        log_info(message, ctx, context);
    }
}

void Observability::write_line(const std::string& level, const std::string& line) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (level == "ERROR") {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}

std::string Observability::format_json_log(const std::string& level,
                                           const std::string& message,
                                           const LogContext& ctx,
                                           const std::unordered_map<std::string, std::string>& context) const {
    json log_entry;

    // Required fields (always present)
    log_entry["timestamp"] = get_iso8601_timestamp();
    log_entry["level"] = level;
    log_entry["component"] = "orchestrator";
    log_entry["message"] = message;

    // Correlation fields (at top level, when provided)
    if (!ctx.workflow_id.empty()) {
        log_entry["workflow_id"] = ctx.workflow_id;
    }
    if (!ctx.run_id.empty()) {
        log_entry["run_id"] = ctx.run_id;
    }
    if (!ctx.profile_id.empty()) {
        log_entry["profile_id"] = ctx.profile_id;
    }
    if (!ctx.step_id.empty()) {
        log_entry["step_id"] = ctx.step_id;
    }
    if (!ctx.schedule_id.empty()) {
        log_entry["schedule_id"] = ctx.schedule_id;
    }

    json context_obj;
    context_obj["instance_id"] = instance_id_;
    for (const auto& [key, value] : context) {
        context_obj[key] = value;
    }
    redact_recursive(context_obj);
    log_entry["context"] = context_obj;

    return log_entry.dump();
}

// ---------------------------------------------------------------------------
// HTTP endpoints
// ---------------------------------------------------------------------------

std::string Observability::get_health_response() {
    json health_response;
    health_response["status"] = "healthy";
    health_response["timestamp"] = get_iso8601_timestamp();
    return health_response.dump();
}

std::string Observability::get_metrics_response() {
    if (!FeatureFlags::is_metrics_enabled()) {
        return "";
    }
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

int Observability::open_listen_socket(const std::string& address, uint16_t port,
                                      const std::string& endpoint) {
    struct sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(port);

    if (address == "0.0.0.0" || address.empty()) {
        server_addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, address.c_str(), &server_addr.sin_addr) != 1) {
        log_error("Invalid " + endpoint + " endpoint address", {}, {{"address", address}});
        return -1;
    }

    int socket_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (socket_fd < 0) {
        log_error("Failed to create " + endpoint + " endpoint socket", {}, {
            {"error", std::strerror(errno)}
        });
        return -1;
    }

    int opt = 1;
    setsockopt(socket_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (bind(socket_fd, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
        log_error("Failed to bind " + endpoint + " endpoint socket", {}, {
            {"error", std::strerror(errno)},
            {"address", address},
            {"port", std::to_string(port)}
        });
        close(socket_fd);
        return -1;
    }

    if (listen(socket_fd, 5) < 0) {
        log_error("Failed to listen on " + endpoint + " endpoint socket", {}, {
            {"error", std::strerror(errno)}
        });
        close(socket_fd);
        return -1;
    }

    return socket_fd;
}

void Observability::serve_loop(int socket_fd, std::atomic<bool>& running, const std::string& path,
                               const std::string& content_type, bool metrics) {
    char buffer[4096];
    const std::string request_line = "GET " + path;

    while (running) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(socket_fd, (struct sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            if (running) {
                continue;
            }
            break;
        }

        ssize_t bytes_read = recv(client_fd, buffer, sizeof(buffer) - 1, 0);
        if (bytes_read > 0) {
            buffer[bytes_read] = '\0';
            std::string request(buffer);
            std::string response;

            if (request.compare(0, request_line.size(), request_line) == 0) {
                std::string body = metrics ? get_metrics_response() : get_health_response();
                response =
                    "HTTP/1.1 200 OK\r\n"
                    "Content-Type: " + content_type + "\r\n"
                    "Content-Length: " + std::to_string(body.length()) + "\r\n"
                    "\r\n" + body;
            } else {
                response =
                    "HTTP/1.1 404 Not Found\r\n"
                    "Content-Type: text/plain\r\n"
                    "Content-Length: 13\r\n"
                    "\r\n"
                    "404 Not Found";
            }
            send(client_fd, response.c_str(), response.length(), 0);
        }

        close(client_fd);
    }
}

void Observability::start_health_endpoint(const std::string& address, uint16_t port) {
    if (health_server_running_) {
        return;
    }

    int socket_fd = open_listen_socket(address, port, "health");
    if (socket_fd < 0) {
        return;
    }

    health_server_socket_ = socket_fd;
    health_server_running_ = true;
    health_server_thread_ = std::thread([this, socket_fd]() {
        serve_loop(socket_fd, health_server_running_, "/_health", "application/json", false);
    });

    log_info("Health endpoint started", {}, {
        {"address", address},
        {"port", std::to_string(port)}
    });
}

void Observability::stop_health_endpoint() {
    if (!health_server_running_) {
        return;
    }

    health_server_running_ = false;

    // Shut down the listening socket to wake up accept()
    if (health_server_socket_ >= 0) {
        shutdown(health_server_socket_, SHUT_RDWR);
        close(health_server_socket_);
        health_server_socket_ = -1;
    }

    if (health_server_thread_.joinable()) {
        health_server_thread_.join();
    }

    log_info("Health endpoint stopped");
}

void Observability::start_metrics_endpoint(const std::string& address, uint16_t port) {
    if (!FeatureFlags::is_metrics_enabled()) {
        return;
    }

    if (metrics_server_running_) {
        return;
    }

    int socket_fd = open_listen_socket(address, port, "metrics");
    if (socket_fd < 0) {
        return;
    }

    metrics_server_socket_ = socket_fd;
    metrics_server_running_ = true;
    metrics_server_thread_ = std::thread([this, socket_fd]() {
        serve_loop(socket_fd, metrics_server_running_, "/metrics", "text/plain; version=0.0.4", true);
    });

    log_info("Metrics endpoint started", {}, {
        {"address", address},
        {"port", std::to_string(port)}
    });
}

void Observability::stop_metrics_endpoint() {
    if (!metrics_server_running_) {
        return;
    }

    metrics_server_running_ = false;

    if (metrics_server_socket_ >= 0) {
        shutdown(metrics_server_socket_, SHUT_RDWR);
        close(metrics_server_socket_);
        metrics_server_socket_ = -1;
    }

    if (metrics_server_thread_.joinable()) {
        metrics_server_thread_.join();
    }

    log_info("Metrics endpoint stopped");
}

} // namespace engine
} // namespace fleetrun
