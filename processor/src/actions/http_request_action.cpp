#include "fleetrun/engine/action.hpp"
#include "fleetrun/engine/timeout_enforcement.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <memory>
#include <mutex>

namespace fleetrun {
namespace engine {

namespace {

struct CurlHandleDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct CurlListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;
using CurlList = std::unique_ptr<curl_slist, CurlListDeleter>;

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

class HttpRequestAction : public BaseAction {
public:
    HttpRequestAction() : BaseAction("http-request") {
        ensure_curl_initialized();
    }

protected:
    caf::expected<ActionResult> execute_impl(ExecutionContext& ctx, const json& config) override {
        if (!validate_required(config, {"url"})) {
            return missing_fields("url");
        }

        std::string url = get_config_or_default(config, "url");
        std::string method = to_upper(get_config_or_default(config, "method", "GET"));
        std::string output_variable = get_config_or_default(config, "saveAs",
                                          get_config_or_default(config, "outputVariable"));
        std::string status_variable = get_config_or_default(config, "saveStatusAs",
                                          get_config_or_default(config, "outputStatusVariable"));

        int64_t timeout_ms = TimeoutEnforcement::default_http_timeout_ms;
        if (config.contains("timeout") && config.at("timeout").is_number()) {
            timeout_ms = config.at("timeout").get<int64_t>();
        }

        json headers = json::object();
        if (config.contains("headers")) {
            const auto& raw = config.at("headers");
            if (raw.is_string() && !raw.get<std::string>().empty()) {
                try {
                    headers = json::parse(raw.get<std::string>());
                } catch (const json::parse_error& e) {
                    return ActionResult::failure(ErrorCode::invalid_format,
                                                 "Invalid headers JSON: " + std::string(e.what()));
                }
            } else if (raw.is_object()) {
                headers = raw;
            }
        }

        std::string body;
        if (config.contains("body") && !config.at("body").is_null()) {
            const auto& raw = config.at("body");
            body = raw.is_string() ? raw.get<std::string>() : raw.dump();
            if (!raw.is_string() && !headers.contains("Content-Type")) {
                headers["Content-Type"] = "application/json";
            }
        }

        auto start_time = std::chrono::steady_clock::now();
        auto response = perform_http_request(url, method, body, headers, timeout_ms, ctx.cancellation.get());
        auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();

        if (!response.error.empty()) {
            ErrorCode code = response.timed_out ? ErrorCode::connection_timeout : ErrorCode::network_error;
            ctx.log("warn", "HTTP request failed", {{"url", url}, {"error", response.error}});
            return ActionResult::failure(code, response.error);
        }

        json data = parse_body(response.body, response.content_type);
        if (!output_variable.empty()) {
            ctx.variables.set(output_variable, data);
        }
        if (!status_variable.empty()) {
            ctx.variables.set(status_variable, response.status_code);
        }

        json result = {
            {"status", response.status_code},
            {"data", data},
            {"duration", duration_ms}
        };

        if (response.status_code < 200 || response.status_code >= 300) {
            ActionResult failure = ActionResult::failure(
                ErrorCode::http_error,
                "HTTP request failed with status: " + std::to_string(response.status_code));
            failure.data = result;
            return failure;
        }
        return ActionResult::ok(result);
    }

private:
    struct HttpResponse {
        long status_code = 0;
        std::string body;
        std::string content_type;
        std::string error;
        bool timed_out = false;
    };

    static json parse_body(const std::string& body, const std::string& content_type) {
        if (content_type.find("application/json") != std::string::npos) {
            try {
                return json::parse(body);
            } catch (const json::parse_error&) {
                return body;
            }
        }
        return body;
    }

    static HttpResponse perform_http_request(const std::string& url, const std::string& method,
                                             const std::string& body, const json& headers,
                                             int64_t timeout_ms, CancellationToken* cancellation) {
        HttpResponse response;

        CurlHandle curl(curl_easy_init());
        if (!curl) {
            response.error = "Failed to initialize CURL";
            return response;
        }

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(TimeoutEnforcement::get_http_connection_timeout_ms(timeout_ms)));
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));

        // Abort the transfer when the execution is cancelled
        if (cancellation) {
            curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
            curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, cancellation);
            curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        }

        if (method == "GET") {
            curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        } else if (method == "POST") {
            curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        } else {
            curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
            if (!body.empty()) {
                curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
                curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
            }
        }

        curl_slist* raw_list = nullptr;
        for (auto& [key, value] : headers.items()) {
            std::string value_str = value.is_string() ? value.get<std::string>() : value.dump();
            std::string header = key + ": " + value_str;
            raw_list = curl_slist_append(raw_list, header.c_str());
        }
        CurlList header_list(raw_list);
        if (header_list) {
            curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
        }

        CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            if (res == CURLE_ABORTED_BY_CALLBACK && cancellation) {
                response.error = cancellation->message();
            } else {
                response.error = "CURL request failed: " + std::string(curl_easy_strerror(res));
            }
            response.timed_out = res == CURLE_OPERATION_TIMEDOUT;
            return response;
        }

        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
        char* content_type = nullptr;
        curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type);
        if (content_type) {
            response.content_type = content_type;
        }
        return response;
    }

    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
        if (userp == nullptr || contents == nullptr) {
            return 0;
        }
        userp->append(static_cast<const char*>(contents), size * nmemb);
        return size * nmemb;
    }

    static int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* cancellation = static_cast<CancellationToken*>(clientp);
        return cancellation->is_cancelled() ? 1 : 0;
    }
};

std::shared_ptr<Action> make_http_request_action() {
    return std::make_shared<HttpRequestAction>();
}

} // namespace engine
} // namespace fleetrun
