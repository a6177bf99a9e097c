#include "../include/routes.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include "../../../shared/cpp/performer_sdk/include/wire.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static HttpReply json_error(int status, const std::string& message) {
    // parser messages can echo raw request bytes
    json body = {{"error", {{"message", message}}}};
    return HttpReply{status, body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json"};
}

int http_status_for(const PipelineError& e) {
    switch (e.category()) {
        case ErrorCategory::InvalidTask:        return 400;
        case ErrorCategory::ConfigurationError: return 500;
        case ErrorCategory::DispatchFailure:    return e.code == ErrorCode::Timeout ? 504 : 502;
        case ErrorCategory::InvalidResult:      return 502;
    }
    return 500;
}

HttpReply route_request(const TaskPipeline& pipeline, const std::string& method, const std::string& path,
                        const std::string& body) {
    if (method == "GET" && path == "/health") {
        return HttpReply{200, json({{"ok", true}}).dump(), "application/json"};
    }
    if (path == "/task") {
        if (method != "POST") return json_error(405, "method not allowed");
        if (body.size() > kMaxRequestBody) return json_error(413, "request body too large");
        Task t;
        try {
            t = decode_task_request(body);
        } catch (const std::invalid_argument& e) {
            log_warn("performer", "Bad task request", {{"error", printable(e.what(), 200)}});
            return json_error(400, e.what());
        }
        auto result = pipeline.run(t);
        if (auto* err = std::get_if<PipelineError>(&result)) {
            return HttpReply{http_status_for(*err), encode_error(*err), "application/json"};
        }
        return HttpReply{200, encode_task_response(std::get<TaskResponse>(result)), "application/json"};
    }
    return json_error(404, "not found");
}
