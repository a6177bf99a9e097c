#include "../include/dispatcher.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <chrono>

using json = nlohmann::json;

static PipelineError failure(ErrorCode code, std::string message) {
    return PipelineError{code, std::move(message), std::nullopt};
}

bool output_claims_valid(const std::string& output) {
    return output.find("valid") != std::string::npos;
}

HttpDispatcher::HttpDispatcher(DispatcherConfig config, HttpPost post)
    : config_(std::move(config)), post_(std::move(post)) {}

std::string HttpDispatcher::build_request_body(const std::string& prompt) const {
    json body = {
        {"messages", json::array({
            json{{"role", "user"}, {"content", prompt}}
        })},
        {"max_tokens", config_.max_output_tokens},
        {"temperature", config_.temperature}
    };
    // binary (NUL-bearing) payloads may not be UTF-8; substitute U+FFFD rather than fail
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

DispatchResult HttpDispatcher::dispatch(const Task& t) const {
    const std::string body = build_request_body(t.payload);
    const std::vector<std::string> headers = {"api-key: " + config_.credential};
    const long timeout_ms = static_cast<long>(config_.timeout.count());

    log_info("dispatch", "Calling inference endpoint", {{"taskId", printable(t.id)}, {"timeoutMs", std::to_string(timeout_ms)}});
    auto started = std::chrono::steady_clock::now();
    HttpResponse resp;
    try {
        resp = post_(config_.endpoint, body, timeout_ms, headers);
    } catch (const HttpError& e) {
        if (e.kind() == HttpError::Kind::Timeout) {
            log_error("dispatch", "Inference call timed out", {{"taskId", printable(t.id)}, {"timeoutMs", std::to_string(timeout_ms)}});
            return failure(ErrorCode::Timeout, "inference call timed out after " + std::to_string(timeout_ms) + " ms");
        }
        log_error("dispatch", "Inference call failed", {{"taskId", printable(t.id)}, {"error", e.what()}});
        return failure(ErrorCode::Transport, std::string("inference call failed: ") + e.what());
    } catch (const std::exception& e) {
        log_error("dispatch", "Inference call failed", {{"taskId", printable(t.id)}, {"error", e.what()}});
        return failure(ErrorCode::Transport, std::string("inference call failed: ") + e.what());
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    log_info("dispatch", "Inference call returned", {
        {"taskId", printable(t.id)},
        {"status", std::to_string(resp.status)},
        {"elapsedMs", std::to_string(elapsed.count())},
    });

    if (resp.status < 200 || resp.status >= 300) {
        return failure(ErrorCode::HttpStatus, "inference endpoint returned status " + std::to_string(resp.status));
    }
    return wrap_completion(t, resp.body);
}

DispatchResult HttpDispatcher::wrap_completion(const Task& t, const std::string& body) const {
    json data;
    try {
        data = json::parse(body);
    } catch (const json::parse_error& e) {
        return failure(ErrorCode::BadResponse, std::string("inference response is not valid JSON: ") + e.what());
    }
    if (!data.is_object()) {
        return failure(ErrorCode::BadResponse, "inference response is not a JSON object");
    }

    // A response without choices yields an empty output, which the result stage rejects.
    std::string output;
    auto choices = data.find("choices");
    if (choices != data.end() && choices->is_array() && !choices->empty()) {
        const json& first = (*choices)[0];
        if (first.is_object() && first.contains("message") && first["message"].is_object()) {
            const json& message = first["message"];
            auto content = message.find("content");
            if (content != message.end() && !content->is_null()) {
                if (!content->is_string()) {
                    return failure(ErrorCode::BadResponse, "inference response content is not a string");
                }
                output = content->get<std::string>();
            }
        }
    }
    if (output.empty()) {
        log_warn("dispatch", "Inference response carried no output", {{"taskId", printable(t.id)}});
    }

    json result = {
        {"llm_output", output},
        {"verified", output_claims_valid(output)}
    };
    return result.dump();
}
