#pragma once
#include "config.hpp"
#include "http.hpp"
#include <functional>
#include <string>
#include <variant>
#include <vector>

// Raw result bytes on success.
using DispatchResult = std::variant<std::string, PipelineError>;

class Dispatcher {
public:
    virtual ~Dispatcher() = default;
    // Exactly one attempt. Implementations report failures as DispatchFailure
    // codes and never substitute an empty answer.
    virtual DispatchResult dispatch(const Task& t) const = 0;
};

using HttpPost = std::function<HttpResponse(const std::string& url, const std::string& body, long timeout_ms,
                                            const std::vector<std::string>& headers)>;

// Sends the payload as a single user message to a chat-completions endpoint
// and wraps the first choice as {"llm_output", "verified"}.
class HttpDispatcher : public Dispatcher {
public:
    explicit HttpDispatcher(DispatcherConfig config, HttpPost post = http_post_json);

    DispatchResult dispatch(const Task& t) const override;

    std::string build_request_body(const std::string& prompt) const;

private:
    DispatchResult wrap_completion(const Task& t, const std::string& body) const;

    DispatcherConfig config_;
    HttpPost post_;
};

// Output counts as verified when it contains "valid".
bool output_claims_valid(const std::string& output);
