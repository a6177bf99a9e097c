#pragma once
#include "task.hpp"
#include <string>
#include <variant>

struct SubmitError {
    long status{0};          // HTTP status, 0 when the request never completed
    std::string message;
    std::optional<PipelineError> pipeline; // decoded error body, when the performer sent one
};

using SubmitResult = std::variant<TaskResponse, SubmitError>;

class PerformerClient {
public:
    explicit PerformerClient(std::string base_url, long timeout_ms = 30000);
    SubmitResult submit(const Task& t);
    bool healthy();

private:
    std::string base_;
    long timeout_ms_;
};
