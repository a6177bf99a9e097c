#pragma once
#include "pipeline.hpp"
#include <cstddef>
#include <string>

constexpr size_t kMaxRequestBody = 64 * 1024;

struct HttpReply {
    int status{200};
    std::string body;
    std::string content_type{"application/json"};
};

// POST /task, GET /health. Never throws; a malformed body is a 400.
HttpReply route_request(const TaskPipeline& pipeline, const std::string& method, const std::string& path,
                        const std::string& body);

int http_status_for(const PipelineError& e);
