#pragma once
#include "task.hpp"
#include <string>

// JSON bodies exchanged with the performer front end. Byte fields (task id,
// payload, result) are base64 so arbitrary bytes survive the JSON layer.
//
//   request:  {"task_id": b64, "payload": b64}
//   response: {"task_id": b64, "result": b64}
//   error:    {"error": {"category": str, "code": str, "message": str, "fragment"?: str}}
//
// Decoders throw std::invalid_argument on malformed input.

std::string base64_encode(const std::string& bytes);
std::string base64_decode(const std::string& text);

std::string encode_task_request(const Task& t);
Task decode_task_request(const std::string& body);

std::string encode_task_response(const TaskResponse& r);
TaskResponse decode_task_response(const std::string& body);

std::string encode_error(const PipelineError& e);
PipelineError decode_error(const std::string& body);
