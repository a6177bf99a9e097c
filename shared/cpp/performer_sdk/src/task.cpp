#include "../include/task.hpp"
#include <array>
#include <utility>

namespace {
const std::array<std::pair<ErrorCode, const char*>, 20> kCodeNames = {{
    {ErrorCode::EmptyIdentifier, "EmptyIdentifier"},
    {ErrorCode::EmptyPayload, "EmptyPayload"},
    {ErrorCode::PayloadTooLarge, "PayloadTooLarge"},
    {ErrorCode::InvalidEncoding, "InvalidEncoding"},
    {ErrorCode::BlankPayload, "BlankPayload"},
    {ErrorCode::MaliciousPattern, "MaliciousPattern"},
    {ErrorCode::MissingCredential, "MissingCredential"},
    {ErrorCode::MissingEndpoint, "MissingEndpoint"},
    {ErrorCode::InsecureEndpoint, "InsecureEndpoint"},
    {ErrorCode::MalformedEndpoint, "MalformedEndpoint"},
    {ErrorCode::Timeout, "Timeout"},
    {ErrorCode::Transport, "Transport"},
    {ErrorCode::HttpStatus, "HttpStatus"},
    {ErrorCode::BadResponse, "BadResponse"},
    {ErrorCode::EmptyResult, "EmptyResult"},
    {ErrorCode::ResultTooLarge, "ResultTooLarge"},
    {ErrorCode::MalformedResult, "MalformedResult"},
    {ErrorCode::MissingField, "MissingField"},
    {ErrorCode::InvalidOutput, "InvalidOutput"},
    {ErrorCode::InvalidVerified, "InvalidVerified"},
}};
}

ErrorCategory category_of(ErrorCode code) {
    switch (code) {
        case ErrorCode::EmptyIdentifier:
        case ErrorCode::EmptyPayload:
        case ErrorCode::PayloadTooLarge:
        case ErrorCode::InvalidEncoding:
        case ErrorCode::BlankPayload:
        case ErrorCode::MaliciousPattern:
            return ErrorCategory::InvalidTask;
        case ErrorCode::MissingCredential:
        case ErrorCode::MissingEndpoint:
        case ErrorCode::InsecureEndpoint:
        case ErrorCode::MalformedEndpoint:
            return ErrorCategory::ConfigurationError;
        case ErrorCode::Timeout:
        case ErrorCode::Transport:
        case ErrorCode::HttpStatus:
        case ErrorCode::BadResponse:
            return ErrorCategory::DispatchFailure;
        case ErrorCode::EmptyResult:
        case ErrorCode::ResultTooLarge:
        case ErrorCode::MalformedResult:
        case ErrorCode::MissingField:
        case ErrorCode::InvalidOutput:
        case ErrorCode::InvalidVerified:
            return ErrorCategory::InvalidResult;
    }
    return ErrorCategory::InvalidTask;
}

ErrorCategory PipelineError::category() const { return category_of(code); }

const char* to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::InvalidTask:        return "InvalidTask";
        case ErrorCategory::ConfigurationError: return "ConfigurationError";
        case ErrorCategory::DispatchFailure:    return "DispatchFailure";
        case ErrorCategory::InvalidResult:      return "InvalidResult";
    }
    return "Unknown";
}

const char* to_string(ErrorCode code) {
    for (const auto& [c, name] : kCodeNames) {
        if (c == code) return name;
    }
    return "Unknown";
}

std::optional<ErrorCode> error_code_from_string(const std::string& name) {
    for (const auto& [c, n] : kCodeNames) {
        if (name == n) return c;
    }
    return std::nullopt;
}
