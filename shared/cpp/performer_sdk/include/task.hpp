#pragma once
#include <string>
#include <optional>

// Byte fields are carried in std::string; they may hold NUL bytes and invalid UTF-8.
struct Task {
    std::string id;      // caller-assigned, never rewritten
    std::string payload; // prompt text, or opaque bytes if it contains a NUL
};

struct TaskResponse {
    std::string task_id;
    std::string result; // serialized ComputationResult (JSON object)
};

enum class ErrorCategory {
    InvalidTask,
    ConfigurationError,
    DispatchFailure,
    InvalidResult
};

enum class ErrorCode {
    // InvalidTask
    EmptyIdentifier,
    EmptyPayload,
    PayloadTooLarge,
    InvalidEncoding,
    BlankPayload,
    MaliciousPattern,
    // ConfigurationError
    MissingCredential,
    MissingEndpoint,
    InsecureEndpoint,
    MalformedEndpoint,
    // DispatchFailure
    Timeout,
    Transport,
    HttpStatus,
    BadResponse,
    // InvalidResult
    EmptyResult,
    ResultTooLarge,
    MalformedResult,
    MissingField,
    InvalidOutput,
    InvalidVerified
};

struct PipelineError {
    ErrorCode code{ErrorCode::EmptyIdentifier};
    std::string message;
    std::optional<std::string> fragment; // offending pattern or field, when there is one

    ErrorCategory category() const;
};

ErrorCategory category_of(ErrorCode code);
const char* to_string(ErrorCategory category);
const char* to_string(ErrorCode code);
std::optional<ErrorCode> error_code_from_string(const std::string& name);
