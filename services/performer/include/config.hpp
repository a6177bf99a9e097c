#pragma once
#include "log.hpp"
#include "../../../shared/cpp/performer_sdk/include/task.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

struct DispatcherConfig {
    std::string credential;                   // AZURE_OPENAI_KEY
    std::string endpoint;                     // AZURE_OPENAI_ENDPOINT, must be https
    std::chrono::milliseconds timeout{10000};
    int max_output_tokens{64};
    double temperature{0.2};
};

struct ServerConfig {
    int port{8080};
    int connection_timeout_s{5};
};

struct PerformerConfig {
    DispatcherConfig dispatcher;
    ServerConfig server;
    LogLevel log_level{LogLevel::Info};
};

using EnvLookup = std::function<std::optional<std::string>(const char*)>;

EnvLookup process_env();

// Reads every setting once. Throws std::invalid_argument on a malformed value.
// Missing credential/endpoint are left empty; check_dispatcher_config reports them per task.
PerformerConfig load_config(const EnvLookup& env);

// Credential and endpoint checks run at intake, before any network call.
std::optional<PipelineError> check_dispatcher_config(const DispatcherConfig& cfg);
