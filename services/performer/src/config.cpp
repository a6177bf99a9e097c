#include "../include/config.hpp"
#include "../include/util.hpp"
#include <cstdlib>
#include <stdexcept>

EnvLookup process_env() {
    return [](const char* key) -> std::optional<std::string> {
        const char* v = std::getenv(key);
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

static long parse_long(const char* key, const std::string& value, long min, long max) {
    size_t used = 0;
    long n = 0;
    try {
        n = std::stol(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(key) + ": not an integer: " + value);
    }
    if (used != value.size()) throw std::invalid_argument(std::string(key) + ": not an integer: " + value);
    if (n < min || n > max) {
        throw std::invalid_argument(std::string(key) + ": " + value + " out of range [" +
                                    std::to_string(min) + ", " + std::to_string(max) + "]");
    }
    return n;
}

static double parse_double(const char* key, const std::string& value, double min, double max) {
    size_t used = 0;
    double f = 0.0;
    try {
        f = std::stod(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(key) + ": not a number: " + value);
    }
    if (used != value.size()) throw std::invalid_argument(std::string(key) + ": not a number: " + value);
    if (!(f >= min && f <= max)) {
        throw std::invalid_argument(std::string(key) + ": " + value + " out of range");
    }
    return f;
}

PerformerConfig load_config(const EnvLookup& env) {
    PerformerConfig cfg;
    if (auto v = env("AZURE_OPENAI_KEY")) cfg.dispatcher.credential = *v;
    if (auto v = env("AZURE_OPENAI_ENDPOINT")) cfg.dispatcher.endpoint = *v;
    if (auto v = env("PERFORMER_TIMEOUT_MS")) {
        cfg.dispatcher.timeout = std::chrono::milliseconds(parse_long("PERFORMER_TIMEOUT_MS", *v, 1, 600000));
    }
    if (auto v = env("PERFORMER_MAX_TOKENS")) {
        cfg.dispatcher.max_output_tokens = (int)parse_long("PERFORMER_MAX_TOKENS", *v, 1, 32768);
    }
    if (auto v = env("PERFORMER_TEMPERATURE")) {
        cfg.dispatcher.temperature = parse_double("PERFORMER_TEMPERATURE", *v, 0.0, 2.0);
    }
    if (auto v = env("PERFORMER_PORT")) {
        cfg.server.port = (int)parse_long("PERFORMER_PORT", *v, 1, 65535);
    }
    if (auto v = env("PERFORMER_CONNECTION_TIMEOUT_S")) {
        cfg.server.connection_timeout_s = (int)parse_long("PERFORMER_CONNECTION_TIMEOUT_S", *v, 1, 3600);
    }
    if (auto v = env("PERFORMER_LOG_LEVEL")) {
        auto lvl = parse_log_level(*v);
        if (!lvl) throw std::invalid_argument("PERFORMER_LOG_LEVEL: unknown level: " + *v);
        cfg.log_level = *lvl;
    }
    return cfg;
}

std::optional<PipelineError> check_dispatcher_config(const DispatcherConfig& cfg) {
    if (cfg.credential.empty()) {
        return PipelineError{ErrorCode::MissingCredential, "inference credential (AZURE_OPENAI_KEY) is not set", std::nullopt};
    }
    if (cfg.endpoint.empty()) {
        return PipelineError{ErrorCode::MissingEndpoint, "inference endpoint (AZURE_OPENAI_ENDPOINT) is not set", std::nullopt};
    }
    const std::string scheme = "https://";
    if (to_lower_ascii(cfg.endpoint.substr(0, scheme.size())) != scheme) {
        return PipelineError{ErrorCode::InsecureEndpoint, "inference endpoint must use HTTPS", std::nullopt};
    }
    std::string rest = cfg.endpoint.substr(scheme.size());
    std::string authority = rest.substr(0, rest.find_first_of("/?#"));
    auto at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);
    if (authority.empty() || authority[0] == ':') {
        return PipelineError{ErrorCode::MalformedEndpoint, "inference endpoint has no host", std::nullopt};
    }
    return std::nullopt;
}
