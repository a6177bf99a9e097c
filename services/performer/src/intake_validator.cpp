#include "../include/intake_validator.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include <stdexcept>

static ValidationOutcome reject(ErrorCode code, std::string message, std::optional<std::string> fragment = std::nullopt) {
    return ValidationOutcome::rejected(PipelineError{code, std::move(message), std::move(fragment)});
}

IntakeValidator::IntakeValidator(DispatcherConfig config, std::shared_ptr<const ContentScreen> screen,
                                 size_t max_payload_bytes)
    : config_(std::move(config)), screen_(std::move(screen)), max_payload_bytes_(max_payload_bytes) {
    if (!screen_) throw std::invalid_argument("IntakeValidator requires a content screen");
}

ValidationOutcome IntakeValidator::validate(const Task& t) const {
    log_debug("intake", "Validating task", {{"taskId", printable(t.id)}, {"payloadSize", std::to_string(t.payload.size())}});
    auto outcome = check(t);
    if (outcome.is_accepted()) {
        log_info("intake", "Task validation passed", {
            {"taskId", printable(t.id)},
            {"payloadSize", std::to_string(t.payload.size())},
            {"payloadSha256", sha256_hex(t.payload)},
        });
    } else {
        const auto& e = outcome.error();
        log_warn("intake", "Task rejected", {
            {"taskId", printable(t.id)},
            {"code", to_string(e.code)},
            {"reason", e.message},
        });
    }
    return outcome;
}

ValidationOutcome IntakeValidator::check(const Task& t) const {
    if (t.id.empty()) {
        return reject(ErrorCode::EmptyIdentifier, "task ID cannot be empty");
    }
    if (t.payload.empty()) {
        return reject(ErrorCode::EmptyPayload, "task payload cannot be empty");
    }
    if (t.payload.size() > max_payload_bytes_) {
        return reject(ErrorCode::PayloadTooLarge,
                      "task payload size " + std::to_string(t.payload.size()) +
                      " exceeds maximum allowed size " + std::to_string(max_payload_bytes_));
    }
    // Payloads with an embedded NUL are treated as binary and skip the encoding check.
    if (t.payload.find('\0') == std::string::npos && !is_valid_utf8(t.payload)) {
        return reject(ErrorCode::InvalidEncoding, "task payload contains invalid UTF-8 characters");
    }
    if (is_blank(t.payload)) {
        return reject(ErrorCode::BlankPayload, "task prompt cannot be empty or whitespace only");
    }
    if (auto hit = screen_->screen(t.payload)) {
        return reject(ErrorCode::MaliciousPattern,
                      "task payload contains potentially malicious content: " + *hit, *hit);
    }
    if (auto cfg_err = check_dispatcher_config(config_)) {
        return ValidationOutcome::rejected(std::move(*cfg_err));
    }
    return ValidationOutcome::accepted();
}
