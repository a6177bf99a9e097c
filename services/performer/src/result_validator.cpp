#include "../include/result_validator.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"

using json = nlohmann::json;

static const char* kOutputKey = "llm_output";
static const char* kVerifiedKey = "verified";

static ResultValidation reject(ErrorCode code, std::string message, std::optional<std::string> fragment = std::nullopt) {
    return ResultValidation{ValidationOutcome::rejected(PipelineError{code, std::move(message), std::move(fragment)}),
                            std::nullopt};
}

std::string serialize_result(const ComputationResult& r) {
    json j = r.extra.is_object() ? r.extra : json::object();
    j[kOutputKey] = r.llm_output;
    j[kVerifiedKey] = r.verified;
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

ResultValidator::ResultValidator(size_t max_result_bytes) : max_result_bytes_(max_result_bytes) {}

ResultValidation ResultValidator::validate(const std::string& bytes) const {
    auto v = check(bytes);
    if (v.outcome.is_accepted()) {
        log_info("result", "Result validation passed", {
            {"resultSize", std::to_string(bytes.size())},
            {"verified", v.result->verified ? "true" : "false"},
        });
    } else {
        const auto& e = v.outcome.error();
        log_warn("result", "Result rejected", {{"code", to_string(e.code)}, {"reason", e.message}});
    }
    return v;
}

ResultValidation ResultValidator::check(const std::string& bytes) const {
    if (bytes.empty()) {
        return reject(ErrorCode::EmptyResult, "result cannot be empty");
    }
    if (bytes.size() > max_result_bytes_) {
        return reject(ErrorCode::ResultTooLarge,
                      "result size " + std::to_string(bytes.size()) +
                      " exceeds maximum allowed size " + std::to_string(max_result_bytes_));
    }

    json j;
    try {
        j = json::parse(bytes);
    } catch (const json::parse_error& e) {
        return reject(ErrorCode::MalformedResult, std::string("result is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        return reject(ErrorCode::MalformedResult, "result is not a JSON object");
    }

    for (const char* key : {kOutputKey, kVerifiedKey}) {
        if (!j.contains(key)) {
            return reject(ErrorCode::MissingField, std::string("result missing required field: ") + key, std::string(key));
        }
    }

    const json& output = j[kOutputKey];
    if (!output.is_string()) {
        return reject(ErrorCode::InvalidOutput, "llm_output field must be a string", std::string(kOutputKey));
    }
    if (is_blank(output.get_ref<const std::string&>())) {
        return reject(ErrorCode::InvalidOutput, "llm_output cannot be empty or whitespace only", std::string(kOutputKey));
    }

    const json& verified = j[kVerifiedKey];
    if (!verified.is_boolean()) {
        return reject(ErrorCode::InvalidVerified, "verified field must be a boolean", std::string(kVerifiedKey));
    }

    ComputationResult r;
    r.llm_output = output.get<std::string>();
    r.verified = verified.get<bool>();
    j.erase(std::string(kOutputKey));
    j.erase(std::string(kVerifiedKey));
    r.extra = std::move(j);
    return ResultValidation{ValidationOutcome::accepted(), std::move(r)};
}
