#pragma once
#include "validation.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>

constexpr size_t kMaxResultBytes = 8192;

struct ComputationResult {
    std::string llm_output;
    bool verified{false};
    nlohmann::json extra = nlohmann::json::object(); // unknown keys, kept for re-serialization
};

// Writes the two required keys over any extra field of the same name.
std::string serialize_result(const ComputationResult& r);

struct ResultValidation {
    ValidationOutcome outcome;
    std::optional<ComputationResult> result; // set only when accepted
};

// Last stage before a computation result is trusted. Rejects, never coerces:
// "true" is not a boolean and a missing key has no default.
class ResultValidator {
public:
    explicit ResultValidator(size_t max_result_bytes = kMaxResultBytes);

    ResultValidation validate(const std::string& bytes) const;

private:
    ResultValidation check(const std::string& bytes) const;

    size_t max_result_bytes_;
};
