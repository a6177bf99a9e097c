#pragma once
#include "../../../shared/cpp/performer_sdk/include/task.hpp"
#include <optional>
#include <stdexcept>

// Accepted, or Rejected carrying exactly one error.
class ValidationOutcome {
public:
    static ValidationOutcome accepted() { return ValidationOutcome(); }
    static ValidationOutcome rejected(PipelineError error) {
        ValidationOutcome o;
        o.error_ = std::move(error);
        return o;
    }

    bool is_accepted() const { return !error_.has_value(); }

    const PipelineError& error() const {
        if (!error_) throw std::logic_error("accepted outcome has no error");
        return *error_;
    }

private:
    ValidationOutcome() = default;
    std::optional<PipelineError> error_;
};
