#pragma once
#include "config.hpp"
#include "content_screen.hpp"
#include "validation.hpp"
#include <cstddef>
#include <memory>

constexpr size_t kMaxPayloadBytes = 4096;

// First stage of the pipeline. Checks run cheapest first and the first failure
// is the only one reported:
//   1. id non-empty            4. UTF-8 (skipped if the payload holds a NUL byte)
//   2. payload non-empty       5. payload not blank
//   3. payload size <= limit   6. content screen
//                              7. downstream credential/endpoint
// Holds no mutable state; the same task always yields the same outcome.
class IntakeValidator {
public:
    explicit IntakeValidator(DispatcherConfig config,
                             std::shared_ptr<const ContentScreen> screen = std::make_shared<DenylistScreen>(),
                             size_t max_payload_bytes = kMaxPayloadBytes);

    ValidationOutcome validate(const Task& t) const;

private:
    ValidationOutcome check(const Task& t) const;

    DispatcherConfig config_;
    std::shared_ptr<const ContentScreen> screen_;
    size_t max_payload_bytes_;
};
