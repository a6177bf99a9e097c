#pragma once
#include "dispatcher.hpp"
#include "intake_validator.hpp"
#include "result_validator.hpp"
#include <memory>
#include <variant>

using PipelineResult = std::variant<TaskResponse, PipelineError>;

// intake -> dispatch -> result. Each stage runs only if the previous one
// succeeded, nothing is retried and nothing is kept between calls, so one
// instance can serve concurrent requests.
class TaskPipeline {
public:
    TaskPipeline(IntakeValidator intake, std::shared_ptr<const Dispatcher> dispatcher,
                 ResultValidator results = ResultValidator());

    PipelineResult run(const Task& t) const;

private:
    IntakeValidator intake_;
    std::shared_ptr<const Dispatcher> dispatcher_;
    ResultValidator results_;
};

TaskPipeline make_pipeline(const DispatcherConfig& cfg);
