#include "../include/pipeline.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include <stdexcept>

TaskPipeline::TaskPipeline(IntakeValidator intake, std::shared_ptr<const Dispatcher> dispatcher,
                           ResultValidator results)
    : intake_(std::move(intake)), dispatcher_(std::move(dispatcher)), results_(std::move(results)) {
    if (!dispatcher_) throw std::invalid_argument("TaskPipeline requires a dispatcher");
}

PipelineResult TaskPipeline::run(const Task& t) const {
    auto intake = intake_.validate(t);
    if (!intake.is_accepted()) return intake.error();

    auto dispatched = dispatcher_->dispatch(t);
    if (auto* err = std::get_if<PipelineError>(&dispatched)) return *err;
    const std::string& raw = std::get<std::string>(dispatched);

    auto checked = results_.validate(raw);
    if (!checked.outcome.is_accepted()) return checked.outcome.error();

    log_info("performer", "Task completed", {
        {"taskId", printable(t.id)},
        {"verified", checked.result->verified ? "true" : "false"},
    });
    return TaskResponse{t.id, raw};
}

TaskPipeline make_pipeline(const DispatcherConfig& cfg) {
    return TaskPipeline(IntakeValidator(cfg), std::make_shared<HttpDispatcher>(cfg));
}
