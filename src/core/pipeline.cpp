#include <sightline/core/pipeline.hpp>
#include <chrono>
#include <utility>

namespace sightline::core {

namespace {

using Clock = std::chrono::steady_clock;

double elapsed_ms(Clock::time_point start) {
  return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

}  // namespace

void Pipeline::add_stage(std::unique_ptr<IPipelineStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::expected<DetectionResult, PipelineError> Pipeline::run(
    const Frame& input,
    StageTimingCallback* timing_cb) {
  if (stages_.empty()) {
    return std::unexpected(PipelineError::InvalidConfig);
  }

  // The caller's frame is read in place; only stage outputs are owned here.
  const Frame* frame = &input;
  StageOutput held;

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    IPipelineStage& stage = *stages_[i];
    const auto start = Clock::now();
    auto output = stage.process(*frame);
    if (timing_cb) {
      (*timing_cb)(i, stage.name(), elapsed_ms(start));
    }
    if (!output) {
      return std::unexpected(output.error());
    }

    if (auto* result = std::get_if<DetectionResult>(&*output)) {
      return std::move(*result);
    }
    held = std::move(*output);
    frame = &std::get<Frame>(held);
  }
  return std::unexpected(PipelineError::InvalidConfig);
}

std::string Pipeline::describe() const {
  std::string out;
  for (const auto& stage : stages_) {
    if (!out.empty()) out += " -> ";
    out += stage->name();
  }
  return out;
}

}  // namespace sightline::core
