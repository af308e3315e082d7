#pragma once

#include <sightline/core/detection_result.hpp>
#include <sightline/core/error.hpp>
#include <sightline/core/frame.hpp>
#include <sightline/core/pipeline_stage.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sightline::core {

/// Called after each stage that ran: (stage_index, stage name, duration_ms).
using StageTimingCallback =
    std::function<void(std::size_t stage_index, std::string_view stage_name, double duration_ms)>;

/// Ordered chain of stages from captured image to DetectionResult.
///
/// Each Frame produced by a stage feeds the next one. The first stage that
/// returns a DetectionResult ends the run; later stages are skipped.
class Pipeline {
 public:
  Pipeline() = default;

  /// Appends a stage. nullptr is ignored.
  void add_stage(std::unique_ptr<IPipelineStage> stage);

  /// Run the chain on one frame.
  /// Errors: the first failing stage's error; InvalidConfig if the chain is
  /// empty or no stage produced a DetectionResult.
  /// Not reentrant: stages may keep scratch buffers (e.g. the ONNX backend), so
  /// callers serialize run() per Pipeline instance.
  [[nodiscard]] std::expected<DetectionResult, PipelineError> run(
      const Frame& input,
      StageTimingCallback* timing_cb = nullptr);

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

  /// Stage names joined with " -> ", for startup logs.
  [[nodiscard]] std::string describe() const;

 private:
  std::vector<std::unique_ptr<IPipelineStage>> stages_;
};

}  // namespace sightline::core
