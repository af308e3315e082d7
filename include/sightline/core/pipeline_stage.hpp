#pragma once

#include <sightline/core/detection_result.hpp>
#include <sightline/core/error.hpp>
#include <sightline/core/frame.hpp>
#include <expected>
#include <string_view>
#include <variant>

namespace sightline::core {

/// Output of a pipeline stage: the transformed Frame for the next stage, or the
/// final DetectionResult.
using StageOutput = std::variant<Frame, DetectionResult>;

/// One step of the detection chain (rotate, letterbox, normalize, detect, ...).
/// Preprocessing stages return a Frame carrying the InputTransform applied so far;
/// the detection stage returns a DetectionResult in source-image coordinates.
class IPipelineStage {
 public:
  virtual ~IPipelineStage() = default;

  [[nodiscard]] virtual std::expected<StageOutput, PipelineError> process(
      const Frame& input) = 0;

  /// Short identifier used in timing reports and logs, e.g. "letterbox".
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace sightline::core
