#pragma once

#include <sightline/core/error.hpp>
#include <sightline/core/frame.hpp>
#include <sightline/core/pipeline_stage.hpp>
#include <expected>
#include <string_view>

namespace sightline::vision {

/// Clockwise rotation applied to a captured frame before preprocessing.
enum class Rotation : int {
  None = 0,
  Cw90 = 90,
  Cw180 = 180,
  Cw270 = 270,
};

/// Rotates a capture into display orientation (e.g. a portrait capture from a
/// landscape sensor). Must run before LetterboxStage / ResizeStage: the
/// rotated extent becomes the original image size that detections map back to.
/// Rejects frames that were already resized (non-identity transform).
class RotateStage : public sightline::core::IPipelineStage {
 public:
  explicit RotateStage(Rotation rotation);

  [[nodiscard]] std::expected<sightline::core::StageOutput, sightline::core::PipelineError>
  process(const sightline::core::Frame& input) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "rotate"; }

 private:
  Rotation rotation_;
};

}  // namespace sightline::vision
