#pragma once

#include <sightline/core/detection_result.hpp>
#include <sightline/core/error.hpp>
#include <sightline/core/frame.hpp>
#include <sightline/core/pipeline_stage.hpp>
#include <sightline/core/thresholds.hpp>
#include <sightline/vision/detection_decoder.hpp>
#include <sightline/vision/inference_backend.hpp>
#include <expected>
#include <memory>
#include <string_view>

namespace sightline::vision {

/// Pipeline stage: run inference backend + decoder, then map the detections
/// back to the original image through the frame's InputTransform.
/// Thresholds are read from `thresholds` on every process() call, so a
/// settings surface can change them while frames are flowing.
class DetectionStage : public sightline::core::IPipelineStage {
 public:
  DetectionStage(std::unique_ptr<IInferenceBackend> backend,
                 DetectionDecoder decoder,
                 std::shared_ptr<const sightline::core::SharedThresholds> thresholds);

  [[nodiscard]] std::expected<sightline::core::StageOutput, sightline::core::PipelineError>
  process(const sightline::core::Frame& input) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "detect"; }

 private:
  std::unique_ptr<IInferenceBackend> backend_;
  DetectionDecoder decoder_;
  std::shared_ptr<const sightline::core::SharedThresholds> thresholds_;
};

}  // namespace sightline::vision
