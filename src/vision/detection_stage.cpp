#include <sightline/vision/detection_stage.hpp>
#include <sightline/core/detection_result.hpp>
#include <sightline/vision/coordinate_mapper.hpp>

namespace sightline::vision {

DetectionStage::DetectionStage(
    std::unique_ptr<IInferenceBackend> backend,
    DetectionDecoder decoder,
    std::shared_ptr<const sightline::core::SharedThresholds> thresholds)
    : backend_(std::move(backend)),
      decoder_(std::move(decoder)),
      thresholds_(thresholds ? std::move(thresholds)
                             : std::make_shared<const sightline::core::SharedThresholds>()) {}

std::expected<sightline::core::StageOutput, sightline::core::PipelineError>
DetectionStage::process(const sightline::core::Frame& input) {
  auto valid = backend_->validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto tensor = backend_->infer(input);
  if (!tensor) {
    return std::unexpected(tensor.error());
  }

  const auto model_space = decoder_.decode(*tensor, thresholds_->snapshot());

  sightline::core::DetectionResult out;
  out.source_width = input.source_width();
  out.source_height = input.source_height();
  out.detections = map_to_image(model_space, input.transform());
  return sightline::core::StageOutput{std::move(out)};
}

}  // namespace sightline::vision
