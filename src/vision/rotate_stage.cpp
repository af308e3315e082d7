#include <sightline/vision/rotate_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <variant>
#include <vector>

namespace sightline::vision {

RotateStage::RotateStage(Rotation rotation) : rotation_(rotation) {}

std::expected<sightline::core::StageOutput, sightline::core::PipelineError>
RotateStage::process(const sightline::core::Frame& input) {
  if (input.empty() || !std::holds_alternative<sightline::core::IdentityTransform>(input.transform())) {
    return std::unexpected(sightline::core::PipelineError::InvalidFrame);
  }

  if (rotation_ == Rotation::None) {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return sightline::core::StageOutput{
        sightline::core::Frame(input.width(), input.height(), input.format(), std::move(buf))};
  }

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(sightline::core::PipelineError::InvalidFrame);
  }

  int code = cv::ROTATE_90_CLOCKWISE;
  if (rotation_ == Rotation::Cw180) code = cv::ROTATE_180;
  if (rotation_ == Rotation::Cw270) code = cv::ROTATE_90_COUNTERCLOCKWISE;

  cv::Mat mat_out;
  cv::rotate(*mat_in, mat_out, code);
  return sightline::core::StageOutput{detail::mat_to_frame(mat_out, input.format())};
}

}  // namespace sightline::vision
