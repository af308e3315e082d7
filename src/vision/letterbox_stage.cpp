#include <sightline/vision/letterbox_stage.hpp>
#include "frame_cv_utils.hpp"
#include <sightline/vision/letterbox.hpp>
#include <opencv2/imgproc.hpp>
#include <variant>

namespace sightline::vision {

LetterboxStage::LetterboxStage(std::uint32_t target_width,
                               std::uint32_t target_height)
    : target_width_(target_width), target_height_(target_height) {}

std::expected<sightline::core::StageOutput, sightline::core::PipelineError>
LetterboxStage::process(const sightline::core::Frame& input) {
  if (input.empty() || !std::holds_alternative<sightline::core::IdentityTransform>(input.transform())) {
    return std::unexpected(sightline::core::PipelineError::InvalidFrame);
  }

  const auto params = compute_letterbox(input.width(), input.height(),
                                        target_width_, target_height_);
  if (!params) {
    return std::unexpected(sightline::core::PipelineError::InvalidFrame);
  }

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(sightline::core::PipelineError::InvalidFrame);
  }

  const auto resized = letterbox_resized_extent(input.width(), input.height(),
                                                target_width_, target_height_);
  if (resized.width <= 0 || resized.height <= 0) {
    return std::unexpected(sightline::core::PipelineError::InvalidFrame);
  }

  cv::Mat canvas(static_cast<int>(target_height_), static_cast<int>(target_width_),
                 mat_in->type(), cv::Scalar::all(0));
  cv::Mat roi = canvas(cv::Rect(params->pad_x, params->pad_y, resized.width, resized.height));
  cv::resize(*mat_in, roi, roi.size(), 0, 0, cv::INTER_LINEAR);

  const sightline::core::LetterboxTransform transform{input.width(), input.height(), *params};
  return sightline::core::StageOutput{detail::mat_to_frame(canvas, input.format(), transform)};
}

}  // namespace sightline::vision
