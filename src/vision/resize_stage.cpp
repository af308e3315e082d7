#include <sightline/vision/resize_stage.hpp>
#include "frame_cv_utils.hpp"
#include <sightline/core/error.hpp>
#include <sightline/core/frame.hpp>
#include <opencv2/imgproc.hpp>
#include <variant>
#include <vector>

namespace sightline::vision {

ResizeStage::ResizeStage(std::uint32_t target_width,
                         std::uint32_t target_height)
    : target_width_(target_width), target_height_(target_height) {}

std::expected<sightline::core::StageOutput, sightline::core::PipelineError>
ResizeStage::process(const sightline::core::Frame& input) {
  if (input.empty() || target_width_ == 0 || target_height_ == 0 ||
      !std::holds_alternative<sightline::core::IdentityTransform>(input.transform())) {
    return std::unexpected(sightline::core::PipelineError::InvalidFrame);
  }

  using namespace sightline::core;

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(PipelineError::InvalidFrame);
  }

  const StretchTransform transform{input.width(), input.height(),
                                   target_width_, target_height_};

  if (input.width() == target_width_ && input.height() == target_height_) {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return StageOutput{Frame(input.width(), input.height(), input.format(),
                             std::move(buf), transform)};
  }

  cv::Mat mat_out;
  cv::resize(*mat_in, mat_out,
             cv::Size(static_cast<int>(target_width_),
                      static_cast<int>(target_height_)),
             0, 0, cv::INTER_LINEAR);

  return StageOutput{detail::mat_to_frame(mat_out, input.format(), transform)};
}

}  // namespace sightline::vision
