#include <sightline/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <sightline/core/frame.hpp>
#include <opencv2/imgcodecs.hpp>

namespace sightline::vision {

std::expected<sightline::core::Frame, sightline::core::PipelineError>
load_frame_from_image(const std::string& path) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_COLOR);
  if (mat.empty()) {
    return std::unexpected(sightline::core::PipelineError::LoadFailed);
  }

  sightline::core::PixelFormat format = sightline::core::PixelFormat::BGR8;
  if (mat.channels() == 1) format = sightline::core::PixelFormat::Grayscale8;

  return detail::mat_to_frame(mat, format);
}

}  // namespace sightline::vision
