#include <sightline/vision/normalize_stage.hpp>
#include "frame_cv_utils.hpp"
#include <sightline/core/error.hpp>
#include <sightline/core/frame.hpp>
#include <opencv2/core.hpp>
#include <cstring>
#include <vector>

namespace sightline::vision {

NormalizeStage::NormalizeStage(float mean, float scale)
    : mean_(mean), scale_(scale) {}

std::expected<sightline::core::StageOutput, sightline::core::PipelineError>
NormalizeStage::process(const sightline::core::Frame& input) {
  if (input.empty()) {
    return std::unexpected(sightline::core::PipelineError::InvalidFrame);
  }

  using namespace sightline::core;

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in || mat_in->channels() != 3) {
    return std::unexpected(PipelineError::InvalidFrame);
  }

  cv::Mat mat_float;
  mat_in->convertTo(mat_float, CV_32FC3, scale_, -mean_ * scale_);

  std::vector<cv::Mat> planes;
  cv::split(mat_float, planes);

  const std::size_t plane_bytes = mat_float.total() * sizeof(float);
  std::vector<std::byte> buffer(plane_bytes * planes.size());
  for (std::size_t c = 0; c < planes.size(); ++c) {
    std::memcpy(buffer.data() + c * plane_bytes, planes[c].ptr(), plane_bytes);
  }

  return StageOutput{Frame(static_cast<std::uint32_t>(mat_float.cols),
                           static_cast<std::uint32_t>(mat_float.rows),
                           PixelFormat::Float32Planar,
                           std::move(buffer),
                           input.transform())};
}

}  // namespace sightline::vision
