#include "frame_cv_utils.hpp"
#include <sightline/core/frame.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace sightline::vision::detail {

namespace nc = sightline::core;

std::optional<cv::Mat> frame_to_mat(const nc::Frame& frame) {
  if (frame.empty() || frame.height() == 0) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  const std::size_t step = frame.size_bytes() / static_cast<std::size_t>(h);
  if (frame.size_bytes() < nc::Frame::min_bytes(frame.width(), frame.height(), frame.format())) {
    return std::nullopt;
  }
  void* data = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case nc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case nc::PixelFormat::RGB8:
    case nc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case nc::PixelFormat::RGBA8:
    case nc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data, step);
    case nc::PixelFormat::Float32Planar:
    case nc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

nc::Frame mat_to_frame(const cv::Mat& mat, nc::PixelFormat format,
                       const nc::InputTransform& transform) {
  if (mat.empty()) return nc::Frame();

  const cv::Mat contiguous = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(contiguous.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(contiguous.rows);
  const std::size_t len = contiguous.total() * contiguous.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), contiguous.ptr(), len);
  return nc::Frame(w, h, format, std::move(buffer), transform);
}

}  // namespace sightline::vision::detail
