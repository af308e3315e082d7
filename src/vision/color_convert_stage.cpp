#include <sightline/vision/color_convert_stage.hpp>
#include "frame_cv_utils.hpp"
#include <sightline/core/error.hpp>
#include <sightline/core/frame.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

namespace sightline::vision {

namespace {

/// OpenCV conversion code, or -1 if the pair is not supported.
int conversion_code(sightline::core::PixelFormat from, sightline::core::PixelFormat to) {
  using sightline::core::PixelFormat;
  if (from == PixelFormat::BGR8 && to == PixelFormat::RGB8) return cv::COLOR_BGR2RGB;
  if (from == PixelFormat::RGB8 && to == PixelFormat::BGR8) return cv::COLOR_RGB2BGR;
  if (from == PixelFormat::BGRA8 && to == PixelFormat::RGB8) return cv::COLOR_BGRA2RGB;
  if (from == PixelFormat::RGBA8 && to == PixelFormat::RGB8) return cv::COLOR_RGBA2RGB;
  if (from == PixelFormat::Grayscale8 && to == PixelFormat::RGB8) return cv::COLOR_GRAY2RGB;
  if (from == PixelFormat::Grayscale8 && to == PixelFormat::BGR8) return cv::COLOR_GRAY2BGR;
  if (from == PixelFormat::RGB8 && to == PixelFormat::Grayscale8) return cv::COLOR_RGB2GRAY;
  if (from == PixelFormat::BGR8 && to == PixelFormat::Grayscale8) return cv::COLOR_BGR2GRAY;
  return -1;
}

}  // namespace

ColorConvertStage::ColorConvertStage(sightline::core::PixelFormat output_format)
    : output_format_(output_format) {}

std::expected<sightline::core::StageOutput, sightline::core::PipelineError>
ColorConvertStage::process(const sightline::core::Frame& input) {
  if (input.empty()) {
    return std::unexpected(sightline::core::PipelineError::InvalidFrame);
  }

  using namespace sightline::core;

  if (input.format() == output_format_) {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return StageOutput{Frame(input.width(), input.height(), output_format_,
                             std::move(buf), input.transform())};
  }

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(PipelineError::InvalidFrame);
  }

  const int code = conversion_code(input.format(), output_format_);
  if (code < 0) {
    return std::unexpected(PipelineError::InvalidFrame);
  }

  cv::Mat mat_out;
  cv::cvtColor(*mat_in, mat_out, code);
  return StageOutput{detail::mat_to_frame(mat_out, output_format_, input.transform())};
}

}  // namespace sightline::vision
