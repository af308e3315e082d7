#pragma once

#include <sightline/core/error.hpp>
#include <sightline/core/frame.hpp>
#include <sightline/core/pipeline_stage.hpp>
#include <expected>
#include <string_view>

namespace sightline::vision {

/// Converts between pixel formats (e.g. BGR from OpenCV decoding -> RGB for the model).
class ColorConvertStage : public sightline::core::IPipelineStage {
 public:
  explicit ColorConvertStage(sightline::core::PixelFormat output_format);

  [[nodiscard]] std::expected<sightline::core::StageOutput, sightline::core::PipelineError>
  process(const sightline::core::Frame& input) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "color_convert"; }

 private:
  sightline::core::PixelFormat output_format_;
};

}  // namespace sightline::vision
