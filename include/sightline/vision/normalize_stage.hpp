#pragma once

#include <sightline/core/error.hpp>
#include <sightline/core/frame.hpp>
#include <sightline/core/pipeline_stage.hpp>
#include <expected>
#include <string_view>

namespace sightline::vision {

/// Converts an 8-bit 3-channel frame to planar CHW float: (value - mean) * scale.
/// mean 0, scale 1/255 gives the 0..1 range detection models expect.
class NormalizeStage : public sightline::core::IPipelineStage {
 public:
  NormalizeStage(float mean, float scale);

  [[nodiscard]] std::expected<sightline::core::StageOutput, sightline::core::PipelineError>
  process(const sightline::core::Frame& input) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "normalize"; }

 private:
  float mean_;
  float scale_;
};

}  // namespace sightline::vision
