#pragma once

#include <sightline/core/error.hpp>
#include <sightline/core/frame.hpp>
#include <sightline/core/pipeline_stage.hpp>
#include <cstdint>
#include <expected>
#include <string_view>

namespace sightline::vision {

/// Resizes input frame to a fixed size, each axis independently (no
/// letterbox). Tags the output with a StretchTransform.
class ResizeStage : public sightline::core::IPipelineStage {
 public:
  ResizeStage(std::uint32_t target_width, std::uint32_t target_height);

  [[nodiscard]] std::expected<sightline::core::StageOutput, sightline::core::PipelineError>
  process(const sightline::core::Frame& input) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "resize"; }

 private:
  std::uint32_t target_width_;
  std::uint32_t target_height_;
};

}  // namespace sightline::vision
