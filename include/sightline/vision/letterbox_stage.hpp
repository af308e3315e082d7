#pragma once

#include <sightline/core/error.hpp>
#include <sightline/core/frame.hpp>
#include <sightline/core/pipeline_stage.hpp>
#include <cstdint>
#include <expected>
#include <string_view>

namespace sightline::vision {

/// Aspect-preserving resize into a fixed model input, padded symmetrically
/// with black. Tags the output with a LetterboxTransform so detections can be
/// mapped back with the letterbox inverse.
class LetterboxStage : public sightline::core::IPipelineStage {
 public:
  LetterboxStage(std::uint32_t target_width, std::uint32_t target_height);

  [[nodiscard]] std::expected<sightline::core::StageOutput, sightline::core::PipelineError>
  process(const sightline::core::Frame& input) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "letterbox"; }

 private:
  std::uint32_t target_width_;
  std::uint32_t target_height_;
};

}  // namespace sightline::vision
