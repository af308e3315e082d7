#pragma once

#include <sightline/core/error.hpp>
#include <sightline/core/frame.hpp>
#include <sightline/vision/raw_output_tensor.hpp>
#include <expected>

namespace sightline::vision {

/// Abstract inference backend: planar CHW float Frame -> RawOutputTensor.
/// Implement infer(); optionally override validate_input and warmup.
class IInferenceBackend {
 public:
  virtual ~IInferenceBackend() = default;

  /// Single-frame inference. Must be implemented.
  [[nodiscard]] virtual std::expected<RawOutputTensor, sightline::core::PipelineError>
  infer(const sightline::core::Frame& input) = 0;

  /// Optional: validate frame format/dimensions before infer. Default: accept.
  [[nodiscard]] virtual std::expected<void, sightline::core::PipelineError>
  validate_input(const sightline::core::Frame& /*input*/) const {
    return {};
  }

  /// Optional: warmup run (e.g. dummy inference). Call once after construction. Default: no-op.
  virtual void warmup() {}
};

}  // namespace sightline::vision
