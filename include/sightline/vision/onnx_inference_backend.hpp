#pragma once

#include <sightline/core/error.hpp>
#include <sightline/core/frame.hpp>
#include <sightline/vision/inference_backend.hpp>
#include <sightline/vision/raw_output_tensor.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace sightline::vision {

/// ONNX Runtime inference backend (CPU session): loads an ONNX detection model
/// and implements IInferenceBackend.
///
/// Expected model: one float image input, [1,3,H,W] or [1,H,W,3], and a
/// detection output of rank 3 such as [1,84,8400], [1,8400,85] or [1,300,6].
/// The output is returned as-is; DetectionDecoder decides how to read it.
/// Output name is configurable; if empty, the first output is used.
///
/// Input contract: Frame must be Float32Planar (CHW, values 0..1) with
/// dimensions matching the model input (e.g. 640x640). If the model expects
/// NHWC, the backend transposes when copying to the input tensor.
class OnnxInferenceBackend : public IInferenceBackend {
 public:
  /// \param model_path Path to the .onnx model file.
  /// \param input_name Optional input tensor name; if empty, the first input is used.
  /// \param output_name Optional output tensor name; if empty, the first output is used.
  explicit OnnxInferenceBackend(std::string model_path,
                                std::string input_name = {},
                                std::string output_name = {});

  ~OnnxInferenceBackend() override;

  OnnxInferenceBackend(const OnnxInferenceBackend&) = delete;
  OnnxInferenceBackend& operator=(const OnnxInferenceBackend&) = delete;

  [[nodiscard]] std::expected<RawOutputTensor, sightline::core::PipelineError>
  infer(const sightline::core::Frame& input) override;

  [[nodiscard]] std::expected<void, sightline::core::PipelineError>
  validate_input(const sightline::core::Frame& input) const override;

  /// One inference on a zero frame. Throws std::runtime_error if it fails.
  void warmup() override;

  /// Spatial input size read from the model.
  [[nodiscard]] std::uint32_t input_width() const noexcept;
  [[nodiscard]] std::uint32_t input_height() const noexcept;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace sightline::vision
