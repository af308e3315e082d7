#pragma once

#include <sightline/vision/inference_backend.hpp>
#include <array>
#include <cstddef>
#include <vector>

namespace sightline::vision {

/// Mock backend that returns a configurable output tensor (for tests/demo).
class MockInferenceBackend : public IInferenceBackend {
 public:
  /// Tensor to return on every infer() call.
  void set_output(RawOutputTensor output);

  [[nodiscard]] std::expected<RawOutputTensor, sightline::core::PipelineError>
  infer(const sightline::core::Frame& input) override;

  [[nodiscard]] std::expected<void, sightline::core::PipelineError>
  validate_input(const sightline::core::Frame& input) const override;

  [[nodiscard]] std::size_t infer_count() const noexcept { return infer_count_; }

 private:
  RawOutputTensor output_;
  std::size_t infer_count_{0};
};

/// Build a [1, N, 6] pre-suppressed tensor from rows of
/// {x1, y1, x2, y2, score, class_id}. Zero rows pad N up to max_detections,
/// the fixed row count end-to-end exports emit; fewer rows than 6 would
/// otherwise resolve as channel-first.
[[nodiscard]] RawOutputTensor make_pre_suppressed_tensor(
    const std::vector<std::array<float, 6>>& rows, std::size_t max_detections = 300);

}  // namespace sightline::vision
