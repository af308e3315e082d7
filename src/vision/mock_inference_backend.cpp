#include <sightline/vision/mock_inference_backend.hpp>
#include <sightline/core/error.hpp>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace sightline::vision {

void MockInferenceBackend::set_output(RawOutputTensor output) {
  output_ = std::move(output);
}

std::expected<RawOutputTensor, sightline::core::PipelineError>
MockInferenceBackend::infer(const sightline::core::Frame& /*input*/) {
  ++infer_count_;
  return output_;
}

std::expected<void, sightline::core::PipelineError>
MockInferenceBackend::validate_input(const sightline::core::Frame& input) const {
  if (input.empty()) {
    return std::unexpected(sightline::core::PipelineError::InvalidFrame);
  }
  return {};
}

RawOutputTensor make_pre_suppressed_tensor(const std::vector<std::array<float, 6>>& rows,
                                           std::size_t max_detections) {
  const std::size_t n = std::max(rows.size(), max_detections);
  RawOutputTensor t;
  t.shape = {1, static_cast<std::int64_t>(n), 6};
  t.data.assign(n * 6, 0.f);
  for (std::size_t i = 0; i < rows.size(); ++i) {
    std::copy(rows[i].begin(), rows[i].end(), t.data.begin() + static_cast<std::ptrdiff_t>(i * 6));
  }
  return t;
}

}  // namespace sightline::vision
