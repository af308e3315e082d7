#include <sightline/vision/onnx_inference_backend.hpp>
#include <sightline/core/error.hpp>
#include <sightline/core/frame.hpp>
#include <onnxruntime_cxx_api.h>
#include <array>
#include <cstdint>
#include <cstring>
#include <expected>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace sightline::vision {

namespace {

constexpr int64_t kNumChannels = 3;

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

/// Copy CHW (channels, height, width) float buffer to HWC for NHWC models.
void ChwToHwc(const float* chw, std::uint32_t h, std::uint32_t w, float* hwc) {
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (std::size_t i = 0; i < hw; ++i) {
    hwc[i * kNumChannels + 0] = chw[0 * hw + i];
    hwc[i * kNumChannels + 1] = chw[1 * hw + i];
    hwc[i * kNumChannels + 2] = chw[2 * hw + i];
  }
}

}  // namespace

struct OnnxInferenceBackend::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "sightline"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_name;
  std::string output_name;

  std::uint32_t input_height{0};
  std::uint32_t input_width{0};
  bool input_is_nchw{true};

  std::vector<float> input_buffer;  // scratch: CHW copy or CHW -> HWC

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxInferenceBackend::OnnxInferenceBackend(std::string model_path,
                                           std::string input_name,
                                           std::string output_name)
    : impl_(std::make_unique<Impl>()) {
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxInferenceBackend: model has no inputs");
  }
  impl_->input_name = input_name.empty()
                          ? impl_->session.GetInputNameAllocated(0, allocator).get()
                          : std::move(input_name);

  Ort::TypeInfo input_type = impl_->session.GetInputTypeInfo(0);
  const auto shape_info = input_type.GetTensorTypeAndShapeInfo();
  std::vector<int64_t> dims = shape_info.GetShape();
  if (dims.size() != 4u) {
    throw std::runtime_error("OnnxInferenceBackend: expected 4D input");
  }
  // NCHW: [1, C, H, W] or NHWC: [1, H, W, C]
  if (dims[1] == kNumChannels) {
    impl_->input_is_nchw = true;
    impl_->input_height = static_cast<std::uint32_t>(dims[2]);
    impl_->input_width = static_cast<std::uint32_t>(dims[3]);
  } else if (dims[3] == kNumChannels) {
    impl_->input_is_nchw = false;
    impl_->input_height = static_cast<std::uint32_t>(dims[1]);
    impl_->input_width = static_cast<std::uint32_t>(dims[2]);
  } else {
    throw std::runtime_error("OnnxInferenceBackend: expected input shape [1,3,H,W] or [1,H,W,3]");
  }
  if (dims[2] <= 0 || dims[3] <= 0 || dims[1] <= 0) {
    throw std::runtime_error("OnnxInferenceBackend: model input must have a fixed spatial size");
  }

  if (impl_->session.GetOutputCount() == 0) {
    throw std::runtime_error("OnnxInferenceBackend: model has no outputs");
  }
  impl_->output_name = output_name.empty()
                           ? impl_->session.GetOutputNameAllocated(0, allocator).get()
                           : std::move(output_name);
}

OnnxInferenceBackend::~OnnxInferenceBackend() = default;

std::uint32_t OnnxInferenceBackend::input_width() const noexcept {
  return impl_->input_width;
}

std::uint32_t OnnxInferenceBackend::input_height() const noexcept {
  return impl_->input_height;
}

std::expected<void, sightline::core::PipelineError>
OnnxInferenceBackend::validate_input(const sightline::core::Frame& input) const {
  if (input.empty()) {
    return std::unexpected(sightline::core::PipelineError::InvalidFrame);
  }
  if (input.format() != sightline::core::PixelFormat::Float32Planar) {
    return std::unexpected(sightline::core::PipelineError::InvalidFrame);
  }
  if (input.width() != impl_->input_width || input.height() != impl_->input_height) {
    return std::unexpected(sightline::core::PipelineError::InvalidFrame);
  }
  if (input.size_bytes() <
      sightline::core::Frame::min_bytes(impl_->input_width, impl_->input_height,
                             sightline::core::PixelFormat::Float32Planar)) {
    return std::unexpected(sightline::core::PipelineError::InvalidFrame);
  }
  return {};
}

std::expected<RawOutputTensor, sightline::core::PipelineError>
OnnxInferenceBackend::infer(const sightline::core::Frame& input) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  const std::uint32_t h = input.height();
  const std::uint32_t w = input.width();
  const std::size_t num_floats = static_cast<std::size_t>(kNumChannels) * h * w;
  impl_->input_buffer.resize(num_floats);
  if (impl_->input_is_nchw) {
    std::memcpy(impl_->input_buffer.data(), input.data().data(), num_floats * sizeof(float));
  } else {
    std::vector<float> chw(num_floats);
    std::memcpy(chw.data(), input.data().data(), num_floats * sizeof(float));
    ChwToHwc(chw.data(), h, w, impl_->input_buffer.data());
  }

  const std::array<int64_t, 4> shape =
      impl_->input_is_nchw
          ? std::array<int64_t, 4>{1, kNumChannels, static_cast<int64_t>(h), static_cast<int64_t>(w)}
          : std::array<int64_t, 4>{1, static_cast<int64_t>(h), static_cast<int64_t>(w), kNumChannels};

  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
      mem_info, impl_->input_buffer.data(), num_floats, shape.data(), shape.size());

  const char* input_names_c[] = {impl_->input_name.c_str()};
  const char* output_names_c[] = {impl_->output_name.c_str()};
  Ort::RunOptions run_options;

  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(run_options, input_names_c, &input_tensor, 1,
                                 output_names_c, 1);
  } catch (const Ort::Exception&) {
    return std::unexpected(sightline::core::PipelineError::InferenceFailed);
  }
  if (outputs.size() != 1u || !outputs[0].IsTensor()) {
    return std::unexpected(sightline::core::PipelineError::InferenceFailed);
  }

  Ort::Value& out = outputs[0];
  auto info = out.GetTensorTypeAndShapeInfo();
  if (info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
    return std::unexpected(sightline::core::PipelineError::InferenceFailed);
  }

  RawOutputTensor result;
  result.shape = info.GetShape();
  const std::size_t count = info.GetElementCount();
  const float* data = out.GetTensorData<float>();
  result.data.assign(data, data + count);
  return result;
}

void OnnxInferenceBackend::warmup() {
  const std::size_t num_bytes = sightline::core::Frame::min_bytes(
      impl_->input_width, impl_->input_height, sightline::core::PixelFormat::Float32Planar);
  std::vector<std::byte> buffer(num_bytes, std::byte{0});
  sightline::core::Frame frame(impl_->input_width, impl_->input_height,
                    sightline::core::PixelFormat::Float32Planar, std::move(buffer));
  auto result = infer(frame);
  if (!result) {
    throw std::runtime_error(std::string("OnnxInferenceBackend: warmup failed: ") +
                             sightline::core::to_string(result.error()));
  }
}

}  // namespace sightline::vision
