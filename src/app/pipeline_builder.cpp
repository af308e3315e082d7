#include <sightline/app/pipeline_builder.hpp>
#include <sightline/vision/color_convert_stage.hpp>
#include <sightline/vision/detection_decoder.hpp>
#include <sightline/vision/detection_stage.hpp>
#include <sightline/vision/letterbox_stage.hpp>
#include <sightline/vision/mock_inference_backend.hpp>
#include <sightline/vision/normalize_stage.hpp>
#include <sightline/vision/onnx_inference_backend.hpp>
#include <sightline/vision/resize_stage.hpp>
#include <sightline/vision/rotate_stage.hpp>
#include <stdexcept>

namespace sightline::app {

std::unique_ptr<sightline::vision::IInferenceBackend> make_backend(const PipelineConfig& cfg) {
  if (cfg.backend_type == InferenceBackendType::Onnx) {
    if (cfg.model_path.empty()) {
      throw std::runtime_error("backend_type=onnx requires model_path to be set in config");
    }
    auto onnx = std::make_unique<sightline::vision::OnnxInferenceBackend>(cfg.model_path);
    if (onnx->input_width() != cfg.input_width || onnx->input_height() != cfg.input_height) {
      throw std::runtime_error("model input is " + std::to_string(onnx->input_width()) + "x" +
                               std::to_string(onnx->input_height()) +
                               " but config input_width/input_height is " +
                               std::to_string(cfg.input_width) + "x" +
                               std::to_string(cfg.input_height));
    }
    onnx->warmup();
    return onnx;
  }

  const float w = static_cast<float>(cfg.input_width);
  const float h = static_cast<float>(cfg.input_height);
  auto mock = std::make_unique<sightline::vision::MockInferenceBackend>();
  mock->set_output(sightline::vision::make_pre_suppressed_tensor({
      {0.25f * w, 0.25f * h, 0.75f * w, 0.75f * h, 0.9f, 0.f},
  }));
  return mock;
}

std::expected<sightline::vision::ClassCatalog, sightline::core::PipelineError> make_catalog(
    const PipelineConfig& cfg) {
  if (cfg.labels_path.empty()) {
    return sightline::vision::ClassCatalog::coco();
  }
  return sightline::vision::ClassCatalog::from_file(cfg.labels_path);
}

sightline::core::Pipeline build_pipeline(const PipelineConfig& cfg,
                              PreprocessMode mode,
                              std::unique_ptr<sightline::vision::IInferenceBackend> backend,
                              sightline::vision::ClassCatalog catalog,
                              std::shared_ptr<const sightline::core::SharedThresholds> thresholds) {
  using namespace sightline::vision;

  sightline::core::Pipeline pipeline;
  if (cfg.rotation != Rotation::None) {
    pipeline.add_stage(std::make_unique<RotateStage>(cfg.rotation));
  }
  pipeline.add_stage(std::make_unique<ColorConvertStage>(sightline::core::PixelFormat::RGB8));
  if (mode == PreprocessMode::Letterbox) {
    pipeline.add_stage(std::make_unique<LetterboxStage>(cfg.input_width, cfg.input_height));
  } else {
    pipeline.add_stage(std::make_unique<ResizeStage>(cfg.input_width, cfg.input_height));
  }
  pipeline.add_stage(std::make_unique<NormalizeStage>(cfg.normalize_mean, cfg.normalize_scale));

  DetectionDecoder decoder(std::move(catalog), cfg.nms_mode);
  pipeline.add_stage(std::make_unique<DetectionStage>(
      std::move(backend), std::move(decoder), std::move(thresholds)));
  return pipeline;
}

}  // namespace sightline::app
