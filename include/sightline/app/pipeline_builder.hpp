#pragma once

#include <sightline/app/config.hpp>
#include <sightline/core/error.hpp>
#include <sightline/core/pipeline.hpp>
#include <sightline/core/thresholds.hpp>
#include <sightline/vision/class_catalog.hpp>
#include <sightline/vision/inference_backend.hpp>
#include <expected>
#include <memory>

namespace sightline::app {

/// Backend selected by config. Onnx loads model_path (throws Ort::Exception or
/// std::runtime_error if it cannot); Mock returns one fixed demo detection.
[[nodiscard]] std::unique_ptr<sightline::vision::IInferenceBackend> make_backend(
    const PipelineConfig& cfg);

/// COCO names, or labels_path if set.
[[nodiscard]] std::expected<sightline::vision::ClassCatalog, sightline::core::PipelineError>
make_catalog(const PipelineConfig& cfg);

/// rotate -> BGR to RGB -> letterbox or stretch -> normalize -> detect.
/// The preprocessing mode decides which inverse the detection stage applies.
[[nodiscard]] sightline::core::Pipeline build_pipeline(
    const PipelineConfig& cfg,
    PreprocessMode mode,
    std::unique_ptr<sightline::vision::IInferenceBackend> backend,
    sightline::vision::ClassCatalog catalog,
    std::shared_ptr<const sightline::core::SharedThresholds> thresholds);

}  // namespace sightline::app
