#pragma once

#include <sightline/core/error.hpp>
#include <sightline/core/thresholds.hpp>
#include <sightline/vision/non_max_suppression.hpp>
#include <sightline/vision/rotate_stage.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace sightline::app {

/// Inference backend type: mock (synthetic) or onnx (real model).
enum class InferenceBackendType {
  Mock,
  Onnx,
};

/// How a frame is fitted into the square model input.
enum class PreprocessMode {
  Letterbox,  // aspect-preserving resize + padding
  Stretch,    // independent per-axis resize
};

/// Pipeline configuration: model, preprocessing, thresholds, live-loop timing.
struct PipelineConfig {
  std::string model_path;
  InferenceBackendType backend_type{InferenceBackendType::Mock};
  std::uint32_t input_width{640};
  std::uint32_t input_height{640};
  PreprocessMode image_preprocess{PreprocessMode::Stretch};
  PreprocessMode stream_preprocess{PreprocessMode::Letterbox};
  sightline::vision::Rotation rotation{sightline::vision::Rotation::None};
  float normalize_mean{0.f};
  float normalize_scale{1.f / 255.f};
  sightline::core::Thresholds thresholds{};
  sightline::vision::NmsMode nms_mode{sightline::vision::NmsMode::ClassAgnostic};
  std::string labels_path;  // empty: COCO names
  std::chrono::milliseconds capture_timeout{500};  // 0: no timeout
  std::chrono::milliseconds loop_interval{100};
  std::chrono::milliseconds busy_poll{5};
};

/// Default config when no file is provided.
PipelineConfig default_config();

/// Load config from a key=value file (one per line, '#' comments) on top of
/// the defaults. A missing file yields the defaults; a malformed value yields
/// PipelineError::InvalidConfig. Unknown keys are ignored.
[[nodiscard]] std::expected<PipelineConfig, sightline::core::PipelineError> load_config(
    const std::string& path);

/// Apply one key=value pair. Unknown keys are accepted and ignored.
[[nodiscard]] std::expected<void, sightline::core::PipelineError> apply_config_value(
    PipelineConfig& config, std::string_view key, std::string_view value);

[[nodiscard]] std::optional<InferenceBackendType> parse_backend_type(std::string_view s);
[[nodiscard]] std::optional<PreprocessMode> parse_preprocess_mode(std::string_view s);

/// Re-reads confidence_threshold / iou_threshold from a config file whenever
/// its modification time changes and publishes them to SharedThresholds.
/// Called between live-loop cycles; not thread-safe itself.
class ThresholdFileWatcher {
 public:
  explicit ThresholdFileWatcher(std::filesystem::path path);

  /// Returns true if new thresholds were published. A file that disappears or
  /// fails to parse leaves the current thresholds in place.
  bool poll(sightline::core::SharedThresholds& thresholds);

 private:
  std::filesystem::path path_;
  std::optional<std::filesystem::file_time_type> last_write_;
};

}  // namespace sightline::app
