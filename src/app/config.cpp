#include <sightline/app/config.hpp>
#include <sightline/app/logging.hpp>
#include <sightline/core/text.hpp>
#include <charconv>
#include <fstream>
#include <string>
#include <system_error>

namespace sightline::app {

namespace {

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(sightline::core::trim(line.substr(0, pos)));
  value.assign(sightline::core::trim(line.substr(pos + 1)));
  return !key.empty();
}

template <typename T>
std::optional<T> parse_number(std::string_view s) {
  T out{};
  const auto* end = s.data() + s.size();
  const auto [ptr, ec] = std::from_chars(s.data(), end, out);
  if (ec != std::errc{} || ptr != end) return std::nullopt;
  return out;
}

std::optional<float> parse_unit_interval(std::string_view s) {
  const auto v = parse_number<float>(s);
  if (!v || !(*v >= 0.f && *v <= 1.f)) return std::nullopt;
  return v;
}

std::optional<std::chrono::milliseconds> parse_millis(std::string_view s) {
  const auto v = parse_number<std::int64_t>(s);
  if (!v || *v < 0) return std::nullopt;
  return std::chrono::milliseconds(*v);
}

/// Reads the key=value file; calls fn(key, value) per entry.
template <typename Fn>
std::expected<void, sightline::core::PipelineError> for_each_entry(std::ifstream& f, Fn&& fn) {
  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    const auto entry = sightline::core::trim(line);
    if (entry.empty() || entry.front() == '#') continue;
    if (!parse_line(entry, key, value)) continue;
    auto applied = fn(key, value);
    if (!applied) {
      SIGHTLINE_LOG_WARN("config: bad value for '" + key + "': " + value);
      return applied;
    }
  }
  return {};
}

}  // namespace

PipelineConfig default_config() {
  return PipelineConfig{};
}

std::optional<InferenceBackendType> parse_backend_type(std::string_view s) {
  if (s == "mock") return InferenceBackendType::Mock;
  if (s == "onnx") return InferenceBackendType::Onnx;
  return std::nullopt;
}

std::optional<PreprocessMode> parse_preprocess_mode(std::string_view s) {
  if (s == "letterbox") return PreprocessMode::Letterbox;
  if (s == "stretch") return PreprocessMode::Stretch;
  return std::nullopt;
}

std::expected<void, sightline::core::PipelineError> apply_config_value(
    PipelineConfig& c, std::string_view key, std::string_view value) {
  const auto invalid = std::unexpected(sightline::core::PipelineError::InvalidConfig);

  if (key == "model_path") {
    c.model_path = std::string(value);
  } else if (key == "backend_type") {
    const auto t = parse_backend_type(value);
    if (!t) return invalid;
    c.backend_type = *t;
  } else if (key == "input_width" || key == "input_height") {
    const auto v = parse_number<std::uint32_t>(value);
    if (!v || *v == 0) return invalid;
    (key == "input_width" ? c.input_width : c.input_height) = *v;
  } else if (key == "image_preprocess" || key == "stream_preprocess") {
    const auto m = parse_preprocess_mode(value);
    if (!m) return invalid;
    (key == "image_preprocess" ? c.image_preprocess : c.stream_preprocess) = *m;
  } else if (key == "rotation") {
    const auto v = parse_number<int>(value);
    if (!v || (*v != 0 && *v != 90 && *v != 180 && *v != 270)) return invalid;
    c.rotation = static_cast<sightline::vision::Rotation>(*v);
  } else if (key == "normalize_mean" || key == "normalize_scale") {
    const auto v = parse_number<float>(value);
    if (!v) return invalid;
    (key == "normalize_mean" ? c.normalize_mean : c.normalize_scale) = *v;
  } else if (key == "confidence_threshold" || key == "iou_threshold") {
    const auto v = parse_unit_interval(value);
    if (!v) return invalid;
    (key == "confidence_threshold" ? c.thresholds.confidence : c.thresholds.iou) = *v;
  } else if (key == "nms_mode") {
    if (value == "class_agnostic") c.nms_mode = sightline::vision::NmsMode::ClassAgnostic;
    else if (value == "class_aware") c.nms_mode = sightline::vision::NmsMode::ClassAware;
    else return invalid;
  } else if (key == "labels_path") {
    c.labels_path = std::string(value);
  } else if (key == "capture_timeout_ms" || key == "loop_interval_ms" || key == "busy_poll_ms") {
    const auto v = parse_millis(value);
    if (!v) return invalid;
    if (key == "capture_timeout_ms") c.capture_timeout = *v;
    else if (key == "loop_interval_ms") c.loop_interval = *v;
    else c.busy_poll = *v;
  }
  return {};
}

std::expected<PipelineConfig, sightline::core::PipelineError> load_config(const std::string& path) {
  PipelineConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  auto loaded = for_each_entry(f, [&c](const std::string& key, const std::string& value) {
    return apply_config_value(c, key, value);
  });
  if (!loaded) return std::unexpected(loaded.error());
  return c;
}

ThresholdFileWatcher::ThresholdFileWatcher(std::filesystem::path path)
    : path_(std::move(path)) {}

bool ThresholdFileWatcher::poll(sightline::core::SharedThresholds& thresholds) {
  std::error_code ec;
  const auto write_time = std::filesystem::last_write_time(path_, ec);
  if (ec || (last_write_ && *last_write_ == write_time)) {
    return false;
  }
  last_write_ = write_time;

  std::ifstream f(path_);
  if (!f) return false;

  sightline::core::Thresholds next = thresholds.snapshot();
  auto parsed = for_each_entry(f, [&next](const std::string& key, const std::string& value)
                                      -> std::expected<void, sightline::core::PipelineError> {
    if (key != "confidence_threshold" && key != "iou_threshold") return {};
    const auto v = parse_unit_interval(value);
    if (!v) return std::unexpected(sightline::core::PipelineError::InvalidConfig);
    (key == "confidence_threshold" ? next.confidence : next.iou) = *v;
    return {};
  });
  if (!parsed) return false;

  thresholds.set(next);
  SIGHTLINE_LOG_INFO("thresholds reloaded: confidence=" + std::to_string(next.confidence) +
                     " iou=" + std::to_string(next.iou));
  return true;
}

}  // namespace sightline::app
