/**
 * sightline-cli - Run object detection on an image or a live stream; print detections.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/sightline_cli [--config path] [--input path | --camera idx | --video path]
 * With --input: also writes results to output/<basename>.txt (same content as terminal).
 */

#include <sightline/app/config.hpp>
#include <sightline/app/live_detection_loop.hpp>
#include <sightline/app/logging.hpp>
#include <sightline/app/pipeline_builder.hpp>
#include <sightline/app/pipeline_runner.hpp>
#include <sightline/core/detection_result.hpp>
#include <sightline/core/frame.hpp>
#include <sightline/core/pipeline.hpp>
#include <sightline/core/thresholds.hpp>
#include <sightline/vision/frame_source.hpp>
#include <sightline/vision/load_image.hpp>

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_sigint(int) { g_interrupted = 1; }

std::string format_result(const sightline::core::DetectionResult& result) {
  std::ostringstream out;
  out << "frame_id=" << result.frame_id << " size=" << result.source_width << "x"
      << result.source_height << " detections=" << result.detections.size();
  if (result.source_id.has_value()) out << " source_id=" << *result.source_id;
  out << "\n";
  for (const auto& d : result.detections) {
    out << "  " << d.label << " class_id=" << d.class_id << " confidence=" << d.confidence
        << " bbox=(" << d.bbox.x << "," << d.bbox.y << "," << d.bbox.w << "," << d.bbox.h
        << ")\n";
  }
  return out.str();
}

std::optional<std::uint64_t> parse_count(const std::string& s) {
  std::uint64_t v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

int run_static(sightline::core::Pipeline& pipeline, const std::string& input_path) {
  auto loaded = sightline::vision::load_frame_from_image(input_path);
  if (!loaded) {
    SIGHTLINE_LOG_ERROR("Failed to load image: " + input_path);
    return 1;
  }
  sightline::app::StageTimingCallback log_timing = [](std::size_t, std::string_view stage,
                                                      double ms) {
    SIGHTLINE_LOG_DEBUG(std::string(stage) + " took " + std::to_string(ms) + " ms");
  };
  auto result = sightline::app::run_pipeline(pipeline, *loaded, &log_timing, 0,
                                             std::filesystem::path(input_path).filename().string());
  if (!result) {
    SIGHTLINE_LOG_ERROR(std::string("Pipeline error: ") + sightline::core::to_string(result.error()));
    return 1;
  }

  const std::string text = format_result(*result);
  std::cout << text;

  std::filesystem::path out_dir("output");
  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  std::filesystem::path out_file = out_dir / (std::filesystem::path(input_path).stem().string() + ".txt");
  std::ofstream f(out_file);
  if (ec || !f) {
    SIGHTLINE_LOG_WARN("could not write " + out_file.string());
  } else {
    f << text;
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  sightline::app::Logger::init();

  std::string config_path;
  std::string input_path;
  std::string backend_override;
  std::string model_override;
  std::optional<int> camera_index;
  std::string video_path;
  std::optional<std::uint64_t> max_frames;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_path = argv[++i];
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--model" && i + 1 < argc) {
      model_override = argv[++i];
    } else if (arg == "--camera" && i + 1 < argc) {
      auto idx = parse_count(argv[++i]);
      if (!idx) {
        std::cerr << "Invalid --camera index\n";
        return 1;
      }
      camera_index = static_cast<int>(*idx);
    } else if (arg == "--video" && i + 1 < argc) {
      video_path = argv[++i];
    } else if (arg == "--max-frames" && i + 1 < argc) {
      max_frames = parse_count(argv[++i]);
      if (!max_frames) {
        std::cerr << "Invalid --max-frames value\n";
        return 1;
      }
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: sightline_cli [options] (--input <path> | --camera <idx> | --video <path>)\n"
                << "  --config <path>     Pipeline config (key=value file); default: built-in (mock)\n"
                << "  --backend <type>    Override backend: mock | onnx (default from config)\n"
                << "  --model <path>      Override model path (required for --backend onnx)\n"
                << "  --input <path>      Detect on one image (stretch preprocessing by default)\n"
                << "  --camera <idx>      Live detection from a camera (letterbox by default)\n"
                << "  --video <path>      Live detection from a video file or stream URL\n"
                << "  --max-frames <n>    Stop the live loop after n processed frames\n"
                << "\nLog format: SIGHTLINE_LOG_FORMAT=pretty|json, level: SIGHTLINE_LOG_LEVEL.\n";
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }

  const bool live = camera_index.has_value() || !video_path.empty();
  if (live && !input_path.empty()) {
    std::cerr << "--input cannot be combined with --camera or --video\n";
    return 1;
  }
  if (!live && input_path.empty()) {
    std::cerr << "Nothing to do: pass --input, --camera or --video (see --help)\n";
    return 1;
  }

  auto loaded_cfg = config_path.empty() ? std::expected<sightline::app::PipelineConfig,
                                                        sightline::core::PipelineError>(
                                              sightline::app::default_config())
                                        : sightline::app::load_config(config_path);
  if (!loaded_cfg) {
    SIGHTLINE_LOG_ERROR("Invalid config " + config_path);
    return 1;
  }
  sightline::app::PipelineConfig cfg = std::move(*loaded_cfg);

  if (!backend_override.empty()) {
    auto type = sightline::app::parse_backend_type(backend_override);
    if (!type) {
      std::cerr << "Unknown --backend " << backend_override << " (use mock or onnx)\n";
      return 1;
    }
    cfg.backend_type = *type;
  }
  if (!model_override.empty()) {
    cfg.model_path = model_override;
  }

  auto catalog = sightline::app::make_catalog(cfg);
  if (!catalog) {
    SIGHTLINE_LOG_ERROR("Failed to load labels: " + cfg.labels_path);
    return 1;
  }

  auto thresholds = std::make_shared<sightline::core::SharedThresholds>(cfg.thresholds);
  const auto mode = live ? cfg.stream_preprocess : cfg.image_preprocess;

  std::unique_ptr<sightline::vision::IInferenceBackend> backend;
  try {
    backend = sightline::app::make_backend(cfg);
  } catch (const std::exception& e) {
    SIGHTLINE_LOG_ERROR(std::string("Failed to create inference backend: ") + e.what());
    return 1;
  }
  sightline::core::Pipeline pipeline = sightline::app::build_pipeline(
      cfg, mode, std::move(backend), std::move(*catalog), thresholds);
  SIGHTLINE_LOG_INFO("pipeline: " + pipeline.describe());

  if (!live) {
    return run_static(pipeline, input_path);
  }

  std::unique_ptr<sightline::vision::IFrameSource> source;
  try {
    if (camera_index) {
      source = std::make_unique<sightline::vision::VideoFrameSource>(*camera_index);
    } else {
      source = std::make_unique<sightline::vision::VideoFrameSource>(video_path);
    }
  } catch (const std::exception& e) {
    SIGHTLINE_LOG_ERROR(e.what());
    return 1;
  }

  std::optional<sightline::app::ThresholdFileWatcher> watcher;
  if (!config_path.empty()) watcher.emplace(config_path);

  sightline::app::LiveLoopOptions options;
  options.capture_timeout = cfg.capture_timeout;
  options.loop_interval = cfg.loop_interval;
  options.busy_poll = cfg.busy_poll;
  options.max_frames = max_frames;
  options.source_id = camera_index ? "camera" + std::to_string(*camera_index) : video_path;
  if (watcher) {
    options.on_cycle = [&watcher, &thresholds] { watcher->poll(*thresholds); };
  }

  std::signal(SIGINT, on_sigint);
  sightline::app::LiveDetectionLoop loop(
      pipeline, *source,
      [](const sightline::core::DetectionResult& r) { std::cout << format_result(r) << std::flush; },
      std::move(options));
  loop.start();
  while (loop.running() && !g_interrupted) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  loop.stop();

  const auto stats = loop.stats();
  SIGHTLINE_LOG_INFO("processed=" + std::to_string(stats.frames_processed) +
                     " dropped=" + std::to_string(stats.frames_dropped) +
                     " timeouts=" + std::to_string(stats.capture_timeouts) +
                     " errors=" + std::to_string(stats.errors));
  return 0;
}
