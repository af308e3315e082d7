#include <sightline/app/config.hpp>
#include <sightline/app/pipeline_builder.hpp>
#include <sightline/app/pipeline_runner.hpp>
#include <sightline/core/detection_result.hpp>
#include <sightline/core/frame.hpp>
#include <sightline/core/pipeline.hpp>
#include <sightline/core/thresholds.hpp>
#include <sightline/vision/load_image.hpp>
#include <sightline/vision/mock_inference_backend.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace sightline::core;
using namespace sightline::vision;
using namespace sightline::app;

PipelineConfig small_config() {
  PipelineConfig cfg = default_config();
  cfg.input_width = 64;
  cfg.input_height = 64;
  return cfg;
}

/// Mock backend boxes cover the middle of the model input: (16,16)-(48,48) at 64x64.
Pipeline build_demo_pipeline(PreprocessMode mode, PipelineConfig cfg = small_config()) {
  return build_pipeline(cfg, mode, make_backend(cfg), ClassCatalog::coco(),
                        std::make_shared<SharedThresholds>(cfg.thresholds));
}

Frame bgr_frame(std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h * 3, std::byte{128});
  return Frame(w, h, PixelFormat::BGR8, std::move(buf));
}

}  // namespace

TEST(FullPipeline, StretchedImageMapsBackPerAxis) {
  Pipeline pipeline = build_demo_pipeline(PreprocessMode::Stretch);
  auto result = run_pipeline(pipeline, bgr_frame(128, 64));
  ASSERT_TRUE(result.has_value()) << "Pipeline run failed";
  EXPECT_EQ(result->source_width, 128u);
  EXPECT_EQ(result->source_height, 64u);
  ASSERT_EQ(result->detections.size(), 1u);
  const auto& d = result->detections[0];
  EXPECT_EQ(d.label, "person");
  EXPECT_FLOAT_EQ(d.confidence, 0.9f);
  EXPECT_FLOAT_EQ(d.bbox.x, 32.f);
  EXPECT_FLOAT_EQ(d.bbox.y, 16.f);
  EXPECT_FLOAT_EQ(d.bbox.w, 64.f);
  EXPECT_FLOAT_EQ(d.bbox.h, 32.f);
}

TEST(FullPipeline, LetterboxedStreamFrameMapsBackThroughPadding) {
  Pipeline pipeline = build_demo_pipeline(PreprocessMode::Letterbox);
  // 128x64 -> scale 0.5, content 64x32 at pad_y 16.
  auto result = run_pipeline(pipeline, bgr_frame(128, 64));
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->detections.size(), 1u);
  const auto& d = result->detections[0];
  EXPECT_FLOAT_EQ(d.bbox.x, 32.f);
  EXPECT_FLOAT_EQ(d.bbox.y, 0.f);
  EXPECT_FLOAT_EQ(d.bbox.w, 64.f);
  EXPECT_FLOAT_EQ(d.bbox.h, 64.f);
}

TEST(FullPipeline, RotationChangesSourceExtent) {
  PipelineConfig cfg = small_config();
  cfg.rotation = Rotation::Cw90;
  Pipeline pipeline = build_demo_pipeline(PreprocessMode::Letterbox, cfg);
  EXPECT_EQ(pipeline.stage_count(), 5u);
  auto result = run_pipeline(pipeline, bgr_frame(64, 128));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->source_width, 128u);
  EXPECT_EQ(result->source_height, 64u);
}

TEST(FullPipeline, ChannelFirstOutputDecodedAndSuppressed) {
  PipelineConfig cfg = small_config();
  // [1, 4 + 3 classes, 16 boxes]; two overlapping boxes of different classes.
  RawOutputTensor t;
  const std::size_t attrs = 7;
  const std::size_t boxes = 16;
  t.shape = {1, static_cast<std::int64_t>(attrs), static_cast<std::int64_t>(boxes)};
  t.data.assign(attrs * boxes, 0.f);
  auto set_box = [&t](std::size_t b, std::vector<float> v) {
    for (std::size_t a = 0; a < v.size(); ++a) t.data[a * boxes + b] = v[a];
  };
  set_box(0, {32.f, 32.f, 20.f, 20.f, 0.f, 0.8f, 0.f});
  set_box(1, {33.f, 32.f, 20.f, 20.f, 0.f, 0.f, 0.7f});
  auto mock = std::make_unique<MockInferenceBackend>();
  mock->set_output(std::move(t));

  Pipeline pipeline = build_pipeline(cfg, PreprocessMode::Stretch, std::move(mock),
                                     ClassCatalog({"cat", "dog", "bird"}),
                                     std::make_shared<SharedThresholds>());
  auto result = run_pipeline(pipeline, bgr_frame(64, 64));
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->detections.size(), 1u);
  EXPECT_EQ(result->detections[0].label, "dog");
  EXPECT_FLOAT_EQ(result->detections[0].bbox.x, 22.f);
}

TEST(FullPipeline, ImageFileThroughPipeline) {
  const auto path = std::filesystem::temp_directory_path() / "sightline_full_pipeline.png";
  cv::Mat image(48, 96, CV_8UC3, cv::Scalar(10, 20, 30));
  ASSERT_TRUE(cv::imwrite(path.string(), image));

  auto frame = load_frame_from_image(path.string());
  std::filesystem::remove(path);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->format(), PixelFormat::BGR8);
  EXPECT_EQ(frame->width(), 96u);
  EXPECT_EQ(frame->height(), 48u);

  Pipeline pipeline = build_demo_pipeline(PreprocessMode::Stretch);
  auto result = run_pipeline(pipeline, *frame, nullptr, 3, std::string("sample.png"));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->frame_id, 3u);
  EXPECT_EQ(result->source_id.value_or(""), "sample.png");
  EXPECT_EQ(result->detections.size(), 1u);
}

TEST(FullPipeline, MissingImageIsLoadFailed) {
  auto frame = load_frame_from_image("/nonexistent/sightline/image.png");
  ASSERT_FALSE(frame.has_value());
  EXPECT_EQ(frame.error(), PipelineError::LoadFailed);
}

TEST(FullPipeline, StageTimingCallbackInvoked) {
  Pipeline pipeline = build_demo_pipeline(PreprocessMode::Stretch);
  std::vector<std::size_t> indices;
  std::vector<std::string> names;
  StageTimingCallback timing_cb = [&](std::size_t idx, std::string_view name, double ms) {
    EXPECT_GE(ms, 0.0);
    indices.push_back(idx);
    names.emplace_back(name);
  };

  auto result = run_pipeline(pipeline, bgr_frame(64, 64), &timing_cb);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(indices, (std::vector<std::size_t>{0, 1, 2, 3}));
  EXPECT_EQ(names, (std::vector<std::string>{"color_convert", "resize", "normalize", "detect"}));
  EXPECT_EQ(pipeline.describe(), "color_convert -> resize -> normalize -> detect");
}
