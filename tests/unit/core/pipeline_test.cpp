#include <sightline/core/detection_result.hpp>
#include <sightline/core/frame.hpp>
#include <sightline/core/pipeline.hpp>
#include <sightline/core/pipeline_stage.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace nc = sightline::core;

namespace {

class PassThroughStage : public nc::IPipelineStage {
 public:
  std::string_view name() const noexcept override { return "pass_through"; }
  std::expected<nc::StageOutput, nc::PipelineError> process(
      const nc::Frame& input) override {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return nc::StageOutput{nc::Frame(input.width(), input.height(),
                                     input.format(), std::move(buf), input.transform())};
  }
};

class EmitDetectionResultStage : public nc::IPipelineStage {
 public:
  std::string_view name() const noexcept override { return "emit"; }
  std::expected<nc::StageOutput, nc::PipelineError> process(
      const nc::Frame&) override {
    nc::DetectionResult r;
    r.frame_id = 1;
    r.detections.push_back({{1.f, 2.f, 3.f, 4.f}, "person", 0, 0.9f});
    return nc::StageOutput{std::move(r)};
  }
};

class FailingStage : public nc::IPipelineStage {
 public:
  std::string_view name() const noexcept override { return "failing"; }
  std::expected<nc::StageOutput, nc::PipelineError> process(const nc::Frame&) override {
    return std::unexpected(nc::PipelineError::InferenceFailed);
  }
};

nc::Frame tiny_frame() {
  return nc::Frame(1, 1, nc::PixelFormat::Grayscale8, std::vector<std::byte>(10));
}

}  // namespace

TEST(Pipeline, EmptyPipelineReturnsError) {
  nc::Pipeline p;
  auto result = p.run(tiny_frame());
  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), nc::PipelineError::InvalidConfig);
}

TEST(Pipeline, PipelineWithoutResultStageReturnsError) {
  nc::Pipeline p;
  p.add_stage(std::make_unique<PassThroughStage>());
  auto result = p.run(tiny_frame());
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), nc::PipelineError::InvalidConfig);
}

TEST(Pipeline, SingleStageEmitResult) {
  nc::Pipeline p;
  p.add_stage(std::make_unique<EmitDetectionResultStage>());
  auto result = p.run(tiny_frame());
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->frame_id, 1u);
  ASSERT_EQ(result->detections.size(), 1u);
  EXPECT_EQ(result->detections[0].label, "person");
  EXPECT_FLOAT_EQ(result->detections[0].confidence, 0.9f);
}

TEST(Pipeline, PassThroughThenEmit) {
  nc::Pipeline p;
  p.add_stage(std::make_unique<PassThroughStage>());
  p.add_stage(std::make_unique<EmitDetectionResultStage>());
  EXPECT_EQ(p.stage_count(), 2u);
  auto result = p.run(tiny_frame());
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->detections.size(), 1u);
}

TEST(Pipeline, StageErrorStopsPipeline) {
  nc::Pipeline p;
  p.add_stage(std::make_unique<FailingStage>());
  p.add_stage(std::make_unique<EmitDetectionResultStage>());
  auto result = p.run(tiny_frame());
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), nc::PipelineError::InferenceFailed);
}

TEST(Pipeline, TimingCallbackCalledPerStage) {
  nc::Pipeline p;
  p.add_stage(std::make_unique<PassThroughStage>());
  p.add_stage(std::make_unique<EmitDetectionResultStage>());
  std::vector<std::size_t> seen;
  std::vector<std::string_view> names;
  nc::StageTimingCallback cb = [&](std::size_t i, std::string_view name, double ms) {
    EXPECT_GE(ms, 0.0);
    seen.push_back(i);
    names.push_back(name);
  };
  auto result = p.run(tiny_frame(), &cb);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(seen, (std::vector<std::size_t>{0, 1}));
  EXPECT_EQ(names, (std::vector<std::string_view>{"pass_through", "emit"}));
}

TEST(Pipeline, NullStageIgnored) {
  nc::Pipeline p;
  p.add_stage(nullptr);
  EXPECT_EQ(p.stage_count(), 0u);
}

TEST(Pipeline, StagesAfterResultAreSkipped) {
  nc::Pipeline p;
  p.add_stage(std::make_unique<EmitDetectionResultStage>());
  p.add_stage(std::make_unique<FailingStage>());
  std::size_t calls = 0;
  nc::StageTimingCallback cb = [&calls](std::size_t, std::string_view, double) { ++calls; };
  auto result = p.run(tiny_frame(), &cb);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->frame_id, 1u);
  EXPECT_EQ(calls, 1u);
}

TEST(Pipeline, FailingStageStillReportsTiming) {
  nc::Pipeline p;
  p.add_stage(std::make_unique<FailingStage>());
  std::vector<std::string_view> names;
  nc::StageTimingCallback cb = [&names](std::size_t, std::string_view name, double) {
    names.push_back(name);
  };
  EXPECT_FALSE(p.run(tiny_frame(), &cb).has_value());
  EXPECT_EQ(names, (std::vector<std::string_view>{"failing"}));
}

TEST(Pipeline, DescribeJoinsStageNames) {
  nc::Pipeline p;
  EXPECT_EQ(p.describe(), "");
  p.add_stage(std::make_unique<PassThroughStage>());
  p.add_stage(std::make_unique<EmitDetectionResultStage>());
  EXPECT_EQ(p.describe(), "pass_through -> emit");
}
