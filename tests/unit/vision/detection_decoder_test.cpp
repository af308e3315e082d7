#include <sightline/vision/detection_decoder.hpp>
#include <sightline/vision/mock_inference_backend.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

namespace nv = sightline::vision;
namespace nc = sightline::core;

namespace {

/// [1, 4 + classes, num_boxes] tensor; unset boxes stay zero.
struct ChannelFirstTensor {
  ChannelFirstTensor(std::size_t classes, std::size_t num_boxes)
      : attrs(4 + classes), boxes(num_boxes) {
    tensor.shape = {1, static_cast<std::int64_t>(attrs), static_cast<std::int64_t>(boxes)};
    tensor.data.assign(attrs * boxes, 0.f);
  }
  void set_box(std::size_t b, std::vector<float> values) {
    for (std::size_t a = 0; a < values.size(); ++a) tensor.data[a * boxes + b] = values[a];
  }
  std::size_t attrs;
  std::size_t boxes;
  nv::RawOutputTensor tensor;
};

}  // namespace

TEST(DetectionDecoder, PreSuppressedOutputSkipsNms) {
  auto t = nv::make_pre_suppressed_tensor({{0.f, 0.f, 100.f, 100.f, 0.9f, 0.f},
                                           {1.f, 1.f, 100.f, 100.f, 0.8f, 0.f}});
  nv::DetectionDecoder decoder;
  auto out = decoder.decode(t, nc::Thresholds{0.25f, 0.45f});
  EXPECT_EQ(out.size(), 2u);
}

TEST(DetectionDecoder, ChannelFirstAppliesClassAgnosticNms) {
  ChannelFirstTensor t(3, 10);
  t.set_box(0, {50.f, 50.f, 40.f, 40.f, 0.9f, 0.f, 0.f});
  t.set_box(1, {52.f, 50.f, 40.f, 40.f, 0.f, 0.8f, 0.f});
  t.set_box(2, {300.f, 300.f, 40.f, 40.f, 0.f, 0.f, 0.6f});

  nv::DetectionDecoder decoder(nv::ClassCatalog({"a", "b", "c"}));
  auto out = decoder.decode(t.tensor, nc::Thresholds{0.25f, 0.45f});
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].label, "a");
  EXPECT_EQ(out[1].label, "c");
}

TEST(DetectionDecoder, ClassAwareModeKeepsOverlappingClasses) {
  ChannelFirstTensor t(3, 10);
  t.set_box(0, {50.f, 50.f, 40.f, 40.f, 0.9f, 0.f, 0.f});
  t.set_box(1, {52.f, 50.f, 40.f, 40.f, 0.f, 0.8f, 0.f});

  nv::DetectionDecoder decoder(nv::ClassCatalog::coco(), nv::NmsMode::ClassAware);
  EXPECT_EQ(decoder.nms_mode(), nv::NmsMode::ClassAware);
  auto out = decoder.decode(t.tensor, nc::Thresholds{0.25f, 0.45f});
  EXPECT_EQ(out.size(), 2u);
}

TEST(DetectionDecoder, ConfidenceThresholdFiltersPerCall) {
  ChannelFirstTensor t(3, 8);
  t.set_box(0, {50.f, 50.f, 40.f, 40.f, 0.3f, 0.f, 0.f});
  nv::DetectionDecoder decoder;
  EXPECT_EQ(decoder.decode(t.tensor, nc::Thresholds{0.25f, 0.45f}).size(), 1u);
  EXPECT_TRUE(decoder.decode(t.tensor, nc::Thresholds{0.5f, 0.45f}).empty());
}

TEST(DetectionDecoder, BoxFirstUsesObjectness) {
  nv::RawOutputTensor t;
  // Eight boxes of seven values: more boxes than values keeps it box-first.
  t.shape = {1, 8, 7};
  t.data.assign(8 * 7, 0.f);
  const std::vector<float> rows = {50.f, 50.f, 20.f, 20.f, 0.9f, 0.1f, 0.8f,
                                   10.f, 10.f, 5.f, 5.f, 0.1f, 0.9f, 0.0f};
  std::copy(rows.begin(), rows.end(), t.data.begin());
  nv::DetectionDecoder decoder;
  auto out = decoder.decode(t, nc::Thresholds{0.25f, 0.45f});
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].class_id, 1);
  EXPECT_NEAR(out[0].confidence, 0.72f, 1e-6f);
}

TEST(DetectionDecoder, UninterpretableOutputIsEmpty) {
  nv::DetectionDecoder decoder;
  const nc::Thresholds th{};
  EXPECT_TRUE(decoder.decode(nv::RawOutputTensor{{1.f, 2.f}, {1, 2}}, th).empty());
  EXPECT_TRUE(decoder.decode(nv::RawOutputTensor{std::vector<float>(50, 1.f), {1, 5, 10}}, th).empty());
  EXPECT_TRUE(decoder.decode(nv::RawOutputTensor{std::vector<float>(50, 1.f), {1, 10, 5}}, th).empty());
  EXPECT_TRUE(decoder.decode(nv::RawOutputTensor{std::vector<float>(10, 1.f), {1, 84, 8400}}, th).empty());
  EXPECT_TRUE(decoder.decode(nv::RawOutputTensor{}, th).empty());
}

TEST(DetectionDecoder, BatchOfTwoIsEmpty) {
  nv::DetectionDecoder decoder;
  nv::RawOutputTensor t{std::vector<float>(2 * 84 * 10, 0.9f), {2, 84, 10}};
  EXPECT_TRUE(decoder.decode(t, nc::Thresholds{}).empty());
}

TEST(DetectionDecoder, ThreeValuesPerBoxIsEmpty) {
  nv::DetectionDecoder decoder;
  nv::RawOutputTensor t{std::vector<float>(10 * 3, 0.9f), {1, 10, 3}};
  EXPECT_TRUE(decoder.decode(t, nc::Thresholds{}).empty());
}

TEST(DetectionDecoder, NothingAboveThresholdIsEmpty) {
  ChannelFirstTensor t(3, 8);
  t.set_box(0, {50.f, 50.f, 40.f, 40.f, 0.3f, 0.2f, 0.1f});
  nv::DetectionDecoder decoder;
  EXPECT_TRUE(decoder.decode(t.tensor, nc::Thresholds{0.9f, 0.45f}).empty());
}

TEST(DetectionDecoder, ShapeWhoseElementCountWrapsIsEmpty) {
  nv::DetectionDecoder decoder;
  constexpr std::int64_t kHuge = std::int64_t{1} << 32;
  nv::RawOutputTensor t{std::vector<float>(8, 0.9f), {1, kHuge, kHuge}};
  EXPECT_TRUE(decoder.decode(t, nc::Thresholds{}).empty());
}
