#include <sightline/vision/coordinate_mapper.hpp>
#include <sightline/vision/letterbox.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <utility>
#include <vector>

namespace nv = sightline::vision;
namespace nc = sightline::core;

namespace {

std::vector<nc::ModelDetection> one(float x, float y, float w, float h) {
  nc::ModelDetection d;
  d.bbox = {x, y, w, h};
  d.label = "dog";
  d.class_id = 16;
  d.confidence = 0.77f;
  return {d};
}

}  // namespace

TEST(CoordinateMapper, StretchScalesPerAxis) {
  auto out = nv::map_stretched(one(64, 64, 320, 320), 1920, 1080, 640, 640);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_FLOAT_EQ(out[0].bbox.x, 192.f);
  EXPECT_FLOAT_EQ(out[0].bbox.y, 108.f);
  EXPECT_FLOAT_EQ(out[0].bbox.w, 960.f);
  EXPECT_FLOAT_EQ(out[0].bbox.h, 540.f);
  EXPECT_EQ(out[0].label, "dog");
  EXPECT_EQ(out[0].class_id, 16);
  EXPECT_FLOAT_EQ(out[0].confidence, 0.77f);
}

TEST(CoordinateMapper, StretchWithZeroExtentMapsNothing) {
  EXPECT_TRUE(nv::map_stretched(one(1, 1, 1, 1), 0, 1080, 640, 640).empty());
  EXPECT_TRUE(nv::map_stretched(one(1, 1, 1, 1), 1920, 1080, 640, 0).empty());
}

TEST(CoordinateMapper, LetterboxRemovesPaddingThenScale) {
  nc::LetterboxParams p{0.5f, 0, 140};
  auto out = nv::map_letterboxed(one(50, 190, 100, 75), p);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_FLOAT_EQ(out[0].bbox.x, 100.f);
  EXPECT_FLOAT_EQ(out[0].bbox.y, 100.f);
  EXPECT_FLOAT_EQ(out[0].bbox.w, 200.f);
  EXPECT_FLOAT_EQ(out[0].bbox.h, 150.f);
}

TEST(CoordinateMapper, LetterboxWithInvalidScaleMapsNothing) {
  EXPECT_TRUE(nv::map_letterboxed(one(1, 1, 1, 1), nc::LetterboxParams{0.f, 0, 0}).empty());
  EXPECT_TRUE(nv::map_letterboxed(one(1, 1, 1, 1), nc::LetterboxParams{-1.f, 0, 0}).empty());
  EXPECT_TRUE(nv::map_letterboxed(
      one(1, 1, 1, 1),
      nc::LetterboxParams{std::numeric_limits<float>::infinity(), 0, 0}).empty());
}

TEST(CoordinateMapper, DispatchesOnTransform) {
  const auto dets = one(50, 190, 100, 75);
  auto p = nv::compute_letterbox(1280, 720, 640, 640);
  ASSERT_TRUE(p.has_value());

  auto lb = nv::map_to_image(dets, nc::LetterboxTransform{1280, 720, *p});
  auto st = nv::map_to_image(dets, nc::StretchTransform{1280, 720, 640, 640});
  auto id = nv::map_to_image(dets, nc::IdentityTransform{});
  ASSERT_EQ(lb.size(), 1u);
  ASSERT_EQ(st.size(), 1u);
  ASSERT_EQ(id.size(), 1u);

  EXPECT_FLOAT_EQ(lb[0].bbox.y, 100.f);
  EXPECT_FLOAT_EQ(st[0].bbox.y, 190.f * 720.f / 640.f);
  EXPECT_NE(lb[0].bbox.y, st[0].bbox.y);
  EXPECT_FLOAT_EQ(id[0].bbox.x, 50.f);
  EXPECT_FLOAT_EQ(id[0].bbox.h, 75.f);
}

TEST(CoordinateMapper, LetterboxRoundTripWithinOnePixel) {
  for (auto [w, h] : {std::pair{1280, 720}, std::pair{1000, 1000}, std::pair{1001, 500},
                      std::pair{480, 1920}}) {
    auto p = nv::compute_letterbox(w, h, 640, 640);
    ASSERT_TRUE(p.has_value());
    const nc::BBox orig{static_cast<float>(w) * 0.25f, static_cast<float>(h) * 0.3f,
                        static_cast<float>(w) * 0.4f, static_cast<float>(h) * 0.2f};
    const auto dets = one(orig.x * p->scale + static_cast<float>(p->pad_x),
                          orig.y * p->scale + static_cast<float>(p->pad_y),
                          orig.w * p->scale, orig.h * p->scale);
    auto out = nv::map_letterboxed(dets, *p);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_NEAR(out[0].bbox.x, orig.x, 1.f) << w << "x" << h;
    EXPECT_NEAR(out[0].bbox.y, orig.y, 1.f) << w << "x" << h;
    EXPECT_NEAR(out[0].bbox.w, orig.w, 1.f) << w << "x" << h;
    EXPECT_NEAR(out[0].bbox.h, orig.h, 1.f) << w << "x" << h;
  }
}
