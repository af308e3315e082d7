#include <sightline/vision/letterbox.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <utility>

namespace nv = sightline::vision;
namespace nc = sightline::core;

using Extent = std::pair<std::int64_t, std::int64_t>;

TEST(Letterbox, LandscapePadsVertically) {
  auto p = nv::compute_letterbox(1280, 720, 640, 640);
  ASSERT_TRUE(p.has_value());
  EXPECT_FLOAT_EQ(p->scale, 0.5f);
  EXPECT_EQ(p->pad_x, 0);
  EXPECT_EQ(p->pad_y, 140);
}

TEST(Letterbox, PortraitPadsHorizontally) {
  auto p = nv::compute_letterbox(720, 1280, 640, 640);
  ASSERT_TRUE(p.has_value());
  EXPECT_FLOAT_EQ(p->scale, 0.5f);
  EXPECT_EQ(p->pad_x, 140);
  EXPECT_EQ(p->pad_y, 0);
}

TEST(Letterbox, SquareSourceHasNoPadding) {
  auto p = nv::compute_letterbox(1000, 1000, 640, 640);
  ASSERT_TRUE(p.has_value());
  EXPECT_FLOAT_EQ(p->scale, 0.64f);
  EXPECT_EQ(p->pad_x, 0);
  EXPECT_EQ(p->pad_y, 0);
}

TEST(Letterbox, OddResidualGoesToBottom) {
  // 500 * 640 / 1001 = 319.68 -> 319 rows of content, 321 rows of padding.
  auto extent = nv::letterbox_resized_extent(1001, 500, 640, 640);
  EXPECT_EQ(extent.width, 640);
  EXPECT_EQ(extent.height, 319);
  auto p = nv::compute_letterbox(1001, 500, 640, 640);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->pad_y, 160);
  EXPECT_LE(640 - extent.height - 2 * p->pad_y, 1);
}

TEST(Letterbox, LimitingAxisFillsTargetExactly) {
  for (std::int64_t w : {333, 999, 1000, 1366, 1920, 4032}) {
    for (std::int64_t h : {240, 480, 720, 1080, 3024}) {
      auto e = nv::letterbox_resized_extent(w, h, 640, 640);
      EXPECT_TRUE(e.width == 640 || e.height == 640) << w << "x" << h;
      EXPECT_LE(e.width, 640);
      EXPECT_LE(e.height, 640);
    }
  }
}

TEST(Letterbox, RejectsNonPositiveDimensions) {
  EXPECT_FALSE(nv::compute_letterbox(0, 720, 640, 640).has_value());
  EXPECT_FALSE(nv::compute_letterbox(1280, -1, 640, 640).has_value());
  EXPECT_FALSE(nv::compute_letterbox(1280, 720, 0, 640).has_value());
  auto e = nv::letterbox_resized_extent(1280, 720, 640, 0);
  EXPECT_EQ(e.width, 0);
  EXPECT_EQ(e.height, 0);
}

TEST(Letterbox, UnmapInvertsForwardTransform) {
  auto p = nv::compute_letterbox(1280, 720, 640, 640);
  ASSERT_TRUE(p.has_value());
  const nc::BBox original{100.f, 100.f, 200.f, 150.f};
  const nc::BBox model{original.x * p->scale + static_cast<float>(p->pad_x),
                       original.y * p->scale + static_cast<float>(p->pad_y),
                       original.w * p->scale, original.h * p->scale};
  const nc::BBox back = nv::unmap_letterbox(model, *p);
  EXPECT_NEAR(back.x, original.x, 1.f);
  EXPECT_NEAR(back.y, original.y, 1.f);
  EXPECT_NEAR(back.w, original.w, 1.f);
  EXPECT_NEAR(back.h, original.h, 1.f);
}

TEST(Letterbox, ContentRectUnmapsToWholeImage) {
  for (std::int64_t w : {1, 17, 333, 640, 1001, 1920, 4032}) {
    for (std::int64_t h : {1, 9, 480, 640, 1080, 3024}) {
      for (auto [tw, th] : {Extent{640, 640}, Extent{416, 320}}) {
        auto p = nv::compute_letterbox(w, h, tw, th);
        ASSERT_TRUE(p.has_value());
        const auto e = nv::letterbox_resized_extent(w, h, tw, th);
        const nc::BBox content{static_cast<float>(p->pad_x), static_cast<float>(p->pad_y),
                               static_cast<float>(e.width), static_cast<float>(e.height)};
        const nc::BBox back = nv::unmap_letterbox(content, *p);
        // Flooring the non-limiting axis loses under one model pixel.
        const float tol = 1.f / p->scale;
        EXPECT_NEAR(back.x, 0.f, 1e-3f);
        EXPECT_NEAR(back.y, 0.f, 1e-3f);
        EXPECT_NEAR(back.w, static_cast<float>(w), std::max(1.f, tol)) << w << "x" << h;
        EXPECT_NEAR(back.h, static_cast<float>(h), std::max(1.f, tol)) << w << "x" << h;
      }
    }
  }
}
