#include <sightline/core/thresholds.hpp>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

namespace nc = sightline::core;

TEST(SharedThresholds, Defaults) {
  nc::SharedThresholds t;
  const auto s = t.snapshot();
  EXPECT_FLOAT_EQ(s.confidence, 0.25f);
  EXPECT_FLOAT_EQ(s.iou, 0.45f);
}

TEST(SharedThresholds, SetIndividually) {
  nc::SharedThresholds t(nc::Thresholds{0.5f, 0.6f});
  t.set_confidence(0.1f);
  EXPECT_FLOAT_EQ(t.snapshot().confidence, 0.1f);
  EXPECT_FLOAT_EQ(t.snapshot().iou, 0.6f);
  t.set_iou(0.7f);
  EXPECT_FLOAT_EQ(t.snapshot().iou, 0.7f);
}

TEST(SharedThresholds, SnapshotNeverMixesTwoWrites) {
  nc::SharedThresholds t;
  std::vector<std::jthread> threads;
  for (int w = 0; w < 2; ++w) {
    threads.emplace_back([&t, w] {
      for (int i = 0; i < 1000; ++i) t.set(nc::Thresholds{w ? 0.3f : 0.7f, w ? 0.2f : 0.8f});
    });
  }
  threads.emplace_back([&t] {
    for (int i = 0; i < 1000; ++i) {
      const auto s = t.snapshot();
      const bool initial = s.confidence == 0.25f && s.iou == 0.45f;
      const bool first = s.confidence == 0.7f && s.iou == 0.8f;
      const bool second = s.confidence == 0.3f && s.iou == 0.2f;
      EXPECT_TRUE(initial || first || second) << s.confidence << " / " << s.iou;
    }
  });
}

TEST(SharedThresholds, ConcurrentSingleFieldUpdatesAreNotLost) {
  nc::SharedThresholds t(nc::Thresholds{0.f, 0.f});
  {
    std::jthread conf([&t] {
      for (int i = 0; i < 1000; ++i) t.set_confidence(0.6f);
    });
    std::jthread iou([&t] {
      for (int i = 0; i < 1000; ++i) t.set_iou(0.3f);
    });
  }
  const auto s = t.snapshot();
  EXPECT_FLOAT_EQ(s.confidence, 0.6f);
  EXPECT_FLOAT_EQ(s.iou, 0.3f);
}
