#pragma once

#include <sightline/core/detection.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sightline::core {

/// Result of the detection pipeline for one frame.
/// Detections are in original-image pixels, in suppression order
/// (confidence descending); callers must not rely on spatial order.
struct DetectionResult {
  std::uint64_t frame_id{0};
  std::uint32_t source_width{0};
  std::uint32_t source_height{0};
  std::vector<ImageDetection> detections;

  /// Which camera, stream or file produced this frame. Set by app or pipeline runner.
  std::optional<std::string> source_id;
};

}  // namespace sightline::core
