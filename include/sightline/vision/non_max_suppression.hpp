#pragma once

#include <sightline/core/detection.hpp>
#include <cstdint>
#include <vector>

namespace sightline::vision {

/// Which pairs of boxes may suppress each other.
enum class NmsMode : std::uint8_t {
  ClassAgnostic,  // any overlapping pair, regardless of class
  ClassAware,     // only pairs with the same class_id
};

/// Intersection-over-union of two axis-aligned boxes. Negative overlap extents
/// are clamped to zero; returns 0 when the boxes do not overlap or the union
/// is not positive.
[[nodiscard]] float iou(const sightline::core::BBox& a, const sightline::core::BBox& b) noexcept;

/// Greedy NMS: stable-sort by confidence (descending), keep the best remaining
/// box, drop every remaining box whose IoU with it is >= iou_threshold, repeat.
/// Output is in keep order. O(n^2) in the number of candidates.
[[nodiscard]] std::vector<sightline::core::ModelDetection> non_max_suppression(
    std::vector<sightline::core::ModelDetection> candidates,
    float iou_threshold,
    NmsMode mode = NmsMode::ClassAgnostic);

}  // namespace sightline::vision
