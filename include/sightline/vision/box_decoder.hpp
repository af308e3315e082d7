#pragma once

#include <sightline/core/detection.hpp>
#include <sightline/vision/class_catalog.hpp>
#include <sightline/vision/tensor_layout.hpp>
#include <cstddef>
#include <optional>
#include <span>
#include <variant>
#include <vector>

namespace sightline::vision {

/// [x1, y1, x2, y2, score, class_id] per box. The model already ran NMS.
struct PreSuppressedDecode {};

/// [cx, cy, w, h, objectness, class_0 .. class_{N-1}] per box;
/// score = objectness * best class probability.
struct ObjectnessGatedDecode {
  std::size_t num_classes{0};
};

/// [cx, cy, w, h, class_0 .. class_{N-1}] per box; score = best class probability.
struct ClassScoreDecode {
  std::size_t num_classes{0};
};

/// Per-box encoding of a detection output, chosen once per tensor.
using DecodeStrategy =
    std::variant<PreSuppressedDecode, ObjectnessGatedDecode, ClassScoreDecode>;

/// Pick the encoding from the resolved layout:
///   elem_per_box == 6                 -> PreSuppressedDecode (either layout)
///   elem_per_box <= 5                 -> nullopt (no class channel)
///   box-first ([1, N, C])             -> ObjectnessGatedDecode, C - 5 classes
///   channel-first ([1, C, N])         -> ClassScoreDecode, C - 4 classes
/// Box-first and channel-first differ on purpose: they match two distinct
/// export pipelines, and the shape alone cannot tell the two encodings apart.
[[nodiscard]] std::optional<DecodeStrategy> select_strategy(
    const TensorLayout& layout) noexcept;

/// True if boxes decoded with this strategy must not go through NMS again.
[[nodiscard]] bool is_pre_suppressed(const DecodeStrategy& strategy) noexcept;

/// Decode all boxes scoring >= confidence_threshold into model-space detections
/// (unsorted, not suppressed). The best class is the first index with the
/// strictly highest score. Boxes with non-finite values or non-positive extent
/// are dropped. Returns an empty list if data holds fewer than
/// num_boxes * elem_per_box values.
[[nodiscard]] std::vector<sightline::core::ModelDetection> decode_boxes(
    std::span<const float> data,
    const TensorLayout& layout,
    const DecodeStrategy& strategy,
    float confidence_threshold,
    const ClassCatalog& catalog);

}  // namespace sightline::vision
