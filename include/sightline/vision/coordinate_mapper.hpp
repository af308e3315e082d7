#pragma once

#include <sightline/core/detection.hpp>
#include <sightline/core/input_transform.hpp>
#include <cstdint>
#include <span>
#include <vector>

namespace sightline::vision {

/// Static-image path: the image was resized to the model input without
/// letterboxing. Scales x, w by source_w / model_w and y, h by
/// source_h / model_h. Empty result if any extent is zero.
[[nodiscard]] std::vector<sightline::core::ImageDetection> map_stretched(
    std::span<const sightline::core::ModelDetection> detections,
    std::uint32_t source_w, std::uint32_t source_h,
    std::uint32_t model_w, std::uint32_t model_h);

/// Live-capture path: invert the letterbox, (x - pad_x) / scale etc.
/// Empty result if scale is not positive and finite.
[[nodiscard]] std::vector<sightline::core::ImageDetection> map_letterboxed(
    std::span<const sightline::core::ModelDetection> detections,
    const sightline::core::LetterboxParams& params);

/// Apply the inverse that matches how the model input was produced.
/// The two inverses are not interchangeable.
[[nodiscard]] std::vector<sightline::core::ImageDetection> map_to_image(
    std::span<const sightline::core::ModelDetection> detections,
    const sightline::core::InputTransform& transform);

}  // namespace sightline::vision
