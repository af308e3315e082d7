#pragma once

#include <sightline/core/detection.hpp>
#include <sightline/core/input_transform.hpp>
#include <cstdint>
#include <optional>

namespace sightline::vision {

/// Scale and padding that fit an orig_w x orig_h image into target_w x target_h
/// without distortion: scale = min(target_w / orig_w, target_h / orig_h), the
/// resized extent is floor(orig * scale) and each pad is half the remainder
/// (floored). At most one pixel of residual ends up on the right/bottom side.
/// Returns nullopt if any dimension is not positive.
[[nodiscard]] std::optional<sightline::core::LetterboxParams> compute_letterbox(
    std::int64_t orig_w, std::int64_t orig_h,
    std::int64_t target_w, std::int64_t target_h);

/// Extent of the resized content inside the letterboxed target.
struct ResizedExtent {
  int width{0};
  int height{0};
};

/// Computed in integers so the limiting axis fills the target exactly.
/// Zero extent if any dimension is not positive.
[[nodiscard]] ResizedExtent letterbox_resized_extent(
    std::int64_t orig_w, std::int64_t orig_h,
    std::int64_t target_w, std::int64_t target_h);

/// Inverse of the letterbox: model-input pixels -> original pixels.
/// Corner and extent are mapped independently.
[[nodiscard]] sightline::core::BBox unmap_letterbox(const sightline::core::BBox& box,
                                         const sightline::core::LetterboxParams& params);

}  // namespace sightline::vision
