#include <sightline/vision/letterbox.hpp>
#include <algorithm>

namespace sightline::vision {

std::optional<sightline::core::LetterboxParams> compute_letterbox(
    std::int64_t orig_w, std::int64_t orig_h,
    std::int64_t target_w, std::int64_t target_h) {
  if (orig_w <= 0 || orig_h <= 0 || target_w <= 0 || target_h <= 0) {
    return std::nullopt;
  }

  const auto resized = letterbox_resized_extent(orig_w, orig_h, target_w, target_h);

  sightline::core::LetterboxParams params;
  params.scale = std::min(static_cast<float>(target_w) / static_cast<float>(orig_w),
                          static_cast<float>(target_h) / static_cast<float>(orig_h));
  params.pad_x = static_cast<int>((target_w - resized.width) / 2);
  params.pad_y = static_cast<int>((target_h - resized.height) / 2);
  return params;
}

ResizedExtent letterbox_resized_extent(std::int64_t orig_w, std::int64_t orig_h,
                                       std::int64_t target_w, std::int64_t target_h) {
  if (orig_w <= 0 || orig_h <= 0 || target_w <= 0 || target_h <= 0) {
    return {};
  }
  // floor(orig * scale) with scale = min(target_w / orig_w, target_h / orig_h).
  if (target_w * orig_h <= target_h * orig_w) {
    return ResizedExtent{static_cast<int>(target_w),
                         static_cast<int>(orig_h * target_w / orig_w)};
  }
  return ResizedExtent{static_cast<int>(orig_w * target_h / orig_h),
                       static_cast<int>(target_h)};
}

sightline::core::BBox unmap_letterbox(const sightline::core::BBox& box,
                                      const sightline::core::LetterboxParams& params) {
  const float pad_x = static_cast<float>(params.pad_x);
  const float pad_y = static_cast<float>(params.pad_y);
  return sightline::core::BBox{(box.x - pad_x) / params.scale,
                    (box.y - pad_y) / params.scale,
                    box.w / params.scale,
                    box.h / params.scale};
}

}  // namespace sightline::vision
