#include <sightline/vision/non_max_suppression.hpp>
#include <algorithm>

namespace sightline::vision {

float iou(const sightline::core::BBox& a, const sightline::core::BBox& b) noexcept {
  const float x1 = std::max(a.x, b.x);
  const float y1 = std::max(a.y, b.y);
  const float x2 = std::min(a.x + a.w, b.x + b.w);
  const float y2 = std::min(a.y + a.h, b.y + b.h);

  const float inter = std::max(0.f, x2 - x1) * std::max(0.f, y2 - y1);
  if (inter <= 0.f) return 0.f;

  const float uni = a.w * a.h + b.w * b.h - inter;
  if (uni <= 0.f) return 0.f;
  return inter / uni;
}

std::vector<sightline::core::ModelDetection> non_max_suppression(
    std::vector<sightline::core::ModelDetection> candidates,
    float iou_threshold,
    NmsMode mode) {
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const sightline::core::ModelDetection& a,
                      const sightline::core::ModelDetection& b) {
                     return a.confidence > b.confidence;
                   });

  std::vector<sightline::core::ModelDetection> kept;
  std::vector<bool> suppressed(candidates.size(), false);

  for (std::size_t i = 0; i < candidates.size(); ++i) {
    if (suppressed[i]) continue;
    const sightline::core::ModelDetection& current = candidates[i];

    for (std::size_t j = i + 1; j < candidates.size(); ++j) {
      if (suppressed[j]) continue;
      if (mode == NmsMode::ClassAware && candidates[j].class_id != current.class_id) {
        continue;
      }
      if (iou(current.bbox, candidates[j].bbox) >= iou_threshold) {
        suppressed[j] = true;
      }
    }
    kept.push_back(current);
  }
  return kept;
}

}  // namespace sightline::vision
