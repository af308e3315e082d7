#include <sightline/vision/coordinate_mapper.hpp>
#include <sightline/vision/letterbox.hpp>
#include <cmath>
#include <type_traits>
#include <variant>

namespace sightline::vision {

namespace {

sightline::core::ImageDetection with_box(const sightline::core::ModelDetection& d,
                                         const sightline::core::BBox& bbox) {
  sightline::core::ImageDetection out;
  out.bbox = bbox;
  out.label = d.label;
  out.class_id = d.class_id;
  out.confidence = d.confidence;
  return out;
}

}  // namespace

std::vector<sightline::core::ImageDetection> map_stretched(
    std::span<const sightline::core::ModelDetection> detections,
    std::uint32_t source_w, std::uint32_t source_h,
    std::uint32_t model_w, std::uint32_t model_h) {
  std::vector<sightline::core::ImageDetection> out;
  if (source_w == 0 || source_h == 0 || model_w == 0 || model_h == 0) {
    return out;
  }

  const float sx = static_cast<float>(source_w) / static_cast<float>(model_w);
  const float sy = static_cast<float>(source_h) / static_cast<float>(model_h);
  out.reserve(detections.size());
  for (const auto& d : detections) {
    out.push_back(with_box(
        d, sightline::core::BBox{d.bbox.x * sx, d.bbox.y * sy, d.bbox.w * sx, d.bbox.h * sy}));
  }
  return out;
}

std::vector<sightline::core::ImageDetection> map_letterboxed(
    std::span<const sightline::core::ModelDetection> detections,
    const sightline::core::LetterboxParams& params) {
  std::vector<sightline::core::ImageDetection> out;
  if (!std::isfinite(params.scale) || params.scale <= 0.f) {
    return out;
  }

  out.reserve(detections.size());
  for (const auto& d : detections) {
    out.push_back(with_box(d, unmap_letterbox(d.bbox, params)));
  }
  return out;
}

std::vector<sightline::core::ImageDetection> map_to_image(
    std::span<const sightline::core::ModelDetection> detections,
    const sightline::core::InputTransform& transform) {
  return std::visit(
      [detections](const auto& t) -> std::vector<sightline::core::ImageDetection> {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, sightline::core::StretchTransform>) {
          return map_stretched(detections, t.source_width, t.source_height,
                               t.model_width, t.model_height);
        } else if constexpr (std::is_same_v<T, sightline::core::LetterboxTransform>) {
          return map_letterboxed(detections, t.params);
        } else {
          std::vector<sightline::core::ImageDetection> out;
          out.reserve(detections.size());
          for (const auto& d : detections) out.push_back(with_box(d, d.bbox));
          return out;
        }
      },
      transform);
}

}  // namespace sightline::vision
