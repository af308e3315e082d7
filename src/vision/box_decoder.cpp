#include <sightline/vision/box_decoder.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace sightline::vision {

namespace {

constexpr std::size_t kPreSuppressedElems = 6;
constexpr std::size_t kBoxCoords = 4;
constexpr float kMaxClassId = static_cast<float>(std::numeric_limits<std::int32_t>::max());

/// Strided read of attribute `attr` for box `box`.
class BoxReader {
 public:
  BoxReader(std::span<const float> data, const TensorLayout& layout)
      : data_(data), layout_(layout) {}

  [[nodiscard]] float at(std::size_t box, std::size_t attr) const {
    return data_[layout_.index(box, attr)];
  }

 private:
  std::span<const float> data_;
  const TensorLayout& layout_;
};

bool is_valid_box(const sightline::core::BBox& b) {
  return std::isfinite(b.x) && std::isfinite(b.y) && std::isfinite(b.w) &&
         std::isfinite(b.h) && b.w > 0.f && b.h > 0.f;
}

sightline::core::ModelDetection make_detection(const sightline::core::BBox& bbox,
                                               std::int64_t class_id, float score,
                                               const ClassCatalog& catalog) {
  sightline::core::ModelDetection d;
  d.bbox = bbox;
  d.label = catalog.label(class_id);
  d.class_id = static_cast<std::int32_t>(class_id);
  d.confidence = score;
  return d;
}

sightline::core::BBox center_to_corner(float cx, float cy, float w, float h) {
  return sightline::core::BBox{cx - w / 2.f, cy - h / 2.f, w, h};
}

void decode_pre_suppressed(const BoxReader& in, std::size_t num_boxes, float threshold,
                           const ClassCatalog& catalog,
                           std::vector<sightline::core::ModelDetection>& out) {
  for (std::size_t i = 0; i < num_boxes; ++i) {
    const float score = in.at(i, 4);
    if (!(score >= threshold)) continue;

    const float x1 = in.at(i, 0);
    const float y1 = in.at(i, 1);
    const sightline::core::BBox bbox{x1, y1, in.at(i, 2) - x1, in.at(i, 3) - y1};
    const float cls = in.at(i, 5);
    if (!is_valid_box(bbox) || !(std::fabs(cls) < kMaxClassId)) continue;

    out.push_back(make_detection(bbox, static_cast<std::int64_t>(cls), score, catalog));
  }
}

/// first_class: attribute index of class 0. gated: multiply by objectness (attr 4).
void decode_scored(const BoxReader& in, std::size_t num_boxes, std::size_t first_class,
                   std::size_t num_classes, bool gated, float threshold,
                   const ClassCatalog& catalog,
                   std::vector<sightline::core::ModelDetection>& out) {
  for (std::size_t i = 0; i < num_boxes; ++i) {
    const float objectness = gated ? in.at(i, 4) : 1.f;

    std::int64_t best_class = -1;
    float best_score = 0.f;
    for (std::size_t c = 0; c < num_classes; ++c) {
      const float p = in.at(i, first_class + c);
      const float score = gated ? objectness * p : p;
      if (score > best_score) {
        best_score = score;
        best_class = static_cast<std::int64_t>(c);
      }
    }

    if (best_class < 0 || best_score < threshold) continue;

    const sightline::core::BBox bbox =
        center_to_corner(in.at(i, 0), in.at(i, 1), in.at(i, 2), in.at(i, 3));
    if (!is_valid_box(bbox)) continue;

    out.push_back(make_detection(bbox, best_class, best_score, catalog));
  }
}

}  // namespace

std::optional<DecodeStrategy> select_strategy(const TensorLayout& layout) noexcept {
  const std::size_t elems = layout.elem_per_box;
  if (elems == kPreSuppressedElems) {
    return DecodeStrategy{PreSuppressedDecode{}};
  }
  if (elems <= kBoxCoords + 1) {
    return std::nullopt;
  }
  if (layout.boxes_first) {
    return DecodeStrategy{ObjectnessGatedDecode{elems - kBoxCoords - 1}};
  }
  return DecodeStrategy{ClassScoreDecode{elems - kBoxCoords}};
}

bool is_pre_suppressed(const DecodeStrategy& strategy) noexcept {
  return std::holds_alternative<PreSuppressedDecode>(strategy);
}

std::vector<sightline::core::ModelDetection> decode_boxes(std::span<const float> data,
                                               const TensorLayout& layout,
                                               const DecodeStrategy& strategy,
                                               float confidence_threshold,
                                               const ClassCatalog& catalog) {
  std::vector<sightline::core::ModelDetection> out;
  if (layout.num_boxes == 0 || layout.elem_per_box == 0 ||
      data.size() / layout.elem_per_box < layout.num_boxes) {
    return out;
  }

  const BoxReader in(data, layout);
  std::visit(
      [&](const auto& s) {
        using S = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<S, PreSuppressedDecode>) {
          if (layout.elem_per_box < kPreSuppressedElems) return;
          decode_pre_suppressed(in, layout.num_boxes, confidence_threshold, catalog, out);
        } else if constexpr (std::is_same_v<S, ObjectnessGatedDecode>) {
          if (kBoxCoords + 1 + s.num_classes > layout.elem_per_box) return;
          decode_scored(in, layout.num_boxes, kBoxCoords + 1, s.num_classes, true,
                        confidence_threshold, catalog, out);
        } else {
          if (kBoxCoords + s.num_classes > layout.elem_per_box) return;
          decode_scored(in, layout.num_boxes, kBoxCoords, s.num_classes, false,
                        confidence_threshold, catalog, out);
        }
      },
      strategy);
  return out;
}

}  // namespace sightline::vision
