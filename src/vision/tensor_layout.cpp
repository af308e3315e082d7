#include <sightline/vision/tensor_layout.hpp>
#include <limits>

namespace sightline::vision {

std::optional<TensorLayout> resolve_layout(std::span<const std::int64_t> shape) noexcept {
  if (shape.size() != 3u || shape[0] != 1) {
    return std::nullopt;
  }
  const std::int64_t d1 = shape[1];
  const std::int64_t d2 = shape[2];
  if (d1 <= 0 || d2 <= 0) {
    return std::nullopt;
  }
  // element_count() must not wrap.
  if (static_cast<std::uint64_t>(d1) >
      std::numeric_limits<std::size_t>::max() / static_cast<std::uint64_t>(d2)) {
    return std::nullopt;
  }

  TensorLayout layout;
  if (d1 <= kMaxChannelFirstAttributes && d2 > d1) {
    layout.elem_per_box = static_cast<std::size_t>(d1);
    layout.num_boxes = static_cast<std::size_t>(d2);
    layout.boxes_first = false;
  } else {
    layout.num_boxes = static_cast<std::size_t>(d1);
    layout.elem_per_box = static_cast<std::size_t>(d2);
    layout.boxes_first = true;
  }
  return layout;
}

}  // namespace sightline::vision
