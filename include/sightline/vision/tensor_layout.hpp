#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace sightline::vision {

/// Memory layout of a [1, d1, d2] detection output.
/// boxes_first: element (box, attr) is at box * elem_per_box + attr ([1, N, C]).
/// Otherwise it is at attr * num_boxes + box ([1, C, N]).
struct TensorLayout {
  std::size_t num_boxes{0};
  std::size_t elem_per_box{0};
  bool boxes_first{true};

  [[nodiscard]] std::size_t index(std::size_t box, std::size_t attr) const noexcept {
    return boxes_first ? box * elem_per_box + attr : attr * num_boxes + box;
  }
  [[nodiscard]] std::size_t element_count() const noexcept {
    return num_boxes * elem_per_box;
  }
};

/// Largest d1 still treated as an attribute count (4 box values + up to ~300
/// classes). A model with more classes than this AND fewer boxes than classes
/// is resolved as box-first and decodes incorrectly; changing the value
/// changes decode results for existing exports.
inline constexpr std::int64_t kMaxChannelFirstAttributes = 300;

/// Decide between [1, C, N] and [1, N, C] from the shape alone:
/// channel-first when d1 <= kMaxChannelFirstAttributes and d2 > d1.
/// Returns nullopt unless the shape is [1, d1, d2] with positive d1, d2 whose
/// product fits in size_t.
[[nodiscard]] std::optional<TensorLayout> resolve_layout(
    std::span<const std::int64_t> shape) noexcept;

}  // namespace sightline::vision
