#pragma once

#include <cstdint>
#include <string>

namespace sightline::core {

/// Coordinate space a detection lives in: fixed model input or original image.
enum class CoordinateSpace : std::uint8_t {
  Model,
  Image,
};

/// Axis-aligned bounding box: top-left corner and extent, in pixels.
struct BBox {
  float x{0.f};
  float y{0.f};
  float w{0.f};
  float h{0.f};
};

/// Single labeled detection. The Space parameter keeps model-space and
/// image-space results apart at compile time; only the coordinate mapper
/// converts one into the other.
template <CoordinateSpace Space>
struct Detection {
  BBox bbox{};
  std::string label;
  std::int32_t class_id{-1};
  float confidence{0.f};
};

using ModelDetection = Detection<CoordinateSpace::Model>;
using ImageDetection = Detection<CoordinateSpace::Image>;

}  // namespace sightline::core
