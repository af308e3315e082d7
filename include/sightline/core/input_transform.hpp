#pragma once

#include <cstdint>
#include <variant>

namespace sightline::core {

/// Uniform scale and symmetric half-padding that fit an image into a fixed
/// model input without distortion. target = original * scale + 2 * pad per
/// axis, within one pixel of integer rounding.
struct LetterboxParams {
  float scale{1.f};
  int pad_x{0};
  int pad_y{0};
};

/// Frame was not resized; model coordinates are image coordinates.
struct IdentityTransform {};

/// Frame was resized to the model input independently per axis (no padding).
struct StretchTransform {
  std::uint32_t source_width{0};
  std::uint32_t source_height{0};
  std::uint32_t model_width{0};
  std::uint32_t model_height{0};
};

/// Frame was letterboxed into the model input.
struct LetterboxTransform {
  std::uint32_t source_width{0};
  std::uint32_t source_height{0};
  LetterboxParams params{};
};

/// How a model-input frame was derived from the original image. Recorded by
/// the preprocessing stages and inverted exactly once by the coordinate mapper.
using InputTransform =
    std::variant<IdentityTransform, StretchTransform, LetterboxTransform>;

}  // namespace sightline::core
