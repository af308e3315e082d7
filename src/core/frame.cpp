#include <sightline/core/frame.hpp>
#include <cstddef>
#include <type_traits>
#include <variant>

namespace sightline::core {

namespace {

struct SourceExtent {
  std::uint32_t width;
  std::uint32_t height;
};

SourceExtent source_extent(const Frame& frame) {
  return std::visit(
      [&frame](const auto& t) -> SourceExtent {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, IdentityTransform>) {
          return {frame.width(), frame.height()};
        } else {
          return {t.source_width, t.source_height};
        }
      },
      frame.transform());
}

}  // namespace

std::uint32_t Frame::source_width() const noexcept {
  return source_extent(*this).width;
}

std::uint32_t Frame::source_height() const noexcept {
  return source_extent(*this).height;
}

std::size_t Frame::min_bytes(std::uint32_t width,
                              std::uint32_t height,
                              PixelFormat format) {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  switch (format) {
    case PixelFormat::Grayscale8:
      return pixels;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return pixels * 3;
    case PixelFormat::RGBA8:
    case PixelFormat::BGRA8:
      return pixels * 4;
    case PixelFormat::Float32Planar:
      return pixels * 3 * sizeof(float);  // CHW, 3 channels
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

}  // namespace sightline::core
