#pragma once

#include <sightline/core/input_transform.hpp>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace sightline::core {

/// Memory: Frame owns a single contiguous buffer (std::vector<std::byte>);
/// move semantics and RAII throughout. Use data() for std::span views (non-owning).
/// Thread-safety: distinct Frame instances are independent; sharing one Frame
/// across threads requires external synchronization.

/// Pixel layout / format.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
  Float32Planar,  // CHW float, 3 planes, values 0..1
};

/// Single image or video frame: dimensions, format, buffer, and the transform
/// that produced it from the original capture.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer,
        InputTransform transform = IdentityTransform{})
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)),
        transform_(transform) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  /// Mutable view of the buffer (owned).
  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// Mapping from this frame's pixels back to the original image.
  [[nodiscard]] const InputTransform& transform() const noexcept { return transform_; }

  /// Width and height of the original image this frame was derived from.
  /// Equal to width()/height() for an untransformed frame.
  [[nodiscard]] std::uint32_t source_width() const noexcept;
  [[nodiscard]] std::uint32_t source_height() const noexcept;

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
  InputTransform transform_{IdentityTransform{}};
};

}  // namespace sightline::core
