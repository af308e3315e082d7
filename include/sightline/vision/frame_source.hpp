#pragma once

#include <sightline/core/error.hpp>
#include <sightline/core/frame.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>

namespace sightline::vision {

/// Source of captured frames for the live loop (camera, video file, test feed).
class IFrameSource {
 public:
  virtual ~IFrameSource() = default;

  /// Acquire the next frame, giving up after `timeout`.
  /// Errors: CaptureTimeout (nothing in time; try again next cycle),
  /// CaptureFailed (source broken or exhausted).
  [[nodiscard]] virtual std::expected<sightline::core::Frame, sightline::core::PipelineError>
  capture(std::chrono::milliseconds timeout) = 0;

  /// False once the source will never produce another frame.
  [[nodiscard]] virtual bool is_open() const = 0;
};

enum class SourceKind { Camera, File };

/// Consecutive failed grabs after which a camera is treated as gone.
inline constexpr std::uint32_t kMaxConsecutiveCameraFailures = 30;

struct GrabFailure {
  sightline::core::PipelineError error{sightline::core::PipelineError::CaptureFailed};
  bool exhausted{false};
};

/// Classify a failed grab. A zero timeout never reports CaptureTimeout.
/// A file at its last frame is exhausted; a camera only after
/// kMaxConsecutiveCameraFailures failures in a row (including this one).
[[nodiscard]] GrabFailure classify_grab_failure(SourceKind kind,
                                                std::chrono::milliseconds elapsed,
                                                std::chrono::milliseconds timeout,
                                                bool at_end_of_file,
                                                std::uint32_t consecutive_failures) noexcept;

/// OpenCV VideoCapture source: camera index or video file / stream URL.
/// Produces BGR8 frames at native resolution.
class VideoFrameSource : public IFrameSource {
 public:
  /// Throws std::runtime_error if the device or file cannot be opened.
  /// capture(0ms) waits as long as the backend does and never reports a timeout.
  explicit VideoFrameSource(int camera_index);
  explicit VideoFrameSource(const std::string& path);
  ~VideoFrameSource() override;

  VideoFrameSource(const VideoFrameSource&) = delete;
  VideoFrameSource& operator=(const VideoFrameSource&) = delete;

  [[nodiscard]] std::expected<sightline::core::Frame, sightline::core::PipelineError> capture(
      std::chrono::milliseconds timeout) override;

  [[nodiscard]] bool is_open() const override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace sightline::vision
