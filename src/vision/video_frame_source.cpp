#include <sightline/vision/frame_source.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/videoio.hpp>
#include <stdexcept>
#include <string>

namespace sightline::vision {

GrabFailure classify_grab_failure(SourceKind kind, std::chrono::milliseconds elapsed,
                                  std::chrono::milliseconds timeout, bool at_end_of_file,
                                  std::uint32_t consecutive_failures) noexcept {
  if (kind == SourceKind::File && at_end_of_file) {
    return GrabFailure{sightline::core::PipelineError::CaptureFailed, true};
  }
  if (timeout.count() > 0 && elapsed >= timeout) {
    return GrabFailure{sightline::core::PipelineError::CaptureTimeout, false};
  }
  if (kind == SourceKind::File) {
    return GrabFailure{sightline::core::PipelineError::CaptureFailed, true};
  }
  return GrabFailure{sightline::core::PipelineError::CaptureFailed,
                     consecutive_failures >= kMaxConsecutiveCameraFailures};
}

struct VideoFrameSource::Impl {
  explicit Impl(SourceKind k) : kind(k) {}

  bool at_end_of_file() const {
    const double count = capture.get(cv::CAP_PROP_FRAME_COUNT);
    return count > 0 && capture.get(cv::CAP_PROP_POS_FRAMES) >= count;
  }

  SourceKind kind;
  cv::VideoCapture capture;
  std::chrono::milliseconds read_timeout{0};
  std::uint32_t consecutive_failures{0};
  bool exhausted{false};
};

VideoFrameSource::VideoFrameSource(int camera_index)
    : impl_(std::make_unique<Impl>(SourceKind::Camera)) {
  if (!impl_->capture.open(camera_index)) {
    throw std::runtime_error("VideoFrameSource: cannot open camera " +
                             std::to_string(camera_index));
  }
}

VideoFrameSource::VideoFrameSource(const std::string& path)
    : impl_(std::make_unique<Impl>(SourceKind::File)) {
  if (!impl_->capture.open(path)) {
    throw std::runtime_error("VideoFrameSource: cannot open " + path);
  }
}

VideoFrameSource::~VideoFrameSource() = default;

std::expected<sightline::core::Frame, sightline::core::PipelineError> VideoFrameSource::capture(
    std::chrono::milliseconds timeout) {
  if (!is_open()) {
    return std::unexpected(sightline::core::PipelineError::CaptureFailed);
  }

  // Honoured by network / FFmpeg backends; local devices return promptly anyway.
  if (timeout.count() > 0 && timeout != impl_->read_timeout) {
    impl_->capture.set(cv::CAP_PROP_READ_TIMEOUT_MSEC, static_cast<double>(timeout.count()));
    impl_->read_timeout = timeout;
  }

  const auto start = std::chrono::steady_clock::now();
  if (!impl_->capture.grab()) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    ++impl_->consecutive_failures;
    const GrabFailure failure =
        classify_grab_failure(impl_->kind, elapsed, timeout, impl_->at_end_of_file(),
                              impl_->consecutive_failures);
    impl_->exhausted = failure.exhausted;
    return std::unexpected(failure.error);
  }

  cv::Mat mat;
  if (!impl_->capture.retrieve(mat) || mat.empty()) {
    ++impl_->consecutive_failures;
    impl_->exhausted = impl_->kind == SourceKind::File ||
                       impl_->consecutive_failures >= kMaxConsecutiveCameraFailures;
    return std::unexpected(sightline::core::PipelineError::CaptureFailed);
  }
  impl_->consecutive_failures = 0;
  return detail::mat_to_frame(mat, sightline::core::PixelFormat::BGR8);
}

bool VideoFrameSource::is_open() const {
  return !impl_->exhausted && impl_->capture.isOpened();
}

}  // namespace sightline::vision
