#pragma once

namespace sightline::core {

/// Pipeline error codes; used with std::expected for recoverable failures.
/// Uninterpretable model output is not an error: it decodes to no detections.
enum class PipelineError {
  None = 0,
  InvalidFrame,
  LoadFailed,
  InferenceFailed,
  InvalidConfig,
  CaptureTimeout,
  CaptureFailed,
  Busy,
};

/// Short name for logs and CLI messages.
constexpr const char* to_string(PipelineError e) noexcept {
  switch (e) {
    case PipelineError::None: return "none";
    case PipelineError::InvalidFrame: return "invalid_frame";
    case PipelineError::LoadFailed: return "load_failed";
    case PipelineError::InferenceFailed: return "inference_failed";
    case PipelineError::InvalidConfig: return "invalid_config";
    case PipelineError::CaptureTimeout: return "capture_timeout";
    case PipelineError::CaptureFailed: return "capture_failed";
    case PipelineError::Busy: return "busy";
  }
  return "unknown";
}

}  // namespace sightline::core
