#pragma once

#include <sightline/core/error.hpp>
#include <sightline/core/frame.hpp>
#include <expected>
#include <string>

namespace sightline::vision {

/// Load an image file into a Frame (BGR8 or Grayscale8) at native resolution.
/// Returns PipelineError::LoadFailed if the file cannot be read or decoded.
std::expected<sightline::core::Frame, sightline::core::PipelineError>
load_frame_from_image(const std::string& path);

}  // namespace sightline::vision
