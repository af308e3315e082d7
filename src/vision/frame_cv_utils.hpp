#pragma once

#include <sightline/core/frame.hpp>
#include <sightline/core/input_transform.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace sightline::vision::detail {

/// Convert Frame to cv::Mat (shared view, no copy). Returns nullopt if format
/// unsupported (Float32Planar, Unknown).
std::optional<cv::Mat> frame_to_mat(const sightline::core::Frame& frame);

/// Convert cv::Mat to Frame (copy), tagging it with `transform`.
sightline::core::Frame mat_to_frame(const cv::Mat& mat,
                         sightline::core::PixelFormat format,
                         const sightline::core::InputTransform& transform = sightline::core::IdentityTransform{});

}  // namespace sightline::vision::detail
