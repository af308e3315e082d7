#pragma once

#include <sightline/core/detection.hpp>
#include <sightline/core/thresholds.hpp>
#include <sightline/vision/class_catalog.hpp>
#include <sightline/vision/non_max_suppression.hpp>
#include <sightline/vision/raw_output_tensor.hpp>
#include <vector>

namespace sightline::vision {

/// Decodes RawOutputTensor -> model-space detections: resolve layout, decode
/// with the matching strategy, then suppress (unless the model already did).
/// An output that cannot be interpreted yields an empty list, the same as an
/// output with no detections.
class DetectionDecoder {
 public:
  explicit DetectionDecoder(ClassCatalog catalog = ClassCatalog::coco(),
                            NmsMode nms_mode = NmsMode::ClassAgnostic);

  [[nodiscard]] std::vector<sightline::core::ModelDetection> decode(
      const RawOutputTensor& tensor, const sightline::core::Thresholds& thresholds) const;

  [[nodiscard]] const ClassCatalog& catalog() const noexcept { return catalog_; }
  [[nodiscard]] NmsMode nms_mode() const noexcept { return nms_mode_; }

 private:
  ClassCatalog catalog_;
  NmsMode nms_mode_;
};

}  // namespace sightline::vision
