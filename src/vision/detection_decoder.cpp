#include <sightline/vision/detection_decoder.hpp>
#include <sightline/vision/box_decoder.hpp>
#include <sightline/vision/tensor_layout.hpp>

namespace sightline::vision {

DetectionDecoder::DetectionDecoder(ClassCatalog catalog, NmsMode nms_mode)
    : catalog_(std::move(catalog)), nms_mode_(nms_mode) {}

std::vector<sightline::core::ModelDetection> DetectionDecoder::decode(
    const RawOutputTensor& tensor, const sightline::core::Thresholds& thresholds) const {
  const auto layout = resolve_layout(tensor.shape);
  if (!layout) {
    return {};
  }
  const auto strategy = select_strategy(*layout);
  if (!strategy) {
    return {};
  }

  auto candidates = decode_boxes(tensor.data, *layout, *strategy,
                                 thresholds.confidence, catalog_);
  if (candidates.empty() || is_pre_suppressed(*strategy)) {
    return candidates;
  }
  return non_max_suppression(std::move(candidates), thresholds.iou, nms_mode_);
}

}  // namespace sightline::vision
