#include <sightline/vision/class_catalog.hpp>
#include <sightline/core/text.hpp>
#include <fstream>

namespace sightline::vision {

namespace {

const std::vector<std::string>& coco_names() {
  static const std::vector<std::string> names = {
      "person", "bicycle", "car", "motorcycle", "airplane", "bus", "train", "truck", "boat",
      "traffic light", "fire hydrant", "stop sign", "parking meter", "bench",
      "bird", "cat", "dog", "horse", "sheep", "cow", "elephant", "bear", "zebra", "giraffe",
      "backpack", "umbrella", "handbag", "tie", "suitcase", "frisbee", "skis", "snowboard",
      "sports ball", "kite", "baseball bat", "baseball glove", "skateboard", "surfboard",
      "tennis racket", "bottle", "wine glass", "cup", "fork", "knife", "spoon", "bowl",
      "banana", "apple", "sandwich", "orange", "broccoli", "carrot", "hot dog", "pizza",
      "donut", "cake", "chair", "couch", "potted plant", "bed", "dining table", "toilet",
      "tv", "laptop", "mouse", "remote", "keyboard", "cell phone", "microwave", "oven",
      "toaster", "sink", "refrigerator", "book", "clock", "vase", "scissors", "teddy bear",
      "hair drier", "toothbrush",
  };
  return names;
}

}  // namespace

ClassCatalog::ClassCatalog() : names_(coco_names()) {}

ClassCatalog::ClassCatalog(std::vector<std::string> names) : names_(std::move(names)) {}

ClassCatalog ClassCatalog::coco() { return ClassCatalog(); }

std::expected<ClassCatalog, sightline::core::PipelineError> ClassCatalog::from_file(
    const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    return std::unexpected(sightline::core::PipelineError::InvalidConfig);
  }
  std::vector<std::string> names;
  std::string line;
  while (std::getline(f, line)) {
    const auto name = sightline::core::trim(line);
    if (!name.empty()) names.emplace_back(name);
  }
  if (names.empty()) {
    return std::unexpected(sightline::core::PipelineError::InvalidConfig);
  }
  return ClassCatalog(std::move(names));
}

std::string ClassCatalog::label(std::int64_t class_id) const {
  if (class_id >= 0 && static_cast<std::size_t>(class_id) < names_.size()) {
    return names_[static_cast<std::size_t>(class_id)];
  }
  return "cls_" + std::to_string(class_id);
}

}  // namespace sightline::vision
