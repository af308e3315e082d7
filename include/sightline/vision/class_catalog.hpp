#pragma once

#include <sightline/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace sightline::vision {

/// Ordered, index-addressed class names. Defaults to the 80 COCO classes.
class ClassCatalog {
 public:
  ClassCatalog();
  explicit ClassCatalog(std::vector<std::string> names);

  /// The 80 COCO class names in model index order.
  [[nodiscard]] static ClassCatalog coco();

  /// One class name per line; blank lines are skipped.
  [[nodiscard]] static std::expected<ClassCatalog, sightline::core::PipelineError> from_file(
      const std::string& path);

  /// Name for a class index. Indices outside [0, size()) give "cls_<index>"
  /// so models trained on other class counts still produce labels.
  [[nodiscard]] std::string label(std::int64_t class_id) const;

  [[nodiscard]] std::size_t size() const noexcept { return names_.size(); }

 private:
  std::vector<std::string> names_;
};

}  // namespace sightline::vision
