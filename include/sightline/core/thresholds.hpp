#pragma once

#include <atomic>

namespace sightline::core {

/// Confidence and IoU thresholds for one pipeline invocation.
struct Thresholds {
  float confidence{0.25f};
  float iou{0.45f};
};

/// Thresholds shared between a settings surface and running pipelines.
/// Writers may update either value at any time; each pipeline invocation
/// takes one snapshot() and uses it throughout. A snapshot never mixes the
/// values of two different set() calls.
class SharedThresholds {
 public:
  SharedThresholds() = default;
  explicit SharedThresholds(Thresholds initial) : value_(initial) {}

  SharedThresholds(const SharedThresholds&) = delete;
  SharedThresholds& operator=(const SharedThresholds&) = delete;

  [[nodiscard]] Thresholds snapshot() const noexcept {
    return value_.load(std::memory_order_acquire);
  }

  void set_confidence(float t) noexcept {
    update([t](Thresholds& v) { v.confidence = t; });
  }
  void set_iou(float t) noexcept {
    update([t](Thresholds& v) { v.iou = t; });
  }
  void set(Thresholds t) noexcept { value_.store(t, std::memory_order_release); }

 private:
  template <typename F>
  void update(F&& change) noexcept {
    Thresholds current = value_.load(std::memory_order_relaxed);
    Thresholds next;
    do {
      next = current;
      change(next);
    } while (!value_.compare_exchange_weak(current, next, std::memory_order_acq_rel,
                                           std::memory_order_relaxed));
  }

  std::atomic<Thresholds> value_{Thresholds{}};
};

}  // namespace sightline::core
