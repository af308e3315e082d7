#include <sightline/app/live_detection_loop.hpp>
#include <sightline/app/logging.hpp>
#include <exception>
#include <string>

namespace sightline::app {

namespace {

class InFlightReset {
 public:
  explicit InFlightReset(std::atomic<bool>& flag) : flag_(flag) {}
  ~InFlightReset() { flag_.store(false, std::memory_order_release); }
  InFlightReset(const InFlightReset&) = delete;
  InFlightReset& operator=(const InFlightReset&) = delete;

 private:
  std::atomic<bool>& flag_;
};

}  // namespace

LiveDetectionLoop::LiveDetectionLoop(sightline::core::Pipeline& pipeline,
                                     sightline::vision::IFrameSource& source,
                                     DetectionResultCallback publish,
                                     LiveLoopOptions options)
    : pipeline_(pipeline),
      source_(source),
      publish_(std::move(publish)),
      options_(std::move(options)) {}

LiveDetectionLoop::~LiveDetectionLoop() { stop(); }

void LiveDetectionLoop::start() {
  std::lock_guard lock(worker_mutex_);
  if (worker_.joinable()) return;
  running_.store(true);
  worker_ = std::jthread([this](std::stop_token stop) { run(std::move(stop)); });
  std::lock_guard stop_lock(stop_mutex_);
  stop_source_ = worker_.get_stop_source();
}

void LiveDetectionLoop::stop() {
  // Requested before taking worker_mutex_ so a concurrent wait() can return.
  {
    std::lock_guard stop_lock(stop_mutex_);
    stop_source_.request_stop();
  }
  std::lock_guard lock(worker_mutex_);
  if (worker_.joinable()) worker_.join();
}

void LiveDetectionLoop::wait() {
  std::lock_guard lock(worker_mutex_);
  if (worker_.joinable()) worker_.join();
}

bool LiveDetectionLoop::running() const noexcept { return running_.load(); }

LiveLoopStats LiveDetectionLoop::stats() const noexcept {
  return LiveLoopStats{processed_.load(), dropped_.load(), timeouts_.load(), errors_.load()};
}

std::expected<sightline::core::DetectionResult, sightline::core::PipelineError>
LiveDetectionLoop::try_process(const sightline::core::Frame& frame) {
  bool expected = false;
  if (!in_flight_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    dropped_.fetch_add(1);
    return std::unexpected(sightline::core::PipelineError::Busy);
  }
  InFlightReset reset(in_flight_);

  auto result = run_pipeline(pipeline_, frame, nullptr, next_frame_id_.load(),
                             options_.source_id);
  if (!result) {
    errors_.fetch_add(1);
    return result;
  }
  next_frame_id_.fetch_add(1);
  processed_.fetch_add(1);
  if (publish_) publish_(*result);
  return result;
}

bool LiveDetectionLoop::sleep_for(std::stop_token& stop, std::chrono::milliseconds d) {
  std::unique_lock lock(sleep_mutex_);
  sleep_cv_.wait_for(lock, stop, d, [] { return false; });
  return !stop.stop_requested();
}

void LiveDetectionLoop::run(std::stop_token stop) {
  running_.store(true);
  SIGHTLINE_LOG_INFO("live loop started");

  while (!stop.stop_requested()) {
    while (in_flight_.load(std::memory_order_acquire) && !stop.stop_requested()) {
      sleep_for(stop, options_.busy_poll);
    }
    if (stop.stop_requested()) break;

    try {
      auto frame = source_.capture(options_.capture_timeout);
      if (frame) {
        auto result = try_process(*frame);
        if (!result && result.error() != sightline::core::PipelineError::Busy) {
          SIGHTLINE_LOG_WARN(std::string("frame dropped: ") + sightline::core::to_string(result.error()));
        }
      } else if (frame.error() == sightline::core::PipelineError::CaptureTimeout) {
        timeouts_.fetch_add(1);
        SIGHTLINE_LOG_DEBUG("capture timed out");
      } else {
        errors_.fetch_add(1);
        if (!source_.is_open()) {
          SIGHTLINE_LOG_INFO("frame source exhausted");
          break;
        }
        SIGHTLINE_LOG_WARN(std::string("capture failed: ") + sightline::core::to_string(frame.error()));
      }
    } catch (const std::exception& e) {
      errors_.fetch_add(1);
      SIGHTLINE_LOG_WARN(std::string("detection cycle failed: ") + e.what());
    }

    if (options_.max_frames && processed_.load() >= *options_.max_frames) break;
    if (options_.on_cycle) options_.on_cycle();
    if (!sleep_for(stop, options_.loop_interval)) break;
  }

  SIGHTLINE_LOG_INFO("live loop stopped after " + std::to_string(processed_.load()) + " frames");
  running_.store(false);
}

}  // namespace sightline::app
