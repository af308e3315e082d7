#pragma once

#include <sightline/app/pipeline_runner.hpp>
#include <sightline/core/detection_result.hpp>
#include <sightline/core/error.hpp>
#include <sightline/core/frame.hpp>
#include <sightline/core/pipeline.hpp>
#include <sightline/vision/frame_source.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

namespace sightline::app {

struct LiveLoopOptions {
  std::chrono::milliseconds capture_timeout{500};
  std::chrono::milliseconds loop_interval{100};
  std::chrono::milliseconds busy_poll{5};
  /// Stop after this many processed frames; unset = until stopped or source exhausted.
  std::optional<std::uint64_t> max_frames;
  std::optional<std::string> source_id;
  /// Called once per cycle after publishing (e.g. threshold reload).
  std::function<void()> on_cycle;
};

/// Counters since construction. Read at any time from any thread.
struct LiveLoopStats {
  std::uint64_t frames_processed{0};
  std::uint64_t frames_dropped{0};
  std::uint64_t capture_timeouts{0};
  std::uint64_t errors{0};
};

/// Continuous capture -> detect -> publish loop on one worker thread.
///
/// At most one frame is in flight at a time. Frames offered while another is being
/// processed are dropped (try_process returns PipelineError::Busy); there is no queue.
/// Pipeline and source must outlive the loop. The destructor stops and joins.
class LiveDetectionLoop {
 public:
  LiveDetectionLoop(sightline::core::Pipeline& pipeline,
                    sightline::vision::IFrameSource& source,
                    DetectionResultCallback publish,
                    LiveLoopOptions options = {});
  ~LiveDetectionLoop();

  LiveDetectionLoop(const LiveDetectionLoop&) = delete;
  LiveDetectionLoop& operator=(const LiveDetectionLoop&) = delete;

  /// Spawn the worker thread. No-op if already running.
  void start();
  /// Request stop and join. Safe to call more than once, and concurrently with wait().
  void stop();
  /// True while the worker thread has not finished.
  [[nodiscard]] bool running() const noexcept;
  /// Block until the worker finishes on its own (source exhausted or max_frames).
  void wait();

  /// The loop body; runs on the calling thread until stop is requested,
  /// the source is exhausted or max_frames is reached. An exception thrown by
  /// capture or a stage counts as an error and the loop moves to the next cycle.
  void run(std::stop_token stop);

  /// Process one frame if nothing else is in flight; publishes on success.
  /// Safe to call from any thread, e.g. an external capture callback.
  [[nodiscard]] std::expected<sightline::core::DetectionResult, sightline::core::PipelineError>
  try_process(const sightline::core::Frame& frame);

  [[nodiscard]] LiveLoopStats stats() const noexcept;

 private:
  bool sleep_for(std::stop_token& stop, std::chrono::milliseconds d);

  sightline::core::Pipeline& pipeline_;
  sightline::vision::IFrameSource& source_;
  DetectionResultCallback publish_;
  LiveLoopOptions options_;

  std::atomic<bool> in_flight_{false};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> next_frame_id_{0};
  std::atomic<std::uint64_t> processed_{0};
  std::atomic<std::uint64_t> dropped_{0};
  std::atomic<std::uint64_t> timeouts_{0};
  std::atomic<std::uint64_t> errors_{0};

  std::mutex sleep_mutex_;
  std::condition_variable_any sleep_cv_;
  std::mutex worker_mutex_;
  std::mutex stop_mutex_;
  std::stop_source stop_source_{std::nostopstate};
  std::jthread worker_;
};

}  // namespace sightline::app
