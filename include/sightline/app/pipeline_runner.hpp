#pragma once

#include <sightline/core/detection_result.hpp>
#include <sightline/core/error.hpp>
#include <sightline/core/frame.hpp>
#include <sightline/core/pipeline.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sightline::app {

/// Callback for each DetectionResult. For the TBB runner it may be invoked
/// from worker threads and must be thread-safe.
using DetectionResultCallback =
    std::function<void(const sightline::core::DetectionResult&)>;

/// Optional per-stage timing: (stage_index, stage_name, duration_ms).
using StageTimingCallback = sightline::core::StageTimingCallback;

/// Runs pipeline on a single frame. No threading; direct call.
/// If timing_cb is non-null, it is invoked after each stage that ran.
/// frame_id and source_id are set on the returned DetectionResult for traceability.
[[nodiscard]] std::expected<sightline::core::DetectionResult, sightline::core::PipelineError>
run_pipeline(sightline::core::Pipeline& pipeline,
             const sightline::core::Frame& frame,
             StageTimingCallback* timing_cb = nullptr,
             std::uint64_t frame_id = 0,
             std::optional<std::string> source_id = std::nullopt);

/// Runs pipeline on multiple frames sequentially; calls callback for each
/// successful result (frame_id = index in frames). Failed frames are skipped
/// and their error is reported through on_error if given.
/// If source_ids is provided (same size as frames), each result is tagged with the
/// corresponding id before callback; empty string = leave unset.
void run_pipeline_batch(sightline::core::Pipeline& pipeline,
                        const std::vector<sightline::core::Frame>& frames,
                        DetectionResultCallback callback,
                        const std::vector<std::string>* source_ids = nullptr,
                        std::function<void(std::size_t, sightline::core::PipelineError)> on_error = {});

}  // namespace sightline::app
