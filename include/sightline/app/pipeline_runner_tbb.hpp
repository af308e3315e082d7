#pragma once

#include <sightline/core/detection_result.hpp>
#include <sightline/core/frame.hpp>
#include <sightline/core/pipeline.hpp>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#ifdef SIGHTLINE_HAS_TBB

namespace sightline::app {

/// Callback for each DetectionResult in the multi-source TBB runner; receives result and source_id.
/// May be invoked from TBB worker threads; must be thread-safe.
using DetectionResultCallbackWithSourceId =
    std::function<void(const sightline::core::DetectionResult&, const std::string& source_id)>;

/// Runs pipelines on a batch of (source_id, frame) work items in parallel using TBB.
///
/// Work items are grouped by source_id. Groups run in parallel; items within a group run
/// in submission order on one task, so a pipeline is never entered by two threads at once.
/// On success the result's source_id is set and frame_id is the item's position within its
/// group. Items whose source_id has no pipeline are skipped.
///
/// \param pipelines Map from source_id to pipeline. Caller keeps ownership.
/// \param work_items Flat list of (source_id, frame) pairs. Frames are read only.
/// \param callback Invoked for each successful result with (result, source_id). Must be thread-safe.
void run_pipeline_multi_source_tbb(
    const std::unordered_map<std::string, sightline::core::Pipeline*>& pipelines,
    const std::vector<std::pair<std::string, sightline::core::Frame>>& work_items,
    DetectionResultCallbackWithSourceId callback);

}  // namespace sightline::app

#endif  // SIGHTLINE_HAS_TBB
