#include <sightline/app/pipeline_runner.hpp>

namespace sightline::app {

std::expected<sightline::core::DetectionResult, sightline::core::PipelineError>
run_pipeline(sightline::core::Pipeline& pipeline,
             const sightline::core::Frame& frame,
             StageTimingCallback* timing_cb,
             std::uint64_t frame_id,
             std::optional<std::string> source_id) {
  auto result = pipeline.run(frame, timing_cb);
  if (result) {
    result->frame_id = frame_id;
    if (source_id.has_value()) result->source_id = std::move(source_id);
  }
  return result;
}

void run_pipeline_batch(sightline::core::Pipeline& pipeline,
                        const std::vector<sightline::core::Frame>& frames,
                        DetectionResultCallback callback,
                        const std::vector<std::string>* source_ids,
                        std::function<void(std::size_t, sightline::core::PipelineError)> on_error) {
  const std::size_t n = frames.size();
  const bool tag_source = source_ids && source_ids->size() == n;
  for (std::size_t i = 0; i < n; ++i) {
    auto result = pipeline.run(frames[i]);
    if (!result) {
      if (on_error) on_error(i, result.error());
      continue;
    }
    result->frame_id = i;
    if (tag_source && !(*source_ids)[i].empty()) result->source_id = (*source_ids)[i];
    if (callback) callback(*result);
  }
}

}  // namespace sightline::app
