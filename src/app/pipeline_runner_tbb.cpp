#include <sightline/app/pipeline_runner_tbb.hpp>

#ifdef SIGHTLINE_HAS_TBB

#include <sightline/core/detection_result.hpp>
#include <sightline/core/pipeline.hpp>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sightline::app {

void run_pipeline_multi_source_tbb(
    const std::unordered_map<std::string, sightline::core::Pipeline*>& pipelines,
    const std::vector<std::pair<std::string, sightline::core::Frame>>& work_items,
    DetectionResultCallbackWithSourceId callback) {
  if (work_items.empty() || !callback) return;

  struct Group {
    sightline::core::Pipeline* pipeline = nullptr;
    const std::string* source_id = nullptr;
    std::vector<std::size_t> items;
  };
  std::vector<Group> groups;
  std::unordered_map<std::string, std::size_t> group_index;
  for (std::size_t i = 0; i < work_items.size(); ++i) {
    const std::string& source_id = work_items[i].first;
    auto it = pipelines.find(source_id);
    if (it == pipelines.end() || it->second == nullptr) continue;
    auto [slot, inserted] = group_index.try_emplace(source_id, groups.size());
    if (inserted) groups.push_back(Group{it->second, &source_id, {}});
    groups[slot->second].items.push_back(i);
  }

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, groups.size()),
      [&groups, &work_items, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t g = range.begin(); g != range.end(); ++g) {
          const Group& group = groups[g];
          std::uint64_t frame_id = 0;
          for (std::size_t i : group.items) {
            auto result = group.pipeline->run(work_items[i].second);
            const std::uint64_t id = frame_id++;
            if (!result) continue;
            result->frame_id = id;
            result->source_id = *group.source_id;
            callback(*result, *group.source_id);
          }
        }
      });
}

}  // namespace sightline::app

#endif  // SIGHTLINE_HAS_TBB
