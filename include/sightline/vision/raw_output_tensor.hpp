#pragma once

#include <cstdint>
#include <vector>

namespace sightline::vision {

/// Raw model output before decoding: flat float buffer plus its shape as
/// reported by the runtime (expected [batch, d1, d2]).
struct RawOutputTensor {
  std::vector<float> data;
  std::vector<std::int64_t> shape;
};

}  // namespace sightline::vision
