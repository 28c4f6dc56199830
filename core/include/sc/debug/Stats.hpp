#pragma once
#include <cstdint>

namespace sc {

struct Stats {
  // Timing
  double frameMs = 0.0;

  // Resolve
  std::uint32_t groups = 0;
  std::uint32_t visibleTiles = 0;

  // GPU work
  std::uint32_t dispatches = 0;
  std::uint32_t drawCalls = 0;

  // Mapping buffers uploaded this frame
  std::uint64_t uploadedBytesThisFrame = 0;
};

} // namespace sc
