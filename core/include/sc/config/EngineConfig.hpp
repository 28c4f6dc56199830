#pragma once
#include <cstdint>
#include <string>

namespace sc {

struct EngineConfig {
  std::uint32_t tileSize{256};
  std::uint32_t tilesPerPile{256};
  std::uint32_t maxPiles{0};      // 0 = no budget
  std::uint32_t workgroupSize{16};
  float clearColor[4] = {0.0f, 0.0f, 0.0f, 0.0f};
};

// Serialize EngineConfig to a JSON string.
std::string serializeEngineConfig(const EngineConfig& cfg);

// Deserialize a JSON object into `out`. Missing or wrong-typed keys keep the
// value already in `out`. Returns false (and leaves `out` untouched) on parse
// errors or on zero tileSize / tilesPerPile / workgroupSize.
bool deserializeEngineConfig(const std::string& json, EngineConfig& out);

} // namespace sc
