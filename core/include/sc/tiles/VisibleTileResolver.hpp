#pragma once
#include "sc/math/Mat3.hpp"
#include "sc/math/Rect.hpp"
#include "sc/tiles/TileAddressIndex.hpp"
#include "sc/tiles/TileTypes.hpp"

#include <cstdint>
#include <vector>

namespace sc {

// Inclusive tile-coordinate range. Empty when minX > maxX or minY > maxY.
struct TileRange {
  std::uint32_t minX{1}, minY{1};
  std::uint32_t maxX{0}, maxY{0};

  bool empty() const { return minX > maxX || minY > maxY; }
  std::size_t count() const {
    if (empty()) return 0;
    return static_cast<std::size_t>(maxX - minX + 1) * (maxY - minY + 1);
  }
};

// Viewport -> set of resident tiles, grouped by pile. Read only: resolving
// never allocates, unpainted tiles come back as the sentinel.
class VisibleTileResolver {
public:
  VisibleTileResolver(const TileAddressIndex& index, std::uint32_t tileSize);

  // viewToCanvas is the inverse of the canvas -> view transform.
  TileRange coveredRange(const Rect& viewRect, const Mat3& viewToCanvas,
                         TileGridSize grid) const;

  std::vector<GroupedView> resolve(LayerId layer, const Rect& viewRect,
                                   const Mat3& canvasToView,
                                   TileGridSize grid) const;

private:
  const TileAddressIndex& index_;
  const std::uint32_t tileSize_;
};

} // namespace sc
