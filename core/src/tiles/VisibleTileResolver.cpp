#include "sc/tiles/VisibleTileResolver.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace sc {

VisibleTileResolver::VisibleTileResolver(const TileAddressIndex& index,
                                         std::uint32_t tileSize)
    : index_(index), tileSize_(tileSize) {}

TileRange VisibleTileResolver::coveredRange(const Rect& viewRect,
                                            const Mat3& viewToCanvas,
                                            TileGridSize grid) const {
  TileRange range;
  if (grid.empty() || viewRect.width <= 0.0f || viewRect.height <= 0.0f) return range;

  // Conservative: the AABB of the rotated viewport covers at least as much.
  Rect bounds = transformBounds(viewRect, viewToCanvas);

  const double extentX = static_cast<double>(grid.x) * tileSize_;
  const double extentY = static_cast<double>(grid.y) * tileSize_;
  double x0 = std::clamp(static_cast<double>(bounds.x), 0.0, extentX);
  double y0 = std::clamp(static_cast<double>(bounds.y), 0.0, extentY);
  double x1 = std::clamp(static_cast<double>(bounds.x + bounds.width), 0.0, extentX);
  double y1 = std::clamp(static_cast<double>(bounds.y + bounds.height), 0.0, extentY);
  if (x1 <= x0 || y1 <= y0) return range;

  // Floor for the first tile, ceiling for the end; the end is exclusive so
  // a rect ending on a tile boundary does not pull in the next tile.
  auto ts = static_cast<double>(tileSize_);
  auto minX = static_cast<std::uint32_t>(std::floor(x0 / ts));
  auto minY = static_cast<std::uint32_t>(std::floor(y0 / ts));
  auto endX = static_cast<std::uint32_t>(std::ceil(x1 / ts));
  auto endY = static_cast<std::uint32_t>(std::ceil(y1 / ts));

  range.minX = std::min(minX, grid.x - 1);
  range.minY = std::min(minY, grid.y - 1);
  range.maxX = std::min(endX - 1, grid.x - 1);
  range.maxY = std::min(endY - 1, grid.y - 1);
  return range;
}

std::vector<GroupedView> VisibleTileResolver::resolve(LayerId layer,
                                                      const Rect& viewRect,
                                                      const Mat3& canvasToView,
                                                      TileGridSize grid) const {
  TileRange range = coveredRange(viewRect, canvasToView.inverse(), grid);
  if (range.empty()) return {};

  std::unordered_map<std::uint32_t, GroupedView> groups;
  for (std::uint32_t y = range.minY; y <= range.maxY; y++) {
    for (std::uint32_t x = range.minX; x <= range.maxX; x++) {
      Tile t = index_.get(TileKey{layer, TileCoord{x, y}});
      auto& g = groups[t.slot.pile];
      if (g.tiles.empty()) {
        g.pile = t.view.pile;
        g.pileIndex = t.slot.pile;
      }
      g.tiles.push_back(GroupedTile{t.key.coord, t.view.arrayLayer});
    }
  }

  std::vector<GroupedView> out;
  out.reserve(groups.size());
  for (auto& entry : groups) {
    out.push_back(std::move(entry.second));
  }
  return out;
}

} // namespace sc
