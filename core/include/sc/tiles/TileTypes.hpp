#pragma once
#include "sc/ids/Id.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace sc {

// Backend name of one pile (a GL texture array name for the GL device).
using PileHandle = std::uint32_t;
inline constexpr PileHandle kNullPile = 0;

// Mapping-buffer value meaning "this tile is not in the current group".
inline constexpr std::uint32_t kNoTile = 0xFFFFFFFFu;

// Pile index reported by the sentinel tile's slot.
inline constexpr std::uint32_t kSentinelPileIndex = 0xFFFFFFFFu;

struct TileCoord {
  std::uint32_t x{0};
  std::uint32_t y{0};

  bool operator==(const TileCoord& o) const { return x == o.x && y == o.y; }
  bool operator!=(const TileCoord& o) const { return !(*this == o); }
};

struct TileKey {
  LayerId layer{kSentinelLayerId};
  TileCoord coord{};

  bool operator==(const TileKey& o) const { return layer == o.layer && coord == o.coord; }
  bool operator!=(const TileKey& o) const { return !(*this == o); }
};

struct TileKeyHash {
  std::size_t operator()(const TileKey& k) const {
    std::uint64_t c = (static_cast<std::uint64_t>(k.coord.x) << 32) | k.coord.y;
    std::size_t h = std::hash<std::uint64_t>{}(k.layer);
    return h ^ (std::hash<std::uint64_t>{}(c) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2));
  }
};

struct PhysicalTileSlot {
  std::uint32_t pile{0};
  std::uint32_t layer{0};

  bool operator==(const PhysicalTileSlot& o) const { return pile == o.pile && layer == o.layer; }
  bool operator!=(const PhysicalTileSlot& o) const { return !(*this == o); }
};

// What a shader binds to reach one tile: the pile's array texture plus a layer.
struct TileView {
  PileHandle pile{kNullPile};
  std::uint32_t arrayLayer{0};
};

struct Tile {
  TileKey key{};
  PhysicalTileSlot slot{};
  TileView view{};

  bool isSentinel() const { return key.layer == kSentinelLayerId; }
};

struct TileGridSize {
  std::uint32_t x{0};
  std::uint32_t y{0};

  std::size_t count() const { return static_cast<std::size_t>(x) * y; }
  bool empty() const { return x == 0 || y == 0; }
  bool operator==(const TileGridSize& o) const { return x == o.x && y == o.y; }
};

inline std::uint32_t ceilDiv(std::uint32_t a, std::uint32_t b) {
  return (a + b - 1) / b;
}

inline TileGridSize calcTileCount(std::uint32_t width, std::uint32_t height,
                                  std::uint32_t tileSize) {
  return TileGridSize{ceilDiv(width, tileSize), ceilDiv(height, tileSize)};
}

struct GroupedTile {
  TileCoord coord{};
  std::uint32_t arrayLayer{0};
};

// Visible tiles that live in the same pile; drawn with one dispatch.
struct GroupedView {
  PileHandle pile{kNullPile};
  std::uint32_t pileIndex{0};
  std::vector<GroupedTile> tiles;
};

} // namespace sc
